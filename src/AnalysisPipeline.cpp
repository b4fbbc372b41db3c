#include "AnalysisPipeline.h"

#include "Bootstrapper.h"
#include "CentralityEngine.h"
#include "CommonUtils.h"
#include "CorrelationEngine.h"
#include "FactorAnalysis.h"
#include "GnuplotEngine.h"
#include "ItemDataset.h"
#include "MathUtils.h"
#include "NetworkEstimator.h"
#include "NetworkLayout.h"
#include "PsynetExceptions.h"
#include "ReportEngine.h"
#include "Statistics.h"
#include "TerminalUI.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {
using Table = std::vector<std::vector<std::string>>;

void prepareOutputs(const AutoConfig& config) {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::remove(config.reportFile, ec);
    fs::path html(config.reportFile);
    html.replace_extension(".html");
    fs::remove(html, ec);

    ec.clear();
    fs::create_directories(config.assetsDir, ec);
    if (ec) {
        throw Psynet::IOException("Cannot create assets directory '" + config.assetsDir + "': " + ec.message());
    }
}

void writeCsv(const std::string& path, const std::vector<std::string>& header, const Table& rows) {
    std::ofstream out(path);
    if (!out) {
        throw Psynet::IOException("Cannot write " + path);
    }
    auto writeRow = [&out](const std::vector<std::string>& row) {
        for (size_t i = 0; i < row.size(); ++i) {
            if (i > 0) out << ',';
            const bool quote = row[i].find_first_of(",\"\n") != std::string::npos;
            if (!quote) {
                out << row[i];
                continue;
            }
            out << '"';
            for (char ch : row[i]) {
                if (ch == '"') out << '"';
                out << ch;
            }
            out << '"';
        }
        out << '\n';
    };
    writeRow(header);
    for (const auto& row : rows) writeRow(row);
    out.flush();
    if (!out.good()) {
        throw Psynet::IOException("Failed while writing " + path);
    }
}

std::string fullPrecision(double v) {
    if (!std::isfinite(v)) return "NA";
    std::ostringstream os;
    os << std::setprecision(10) << v;
    return os.str();
}

std::string groupLabel(const FactorModelSpec& model, const std::string& item) {
    const std::string g = model.groupOf(item);
    return g.empty() ? "Other" : g;
}

// Explicit items win; otherwise the factor model items when all are present, else every numeric column.
std::vector<std::string> resolveItems(const ItemDataset& dataset, const AutoConfig& config) {
    if (!config.items.empty()) return config.items;

    const std::vector<std::string> modelItems = config.factorModel.allItems();
    bool allPresent = !modelItems.empty();
    for (const auto& item : modelItems) {
        if (dataset.findColumnIndex(item) < 0) {
            allPresent = false;
            break;
        }
    }
    if (allPresent) return modelItems;
    if (config.factorModelExplicit) {
        throw Psynet::ConfigurationException("Factor model items are missing from the dataset");
    }

    std::vector<std::string> numeric = dataset.numericColumnNames();
    if (numeric.size() < 2) {
        throw Psynet::DatasetException("Dataset needs at least two numeric item columns");
    }
    return numeric;
}

NetworkOptions networkOptionsFrom(const AutoConfig& config) {
    NetworkOptions opts;
    opts.estimator = NetworkEstimator::parseEstimator(config.estimator);
    opts.prune = NetworkEstimator::parsePruneMode(config.prune);
    opts.alpha = config.alpha;
    opts.adjust = NetworkEstimator::parseAdjust(config.adjust);
    opts.gamma = config.gamma;
    return opts;
}

std::string estimatorDescription(const NetworkOptions& opts) {
    switch (opts.estimator) {
        case EstimatorKind::Correlation:
            return "Edges are zero-order Pearson correlations.";
        case EstimatorKind::PartialCorrelation:
            return "Edges are partial correlations: the association between two items after conditioning on all "
                   "other items (a Gaussian pairwise Markov random field).";
        case EstimatorKind::EbicGlasso:
            return "Edges are regularized partial correlations from the graphical lasso, with the penalty chosen by "
                   "the extended BIC (gamma = " + CommonUtils::toFixed(opts.gamma, 2) + ").";
    }
    return "";
}

Table weightMatrixRows(const std::vector<std::string>& items, const WeightMatrix& weights, int prec) {
    Table rows;
    rows.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        std::vector<std::string> row = {items[i]};
        for (size_t j = 0; j < items.size(); ++j) {
            row.push_back(prec < 0 ? fullPrecision(weights[i][j]) : CommonUtils::toFixed(weights[i][j], prec));
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

void addDataSection(ReportEngine& report,
                    const MissingDataReport& missing,
                    const ObservationMatrix& data,
                    const std::vector<ColumnStats>& stats,
                    const FactorModelSpec& model) {
    report.addSection("Data");
    report.addParagraph("Rows read: " + std::to_string(missing.originalRows) + ". Respondents with a missing value on any "
                        "selected item were removed (listwise deletion): " + std::to_string(missing.removedRows) +
                        " removed, " + std::to_string(missing.keptRows) + " kept (" +
                        CommonUtils::toFixed(100.0 * missing.removedRatio(), 1) + "% removed).");

    Table missingRows;
    for (size_t i = 0; i < missing.items.size(); ++i) {
        missingRows.push_back({missing.items[i], std::to_string(missing.missingPerItem[i])});
    }
    report.addTable("Missing values per item", {"Item", "Missing"}, missingRows);

    Table descRows;
    for (size_t i = 0; i < data.itemCount(); ++i) {
        const ColumnStats& s = stats[i];
        descRows.push_back({data.items[i], groupLabel(model, data.items[i]), std::to_string(s.count),
                            CommonUtils::toFixed(s.mean, 2),
                            CommonUtils::toFixed(s.stddev, 2), CommonUtils::toFixed(s.median, 1),
                            CommonUtils::toFixed(s.skewness, 2), CommonUtils::toFixed(s.kurtosis, 2),
                            CommonUtils::toFixed(s.min, 0), CommonUtils::toFixed(s.max, 0)});
    }
    report.addTable("Descriptive statistics",
                    {"Item", "Group", "n", "Mean", "SD", "Median", "Skew", "Kurtosis", "Min", "Max"},
                    descRows);
}

void addCfaSection(ReportEngine& report, const CfaResult& cfa) {
    report.addSection("Confirmatory factor analysis");
    report.addParagraph("The measurement model assigns every item to one latent factor. The model is fitted by maximum "
                        "likelihood; each factor is scaled by fixing the loading of its first indicator to 1.");

    const CfaFitIndices& fit = cfa.fit;
    report.addTable("Model fit",
                    {"N", "Chi-square", "df", "p", "CFI", "TLI", "RMSEA", "SRMR", "AIC", "BIC"},
                    {{std::to_string(cfa.sampleSize), CommonUtils::toFixed(fit.chiSquare, 2), std::to_string(fit.df),
                      CommonUtils::formatPValue(fit.pValue), CommonUtils::toFixed(fit.cfi), CommonUtils::toFixed(fit.tli),
                      CommonUtils::toFixed(fit.rmsea), CommonUtils::toFixed(fit.srmr), CommonUtils::toFixed(fit.aic, 1),
                      CommonUtils::toFixed(fit.bic, 1)}});

    Table paramRows;
    for (const auto& p : cfa.parameters) {
        paramRows.push_back({p.lhs, p.op, p.rhs, CommonUtils::toFixed(p.estimate),
                             p.free ? CommonUtils::toFixed(p.se) : "", p.free ? CommonUtils::toFixed(p.z, 2) : "",
                             p.free ? CommonUtils::formatPValue(p.pValue) : "", CommonUtils::toFixed(p.standardized)});
    }
    report.addTable("Parameter estimates", {"lhs", "op", "rhs", "Estimate", "SE", "z", "p", "Std.all"}, paramRows);

    Table corrRows = weightMatrixRows(cfa.factors, cfa.factorCorrelation, 3);
    std::vector<std::string> corrHeader = {"Factor"};
    corrHeader.insert(corrHeader.end(), cfa.factors.begin(), cfa.factors.end());
    report.addTable("Latent factor correlations", corrHeader, corrRows);

    report.addWarnings(cfa.warnings);
}
} // namespace

int AnalysisPipeline::run(const AutoConfig& config) {
    const auto started = std::chrono::steady_clock::now();
    prepareOutputs(config);
    MathUtils::setSignificanceAlpha(config.alpha);

    // Data
    std::cout << "[Psynet][Data] Loading " << config.datasetPath << "\n";
    ItemDataset dataset(config.datasetPath, config.delimiter);
    dataset.load();
    if (dataset.rowCount() == 0 || dataset.colCount() == 0) {
        throw Psynet::DatasetException("Dataset has no usable rows/columns");
    }

    const std::vector<std::string> items = resolveItems(dataset, config);
    MissingDataReport missing;
    const ObservationMatrix data = dataset.completeCases(items, &missing);
    std::cout << "[Psynet][Data] " << data.rowCount() << " complete respondents x " << data.itemCount() << " items\n";
    TerminalUI::printMissingDataReport(missing);

    const std::vector<ColumnStats> stats = Statistics::describe(data);
    if (config.verbose) TerminalUI::printDescriptiveTable(data.items, stats);

    std::vector<std::string> groups;
    groups.reserve(data.itemCount());
    for (const auto& item : data.items) groups.push_back(groupLabel(config.factorModel, item));

    ReportEngine report;
    report.addTitle("Psynet: Network Psychometrics Report");
    report.addParagraph("Dataset: `" + config.datasetPath + "` | Items: " + std::to_string(data.itemCount()) +
                        " | Respondents analysed: " + std::to_string(data.rowCount()));
    addDataSection(report, missing, data, stats, config.factorModel);

    GnuplotEngine plotter(config.assetsDir, config.plot);
    const bool canPlot = config.plots && plotter.isAvailable();
    if (config.plots && !canPlot) {
        std::cerr << "[Psynet][Plot] gnuplot not found in PATH: figures are skipped\n";
        report.addNote("Gnuplot is not available in PATH: figures were skipped.");
    }
    auto addPlot = [&](const std::string& title, const std::string& path) {
        if (!path.empty()) report.addImage(title, path);
    };

    // Confirmatory factor analysis
    if (config.runCfa) {
        const std::vector<std::string> modelItems = config.factorModel.allItems();
        const bool covered = std::all_of(modelItems.begin(), modelItems.end(), [&](const std::string& item) {
            return std::find(data.items.begin(), data.items.end(), item) != data.items.end();
        });
        if (covered) {
            std::cout << "[Psynet][CFA] Fitting " << config.factorModel.factors.size() << "-factor model on "
                      << modelItems.size() << " items\n";
            CfaOptions cfaOptions;
            cfaOptions.maxIterations = static_cast<size_t>(std::max(1, config.cfaMaxIterations));
            cfaOptions.tolerance = config.cfaTolerance;
            const CfaResult cfa = FactorAnalysis::fit(data, config.factorModel, cfaOptions);
            TerminalUI::printCfaSummary(cfa);
            addCfaSection(report, cfa);
        } else if (config.factorModelExplicit) {
            throw Psynet::ConfigurationException("Factor model items are not among the selected items");
        } else {
            std::cerr << "[Psynet][CFA][Warning] Selected items do not cover the factor model: CFA skipped\n";
            report.addSection("Confirmatory factor analysis");
            report.addNote("Skipped: the selected items do not include every item of the factor model.");
        }
    }

    // Correlations
    std::cout << "[Psynet][Network] Computing correlation matrix\n";
    const WeightMatrix corr = CorrelationEngine::calculateCorrelationMatrix(data);
    if (config.verbose) TerminalUI::printCorrelationMatrix(data.items, corr);

    report.addSection("Correlation network");
    report.addParagraph("Pearson correlations between all item pairs. In the correlation graph every nonzero correlation "
                        "is an edge; blue edges are positive, red edges negative, and thicker edges are stronger.");
    Table strongRows;
    for (const auto& c : CorrelationEngine::strongestCorrelations(data, corr, 10)) {
        strongRows.push_back({c.item1, c.item2, CommonUtils::toFixed(c.r), CommonUtils::formatPValue(c.p_value)});
    }
    report.addTable("Strongest correlations", {"Item 1", "Item 2", "r", "p"}, strongRows);

    // Network estimation
    const NetworkOptions netOptions = networkOptionsFrom(config);
    std::cout << "[Psynet][Network] Estimating " << NetworkEstimator::toString(netOptions.estimator) << " network\n";
    const NetworkModel model = NetworkEstimator::estimate(data, netOptions);
    TerminalUI::printNetworkSummary(model, config.threshold);

    const std::vector<NodePosition> positions =
        NetworkLayout::compute(NetworkLayout::parse(config.layout), model.weights, config.seed);

    if (canPlot) {
        addPlot("Correlation matrix", plotter.heatmap("correlation_heatmap", corr, "Item correlation matrix", data.items));
        addPlot("Correlation graph",
                plotter.network("correlation_graph", data.items, groups, positions,
                                NetworkGraph::visibleEdges(corr, config.threshold), "Correlation graph"));
    }

    report.addSection("Network estimation");
    report.addParagraph(estimatorDescription(netOptions));
    Table netRows = {{"Estimator", NetworkEstimator::toString(netOptions.estimator)},
                     {"Nonzero edges", std::to_string(NetworkGraph::nonzeroEdgeCount(model.weights))},
                     {"Density", CommonUtils::toFixed(NetworkGraph::density(model.weights), 3)}};
    if (model.pruning.applied) {
        netRows.push_back({"Pruning", "alpha = " + CommonUtils::toFixed(netOptions.alpha, 3) + ", adjust = " +
                                          NetworkEstimator::toString(netOptions.adjust)});
        netRows.push_back({"Edges pruned", std::to_string(model.pruning.prunedEdges) + " of " +
                                               std::to_string(model.pruning.candidateEdges)});
    }
    if (netOptions.estimator == EstimatorKind::EbicGlasso) {
        netRows.push_back({"Selected lambda", CommonUtils::toFixed(model.selectedLambda, 4)});
        netRows.push_back({"EBIC", CommonUtils::toFixed(model.ebic, 2)});
        netRows.push_back({"Converged", model.converged ? "yes (" + std::to_string(model.iterations) + " iterations)"
                                                        : "no"});
    }
    if (config.threshold > 0.0) {
        netRows.push_back({"Display threshold", "|w| >= " + CommonUtils::toFixed(config.threshold, 2) + " (" +
                                                    std::to_string(model.visibleEdges(config.threshold).size()) +
                                                    " edges shown)"});
    }
    report.addTable("Network summary", {"Property", "Value"}, netRows);
    report.addWarnings(model.warnings);
    if (model.pruning.applied) {
        report.addParagraph("Pruning sets non-significant edges to zero in the model itself; all later steps use the "
                            "pruned network. Thresholding, in contrast, only hides weak edges in the figure.");
    }

    if (canPlot) {
        if (model.pruning.applied) {
            NetworkOptions unprunedOptions = netOptions;
            unprunedOptions.prune = PruneMode::None;
            const NetworkModel unpruned = NetworkEstimator::estimate(data, unprunedOptions);
            addPlot("Unpruned network",
                    plotter.network("network_unpruned", data.items, groups, positions,
                                    unpruned.visibleEdges(config.threshold), "Unpruned network"));
        }
        addPlot("Estimated network",
                plotter.network("network", data.items, groups, positions, model.visibleEdges(config.threshold),
                                "Estimated network (" + NetworkEstimator::toString(netOptions.estimator) + ")"));
    }

    Table edgeRows;
    Table topEdgeRows;
    std::vector<WeightedEdge> edges = model.edges();
    for (const auto& e : edges) {
        edgeRows.push_back({data.items[e.from], data.items[e.to], fullPrecision(e.weight)});
    }
    std::stable_sort(edges.begin(), edges.end(), [](const WeightedEdge& a, const WeightedEdge& b) {
        return std::abs(a.weight) > std::abs(b.weight);
    });
    for (size_t k = 0; k < edges.size() && k < 15; ++k) {
        topEdgeRows.push_back({NetworkGraph::edgeLabel(edges[k], data.items), CommonUtils::toFixed(edges[k].weight)});
    }
    report.addTable("Strongest edges", {"Edge", "Weight"}, topEdgeRows);

    // Centrality
    std::cout << "[Psynet][Centrality] Computing node centrality\n";
    const CentralityResult centrality = CentralityEngine::compute(model.weights, data.items);
    TerminalUI::printCentralityTable(centrality);

    report.addSection("Centrality");
    report.addParagraph("Strength sums absolute edge weights, expected influence sums signed weights, closeness is the "
                        "inverse mean shortest-path distance (edge length 1/|w|; zero in a disconnected network), and betweenness counts shortest paths "
                        "passing through a node. Values are shown standardized in the figure.");
    Table centralityRows;
    for (size_t i = 0; i < centrality.items.size(); ++i) {
        centralityRows.push_back({centrality.items[i], groups[i], CommonUtils::toFixed(centrality.strength[i]),
                                  CommonUtils::toFixed(centrality.closeness[i], 4),
                                  CommonUtils::toFixed(centrality.betweenness[i], 1),
                                  CommonUtils::toFixed(centrality.expectedInfluence[i])});
    }
    report.addTable("Centrality indices", {"Item", "Group", "Strength", "Closeness", "Betweenness", "Expected influence"},
                    centralityRows);
    if (canPlot) {
        addPlot("Centrality plot",
                plotter.centrality("centrality", centrality.items,
                                   {"Strength", "Closeness", "Betweenness", "Expected influence"},
                                   {CentralityEngine::zScores(centrality.strength),
                                    CentralityEngine::zScores(centrality.closeness),
                                    CentralityEngine::zScores(centrality.betweenness),
                                    CentralityEngine::zScores(centrality.expectedInfluence)},
                                   "Centrality (z-scores)"));
    }

    // Bootstrap
    BootstrapOptions bootOptions;
    bootOptions.samples = config.bootstrapSamples;
    bootOptions.workers = config.workers;
    bootOptions.seed = config.seed;
    bootOptions.ciLevel = config.ciLevel;
    bootOptions.network = netOptions;
    std::cout << "[Psynet][Bootstrap] Running " << bootOptions.samples << " resamples (seed " << bootOptions.seed << ")\n";
    const BootstrapResult boot = Bootstrapper::run(data, bootOptions);
    std::cout << "[Psynet][Bootstrap] " << boot.yieldText() << "\n";
    TerminalUI::printBootstrapSummary(boot);

    report.addSection("Edge-weight accuracy (bootstrap)");
    report.addParagraph("Respondents were resampled with replacement and the network re-estimated with the same "
                        "settings. " + boot.yieldText() + ". Intervals are " +
                        CommonUtils::toFixed(100.0 * boot.ciLevel, 0) + "% percentile intervals.");
    report.addNote(BootstrapResult::scopeNote());

    Table bootRows;
    GnuplotEngine::CiSeries ci;
    for (const auto& e : boot.edges) {
        const std::string label = data.items[e.from] + "--" + data.items[e.to];
        bootRows.push_back({data.items[e.from], data.items[e.to], fullPrecision(e.sampleWeight), fullPrecision(e.mean),
                            fullPrecision(e.sd), fullPrecision(e.lower), fullPrecision(e.upper),
                            fullPrecision(e.inclusion)});
        // Pairs that are zero in the sample and in every resample carry no information in the figure.
        if (e.sampleWeight == 0.0 && e.inclusion == 0.0) continue;
        ci.labels.push_back(label);
        ci.sample.push_back(e.sampleWeight);
        ci.mean.push_back(e.mean);
        ci.lower.push_back(e.lower);
        ci.upper.push_back(e.upper);
    }
    if (!boot.failures.empty()) {
        Table failureRows;
        for (size_t k = 0; k < boot.failures.size() && k < 20; ++k) {
            failureRows.push_back({std::to_string(boot.failures[k].index), boot.failures[k].message});
        }
        report.addTable("Failed resamples", {"Resample", "Reason"}, failureRows);
    }
    if (canPlot) {
        addPlot("Bootstrapped edge weights",
                plotter.bootstrapIntervals("bootstrap_edges", ci, "Bootstrapped edge weights"));
    }

    // Exports
    const std::string weightsCsv = config.assetsDir + "/network_weights.csv";
    const std::string edgesCsv = config.assetsDir + "/network_edges.csv";
    const std::string centralityCsv = config.assetsDir + "/centrality.csv";
    const std::string bootstrapCsv = config.assetsDir + "/bootstrap_edges.csv";
    std::vector<std::string> weightHeader = {"item"};
    weightHeader.insert(weightHeader.end(), data.items.begin(), data.items.end());
    writeCsv(weightsCsv, weightHeader, weightMatrixRows(data.items, model.weights, -1));
    writeCsv(edgesCsv, {"from", "to", "weight"}, edgeRows);
    Table centralityCsvRows;
    for (size_t i = 0; i < centrality.items.size(); ++i) {
        centralityCsvRows.push_back({centrality.items[i], groups[i], fullPrecision(centrality.strength[i]),
                                     fullPrecision(centrality.closeness[i]), fullPrecision(centrality.betweenness[i]),
                                     fullPrecision(centrality.expectedInfluence[i])});
    }
    writeCsv(centralityCsv, {"item", "group", "strength", "closeness", "betweenness", "expected_influence"},
             centralityCsvRows);
    writeCsv(bootstrapCsv, {"from", "to", "sample", "mean", "sd", "lower", "upper", "inclusion"}, bootRows);

    report.addSection("Exported files");
    report.addTable("Data exports", {"Content", "File"},
                    {{"Network weight matrix", weightsCsv},
                     {"Network edge list", edgesCsv},
                     {"Centrality indices", centralityCsv},
                     {"Bootstrap edge summary", bootstrapCsv}});

    report.save(config.reportFile);
    std::cout << "[Psynet][Report] Report written to " << config.reportFile << "\n";
    if (config.generateHtml) {
        const std::string html = ReportEngine::exportHtml(config.reportFile);
        if (!html.empty()) std::cout << "[Psynet][Report] HTML report written to " << html << "\n";
    }

    const double elapsed =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    std::cout << "[Psynet] Pipeline finished in " << CommonUtils::toFixed(elapsed, 1) << "s\n";
    return 0;
}
