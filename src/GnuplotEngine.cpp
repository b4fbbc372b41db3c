#include "GnuplotEngine.h"
#include "ProcessUtils.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <map>
#include <numeric>
#include <sstream>

namespace {
const char* const kPositiveEdge = "#2563eb";
const char* const kNegativeEdge = "#dc2626";
const std::vector<std::string> kGroupPalette = {"#f59e0b", "#10b981", "#6366f1", "#ef4444", "#06b6d4",
                                                "#8b5cf6", "#84cc16", "#ec4899", "#64748b", "#d97706"};

struct ThemeColors {
    const char* background;
    const char* title;
    const char* border;
    const char* tics;
    const char* grid;
};

const ThemeColors& themeColors(const std::string& theme) {
    static const ThemeColors light{"#ffffff", "#1f2937", "#9ca3af", "#374151", "#e5e7eb"};
    static const ThemeColors dark{"#111827", "#f9fafb", "#6b7280", "#e5e7eb", "#374151"};
    return theme == "dark" ? dark : light;
}

// Printable ASCII only, truncated with "..." past maxLen.
std::string shortLabel(const std::string& label, size_t maxLen = 28) {
    std::string out;
    std::copy_if(label.begin(), label.end(), std::back_inserter(out), [](char ch) { return ch >= 32 && ch <= 126; });
    if (out.empty()) return "Unnamed";
    if (out.size() > maxLen) out = out.substr(0, maxLen - 3) + "...";
    return out;
}

// Double-quoted string field inside a gnuplot data file.
std::string quoteForDatafileString(const std::string& value) {
    std::string out = "\"";
    for (char ch : value) {
        if (ch == '"') out += '\\';
        out.push_back(ch);
    }
    return out + "\"";
}

// FNV-1a over data and script; identical inputs reuse the previous image.
std::string cacheKey(const std::string& data, const std::string& script, const std::string& format) {
    uint64_t hash = 1469598103934665603ULL;
    auto mix = [&hash](const std::string& text) {
        for (unsigned char c : text) {
            hash ^= c;
            hash *= 1099511628211ULL;
        }
        hash ^= 0xff;
        hash *= 1099511628211ULL;
    };
    mix(data);
    mix(script);
    mix(format);
    std::ostringstream os;
    os << std::hex << hash << ':' << std::dec << (data.size() + script.size());
    return os.str();
}

bool writeTextFile(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    if (!out) return false;
    out << content;
    out.flush();
    return out.good();
}

std::string readFirstLine(const std::string& path) {
    std::ifstream in(path);
    std::string line;
    std::getline(in, line);
    return line;
}

// Gnuplot "lc rgb variable" reads the colour as an integer.
long rgbToInt(const std::string& hex) {
    return std::stol(hex.substr(1), nullptr, 16);
}

std::string ticList(const std::vector<std::string>& labels, size_t maxLen) {
    std::ostringstream os;
    os << "(";
    for (size_t i = 0; i < labels.size(); ++i) {
        if (i > 0) os << ", ";
        std::string quoted = "'";
        for (char ch : shortLabel(labels[i], maxLen)) {
            if (ch == '\'') quoted += "''";
            else quoted.push_back(ch);
        }
        quoted += "'";
        os << quoted << " " << i;
    }
    os << ")";
    return os.str();
}
} // namespace

std::string GnuplotEngine::sanitizeId(const std::string& id) {
    std::string out;
    for (unsigned char c : id) out.push_back((std::isalnum(c) || c == '_' || c == '-') ? static_cast<char>(c) : '_');
    return out.empty() ? "plot" : out;
}

std::string GnuplotEngine::quoteForGnuplot(const std::string& value) {
    std::string out = "'";
    for (char ch : value) {
        if (ch == '\'') out.push_back('\'');
        out.push_back(ch);
    }
    return out + "'";
}

std::string GnuplotEngine::terminalForFormat(const std::string& format, int width, int height) {
    const std::string size = std::to_string(width) + "," + std::to_string(height);
    if (format == "svg") return "svg size " + size;
    if (format == "pdf") return "pdfcairo size 11in,8in";
    return "pngcairo size " + size;
}

std::string GnuplotEngine::dataPath(const std::string& id) const {
    return assetsDir_ + "/" + sanitizeId(id) + ".dat";
}

std::string GnuplotEngine::outputPath(const std::string& id) const {
    return assetsDir_ + "/" + sanitizeId(id) + "." + cfg_.format;
}

std::string GnuplotEngine::styledHeader(const std::string& id, const std::string& title) const {
    const ThemeColors& colors = themeColors(cfg_.theme);
    std::ostringstream script;
    script << "set terminal " << terminalForFormat(cfg_.format, cfg_.width, cfg_.height)
           << " noenhanced background rgb " << quoteForGnuplot(colors.background) << "\n"
           << "set output " << quoteForGnuplot(outputPath(id)) << "\n"
           << "set title " << quoteForGnuplot(shortLabel(title.empty() ? "Psynet" : title, 120)) << " tc rgb "
           << quoteForGnuplot(colors.title) << " font ',14'\n"
           << "set border linewidth " << cfg_.lineWidth << " lc rgb " << quoteForGnuplot(colors.border) << "\n"
           << "set tics out nomirror textcolor rgb " << quoteForGnuplot(colors.tics) << " font ',10'\n";
    if (cfg_.showGrid) script << "set grid back lc rgb " << quoteForGnuplot(colors.grid) << " lw 1 dt 2\n";
    else script << "unset grid\n";
    script << "set key top right opaque box lc rgb " << quoteForGnuplot(colors.border) << " font ',10'\n";

    // ls 1 positive/estimate, ls 2 negative, ls 3 neutral marks
    const char* lineColors[] = {kPositiveEdge, kNegativeEdge, "#111827"};
    const int pointTypes[] = {7, 5, 7};
    for (int k = 0; k < 3; ++k) {
        script << "set style line " << (k + 1) << " lc rgb " << quoteForGnuplot(lineColors[k]) << " lw "
               << cfg_.lineWidth << " pt " << pointTypes[k] << " ps " << cfg_.pointSize << "\n";
    }
    return script.str();
}

GnuplotEngine::GnuplotEngine(std::string assetsDir, PlotConfig cfg)
    : assetsDir_(std::move(assetsDir)), cfg_(std::move(cfg)) {
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(assetsDir_) / ".plot_cache", ec);
    if (ec) std::cerr << "[Psynet][Plot] Could not create assets directory '" << assetsDir_ << "': " << ec.message() << "\n";
}

bool GnuplotEngine::isAvailable() const {
    return !ProcessUtils::findExecutableInPath("gnuplot").empty();
}

std::string GnuplotEngine::runScript(const std::string& id, const std::string& dataContent, const std::string& scriptContent) {
    static const std::string gnuplot = ProcessUtils::findExecutableInPath("gnuplot");
    if (gnuplot.empty()) return "";

    const std::string stem = assetsDir_ + "/" + sanitizeId(id);
    const std::string dataFile = dataPath(id);
    const std::string scriptFile = stem + ".plt";
    const std::string errFile = stem + ".err.log";
    const std::string outputFile = outputPath(id);
    const std::string hashFile = assetsDir_ + "/.plot_cache/" + sanitizeId(id) + ".hash";

    const std::string key = cacheKey(dataContent, scriptContent, cfg_.format);
    std::error_code ec;
    if (readFirstLine(hashFile) == key && std::filesystem::exists(outputFile, ec)) return outputFile;

    if (!writeTextFile(dataFile, dataContent) || !writeTextFile(scriptFile, scriptContent)) {
        std::cerr << "[Psynet][Plot] Could not write plot inputs for '" << id << "' in " << assetsDir_ << "\n";
        return "";
    }

    const int rc = ProcessUtils::spawnAndWait(gnuplot, {scriptFile}, errFile);
    std::filesystem::remove(dataFile, ec);
    std::filesystem::remove(scriptFile, ec);

    if (rc != 0 || !std::filesystem::exists(outputFile, ec)) {
        const std::string firstError = readFirstLine(errFile);
        std::cerr << "[Psynet][Plot] gnuplot failed for '" << id << "' (exit code " << rc << ")";
        if (!firstError.empty()) std::cerr << ": " << firstError;
        std::cerr << " [log: " << errFile << "]\n";
        return "";
    }

    std::filesystem::remove(errFile, ec);
    if (!writeTextFile(hashFile, key)) {
        std::cerr << "[Psynet][Plot] Could not store plot cache key in " << hashFile << "\n";
    }
    return outputFile;
}

std::string GnuplotEngine::heatmap(const std::string& id,
                                   const WeightMatrix& matrix,
                                   const std::string& title,
                                   const std::vector<std::string>& labels) {
    if (matrix.empty() || matrix.front().empty()) return "";

    std::ostringstream data;
    data << std::setprecision(10);
    for (size_t r = 0; r < matrix.size(); ++r) {
        for (size_t c = 0; c < matrix[r].size(); ++c) {
            data << c << " " << r << " " << matrix[r][c] << "\n";
        }
        data << "\n";
    }

    std::ostringstream script;
    script << styledHeader(id, title);
    script << "set view map\nunset key\nunset grid\n";
    script << "set size ratio -1\n";
    script << "set palette defined (-1 '#991b1b', 0 '#f3f4f6', 1 '#1e3a8a')\n";
    script << "set cbrange [-1:1]\n";
    script << "set xrange [-0.5:" << static_cast<double>(matrix.size()) - 0.5 << "]\n";
    script << "set yrange [" << static_cast<double>(matrix.size()) - 0.5 << ":-0.5]\n";
    if (!labels.empty() && labels.size() == matrix.size()) {
        script << "set xtics " << ticList(labels, 12) << " rotate by -45 font ',9'\n";
        script << "set ytics " << ticList(labels, 12) << " font ',9'\n";
    }
    script << "plot " << quoteForGnuplot(dataPath(id)) << " using 1:2:3 with image\n";
    return runScript(id, data.str(), script.str());
}

std::string GnuplotEngine::network(const std::string& id,
                                   const std::vector<std::string>& labels,
                                   const std::vector<std::string>& groups,
                                   const std::vector<NodePosition>& positions,
                                   const std::vector<WeightedEdge>& edges,
                                   const std::string& title) {
    if (labels.empty() || positions.size() != labels.size()) return "";

    double maxAbs = 0.0;
    for (const auto& e : edges) maxAbs = std::max(maxAbs, std::abs(e.weight));

    // Edges are binned by |w| so each block can carry a fixed line width.
    constexpr int kWidthBins = 6;
    std::vector<std::vector<const WeightedEdge*>> bins(kWidthBins);
    for (const auto& e : edges) {
        if (e.from >= positions.size() || e.to >= positions.size() || maxAbs <= 0.0) continue;
        const int bin = std::min(kWidthBins - 1, static_cast<int>(std::abs(e.weight) / maxAbs * kWidthBins));
        bins[static_cast<size_t>(bin)].push_back(&e);
    }

    std::vector<std::string> groupOrder;
    std::map<std::string, std::vector<size_t>> members;
    for (size_t i = 0; i < labels.size(); ++i) {
        const std::string g = (i < groups.size() && !groups[i].empty()) ? groups[i] : "Other";
        if (members.find(g) == members.end()) groupOrder.push_back(g);
        members[g].push_back(i);
    }

    std::ostringstream data;
    std::ostringstream plot;
    data << std::setprecision(8);
    size_t blockIndex = 0;
    const std::string path = quoteForGnuplot(dataPath(id));
    auto beginBlock = [&]() {
        if (blockIndex > 0) data << "\n\n";
        return blockIndex++;
    };

    for (int b = 0; b < kWidthBins; ++b) {
        if (bins[static_cast<size_t>(b)].empty()) continue;
        const size_t idx = beginBlock();
        for (const WeightedEdge* e : bins[static_cast<size_t>(b)]) {
            const NodePosition& p1 = positions[e->from];
            const NodePosition& p2 = positions[e->to];
            data << p1.x << " " << p1.y << " " << (p2.x - p1.x) << " " << (p2.y - p1.y) << " "
                 << rgbToInt(e->weight >= 0.0 ? kPositiveEdge : kNegativeEdge) << "\n";
        }
        const double lw = 0.6 + 1.2 * static_cast<double>(b + 1) * cfg_.lineWidth / 2.0;
        plot << (plot.tellp() > 0 ? ", \\\n     " : "") << path << " index " << idx
             << " using 1:2:3:4:5 with vectors nohead lw " << lw << " lc rgb variable notitle";
    }

    for (size_t g = 0; g < groupOrder.size(); ++g) {
        const size_t idx = beginBlock();
        for (size_t node : members[groupOrder[g]]) {
            data << positions[node].x << " " << positions[node].y << " " << quoteForDatafileString(shortLabel(labels[node], 12))
                 << "\n";
        }
        const std::string color = kGroupPalette[g % kGroupPalette.size()];
        plot << (plot.tellp() > 0 ? ", \\\n     " : "") << path << " index " << idx
             << " using 1:2 with points pt 7 ps " << 4.5 * cfg_.pointSize / 0.8 << " lc rgb " << quoteForGnuplot(color)
             << " title " << quoteForGnuplot(shortLabel(groupOrder[g], 24));
        plot << ", \\\n     " << path << " index " << idx << " using 1:2:3 with labels font ',9' notitle";
    }

    std::ostringstream script;
    script << styledHeader(id, title);
    script << "unset border\nunset tics\nunset grid\n";
    script << "set size ratio -1\n";
    script << "set xrange [-1.25:1.25]\nset yrange [-1.25:1.25]\n";
    script << "set key outside right top\n";
    script << "plot " << plot.str() << "\n";
    return runScript(id, data.str(), script.str());
}

std::string GnuplotEngine::centrality(const std::string& id,
                                      const std::vector<std::string>& items,
                                      const std::vector<std::string>& metricNames,
                                      const std::vector<std::vector<double>>& zScores,
                                      const std::string& title) {
    if (items.empty() || metricNames.empty() || zScores.size() != metricNames.size()) return "";
    for (const auto& series : zScores) {
        if (series.size() != items.size()) return "";
    }

    std::ostringstream data;
    data << std::setprecision(8);
    for (size_t i = 0; i < items.size(); ++i) {
        data << i;
        for (const auto& series : zScores) data << " " << (std::isfinite(series[i]) ? series[i] : 0.0);
        data << "\n";
    }

    double extent = 1.0;
    for (const auto& series : zScores) {
        for (double v : series) {
            if (std::isfinite(v)) extent = std::max(extent, std::abs(v));
        }
    }
    extent = std::ceil(extent * 1.1 * 2.0) / 2.0;

    std::ostringstream script;
    script << styledHeader(id, title);
    script << "unset title\nunset key\n";
    script << "set multiplot layout 1," << metricNames.size() << " title " << quoteForGnuplot(shortLabel(title, 120))
           << " font ',14'\n";
    script << "set xrange [" << -extent << ":" << extent << "]\n";
    script << "set yrange [" << static_cast<double>(items.size()) - 0.5 << ":-0.5]\n";
    script << "set xzeroaxis\n";
    for (size_t k = 0; k < metricNames.size(); ++k) {
        script << "set title " << quoteForGnuplot(shortLabel(metricNames[k], 24)) << " font ',11'\n";
        if (k == 0) {
            script << "set ytics " << ticList(items, 14) << " font ',9'\n";
        } else {
            script << "set ytics format ''\n";
        }
        script << "plot " << quoteForGnuplot(dataPath(id)) << " using " << (k + 2) << ":1 with linespoints ls 1\n";
    }
    script << "unset multiplot\n";
    return runScript(id, data.str(), script.str());
}

std::string GnuplotEngine::bootstrapIntervals(const std::string& id, const CiSeries& series, const std::string& title) {
    const size_t n = series.labels.size();
    if (n == 0 || series.sample.size() != n || series.mean.size() != n || series.lower.size() != n ||
        series.upper.size() != n) {
        return "";
    }

    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) { return series.sample[a] < series.sample[b]; });

    std::ostringstream data;
    data << std::setprecision(8);
    std::vector<std::string> sortedLabels;
    sortedLabels.reserve(n);
    for (size_t rank = 0; rank < n; ++rank) {
        const size_t i = order[rank];
        data << rank << " " << series.sample[i] << " " << series.lower[i] << " " << series.upper[i] << " "
             << series.mean[i] << "\n";
        sortedLabels.push_back(series.labels[i]);
    }

    const std::string path = quoteForGnuplot(dataPath(id));
    std::ostringstream script;
    script << styledHeader(id, title);
    script << "set xlabel 'Edge weight'\n";
    script << "set yrange [" << static_cast<double>(n) - 0.5 << ":-0.5]\n";
    script << "set xzeroaxis\n";
    if (n <= 60) {
        script << "set ytics " << ticList(sortedLabels, 16) << " font ',8'\n";
    } else {
        script << "set ytics format ''\n";
    }
    script << "set key bottom right\n";
    script << "plot " << path << " using 2:1:3:4 with xerrorbars ls 1 pt -1 title 'Bootstrap CI', \\\n"
           << "     " << path << " using 5:1 with points ls 2 title 'Bootstrap mean', \\\n"
           << "     " << path << " using 2:1 with points ls 3 title 'Sample'\n";
    return runScript(id, data.str(), script.str());
}
