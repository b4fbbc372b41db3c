#include "AutoConfig.h"
#include "CommonUtils.h"
#include "NetworkEstimator.h"
#include "PsynetExceptions.h"
#include <algorithm>
#include <fstream>
#include <limits>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Psynet::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Psynet::PsynetException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Psynet::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

// Tracks double-quoted spans (with backslash escapes) while a line is scanned.
struct QuoteState {
    bool inQuotes = false;
    bool escaped = false;

    // True when ch is structural, i.e. outside quotes and not escaped.
    bool structural(char ch) {
        if (escaped) {
            escaped = false;
            return false;
        }
        if (ch == '\\') {
            escaped = true;
            return false;
        }
        if (ch == '"') {
            inQuotes = !inQuotes;
            return false;
        }
        return !inQuotes;
    }
};

// Drops JSON braces and a trailing comma so that JSON objects read as "key": value lines.
std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());
    QuoteState state;
    for (char c : line) {
        if (state.structural(c) && (c == '{' || c == '}')) continue;
        out.push_back(c);
    }
    const size_t last = out.find_last_not_of(" \t\r\n");
    if (last != std::string::npos && out[last] == ',') out.erase(last, 1);
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    QuoteState state;
    for (size_t i = 0; i < line.size(); ++i) {
        if (state.structural(line[i]) && line[i] == sep) return i;
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// Factor names keep their case; every other key is lower-cased with '-' mapped to '_'.
std::string normalizeConfigKey(std::string key) {
    key = CommonUtils::trim(key);
    const std::string lowered = CommonUtils::toLower(key);
    if (lowered.rfind("factor.", 0) == 0) {
        return "factor." + CommonUtils::trim(key.substr(7));
    }
    std::string out = lowered;
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue) {
    int parsed = parseNumericStrict<int>(
        value,
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoi(v, pos); });
    if (parsed < minValue) {
        throw Psynet::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

uint64_t parseUIntStrict(const std::string& value, const std::string& key) {
    if (!value.empty() && value.front() == '-') {
        throw Psynet::ConfigurationException("Invalid unsigned integer for " + key + ": " + value);
    }
    return parseNumericStrict<unsigned long long>(
        value,
        key,
        "Invalid unsigned integer for ",
        [](const std::string& v, size_t* pos) { return std::stoull(v, pos); });
}

double parseDoubleStrict(const std::string& value, const std::string& key, double minValue) {
    double parsed = parseNumericStrict<double>(
        value,
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
    if (parsed < minValue) {
        throw Psynet::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Psynet::ConfigurationException("Invalid boolean for " + key + ": " + value);
}
} // namespace

void AutoConfig::assign(const std::string& key, const std::string& value) {
    if (key.rfind("factor.", 0) == 0) {
        const std::string name = key.substr(7);
        if (name.empty()) throw Psynet::ConfigurationException("factor.<Name> requires a non-empty factor name");
        if (!factorModelExplicit) {
            factorModel.factors.clear();
            factorModelExplicit = true;
        }
        auto it = std::find_if(factorModel.factors.begin(), factorModel.factors.end(),
                               [&](const FactorDefinition& f) { return f.name == name; });
        if (it == factorModel.factors.end()) {
            factorModel.factors.push_back({name, CommonUtils::splitList(value)});
        } else {
            it->items = CommonUtils::splitList(value);
        }
        return;
    }
    if (key == "delimiter") {
        const std::string v = (value == "\\t" || CommonUtils::toLower(value) == "tab") ? "\t" : value;
        if (v.size() != 1) throw Psynet::ConfigurationException("delimiter expects a single character");
        delimiter = v[0];
        return;
    }

    if (key == "dataset") { datasetPath = value; return; }
    if (key == "report") { reportFile = value; return; }
    if (key == "assets_dir") { assetsDir = value; return; }
    if (key == "items") { items = CommonUtils::splitList(value); return; }
    // Aliases (glasso, bh) are stored under their canonical names.
    if (key == "estimator") { estimator = NetworkEstimator::toString(NetworkEstimator::parseEstimator(value)); return; }
    if (key == "prune") { prune = NetworkEstimator::toString(NetworkEstimator::parsePruneMode(value)); return; }
    if (key == "adjust") { adjust = NetworkEstimator::toString(NetworkEstimator::parseAdjust(value)); return; }
    if (key == "layout") { layout = CommonUtils::toLower(value); return; }
    if (key == "plot_format") { plot.format = CommonUtils::toLower(value); return; }
    if (key == "plot_theme") { plot.theme = CommonUtils::toLower(value); return; }
    if (key == "alpha") { alpha = parseDoubleStrict(value, key, 0.0); return; }
    if (key == "threshold") { threshold = parseDoubleStrict(value, key, 0.0); return; }
    if (key == "gamma") { gamma = parseDoubleStrict(value, key, 0.0); return; }
    if (key == "ci_level") { ciLevel = parseDoubleStrict(value, key, 0.0); return; }
    if (key == "cfa_tolerance") { cfaTolerance = parseDoubleStrict(value, key, 0.0); return; }
    if (key == "plot_point_size") { plot.pointSize = parseDoubleStrict(value, key, 0.1); return; }
    if (key == "plot_line_width") { plot.lineWidth = parseDoubleStrict(value, key, 0.1); return; }
    if (key == "bootstrap_samples") {
        bootstrapSamples = static_cast<size_t>(parseIntStrict(value, key, 1));
        return;
    }
    if (key == "workers") { workers = parseIntStrict(value, key, 0); return; }
    if (key == "cfa_max_iterations") { cfaMaxIterations = parseIntStrict(value, key, 1); return; }
    if (key == "plot_width") { plot.width = parseIntStrict(value, key, 320); return; }
    if (key == "plot_height") { plot.height = parseIntStrict(value, key, 240); return; }
    if (key == "seed") { seed = parseUIntStrict(value, key); return; }
    if (key == "plots") { plots = parseBoolStrict(value, key); return; }
    if (key == "plot_grid") { plot.showGrid = parseBoolStrict(value, key); return; }
    if (key == "generate_html") { generateHtml = parseBoolStrict(value, key); return; }
    if (key == "verbose") { verbose = parseBoolStrict(value, key); return; }
    if (key == "cfa") { runCfa = parseBoolStrict(value, key); return; }

    throw Psynet::ConfigurationException("Unknown option: " + key);
}

std::string AutoConfig::usage() {
    return "Usage: psynet <dataset.csv> [--config path] [--report file.md] [--assets-dir dir] [--delimiter ,] "
           "[--items A1,A2,...] [--factor.<Name> item,item,...] [--cfa true|false] "
           "[--estimator cor|pcor|ebicglasso] [--prune none|sig] [--alpha 0..1] "
           "[--adjust none|holm|bonferroni|fdr] [--threshold >=0] [--gamma >=0] "
           "[--bootstrap-samples N] [--workers N] [--seed N] [--ci-level 0..1] "
           "[--cfa-max-iterations N] [--cfa-tolerance >0] [--layout spring|circle] [--plots true|false] "
           "[--plot-format png|svg|pdf] [--plot-width N] [--plot-height N] [--plot-theme light|dark] "
           "[--plot-grid true|false] [--generate-html true|false] [--verbose true|false]";
}

AutoConfig AutoConfig::fromArgs(int argc, char* argv[]) {
    if (argc < 2 || std::string(argv[1]).rfind("--", 0) == 0) {
        throw Psynet::ConfigurationException(usage());
    }

    AutoConfig config;
    config.datasetPath = argv[1];

    std::vector<std::pair<std::string, std::string>> flags;
    std::string configPath;
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            throw Psynet::ConfigurationException("Unexpected argument: " + arg);
        }
        if (i + 1 >= argc) {
            throw Psynet::ConfigurationException(arg + " expects a value");
        }
        const std::string key = normalizeConfigKey(arg.substr(2));
        const std::string value = argv[++i];
        if (key == "config") {
            configPath = value;
        } else {
            flags.emplace_back(key, value);
        }
    }

    if (!configPath.empty()) {
        config = fromFile(configPath, config);
        config.datasetPath = argv[1];
    }
    for (const auto& [key, value] : flags) {
        config.assign(key, value);
    }

    config.validate();
    return config;
}

AutoConfig AutoConfig::fromFile(const std::string& configPath, const AutoConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Psynet::ConfigurationException("Could not open config file: " + configPath);

    AutoConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        // Support loose YAML (key: value) and loose JSON-ish ("key": "value",)
        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) {
            throw Psynet::ConfigurationException("Config parse error at line " + std::to_string(lineNo) +
                                                 ": expected 'key: value', got '" + line + "'");
        }

        const std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        const std::string value = maybeUnquote(line.substr(sep + 1));

        try {
            config.assign(key, value);
        } catch (const Psynet::PsynetException& ex) {
            throw Psynet::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    config.validate();

    return config;
}

void AutoConfig::validate() const {
    if (datasetPath.empty()) {
        throw Psynet::ConfigurationException("dataset path is required");
    }

    const auto isIn = [](const std::string& value, const std::vector<std::string>& allowed) {
        return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
    };

    // Same parsers as the estimator, so every accepted spelling runs.
    NetworkEstimator::parseEstimator(estimator);
    NetworkEstimator::parsePruneMode(prune);
    NetworkEstimator::parseAdjust(adjust);
    if (!isIn(layout, {"spring", "circle"})) {
        throw Psynet::ConfigurationException("layout must be one of: spring, circle");
    }
    if (!isIn(plot.format, {"png", "svg", "pdf"})) {
        throw Psynet::ConfigurationException("plot_format must be one of: png, svg, pdf");
    }
    if (!isIn(plot.theme, {"light", "dark"})) {
        throw Psynet::ConfigurationException("plot_theme must be one of: light, dark");
    }
    if (!(alpha > 0.0 && alpha < 1.0)) {
        throw Psynet::ConfigurationException("alpha must be within (0,1)");
    }
    if (!(ciLevel > 0.0 && ciLevel < 1.0)) {
        throw Psynet::ConfigurationException("ci_level must be within (0,1)");
    }
    if (threshold < 0.0 || threshold > 1.0) {
        throw Psynet::ConfigurationException("threshold must be within [0,1]");
    }
    if (gamma < 0.0 || gamma > 1.0) {
        throw Psynet::ConfigurationException("gamma must be within [0,1]");
    }
    if (bootstrapSamples == 0) {
        throw Psynet::ConfigurationException("bootstrap_samples must be >= 1");
    }
    if (!(cfaTolerance > 0.0)) {
        throw Psynet::ConfigurationException("cfa_tolerance must be > 0");
    }
    if (reportFile.empty() || assetsDir.empty()) {
        throw Psynet::ConfigurationException("report and assets_dir must be non-empty");
    }
    if (runCfa) {
        factorModel.validate();
    }
}
