#pragma once
#include "AutoConfig.h"
#include "NetworkGraph.h"
#include "NetworkLayout.h"
#include <string>
#include <vector>

class GnuplotEngine {
public:
    struct CiSeries {
        std::vector<std::string> labels;
        std::vector<double> sample;
        std::vector<double> mean;
        std::vector<double> lower;
        std::vector<double> upper;
    };

    /**
     * @brief Initializes plotting backend and asset directory.
     * @post assets directory is created if possible.
     */
    GnuplotEngine(std::string assetsDir, PlotConfig cfg);

    /**
     * @brief Checks whether gnuplot executable is available in PATH.
     */
    bool isAvailable() const;

    /**
     * @brief Generates heatmap image with a fixed [-1, 1] colour range.
     * @post Returns output image path, or empty string on generation failure.
     */
    std::string heatmap(const std::string& id,
                        const WeightMatrix& matrix,
                        const std::string& title,
                        const std::vector<std::string>& labels = {});

    /**
     * @brief Draws a weighted network: nodes coloured by group, edge colour by
     * sign and width by |w|. Only the edges passed in are drawn.
     */
    std::string network(const std::string& id,
                        const std::vector<std::string>& labels,
                        const std::vector<std::string>& groups,
                        const std::vector<NodePosition>& positions,
                        const std::vector<WeightedEdge>& edges,
                        const std::string& title);

    /**
     * @brief One panel per metric, items on the y axis, standardized values on x.
     */
    std::string centrality(const std::string& id,
                           const std::vector<std::string>& items,
                           const std::vector<std::string>& metricNames,
                           const std::vector<std::vector<double>>& zScores,
                           const std::string& title);

    /**
     * @brief Bootstrap interval per edge, sorted by sample weight.
     */
    std::string bootstrapIntervals(const std::string& id, const CiSeries& series, const std::string& title);

private:
    std::string assetsDir_;
    PlotConfig cfg_;

    static std::string sanitizeId(const std::string& id);
    static std::string quoteForGnuplot(const std::string& value);
    static std::string terminalForFormat(const std::string& format, int width, int height);
    std::string styledHeader(const std::string& id, const std::string& title) const;
    std::string dataPath(const std::string& id) const;
    std::string outputPath(const std::string& id) const;
    std::string runScript(const std::string& id, const std::string& dataContent, const std::string& scriptContent);
};
