#pragma once

#include "AutoConfig.h"

class AnalysisPipeline final {
public:
    /**
     * @brief Runs load, CFA, correlation, network, centrality and bootstrap in
     * order and writes the report with its assets.
     * @return 0 on success.
     * @throws Psynet::PsynetException subclasses on unrecoverable failures.
     */
    int run(const AutoConfig& config);
};
