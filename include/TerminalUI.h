#pragma once
#include "Bootstrapper.h"
#include "CentralityEngine.h"
#include "FactorAnalysis.h"
#include "ItemDataset.h"
#include "NetworkEstimator.h"
#include "Statistics.h"
#include <vector>
#include <string>

class TerminalUI {
public:
    static void printMissingDataReport(const MissingDataReport& report);
    static void printDescriptiveTable(const std::vector<std::string>& itemNames, const std::vector<ColumnStats>& stats);

    static void printCorrelationMatrix(const std::vector<std::string>& itemNames, const std::vector<std::vector<double>>& matrix);
    static void printCfaSummary(const CfaResult& result);
    static void printNetworkSummary(const NetworkModel& model, double threshold);
    static void printCentralityTable(const CentralityResult& result);

    // Top `limit` edges by |sample weight|.
    static void printBootstrapSummary(const BootstrapResult& result, size_t limit = 15);
};
