#pragma once
#include "NetworkGraph.h"

#include <string>
#include <vector>

struct CentralityResult {
    std::vector<std::string> items;
    std::vector<double> strength;
    std::vector<double> closeness;
    std::vector<double> betweenness;
    std::vector<double> expectedInfluence;
};

class CentralityEngine {
public:
    /**
     * @brief All four node metrics for an undirected weighted network.
     * @details Zero entries are absent edges, so pruned edges never contribute.
     * @throws std::invalid_argument when the matrix is not square or items has the wrong size.
     */
    static CentralityResult compute(const WeightMatrix& weights, const std::vector<std::string>& items);

    static std::vector<double> strength(const WeightMatrix& weights);
    static std::vector<double> expectedInfluence(const WeightMatrix& weights);

    // Dijkstra distances with edge length 1/|w|; +inf for unreachable nodes.
    static std::vector<double> shortestDistances(const WeightMatrix& weights, size_t source);

    // 1 / mean distance to reachable nodes; 0 for isolated nodes.
    static std::vector<double> closeness(const WeightMatrix& weights);

    // Brandes path counting; each unordered pair of other nodes counted once.
    static std::vector<double> betweenness(const WeightMatrix& weights);

    // (x - mean) / sd with the n - 1 divisor; all zeros when sd is zero.
    static std::vector<double> zScores(const std::vector<double>& values);
};
