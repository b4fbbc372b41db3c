#pragma once
#include "NetworkGraph.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct NodePosition {
    double x;
    double y;
};

enum class LayoutKind { Circle, Spring };

class NetworkLayout {
public:
    // Nodes evenly spaced on the unit circle, first node at the top.
    static std::vector<NodePosition> circle(size_t nodeCount);

    /**
     * @brief Fruchterman-Reingold layout with attraction scaled by |w|.
     * @post Coordinates are rescaled into [-1, 1]; the same seed gives the same layout.
     */
    static std::vector<NodePosition> spring(const WeightMatrix& weights, uint64_t seed = 1, size_t iterations = 500);

    static std::vector<NodePosition> compute(LayoutKind kind, const WeightMatrix& weights, uint64_t seed);

    static LayoutKind parse(const std::string& s);
};
