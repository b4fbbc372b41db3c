#pragma once
#include <cstddef>
#include <string>
#include <vector>

// Square p x p matrix of edge weights. Correlation matrices carry 1 on the
// diagonal, network matrices carry 0.
using WeightMatrix = std::vector<std::vector<double>>;

struct WeightedEdge {
    size_t from;
    size_t to;
    double weight;
};

namespace NetworkGraph {
/**
 * @brief Converts a weight matrix to an edge list.
 * @post Undirected: one entry (i < j) per unordered pair with nonzero weight.
 * Directed: one entry per nonzero off-diagonal cell. Self-loops are never emitted.
 * @throws std::invalid_argument when the matrix is not square.
 */
std::vector<WeightedEdge> toEdgeList(const WeightMatrix& matrix, bool directed = false);

/**
 * @brief Inverse of toEdgeList. Weights are accumulated per cell, so duplicate
 * entries for the same (unordered, when undirected) pair are summed.
 * @throws std::invalid_argument when an endpoint is out of range.
 */
WeightMatrix fromEdgeList(const std::vector<WeightedEdge>& edges, size_t nodeCount, bool directed = false);

// View filter only: edges with |w| >= threshold, the matrix itself is untouched.
std::vector<WeightedEdge> visibleEdges(const WeightMatrix& matrix, double threshold);

bool isSquare(const WeightMatrix& matrix);
bool isSymmetric(const WeightMatrix& matrix, double tol = 1e-12);
size_t nonzeroEdgeCount(const WeightMatrix& matrix);
double density(const WeightMatrix& matrix);

std::string edgeLabel(const WeightedEdge& edge, const std::vector<std::string>& names);
} // namespace NetworkGraph
