#include "NetworkGraph.h"

#include <cmath>
#include <stdexcept>

namespace NetworkGraph {

bool isSquare(const WeightMatrix& matrix) {
    for (const auto& row : matrix) {
        if (row.size() != matrix.size()) return false;
    }
    return true;
}

bool isSymmetric(const WeightMatrix& matrix, double tol) {
    if (!isSquare(matrix)) return false;
    for (size_t i = 0; i < matrix.size(); ++i) {
        for (size_t j = i + 1; j < matrix.size(); ++j) {
            if (std::abs(matrix[i][j] - matrix[j][i]) > tol) return false;
        }
    }
    return true;
}

std::vector<WeightedEdge> toEdgeList(const WeightMatrix& matrix, bool directed) {
    if (!isSquare(matrix)) throw std::invalid_argument("Edge list requires a square weight matrix.");
    const size_t n = matrix.size();
    std::vector<WeightedEdge> edges;
    for (size_t i = 0; i < n; ++i) {
        const size_t start = directed ? 0 : i + 1;
        for (size_t j = start; j < n; ++j) {
            if (i == j) continue;
            const double w = matrix[i][j];
            if (w == 0.0) continue;
            edges.push_back({i, j, w});
        }
    }
    return edges;
}

WeightMatrix fromEdgeList(const std::vector<WeightedEdge>& edges, size_t nodeCount, bool directed) {
    WeightMatrix matrix(nodeCount, std::vector<double>(nodeCount, 0.0));
    for (const auto& e : edges) {
        if (e.from >= nodeCount || e.to >= nodeCount) {
            throw std::invalid_argument("Edge endpoint out of range: " + std::to_string(e.from) + " -> " +
                                        std::to_string(e.to));
        }
        if (e.from == e.to) continue;
        matrix[e.from][e.to] += e.weight;
        if (!directed) matrix[e.to][e.from] += e.weight;
    }
    return matrix;
}

std::vector<WeightedEdge> visibleEdges(const WeightMatrix& matrix, double threshold) {
    std::vector<WeightedEdge> out;
    for (const auto& e : toEdgeList(matrix, false)) {
        if (std::abs(e.weight) >= threshold) out.push_back(e);
    }
    return out;
}

size_t nonzeroEdgeCount(const WeightMatrix& matrix) {
    return toEdgeList(matrix, false).size();
}

double density(const WeightMatrix& matrix) {
    const size_t n = matrix.size();
    if (n < 2) return 0.0;
    const double possible = static_cast<double>(n) * static_cast<double>(n - 1) / 2.0;
    return static_cast<double>(nonzeroEdgeCount(matrix)) / possible;
}

std::string edgeLabel(const WeightedEdge& edge, const std::vector<std::string>& names) {
    auto nameOf = [&](size_t idx) {
        return idx < names.size() ? names[idx] : std::to_string(idx + 1);
    };
    return nameOf(edge.from) + " -- " + nameOf(edge.to);
}

} // namespace NetworkGraph
