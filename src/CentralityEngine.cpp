#include "CentralityEngine.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <queue>
#include <stack>
#include <stdexcept>
#include <utility>

namespace {
constexpr double kInf = std::numeric_limits<double>::infinity();

// Relative tolerance when deciding two path lengths are tied.
bool nearlyEqual(double a, double b) {
    return std::abs(a - b) <= 1e-10 * std::max(1.0, std::max(std::abs(a), std::abs(b)));
}

void requireSquare(const WeightMatrix& weights) {
    if (!NetworkGraph::isSquare(weights)) throw std::invalid_argument("Centrality requires a square weight matrix.");
}
} // namespace

std::vector<double> CentralityEngine::strength(const WeightMatrix& weights) {
    requireSquare(weights);
    std::vector<double> out(weights.size(), 0.0);
    for (size_t i = 0; i < weights.size(); ++i) {
        for (size_t j = 0; j < weights.size(); ++j) {
            if (i != j) out[i] += std::abs(weights[i][j]);
        }
    }
    return out;
}

std::vector<double> CentralityEngine::expectedInfluence(const WeightMatrix& weights) {
    requireSquare(weights);
    std::vector<double> out(weights.size(), 0.0);
    for (size_t i = 0; i < weights.size(); ++i) {
        for (size_t j = 0; j < weights.size(); ++j) {
            if (i != j) out[i] += weights[i][j];
        }
    }
    return out;
}

std::vector<double> CentralityEngine::shortestDistances(const WeightMatrix& weights, size_t source) {
    requireSquare(weights);
    const size_t n = weights.size();
    std::vector<double> dist(n, kInf);
    if (source >= n) return dist;

    using Item = std::pair<double, size_t>;
    std::priority_queue<Item, std::vector<Item>, std::greater<Item>> pq;
    dist[source] = 0.0;
    pq.push({0.0, source});
    while (!pq.empty()) {
        const auto [d, u] = pq.top();
        pq.pop();
        if (d > dist[u]) continue;
        for (size_t v = 0; v < n; ++v) {
            if (v == u || weights[u][v] == 0.0) continue;
            const double nd = d + 1.0 / std::abs(weights[u][v]);
            if (nd < dist[v]) {
                dist[v] = nd;
                pq.push({nd, v});
            }
        }
    }
    return dist;
}

std::vector<double> CentralityEngine::closeness(const WeightMatrix& weights) {
    requireSquare(weights);
    const size_t n = weights.size();
    std::vector<double> out(n, 0.0);
    for (size_t s = 0; s < n; ++s) {
        const auto dist = shortestDistances(weights, s);
        // An unreachable node is infinitely far, so the mean distance is too.
        double sum = 0.0;
        for (size_t t = 0; t < n; ++t) {
            if (t != s) sum += dist[t];
        }
        out[s] = (n < 2 || !std::isfinite(sum) || sum <= 0.0) ? 0.0 : static_cast<double>(n - 1) / sum;
    }
    return out;
}

std::vector<double> CentralityEngine::betweenness(const WeightMatrix& weights) {
    requireSquare(weights);
    const size_t n = weights.size();
    std::vector<double> cb(n, 0.0);

    for (size_t s = 0; s < n; ++s) {
        std::vector<std::vector<size_t>> preds(n);
        std::vector<double> sigma(n, 0.0);
        std::vector<double> dist(n, kInf);
        std::stack<size_t> order;

        using Item = std::pair<double, size_t>;
        std::priority_queue<Item, std::vector<Item>, std::greater<Item>> pq;
        std::vector<bool> settled(n, false);
        sigma[s] = 1.0;
        dist[s] = 0.0;
        pq.push({0.0, s});

        while (!pq.empty()) {
            const auto [d, u] = pq.top();
            pq.pop();
            if (settled[u] || d > dist[u]) continue;
            settled[u] = true;
            order.push(u);
            for (size_t v = 0; v < n; ++v) {
                if (v == u || weights[u][v] == 0.0 || settled[v]) continue;
                const double nd = d + 1.0 / std::abs(weights[u][v]);
                if (dist[v] < kInf && nearlyEqual(nd, dist[v])) {
                    sigma[v] += sigma[u];
                    preds[v].push_back(u);
                } else if (nd < dist[v]) {
                    dist[v] = nd;
                    sigma[v] = sigma[u];
                    preds[v].assign(1, u);
                    pq.push({nd, v});
                }
            }
        }

        std::vector<double> delta(n, 0.0);
        while (!order.empty()) {
            const size_t w = order.top();
            order.pop();
            for (size_t v : preds[w]) {
                delta[v] += sigma[v] / sigma[w] * (1.0 + delta[w]);
            }
            if (w != s) cb[w] += delta[w];
        }
    }

    // Each unordered pair was visited from both ends.
    for (double& v : cb) v /= 2.0;
    return cb;
}

std::vector<double> CentralityEngine::zScores(const std::vector<double>& values) {
    std::vector<double> out(values.size(), 0.0);
    if (values.size() < 2) return out;
    double mean = 0.0;
    for (double v : values) mean += v;
    mean /= static_cast<double>(values.size());
    double ss = 0.0;
    for (double v : values) ss += (v - mean) * (v - mean);
    const double sd = std::sqrt(ss / static_cast<double>(values.size() - 1));
    if (!(sd > 0.0)) return out;
    for (size_t i = 0; i < values.size(); ++i) out[i] = (values[i] - mean) / sd;
    return out;
}

CentralityResult CentralityEngine::compute(const WeightMatrix& weights, const std::vector<std::string>& items) {
    requireSquare(weights);
    if (items.size() != weights.size()) {
        throw std::invalid_argument("Centrality item names do not match the weight matrix size.");
    }
    CentralityResult res;
    res.items = items;
    res.strength = strength(weights);
    res.closeness = closeness(weights);
    res.betweenness = betweenness(weights);
    res.expectedInfluence = expectedInfluence(weights);
    return res;
}
