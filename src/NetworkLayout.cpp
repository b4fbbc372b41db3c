#include "NetworkLayout.h"
#include "CommonUtils.h"
#include "PsynetExceptions.h"
#include <algorithm>
#include <cmath>
#include <random>

std::vector<NodePosition> NetworkLayout::circle(size_t nodeCount) {
    std::vector<NodePosition> pos(nodeCount, NodePosition{0.0, 0.0});
    if (nodeCount <= 1) return pos;
    for (size_t i = 0; i < nodeCount; ++i) {
        const double angle = M_PI / 2.0 - 2.0 * M_PI * static_cast<double>(i) / static_cast<double>(nodeCount);
        pos[i] = {std::cos(angle), std::sin(angle)};
    }
    return pos;
}

std::vector<NodePosition> NetworkLayout::spring(const WeightMatrix& weights, uint64_t seed, size_t iterations) {
    const size_t n = weights.size();
    if (n <= 1) return circle(n);

    double maxW = 0.0;
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) maxW = std::max(maxW, std::abs(weights[i][j]));
    }

    // Start from a slightly jittered circle so disconnected nodes stay spread out.
    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<double> jitter(-0.05, 0.05);
    std::vector<NodePosition> pos = circle(n);
    for (auto& p : pos) {
        p.x += jitter(rng);
        p.y += jitter(rng);
    }

    const double area = 4.0;
    const double k = std::sqrt(area / static_cast<double>(n));
    double temperature = 0.2;
    const double cooling = temperature / static_cast<double>(std::max<size_t>(iterations, 1));

    std::vector<NodePosition> disp(n);
    for (size_t iter = 0; iter < iterations; ++iter) {
        std::fill(disp.begin(), disp.end(), NodePosition{0.0, 0.0});
        for (size_t i = 0; i < n; ++i) {
            for (size_t j = i + 1; j < n; ++j) {
                double dx = pos[i].x - pos[j].x;
                double dy = pos[i].y - pos[j].y;
                double dist = std::sqrt(dx * dx + dy * dy);
                if (dist < 1e-9) {
                    dx = jitter(rng);
                    dy = jitter(rng);
                    dist = std::sqrt(dx * dx + dy * dy) + 1e-9;
                }
                double force = k * k / dist;
                if (maxW > 0.0 && weights[i][j] != 0.0) {
                    force -= (std::abs(weights[i][j]) / maxW) * dist * dist / k;
                }
                const double fx = dx / dist * force;
                const double fy = dy / dist * force;
                disp[i].x += fx;
                disp[i].y += fy;
                disp[j].x -= fx;
                disp[j].y -= fy;
            }
        }
        for (size_t i = 0; i < n; ++i) {
            const double len = std::sqrt(disp[i].x * disp[i].x + disp[i].y * disp[i].y);
            if (len <= 0.0) continue;
            const double capped = std::min(len, temperature);
            pos[i].x += disp[i].x / len * capped;
            pos[i].y += disp[i].y / len * capped;
        }
        temperature = std::max(temperature - cooling, 1e-4);
    }

    double cx = 0.0;
    double cy = 0.0;
    for (const auto& p : pos) {
        cx += p.x;
        cy += p.y;
    }
    cx /= static_cast<double>(n);
    cy /= static_cast<double>(n);
    double extent = 0.0;
    for (auto& p : pos) {
        p.x -= cx;
        p.y -= cy;
        extent = std::max({extent, std::abs(p.x), std::abs(p.y)});
    }
    if (extent > 0.0) {
        for (auto& p : pos) {
            p.x /= extent;
            p.y /= extent;
        }
    }
    return pos;
}

std::vector<NodePosition> NetworkLayout::compute(LayoutKind kind, const WeightMatrix& weights, uint64_t seed) {
    return kind == LayoutKind::Circle ? circle(weights.size()) : spring(weights, seed);
}

LayoutKind NetworkLayout::parse(const std::string& s) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(s));
    if (v == "circle") return LayoutKind::Circle;
    if (v == "spring") return LayoutKind::Spring;
    throw Psynet::ConfigurationException("layout must be spring or circle, got '" + s + "'");
}
