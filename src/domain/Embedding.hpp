/**
 * @file Embedding.hpp
 * @brief Vector type and the small amount of linear algebra the engine needs.
 */

#pragma once

#include <cmath>
#include <cstddef>
#include <vector>

namespace notedrift::domain {

using Vector = std::vector<float>;

/// Age, creation season, session season.
constexpr std::size_t kTemporalFeatureCount = 3;

inline double Dot(const Vector& a, const Vector& b) {
    if (a.size() != b.size()) return 0.0;
    double acc = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        acc += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    }
    return acc;
}

inline double Norm(const Vector& v) {
    return std::sqrt(Dot(v, v));
}

/** @brief Cosine similarity in [-1, 1]; 0 for empty, mismatched or zero vectors. */
inline double Cosine(const Vector& a, const Vector& b) {
    if (a.empty() || a.size() != b.size()) return 0.0;
    double na = Norm(a);
    double nb = Norm(b);
    if (na <= 0.0 || nb <= 0.0) return 0.0;
    return Dot(a, b) / (na * nb);
}

inline double EuclideanDistance(const Vector& a, const Vector& b) {
    double acc = 0.0;
    std::size_t n = a.size() < b.size() ? a.size() : b.size();
    for (std::size_t i = 0; i < n; ++i) {
        double d = static_cast<double>(a[i]) - static_cast<double>(b[i]);
        acc += d * d;
    }
    return std::sqrt(acc);
}

/** @brief Returns v / |v|, or v unchanged when |v| is zero. */
inline Vector Normalized(const Vector& v) {
    double n = Norm(v);
    if (n <= 0.0) return v;
    Vector out(v.size());
    for (std::size_t i = 0; i < v.size(); ++i) {
        out[i] = static_cast<float>(static_cast<double>(v[i]) / n);
    }
    return out;
}

} // namespace notedrift::domain
