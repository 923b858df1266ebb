/**
 * @file TemporalCompositor.hpp
 * @brief Appends time features to a semantic vector for one session.
 */

#pragma once

#include <cstdint>

#include "domain/CalendarDate.hpp"
#include "domain/Embedding.hpp"
#include "domain/EngineConfig.hpp"

namespace notedrift::application {

/**
 * @struct TemporalFeatures
 * @brief The three session-dependent scalars.
 */
struct TemporalFeatures {
    double ageYears = 0.0;        ///< (session - created) in whole days / 365.
    double creationSeason = 0.0;  ///< sin(2*pi*doy(created)/365).
    double sessionSeason = 0.0;   ///< sin(2*pi*doy(session)/365).
};

/**
 * @class TemporalCompositor
 * @brief Stateless; recomputed for every session, never cached.
 */
class TemporalCompositor {
public:
    explicit TemporalCompositor(const domain::EmbeddingConfig& config);

    /**
     * @brief Computes the time features of a note at a session date.
     * @throws domain::ClockSkewError when the note postdates the session beyond tolerance.
     */
    TemporalFeatures features(std::int64_t noteCreated, const domain::CalendarDate& sessionDate) const;

    /**
     * @brief semantic * w followed by features * (1 - w), w being the semantic weight.
     * @param semantic L2-normalized semantic vector from the SemanticCache.
     */
    domain::Vector compose(const domain::Vector& semantic,
                           std::int64_t noteCreated,
                           const domain::CalendarDate& sessionDate) const;

    /** @brief The semantic part of a composed embedding, undoing the weight. */
    static domain::Vector semanticPart(const domain::Vector& composed);

private:
    double m_semanticWeight;
    int m_skewToleranceDays;
};

} // namespace notedrift::application
