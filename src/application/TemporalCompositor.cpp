#include "application/TemporalCompositor.hpp"

#include <cmath>

#include "domain/Errors.hpp"

namespace notedrift::application {

namespace {
constexpr double kTwoPi = 6.283185307179586;
constexpr double kDaysPerYear = 365.0;
}

TemporalCompositor::TemporalCompositor(const domain::EmbeddingConfig& config)
    : m_semanticWeight(config.semanticWeight), m_skewToleranceDays(config.ageSkewToleranceDays) {}

TemporalFeatures TemporalCompositor::features(std::int64_t noteCreated, const domain::CalendarDate& sessionDate) const {
    // Whole days, floored, measured from session midnight.
    std::int64_t diff = sessionDate.toEpochSeconds() - noteCreated;
    std::int64_t ageDays = diff / 86400;
    if (diff % 86400 < 0) --ageDays;

    if (ageDays < -static_cast<std::int64_t>(m_skewToleranceDays)) {
        throw domain::ClockSkewError("note created " + std::to_string(-ageDays) + " days after session " +
                                     sessionDate.toString());
    }

    domain::CalendarDate created = domain::CalendarDate::fromEpochSeconds(noteCreated);
    TemporalFeatures f;
    f.ageYears = static_cast<double>(ageDays) / kDaysPerYear;
    f.creationSeason = std::sin(kTwoPi * created.dayOfYear() / kDaysPerYear);
    f.sessionSeason = std::sin(kTwoPi * sessionDate.dayOfYear() / kDaysPerYear);
    return f;
}

domain::Vector TemporalCompositor::compose(const domain::Vector& semantic,
                                           std::int64_t noteCreated,
                                           const domain::CalendarDate& sessionDate) const {
    TemporalFeatures f = features(noteCreated, sessionDate);
    const double temporalWeight = 1.0 - m_semanticWeight;

    domain::Vector out;
    out.reserve(semantic.size() + domain::kTemporalFeatureCount);
    for (float v : semantic) {
        out.push_back(static_cast<float>(static_cast<double>(v) * m_semanticWeight));
    }
    out.push_back(static_cast<float>(f.ageYears * temporalWeight));
    out.push_back(static_cast<float>(f.creationSeason * temporalWeight));
    out.push_back(static_cast<float>(f.sessionSeason * temporalWeight));
    return out;
}

domain::Vector TemporalCompositor::semanticPart(const domain::Vector& composed) {
    if (composed.size() <= domain::kTemporalFeatureCount) return {};
    domain::Vector head(composed.begin(), composed.end() - static_cast<std::ptrdiff_t>(domain::kTemporalFeatureCount));
    return domain::Normalized(head);
}

} // namespace notedrift::application
