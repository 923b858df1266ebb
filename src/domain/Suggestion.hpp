/**
 * @file Suggestion.hpp
 * @brief Output of a detector.
 */

#pragma once

#include <string>
#include <vector>

namespace notedrift::domain {

/**
 * @struct Suggestion
 * @brief A provocation pointing at one or more notes.
 */
struct Suggestion {
    std::string text;
    std::vector<std::string> noteIds; ///< Notes the text refers to.
    std::string detectorId;
    double score = 0.0;               ///< Detector-specific strength, used for ordering only.
};

} // namespace notedrift::domain
