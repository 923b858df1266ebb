/**
 * @file ClusterLabeler.hpp
 * @brief Keyword labels for clusters: class-based TF-IDF filtered by MMR.
 */

#pragma once

#include <map>
#include <string>
#include <vector>

#include "domain/EngineConfig.hpp"

namespace notedrift::application {

class ClusterLabeler {
public:
    explicit ClusterLabeler(const domain::ClusteringConfig& config);

    /**
     * @brief Picks label terms for every cluster.
     * @param clusterTexts Cluster id to the texts of its members (title + content prefix).
     * @return Cluster id to selected terms, most relevant first. Empty when nothing scored.
     */
    std::map<int, std::vector<std::string>> label(const std::map<int, std::vector<std::string>>& clusterTexts) const;

    /** @brief "a, b, c", or "Cluster N" when no terms were found. */
    static std::string JoinTerms(int clusterId, const std::vector<std::string>& terms);

    /** @brief "Notes about a", "Notes about a and b", "Notes about a, b, and c". */
    static std::string FormatLabel(int clusterId, const std::vector<std::string>& terms);

    /** @brief Lowercased word tokens of two or more characters with stop words removed. */
    static std::vector<std::string> Tokenize(const std::string& text);

    /**
     * @brief Maximal marginal relevance over candidate terms.
     *
     * Diversity is the Jaccard overlap of the words of two terms, so "memory"
     * and "memory palace" compete while "memory" and "sleep" do not.
     */
    static std::vector<std::string> SelectDiverse(const std::vector<std::string>& terms,
                                                  const std::vector<double>& scores,
                                                  double lambda,
                                                  std::size_t k);

private:
    domain::ClusteringConfig m_config;
};

} // namespace notedrift::application
