#include "application/ClusterLabeler.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace notedrift::application {

namespace {

const std::unordered_set<std::string>& stopWords() {
    static const std::unordered_set<std::string> kStopWords = {
        "a", "about", "above", "after", "again", "against", "all", "also", "am", "an", "and", "any", "are",
        "as", "at", "be", "because", "been", "before", "being", "below", "between", "both", "but", "by",
        "can", "cannot", "could", "did", "do", "does", "doing", "done", "down", "during", "each", "either",
        "else", "etc", "even", "ever", "every", "few", "for", "from", "further", "get", "had", "has", "have",
        "having", "he", "her", "here", "hers", "herself", "him", "himself", "his", "how", "however", "if",
        "in", "into", "is", "it", "its", "itself", "just", "least", "less", "made", "many", "may", "me",
        "might", "more", "most", "much", "must", "my", "myself", "neither", "no", "nor", "not", "now", "of",
        "off", "often", "on", "once", "one", "only", "or", "other", "others", "otherwise", "our", "ours",
        "ourselves", "out", "over", "own", "per", "perhaps", "rather", "same", "see", "seem", "seemed",
        "seems", "several", "she", "should", "since", "so", "some", "still", "such", "than", "that", "the",
        "their", "theirs", "them", "themselves", "then", "there", "therefore", "these", "they", "this",
        "those", "though", "through", "thus", "to", "together", "too", "toward", "towards", "under", "until",
        "up", "upon", "us", "very", "via", "was", "we", "well", "were", "what", "whatever", "when", "whence",
        "whenever", "where", "whereas", "whether", "which", "while", "who", "whoever", "whole", "whom",
        "whose", "why", "will", "with", "within", "without", "would", "yet", "you", "your", "yours",
        "yourself", "yourselves"};
    return kStopWords;
}

std::set<std::string> wordsOf(const std::string& term) {
    std::set<std::string> words;
    std::istringstream in(term);
    std::string w;
    while (in >> w) words.insert(w);
    return words;
}

} // namespace

ClusterLabeler::ClusterLabeler(const domain::ClusteringConfig& config) : m_config(config) {}

std::vector<std::string> ClusterLabeler::Tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    auto flush = [&]() {
        if (current.size() >= 2 && !stopWords().count(current)) tokens.push_back(current);
        current.clear();
    };
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '_' || c >= 0x80) {
            current.push_back(static_cast<char>(c >= 0x80 ? c : std::tolower(c)));
        } else {
            flush();
        }
    }
    flush();
    return tokens;
}

std::map<int, std::vector<std::string>> ClusterLabeler::label(
    const std::map<int, std::vector<std::string>>& clusterTexts) const {
    // One document per cluster; unigram and bigram counts.
    std::vector<int> ids;
    std::vector<std::unordered_map<std::string, double>> counts;
    std::unordered_map<std::string, double> corpusFrequency;
    for (const auto& [id, texts] : clusterTexts) {
        std::unordered_map<std::string, double> tf;
        for (const auto& text : texts) {
            auto tokens = Tokenize(text);
            for (std::size_t i = 0; i < tokens.size(); ++i) {
                tf[tokens[i]] += 1.0;
                if (i + 1 < tokens.size()) tf[tokens[i] + " " + tokens[i + 1]] += 1.0;
            }
        }
        for (const auto& [term, n] : tf) corpusFrequency[term] += n;
        ids.push_back(id);
        counts.push_back(std::move(tf));
    }

    // Vocabulary restricted to the most frequent terms across all clusters.
    std::vector<std::pair<std::string, double>> vocab(corpusFrequency.begin(), corpusFrequency.end());
    std::sort(vocab.begin(), vocab.end(), [](const auto& x, const auto& y) {
        if (x.second != y.second) return x.second > y.second;
        return x.first < y.first;
    });
    if (vocab.size() > m_config.labelMaxFeatures) vocab.resize(m_config.labelMaxFeatures);

    const double docs = static_cast<double>(ids.size());
    // Ordered so score normalization sums in the same order everywhere.
    std::map<std::string, double> idf;
    for (const auto& [term, freq] : vocab) {
        double df = 0.0;
        for (const auto& tf : counts) {
            if (tf.count(term)) df += 1.0;
        }
        idf[term] = std::log((1.0 + docs) / (1.0 + df)) + 1.0;
    }

    std::map<int, std::vector<std::string>> out;
    for (std::size_t d = 0; d < ids.size(); ++d) {
        std::vector<std::pair<std::string, double>> scored;
        double norm = 0.0;
        for (const auto& [term, weight] : idf) {
            auto it = counts[d].find(term);
            if (it == counts[d].end()) continue;
            double score = it->second * weight;
            norm += score * score;
            scored.emplace_back(term, score);
        }
        norm = std::sqrt(norm);
        if (norm > 0.0) {
            for (auto& entry : scored) entry.second /= norm;
        }
        std::sort(scored.begin(), scored.end(), [](const auto& x, const auto& y) {
            if (x.second != y.second) return x.second > y.second;
            return x.first < y.first;
        });
        if (scored.size() > m_config.labelCandidates) scored.resize(m_config.labelCandidates);

        std::vector<std::string> terms;
        std::vector<double> scores;
        for (const auto& [term, score] : scored) {
            terms.push_back(term);
            scores.push_back(score);
        }
        out[ids[d]] = SelectDiverse(terms, scores, m_config.mmrLambda, m_config.labelTerms);
    }
    return out;
}

std::vector<std::string> ClusterLabeler::SelectDiverse(const std::vector<std::string>& terms,
                                                       const std::vector<double>& scores,
                                                       double lambda,
                                                       std::size_t k) {
    std::vector<std::string> selected;
    std::vector<std::set<std::string>> selectedWords;
    std::vector<bool> used(terms.size(), false);

    while (selected.size() < k && selected.size() < terms.size()) {
        double bestScore = 0.0;
        std::size_t best = terms.size();
        for (std::size_t i = 0; i < terms.size(); ++i) {
            if (used[i]) continue;
            auto words = wordsOf(terms[i]);
            double penalty = 0.0;
            for (const auto& sel : selectedWords) {
                std::size_t shared = 0;
                for (const auto& w : words) shared += sel.count(w);
                std::size_t unionSize = words.size() + sel.size() - shared;
                if (unionSize > 0) penalty = std::max(penalty, static_cast<double>(shared) / unionSize);
            }
            double mmr = lambda * scores[i] - (1.0 - lambda) * penalty;
            if (best == terms.size() || mmr > bestScore) {
                bestScore = mmr;
                best = i;
            }
        }
        if (best == terms.size()) break;
        used[best] = true;
        selected.push_back(terms[best]);
        selectedWords.push_back(wordsOf(terms[best]));
    }
    return selected;
}

std::string ClusterLabeler::JoinTerms(int clusterId, const std::vector<std::string>& terms) {
    if (terms.empty()) return "Cluster " + std::to_string(clusterId);
    std::string out;
    for (std::size_t i = 0; i < terms.size(); ++i) {
        if (i) out += ", ";
        out += terms[i];
    }
    return out;
}

std::string ClusterLabeler::FormatLabel(int clusterId, const std::vector<std::string>& terms) {
    if (terms.empty()) return "Cluster " + std::to_string(clusterId);
    if (terms.size() == 1) return "Notes about " + terms[0];
    if (terms.size() == 2) return "Notes about " + terms[0] + " and " + terms[1];
    std::string out = "Notes about ";
    for (std::size_t i = 0; i + 1 < terms.size(); ++i) {
        out += terms[i];
        out += ", ";
    }
    return out + "and " + terms.back();
}

} // namespace notedrift::application
