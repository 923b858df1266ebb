/**
 * @file SimilarityGraphService.cpp
 * @brief Implementation of SimilarityGraphService.
 */

#include "application/SimilarityGraphService.hpp"

#include <algorithm>
#include <deque>
#include <stdexcept>

namespace notedrift::application {

SimilarityGraphService::SimilarityGraphService(std::shared_ptr<const domain::SessionData> session,
                                               std::shared_ptr<SimilarityCache> cache,
                                               const domain::SimilarityConfig& config)
    : m_session(std::move(session)), m_cache(std::move(cache)), m_config(config) {
    if (!m_session || !m_cache) {
        throw std::invalid_argument("SimilarityGraphService requires a session and a cache");
    }
    if (m_cache->sessionDate() != m_session->date) {
        throw std::logic_error("Similarity cache for " + m_cache->sessionDate().toString() +
                               " cannot serve session " + m_session->date.toString());
    }

    m_ids.reserve(m_session->records.size());
    m_unit.reserve(m_session->records.size());
    for (const auto& [id, record] : m_session->records) {
        m_index.emplace(id, m_ids.size());
        m_ids.push_back(id);
        m_unit.push_back(domain::Normalized(record.embedding));
    }

    for (const auto& link : m_session->links) {
        if (link.source == link.target) continue;
        m_outgoing[link.source].insert(link.target);
        m_incoming[link.target].insert(link.source);
    }
}

float SimilarityGraphService::compute(const std::string& a, const std::string& b) const {
    auto ia = m_index.find(a);
    auto ib = m_index.find(b);
    if (ia == m_index.end() || ib == m_index.end()) return 0.0f;
    double dot = domain::Dot(m_unit[ia->second], m_unit[ib->second]);
    return static_cast<float>(std::clamp(dot, 0.0, 1.0));
}

float SimilarityGraphService::Similarity(const std::string& a, const std::string& b) const {
    if (auto cached = m_cache->find(a, b)) return *cached;
    float value = compute(a, b);
    m_cache->insert(a, b, value);
    return value;
}

std::vector<std::vector<float>> SimilarityGraphService::BatchSimilarity(const std::vector<std::string>& rows,
                                                                        const std::vector<std::string>& cols) const {
    std::vector<std::vector<float>> out(rows.size(), std::vector<float>(cols.size(), 0.0f));
    std::vector<SimilarityCache::Entry> computed;

    for (std::size_t i = 0; i < rows.size(); ++i) {
        for (std::size_t j = 0; j < cols.size(); ++j) {
            if (auto cached = m_cache->find(rows[i], cols[j])) {
                out[i][j] = *cached;
                continue;
            }
            float value = compute(rows[i], cols[j]);
            out[i][j] = value;
            computed.emplace_back(rows[i], cols[j], value);
        }
    }

    if (!computed.empty()) m_cache->insertMany(computed);
    return out;
}

std::vector<std::pair<std::string, float>> SimilarityGraphService::Neighbours(const std::string& id, std::size_t k) const {
    auto memoKey = std::make_pair(id, k);
    {
        std::lock_guard<std::mutex> lock(m_neighbourMutex);
        auto it = m_neighbourMemo.find(memoKey);
        if (it != m_neighbourMemo.end()) return it->second;
    }

    std::vector<std::pair<std::string, float>> ranked;
    if (HasNote(id)) {
        auto row = BatchSimilarity({id}, m_ids);
        for (std::size_t j = 0; j < m_ids.size(); ++j) {
            if (m_ids[j] == id) continue;
            ranked.emplace_back(m_ids[j], row[0][j]);
        }
        std::sort(ranked.begin(), ranked.end(), [](const auto& x, const auto& y) {
            if (x.second != y.second) return x.second > y.second;
            return x.first < y.first;
        });
        if (ranked.size() > k) ranked.resize(k);
    }

    std::lock_guard<std::mutex> lock(m_neighbourMutex);
    m_neighbourMemo.emplace(memoKey, ranked);
    return ranked;
}

SimilarityLevel SimilarityGraphService::Classify(float similarity) const {
    if (similarity >= m_config.veryHigh) return SimilarityLevel::VeryHigh;
    if (similarity >= m_config.high) return SimilarityLevel::High;
    if (similarity >= m_config.moderate) return SimilarityLevel::Moderate;
    if (similarity >= m_config.weak) return SimilarityLevel::Weak;
    if (similarity >= m_config.noise) return SimilarityLevel::Noise;
    return SimilarityLevel::Unrelated;
}

std::size_t SimilarityGraphService::CountAbove(const std::string& id, float threshold) const {
    if (!HasNote(id)) return 0;
    auto row = BatchSimilarity({id}, m_ids);
    std::size_t count = 0;
    for (std::size_t j = 0; j < m_ids.size(); ++j) {
        if (m_ids[j] != id && row[0][j] >= threshold) ++count;
    }
    return count;
}

double SimilarityGraphService::PercentileRank(const std::string& a, const std::string& b) const {
    if (!HasNote(a) || m_ids.size() < 2) return 0.0;
    auto row = BatchSimilarity({a}, m_ids);
    float target = Similarity(a, b);
    std::size_t below = 0;
    std::size_t total = 0;
    for (std::size_t j = 0; j < m_ids.size(); ++j) {
        if (m_ids[j] == a) continue;
        ++total;
        if (row[0][j] <= target) ++below;
    }
    return total ? static_cast<double>(below) / static_cast<double>(total) : 0.0;
}

// Graph

std::vector<std::string> SimilarityGraphService::OutgoingLinks(const std::string& id) const {
    auto it = m_outgoing.find(id);
    if (it == m_outgoing.end()) return {};
    return {it->second.begin(), it->second.end()};
}

std::vector<std::string> SimilarityGraphService::Backlinks(const std::string& id) const {
    auto it = m_incoming.find(id);
    if (it == m_incoming.end()) return {};
    return {it->second.begin(), it->second.end()};
}

bool SimilarityGraphService::HasLink(const std::string& from, const std::string& to) const {
    auto it = m_outgoing.find(from);
    return it != m_outgoing.end() && it->second.count(to) > 0;
}

bool SimilarityGraphService::AreLinked(const std::string& a, const std::string& b) const {
    return HasLink(a, b) || HasLink(b, a);
}

std::vector<std::string> SimilarityGraphService::GraphNeighbours(const std::string& id) const {
    std::set<std::string> all;
    if (auto it = m_outgoing.find(id); it != m_outgoing.end()) all.insert(it->second.begin(), it->second.end());
    if (auto it = m_incoming.find(id); it != m_incoming.end()) all.insert(it->second.begin(), it->second.end());
    return {all.begin(), all.end()};
}

int SimilarityGraphService::Degree(const std::string& id) const {
    return static_cast<int>(GraphNeighbours(id).size());
}

std::vector<std::string> SimilarityGraphService::bfsPath(const std::string& from, const std::string& to) const {
    if (from == to) return {from};

    std::map<std::string, std::string> parent;
    std::deque<std::string> queue{from};
    parent.emplace(from, std::string());

    while (!queue.empty()) {
        std::string current = queue.front();
        queue.pop_front();
        auto it = m_outgoing.find(current);
        if (it == m_outgoing.end()) continue;
        for (const auto& next : it->second) {
            if (parent.count(next)) continue;
            parent.emplace(next, current);
            if (next == to) {
                std::vector<std::string> path{to};
                for (std::string step = current; !step.empty(); step = parent[step]) {
                    path.push_back(step);
                    if (step == from) break;
                }
                std::reverse(path.begin(), path.end());
                return path;
            }
            queue.push_back(next);
        }
    }
    return {};
}

int SimilarityGraphService::ShortestPathLength(const std::string& from, const std::string& to) const {
    auto path = bfsPath(from, to);
    if (path.empty()) return kUnreachable;
    return static_cast<int>(path.size()) - 1;
}

std::vector<std::string> SimilarityGraphService::ShortestPath(const std::string& from, const std::string& to) const {
    return bfsPath(from, to);
}

std::vector<std::string> SimilarityGraphService::KHopNeighbourhood(const std::string& id, int k) const {
    std::set<std::string> visited{id};
    std::vector<std::string> frontier{id};
    for (int hop = 0; hop < k && !frontier.empty(); ++hop) {
        std::vector<std::string> next;
        for (const auto& node : frontier) {
            auto it = m_outgoing.find(node);
            if (it == m_outgoing.end()) continue;
            for (const auto& target : it->second) {
                if (visited.insert(target).second) next.push_back(target);
            }
        }
        frontier = std::move(next);
    }
    visited.erase(id);
    return {visited.begin(), visited.end()};
}

std::vector<std::string> SimilarityGraphService::Hubs(std::size_t k) const {
    std::vector<std::pair<std::string, std::size_t>> counts;
    for (const auto& [target, sources] : m_incoming) {
        counts.emplace_back(target, sources.size());
    }
    std::sort(counts.begin(), counts.end(), [](const auto& x, const auto& y) {
        if (x.second != y.second) return x.second > y.second;
        return x.first < y.first;
    });
    std::vector<std::string> out;
    for (const auto& entry : counts) {
        if (out.size() >= k) break;
        out.push_back(entry.first);
    }
    return out;
}

std::vector<std::string> SimilarityGraphService::Orphans(std::size_t k) const {
    std::vector<const domain::SessionRecord*> orphans;
    for (const auto& [id, record] : m_session->records) {
        if (!m_outgoing.count(id) && !m_incoming.count(id)) orphans.push_back(&record);
    }
    std::sort(orphans.begin(), orphans.end(), [](const auto* x, const auto* y) {
        if (x->stalenessDays != y->stalenessDays) return x->stalenessDays < y->stalenessDays;
        return x->noteId < y->noteId;
    });
    std::vector<std::string> out;
    for (const auto* r : orphans) {
        if (k && out.size() >= k) break;
        out.push_back(r->noteId);
    }
    return out;
}

std::vector<std::string> SimilarityGraphService::allNodes() const {
    std::set<std::string> nodes(m_ids.begin(), m_ids.end());
    for (const auto& [id, targets] : m_outgoing) {
        nodes.insert(id);
        nodes.insert(targets.begin(), targets.end());
    }
    return {nodes.begin(), nodes.end()};
}

std::vector<std::vector<std::string>> SimilarityGraphService::ConnectedComponents() const {
    std::set<std::string> visited;
    std::vector<std::vector<std::string>> components;

    for (const auto& start : allNodes()) {
        if (visited.count(start)) continue;
        std::vector<std::string> component;
        std::deque<std::string> queue{start};
        visited.insert(start);
        while (!queue.empty()) {
            std::string current = queue.front();
            queue.pop_front();
            component.push_back(current);
            for (const auto& next : GraphNeighbours(current)) {
                if (visited.insert(next).second) queue.push_back(next);
            }
        }
        std::sort(component.begin(), component.end());
        components.push_back(std::move(component));
    }

    std::stable_sort(components.begin(), components.end(),
                     [](const auto& x, const auto& y) { return x.size() > y.size(); });
    return components;
}

std::vector<std::pair<std::string, std::string>> SimilarityGraphService::StructuralHoles(float minSimilarity) const {
    auto components = ConnectedComponents();
    std::vector<std::pair<std::string, std::string>> holes;
    if (components.size() < 2) return holes;

    std::map<std::string, std::size_t> componentOf;
    for (std::size_t c = 0; c < components.size(); ++c) {
        for (const auto& id : components[c]) componentOf[id] = c;
    }

    // Row by row keeps peak memory linear in the corpus size.
    for (std::size_t i = 0; i + 1 < m_ids.size(); ++i) {
        std::vector<std::string> rest(m_ids.begin() + static_cast<std::ptrdiff_t>(i + 1), m_ids.end());
        auto row = BatchSimilarity({m_ids[i]}, rest);
        for (std::size_t j = 0; j < rest.size(); ++j) {
            if (componentOf[m_ids[i]] == componentOf[rest[j]]) continue;
            if (row[0][j] >= minSimilarity) holes.emplace_back(m_ids[i], rest[j]);
        }
    }
    return holes;
}

std::vector<std::string> SimilarityGraphService::UnlinkedPairCandidates() const {
    const std::size_t limit = m_config.unlinkedPairCandidateLimit;
    if (limit == 0 || m_ids.size() <= limit) return m_ids;

    std::vector<const domain::SessionRecord*> byRecency;
    for (const auto& [id, record] : m_session->records) byRecency.push_back(&record);
    std::sort(byRecency.begin(), byRecency.end(), [](const auto* x, const auto* y) {
        if (x->stalenessDays != y->stalenessDays) return x->stalenessDays < y->stalenessDays;
        return x->noteId < y->noteId;
    });
    std::vector<std::string> out;
    for (std::size_t i = 0; i < limit; ++i) out.push_back(byRecency[i]->noteId);
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<std::pair<std::string, std::string>> SimilarityGraphService::UnlinkedPairs(std::size_t k) const {
    auto candidates = UnlinkedPairCandidates();

    struct Scored {
        std::size_t i;
        std::size_t j;
        float score;
    };
    std::vector<Scored> scored;
    for (std::size_t i = 0; i + 1 < candidates.size(); ++i) {
        std::vector<std::string> rest(candidates.begin() + static_cast<std::ptrdiff_t>(i + 1), candidates.end());
        auto row = BatchSimilarity({candidates[i]}, rest);
        for (std::size_t r = 0; r < rest.size(); ++r) {
            if (row[0][r] < m_config.unlinkedPairThreshold) continue;
            if (AreLinked(candidates[i], rest[r])) continue;
            scored.push_back({i, i + 1 + r, row[0][r]});
        }
    }
    std::sort(scored.begin(), scored.end(), [&](const Scored& x, const Scored& y) {
        if (x.score != y.score) return x.score > y.score;
        if (x.i != y.i) return x.i < y.i;
        return x.j < y.j;
    });

    std::vector<std::pair<std::string, std::string>> out;
    for (const auto& s : scored) {
        if (out.size() >= k) break;
        out.emplace_back(candidates[s.i], candidates[s.j]);
    }
    return out;
}

} // namespace notedrift::application
