/**
 * @file ClusterEngine.cpp
 * @brief HDBSCAN: core distances, mutual-reachability MST, condensed tree,
 *        excess-of-mass selection.
 */

#include "application/ClusterEngine.hpp"

#include <algorithm>
#include <iostream>
#include <limits>
#include <numeric>

#include "application/ClusterLabeler.hpp"
#include "domain/Session.hpp"

namespace notedrift::application {

namespace {

// Stands in for 1/0 when duplicate points merge at distance zero.
constexpr double kMaxLambda = 1e12;

struct MstEdge {
    std::size_t a;
    std::size_t b;
    double weight;
};

struct Merge {
    std::size_t left;
    std::size_t right;
    double distance;
    std::size_t size;
};

struct CondensedEdge {
    std::size_t parent;
    std::size_t child;
    double lambda;
    std::size_t childSize;
};

class UnionFind {
public:
    explicit UnionFind(std::size_t n) : m_parent(n), m_size(n, 1) {
        std::iota(m_parent.begin(), m_parent.end(), 0);
    }
    std::size_t find(std::size_t x) {
        while (m_parent[x] != x) {
            m_parent[x] = m_parent[m_parent[x]];
            x = m_parent[x];
        }
        return x;
    }
    std::size_t unite(std::size_t a, std::size_t b) {
        a = find(a);
        b = find(b);
        if (m_size[a] < m_size[b]) std::swap(a, b);
        m_parent[b] = a;
        m_size[a] += m_size[b];
        return a;
    }
    std::size_t size(std::size_t x) { return m_size[find(x)]; }

private:
    std::vector<std::size_t> m_parent;
    std::vector<std::size_t> m_size;
};

} // namespace

int ClusterResult::clusterOf(const std::string& noteId) const {
    auto it = assignments.find(noteId);
    return it == assignments.end() ? domain::kNoiseCluster : it->second;
}

std::string ClusterResult::labelOf(int clusterId) const {
    auto it = clusters.find(clusterId);
    return it == clusters.end() ? std::string() : it->second.label;
}

std::size_t ClusterResult::noiseCount() const {
    return static_cast<std::size_t>(std::count_if(assignments.begin(), assignments.end(), [](const auto& entry) {
        return entry.second == domain::kNoiseCluster;
    }));
}

ClusterEngine::ClusterEngine(const domain::ClusteringConfig& config) : m_config(config) {}

std::vector<int> ClusterEngine::hdbscan(const std::vector<domain::Vector>& points,
                                        const domain::Deadline& deadline) const {
    const std::size_t n = points.size();
    const std::size_t mcs = std::max<std::size_t>(2, m_config.minClusterSize);
    std::vector<int> labels(n, domain::kNoiseCluster);
    if (n < 2 || n < mcs) return labels;

    const std::size_t k = std::min(std::max<std::size_t>(1, m_config.minSamples), n);
    auto dist = [&](std::size_t i, std::size_t j) { return domain::EuclideanDistance(points[i], points[j]); };

    // Core distances.
    std::vector<double> core(n, 0.0);
    std::vector<double> row(n);
    for (std::size_t i = 0; i < n; ++i) {
        if (i % 64 == 0) deadline.check("clustering");
        for (std::size_t j = 0; j < n; ++j) row[j] = (i == j) ? 0.0 : dist(i, j);
        std::nth_element(row.begin(), row.begin() + static_cast<std::ptrdiff_t>(k - 1), row.end());
        core[i] = row[k - 1];
    }

    // Prim's MST over mutual reachability distance.
    std::vector<MstEdge> edges;
    edges.reserve(n - 1);
    std::vector<bool> inTree(n, false);
    std::vector<double> best(n, std::numeric_limits<double>::infinity());
    std::vector<std::size_t> from(n, 0);
    std::size_t current = 0;
    inTree[0] = true;
    for (std::size_t step = 1; step < n; ++step) {
        if (step % 64 == 0) deadline.check("clustering");
        std::size_t next = n;
        for (std::size_t j = 0; j < n; ++j) {
            if (inTree[j]) continue;
            double d = std::max({core[current], core[j], dist(current, j)});
            if (d < best[j]) {
                best[j] = d;
                from[j] = current;
            }
            if (next == n || best[j] < best[next]) next = j;
        }
        edges.push_back({from[next], next, best[next]});
        inTree[next] = true;
        current = next;
    }
    std::stable_sort(edges.begin(), edges.end(), [](const MstEdge& x, const MstEdge& y) { return x.weight < y.weight; });

    // Single-linkage dendrogram. Leaves are 0..n-1, merge i is node n+i.
    std::vector<Merge> merges;
    merges.reserve(n - 1);
    UnionFind uf(n);
    std::vector<std::size_t> nodeOf(n);
    std::iota(nodeOf.begin(), nodeOf.end(), 0);
    for (const auto& e : edges) {
        std::size_t ra = uf.find(e.a);
        std::size_t rb = uf.find(e.b);
        std::size_t merged = uf.size(ra) + uf.size(rb);
        merges.push_back({nodeOf[ra], nodeOf[rb], e.weight, merged});
        std::size_t root = uf.unite(ra, rb);
        nodeOf[root] = n + merges.size() - 1;
    }
    deadline.check("clustering");

    auto sizeOf = [&](std::size_t node) { return node < n ? std::size_t{1} : merges[node - n].size; };
    auto subtree = [&](std::size_t top) {
        std::vector<std::size_t> nodes{top};
        for (std::size_t i = 0; i < nodes.size(); ++i) {
            if (nodes[i] >= n) {
                nodes.push_back(merges[nodes[i] - n].left);
                nodes.push_back(merges[nodes[i] - n].right);
            }
        }
        return nodes;
    };

    // Condensed tree. Cluster labels start at n; n is the root.
    const std::size_t rootNode = 2 * n - 2;
    std::vector<std::size_t> relabel(2 * n - 1, 0);
    std::vector<bool> ignore(2 * n - 1, false);
    std::vector<CondensedEdge> condensed;
    std::size_t nextLabel = n + 1;
    relabel[rootNode] = n;

    for (std::size_t node : subtree(rootNode)) {
        if (ignore[node] || node < n) continue;
        const Merge& m = merges[node - n];
        double lambda = m.distance > 0.0 ? std::min(1.0 / m.distance, kMaxLambda) : kMaxLambda;
        std::size_t leftCount = sizeOf(m.left);
        std::size_t rightCount = sizeOf(m.right);
        std::size_t parent = relabel[node];

        auto fallOut = [&](std::size_t child) {
            for (std::size_t sub : subtree(child)) {
                if (sub < n) condensed.push_back({parent, sub, lambda, 1});
                ignore[sub] = true;
            }
        };

        if (leftCount >= mcs && rightCount >= mcs) {
            relabel[m.left] = nextLabel++;
            condensed.push_back({parent, relabel[m.left], lambda, leftCount});
            relabel[m.right] = nextLabel++;
            condensed.push_back({parent, relabel[m.right], lambda, rightCount});
        } else if (leftCount < mcs && rightCount < mcs) {
            fallOut(m.left);
            fallOut(m.right);
        } else if (leftCount < mcs) {
            relabel[m.right] = parent;
            fallOut(m.left);
        } else {
            relabel[m.left] = parent;
            fallOut(m.right);
        }
    }

    // Stability of every condensed cluster.
    const std::size_t clusterCount = nextLabel - n;
    std::vector<double> birth(clusterCount, 0.0);
    std::vector<double> stability(clusterCount, 0.0);
    std::vector<std::size_t> clusterParent(clusterCount, n);
    std::vector<std::vector<std::size_t>> childClusters(clusterCount);
    std::vector<std::size_t> pointParent(n, n);
    for (const auto& e : condensed) {
        if (e.child >= n) {
            birth[e.child - n] = e.lambda;
            clusterParent[e.child - n] = e.parent;
            childClusters[e.parent - n].push_back(e.child);
        } else {
            pointParent[e.child] = e.parent;
        }
    }
    for (const auto& e : condensed) {
        stability[e.parent - n] += (e.lambda - birth[e.parent - n]) * static_cast<double>(e.childSize);
    }

    // Excess of mass, children before parents. The root is never a candidate.
    std::vector<bool> selected(clusterCount, false);
    for (std::size_t c = 1; c < clusterCount; ++c) selected[c] = true;
    for (std::size_t c = clusterCount; c-- > 1;) {
        double childStability = 0.0;
        for (std::size_t child : childClusters[c]) childStability += stability[child - n];
        if (!childClusters[c].empty() && childStability > stability[c]) {
            selected[c] = false;
            stability[c] = childStability;
        } else {
            std::vector<std::size_t> stack(childClusters[c].begin(), childClusters[c].end());
            while (!stack.empty()) {
                std::size_t d = stack.back();
                stack.pop_back();
                selected[d - n] = false;
                stack.insert(stack.end(), childClusters[d - n].begin(), childClusters[d - n].end());
            }
        }
    }

    std::map<std::size_t, int> dense;
    for (std::size_t c = 1; c < clusterCount; ++c) {
        if (selected[c]) {
            int id = static_cast<int>(dense.size());
            dense[c + n] = id;
        }
    }
    for (std::size_t p = 0; p < n; ++p) {
        std::size_t c = pointParent[p];
        while (c != n && !selected[c - n]) c = clusterParent[c - n];
        if (c != n) labels[p] = dense[c];
    }
    return labels;
}

ClusterResult ClusterEngine::cluster(std::vector<ClusterInput> inputs, const domain::Deadline& deadline) const {
    std::sort(inputs.begin(), inputs.end(),
              [](const ClusterInput& a, const ClusterInput& b) { return a.noteId < b.noteId; });

    ClusterResult result;
    for (const auto& in : inputs) result.assignments[in.noteId] = domain::kNoiseCluster;

    if (inputs.size() < m_config.minClusterSize) {
        result.degenerate = true;
        std::cout << "[ClusterEngine] Degenerate clustering: " << inputs.size()
                  << " notes, minimum cluster size " << m_config.minClusterSize << "; all notes are noise" << std::endl;
        return result;
    }

    std::vector<domain::Vector> points;
    points.reserve(inputs.size());
    for (const auto& in : inputs) points.push_back(in.embedding);
    std::vector<int> labels = hdbscan(points, deadline);

    std::map<int, std::vector<std::string>> texts;
    for (std::size_t i = 0; i < inputs.size(); ++i) {
        result.assignments[inputs[i].noteId] = labels[i];
        if (labels[i] == domain::kNoiseCluster) continue;
        ClusterInfo& info = result.clusters[labels[i]];
        info.id = labels[i];
        info.members.push_back(inputs[i].noteId);
        texts[labels[i]].push_back(inputs[i].labelText);
    }
    if (result.clusters.empty()) {
        std::cout << "[ClusterEngine] No stable clusters among " << inputs.size() << " notes" << std::endl;
        return result;
    }
    deadline.check("cluster labelling");

    std::map<std::string, std::size_t> position;
    for (std::size_t i = 0; i < inputs.size(); ++i) position[inputs[i].noteId] = i;

    ClusterLabeler labeler(m_config);
    auto terms = labeler.label(texts);
    for (auto& [id, info] : result.clusters) {
        info.terms = terms[id];
        info.label = ClusterLabeler::JoinTerms(id, info.terms);
        info.formattedLabel = ClusterLabeler::FormatLabel(id, info.terms);

        const std::size_t dim = points[position[info.members.front()]].size();
        std::vector<double> sum(dim, 0.0);
        for (const auto& member : info.members) {
            const auto& v = points[position[member]];
            for (std::size_t d = 0; d < dim && d < v.size(); ++d) sum[d] += v[d];
        }
        info.centroid.resize(dim);
        for (std::size_t d = 0; d < dim; ++d) {
            info.centroid[d] = static_cast<float>(sum[d] / static_cast<double>(info.members.size()));
        }

        std::vector<std::pair<double, std::string>> byCloseness;
        for (const auto& member : info.members) {
            byCloseness.emplace_back(-domain::Cosine(points[position[member]], info.centroid), member);
        }
        std::sort(byCloseness.begin(), byCloseness.end());
        for (std::size_t r = 0; r < byCloseness.size() && r < m_config.representativeCount; ++r) {
            info.representatives.push_back(byCloseness[r].second);
        }
    }

    std::cout << "[ClusterEngine] " << result.clusters.size() << " clusters, " << result.noiseCount()
              << " noise notes out of " << inputs.size() << std::endl;
    return result;
}

} // namespace notedrift::application
