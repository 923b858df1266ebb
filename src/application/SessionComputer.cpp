/**
 * @file SessionComputer.cpp
 * @brief Implementation of SessionComputer.
 */

#include "application/SessionComputer.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>

#include "domain/Errors.hpp"
#include "infrastructure/ContentHasher.hpp"

namespace notedrift::application {

namespace {

std::string TrimLeft(const std::string& line) {
    std::size_t i = 0;
    while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) ++i;
    return line.substr(i);
}

bool IsListItem(const std::string& trimmed) {
    if (trimmed.size() >= 2 && (trimmed[0] == '-' || trimmed[0] == '*' || trimmed[0] == '+') && trimmed[1] == ' ') {
        return true;
    }
    std::size_t i = 0;
    while (i < trimmed.size() && std::isdigit(static_cast<unsigned char>(trimmed[i]))) ++i;
    return i > 0 && i + 1 < trimmed.size() && (trimmed[i] == '.' || trimmed[i] == ')') && trimmed[i + 1] == ' ';
}

} // namespace

SessionComputer::SessionComputer(std::shared_ptr<infrastructure::SemanticCache> cache,
                                 std::shared_ptr<infrastructure::SessionStore> store,
                                 const domain::EngineConfig& config)
    : m_cache(std::move(cache)),
      m_store(std::move(store)),
      m_config(config),
      m_compositor(config.embedding),
      m_clusters(config.clustering) {
    if (!m_cache || !m_store) {
        throw std::invalid_argument("SessionComputer requires a semantic cache and a session store");
    }
}

domain::StructuralProfile SessionComputer::Profile(const std::string& content, int outgoingLinks) {
    domain::StructuralProfile profile;
    profile.outgoingLinkCount = outgoingLinks;

    std::istringstream lines(content);
    std::string line;
    while (std::getline(lines, line)) {
        std::string trimmed = TrimLeft(line);
        if (!trimmed.empty() && trimmed[0] == '#') {
            ++profile.headingCount;
        } else if (IsListItem(trimmed)) {
            ++profile.listItemCount;
        }
        std::istringstream words(line);
        std::string word;
        while (words >> word) ++profile.wordCount;
    }
    return profile;
}

domain::SessionData SessionComputer::buildSession(const domain::CorpusSnapshot& corpus,
                                                  const domain::CalendarDate& date,
                                                  SessionReport& report,
                                                  const domain::Deadline& deadline) {
    std::vector<domain::Note> notes = corpus.notes;
    std::sort(notes.begin(), notes.end(),
              [](const domain::Note& a, const domain::Note& b) { return a.id < b.id; });
    for (auto& note : notes) {
        if (note.contentHash.empty()) note.contentHash = infrastructure::ContentHasher::Sha256Hex(note.content);
    }

    report.date = date;
    report.notesTotal = notes.size();

    std::set<std::string> known;
    for (const auto& note : notes) known.insert(note.id);

    std::set<domain::Link> links;
    for (const auto& link : corpus.links) {
        if (link.source == link.target) continue;
        if (known.count(link.source) && known.count(link.target)) links.insert(link);
    }
    std::map<std::string, int> outgoing;
    for (const auto& link : links) ++outgoing[link.source];

    domain::SessionData data;
    data.date = date;
    data.vaultStateHash = infrastructure::ContentHasher::VaultStateHash(notes);

    std::vector<ClusterInput> inputs;
    for (const auto& note : notes) {
        deadline.check("embedding");
        try {
            domain::Vector semantic = m_cache->getOrCompute(note.contentHash, note.content, deadline);
            domain::Vector full = m_compositor.compose(semantic, note.created, date);

            domain::SessionRecord record;
            record.noteId = note.id;
            record.contentHash = note.contentHash;
            record.embedding = full;
            record.stalenessDays = std::max(0.0, static_cast<double>(date.toEpochSeconds() - note.modified) / 86400.0);
            auto out = outgoing.find(note.id);
            record.structure = Profile(note.content, out == outgoing.end() ? 0 : out->second);
            data.records.emplace(note.id, std::move(record));

            std::string labelText = note.title + " " + note.content.substr(0, m_config.clustering.labelContentChars);
            inputs.push_back({note.id, std::move(full), std::move(labelText)});
        } catch (const domain::EmbeddingUnavailable& e) {
            std::cerr << "[SessionComputer] " << note.id << ": " << e.what() << std::endl;
            report.failures.push_back({note.id, e.what()});
        } catch (const domain::ClockSkewError& e) {
            std::cerr << "[SessionComputer] " << note.id << ": " << e.what() << std::endl;
            report.failures.push_back({note.id, e.what()});
        }
    }

    for (const auto& link : links) {
        if (data.records.count(link.source) && data.records.count(link.target)) data.links.push_back(link);
    }

    ClusterResult clusters = m_clusters.cluster(std::move(inputs), deadline);
    for (auto& [id, record] : data.records) {
        record.clusterId = clusters.clusterOf(id);
        record.clusterLabel = clusters.labelOf(record.clusterId);
    }

    report.notesEmbedded = data.records.size();
    report.degenerateClustering = clusters.degenerate;
    report.clusterCount = clusters.clusters.size();
    report.noiseCount = clusters.noiseCount();
    return data;
}

SessionReport SessionComputer::computeSession(const domain::CorpusSnapshot& corpus,
                                              const domain::CalendarDate& date,
                                              domain::WriteMode mode,
                                              const domain::Deadline& deadline) {
    if (mode == domain::WriteMode::RejectExisting && m_store->hasSession(date)) {
        throw domain::SessionAlreadyExists(date.toString());
    }

    SessionReport report;
    domain::SessionData data = buildSession(corpus, date, report, deadline);
    deadline.check("session write");

    std::vector<domain::Note> notes = corpus.notes;
    for (auto& note : notes) {
        if (note.contentHash.empty()) note.contentHash = infrastructure::ContentHasher::Sha256Hex(note.content);
    }
    m_store->writeSession(data, notes, mode);

    std::cout << "[SessionComputer] Session " << date.toString() << ": " << report.notesEmbedded << "/"
              << report.notesTotal << " notes, " << report.clusterCount << " clusters, "
              << report.noiseCount << " noise" << std::endl;
    return report;
}

} // namespace notedrift::application
