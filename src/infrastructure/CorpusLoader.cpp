#include "infrastructure/CorpusLoader.hpp"

#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "domain/CalendarDate.hpp"
#include "infrastructure/ContentHasher.hpp"

namespace notedrift::infrastructure {

using json = nlohmann::json;

namespace {

std::int64_t readTimestamp(const json& note, const char* key, const std::string& id) {
    if (!note.contains(key)) {
        throw std::runtime_error("Note " + id + " lacks '" + key + "'");
    }
    const json& v = note.at(key);
    if (v.is_number_integer()) return v.get<std::int64_t>();
    if (v.is_string()) return CorpusLoader::ParseTimestamp(v.get<std::string>());
    throw std::runtime_error("Note " + id + " has a non-timestamp '" + key + "'");
}

int parseField(const std::string& text, size_t pos, size_t len) {
    for (size_t i = pos; i < pos + len; ++i) {
        if (i >= text.size() || text[i] < '0' || text[i] > '9') {
            throw std::runtime_error("Malformed timestamp: " + text);
        }
    }
    return std::stoi(text.substr(pos, len));
}

} // namespace

std::int64_t CorpusLoader::ParseTimestamp(const std::string& text) {
    auto date = domain::CalendarDate::parse(text.substr(0, 10));
    if (!date) throw std::runtime_error("Malformed timestamp: " + text);
    std::int64_t seconds = date->toEpochSeconds();
    if (text.size() == 10) return seconds;

    if (text[10] != 'T' && text[10] != ' ') throw std::runtime_error("Malformed timestamp: " + text);
    int hour = parseField(text, 11, 2);
    if (text.size() < 16 || text[13] != ':') throw std::runtime_error("Malformed timestamp: " + text);
    int minute = parseField(text, 14, 2);
    int second = 0;
    if (text.size() >= 19 && text[16] == ':') second = parseField(text, 17, 2);
    if (hour > 23 || minute > 59 || second > 60) throw std::runtime_error("Malformed timestamp: " + text);
    return seconds + hour * 3600 + minute * 60 + second;
}

domain::CorpusSnapshot CorpusLoader::Parse(const std::string& jsonText) {
    json j;
    try {
        j = json::parse(jsonText);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Corpus is not valid JSON: ") + e.what());
    }

    domain::CorpusSnapshot corpus;
    std::set<std::string> seen;
    for (const auto& item : j.value("notes", json::array())) {
        domain::Note n;
        n.id = item.at("id").get<std::string>();
        if (!seen.insert(n.id).second) {
            throw std::runtime_error("Duplicate note id: " + n.id);
        }
        n.content = item.value("content", "");
        n.title = item.value("title", std::filesystem::path(n.id).stem().string());
        n.created = readTimestamp(item, "created", n.id);
        n.modified = item.contains("modified") ? readTimestamp(item, "modified", n.id) : n.created;
        n.isVirtual = item.value("virtual", false);
        n.sourceRef = item.value("source", "");
        n.contentHash = ContentHasher::Sha256Hex(n.content);
        corpus.notes.push_back(std::move(n));
    }
    for (const auto& item : j.value("links", json::array())) {
        corpus.links.push_back({item.at("source").get<std::string>(), item.at("target").get<std::string>()});
    }
    return corpus;
}

domain::CorpusSnapshot CorpusLoader::LoadFile(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Cannot open corpus " + path);
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    return Parse(buffer.str());
}

} // namespace notedrift::infrastructure
