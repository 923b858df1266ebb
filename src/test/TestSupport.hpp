/**
 * @file TestSupport.hpp
 * @brief Fake embedding provider and scratch-directory helper shared by the tests.
 */

#pragma once

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <set>
#include <string>
#include <thread>

#include "domain/EmbeddingProvider.hpp"
#include "domain/Errors.hpp"
#include "domain/Note.hpp"
#include "infrastructure/ContentHasher.hpp"

namespace notedrift::test {

/**
 * @brief Deterministic hashed bag-of-words embedder.
 *
 * Texts sharing words get similar vectors, which is all the clustering and
 * similarity tests need.
 */
class FakeEmbeddingProvider : public domain::EmbeddingProvider {
public:
    static constexpr std::size_t kDimension = 32;

    domain::Vector embed(const std::string& text, std::chrono::milliseconds) override {
        ++m_calls;
        if (m_delay.count() > 0) std::this_thread::sleep_for(m_delay);
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_failing.count(text)) throw domain::EmbeddingUnavailable("fake provider refused input");
        }
        if (text.empty()) throw domain::EmbeddingUnavailable("empty input");

        domain::Vector v(kDimension, 0.0f);
        std::string word;
        auto flush = [&]() {
            if (word.empty()) return;
            std::uint32_t h = 2166136261u;
            for (unsigned char c : word) {
                h ^= c;
                h *= 16777619u;
            }
            v[h % kDimension] += 1.0f;
            word.clear();
        };
        for (char ch : text) {
            unsigned char c = static_cast<unsigned char>(ch);
            if (std::isalnum(c)) {
                word.push_back(static_cast<char>(std::tolower(c)));
            } else {
                flush();
            }
        }
        flush();
        return v;
    }

    std::string modelName() const override { return "fake-embed"; }

    void failOn(const std::string& text) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failing.insert(text);
    }

    void setDelay(std::chrono::milliseconds delay) { m_delay = delay; }

    int calls() const { return m_calls.load(); }
    void resetCalls() { m_calls = 0; }

private:
    std::atomic<int> m_calls{0};
    std::chrono::milliseconds m_delay{0};
    std::mutex m_mutex;
    std::set<std::string> m_failing;
};

/** @brief Fresh directory under the system temp dir, removed on destruction. */
class ScratchDir {
public:
    explicit ScratchDir(const std::string& name) {
        m_path = std::filesystem::temp_directory_path() /
                 ("notedrift_" + name + "_" +
                  std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        std::filesystem::create_directories(m_path);
    }
    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    std::string file(const std::string& name) const { return (m_path / name).string(); }

private:
    std::filesystem::path m_path;
};

inline domain::Note MakeNote(const std::string& id, const std::string& content,
                             std::int64_t created, std::int64_t modified = 0) {
    domain::Note n;
    n.id = id;
    n.title = id;
    n.content = content;
    n.contentHash = infrastructure::ContentHasher::Sha256Hex(content);
    n.created = created;
    n.modified = modified == 0 ? created : modified;
    return n;
}

/** @brief Two topics of six notes each, created a day apart, with a few links. */
inline domain::CorpusSnapshot SampleCorpus() {
    domain::CorpusSnapshot corpus;
    const std::int64_t base = 1693526400; // 2023-09-01
    const char* memory[] = {"memory palace recall", "recall memory loci method", "palace memory tricks",
                            "spaced recall memory cards", "memory palace journey", "loci recall palace"};
    const char* garden[] = {"garden soil compost", "compost heap garden worms", "soil garden raised beds",
                            "garden compost tea", "raised garden soil mix", "worms soil compost garden"};
    for (int i = 0; i < 6; ++i) {
        corpus.notes.push_back(MakeNote("mem/" + std::to_string(i) + ".md", memory[i], base + i * 86400));
        corpus.notes.push_back(MakeNote("gar/" + std::to_string(i) + ".md", garden[i], base + i * 3600));
    }
    corpus.links = {{"mem/0.md", "mem/1.md"}, {"mem/2.md", "mem/1.md"}, {"gar/0.md", "gar/2.md"}};
    return corpus;
}

/**
 * @brief Notes whose wording changes between an early and a later session.
 *
 * near/a and near/b share most words and swap their one distinct word, so they stay
 * close while moving in opposite directions. far/c and far/d share nothing but make
 * the same word change. Filler notes never change.
 */
inline domain::CorpusSnapshot DriftingCorpus(bool later, int fillerCount = 0) {
    domain::CorpusSnapshot corpus;
    const std::int64_t created = 1693526400; // 2023-09-01
    auto repeat = [](const std::string& word) {
        std::string text;
        for (int i = 0; i < 8; ++i) text += word + " ";
        return text;
    };
    const std::string swapped = later ? "violet" : "copper";
    corpus.notes.push_back(MakeNote("near/a.md", repeat("river") + (later ? "cloud" : "stone"), created));
    corpus.notes.push_back(MakeNote("near/b.md", repeat("river") + (later ? "stone" : "cloud"), created));
    corpus.notes.push_back(MakeNote("far/c.md", repeat("lantern") + swapped, created));
    corpus.notes.push_back(MakeNote("far/d.md", repeat("harbor") + swapped, created));
    for (int i = 0; i < fillerCount; ++i) {
        corpus.notes.push_back(MakeNote("filler/" + std::to_string(i) + ".md",
                                        "filler note number " + std::to_string(i), created));
    }
    return corpus;
}

} // namespace notedrift::test
