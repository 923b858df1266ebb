/**
 * @file ContentHasher.hpp
 * @brief Stable content digests (SHA-256) for cache keys and vault fingerprints.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/Note.hpp"

namespace notedrift::infrastructure {

class ContentHasher {
public:
    /** @brief Lowercase hex SHA-256 of the bytes of text. */
    static std::string Sha256Hex(const std::string& text);

    /**
     * @brief Fingerprint of the corpus as a whole: ids, content hashes and
     *        modification times in id order.
     */
    static std::string VaultStateHash(const std::vector<domain::Note>& notes);
};

} // namespace notedrift::infrastructure
