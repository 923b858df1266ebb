#include "infrastructure/ContentHasher.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <stdexcept>

namespace notedrift::infrastructure {

std::string ContentHasher::Sha256Hex(const std::string& text) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(text.data(), text.size(), digest, &length, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    static const char* kHex = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        out.push_back(kHex[digest[i] >> 4]);
        out.push_back(kHex[digest[i] & 0x0f]);
    }
    return out;
}

std::string ContentHasher::VaultStateHash(const std::vector<domain::Note>& notes) {
    std::vector<const domain::Note*> ordered;
    ordered.reserve(notes.size());
    for (const auto& n : notes) ordered.push_back(&n);
    std::sort(ordered.begin(), ordered.end(),
              [](const domain::Note* a, const domain::Note* b) { return a->id < b->id; });

    std::string manifest;
    for (const auto* n : ordered) {
        manifest += n->id;
        manifest += '\t';
        manifest += n->contentHash.empty() ? Sha256Hex(n->content) : n->contentHash;
        manifest += '\t';
        manifest += std::to_string(n->modified);
        manifest += '\n';
    }
    return Sha256Hex(manifest);
}

} // namespace notedrift::infrastructure
