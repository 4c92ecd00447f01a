#pragma once

#include "upo/core/result.hpp"
#include "upo/upload/types.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace upo::upload {

/**
 * @brief One file of a batch together with its digest
 *
 * `index` is the position in the batch handed to find_duplicates(), so the
 * caller can map results back to its own list.
 */
struct HashedCandidate {
    std::size_t index = 0;
    std::string name;
    std::string digest;
};

struct DuplicateReport {
    std::vector<HashedCandidate> duplicates;
    std::vector<HashedCandidate> unique;
};

/**
 * @brief SHA-256 content digests for duplicate detection
 *
 * Digests depend only on the bytes: same content under a different name or
 * at a different batch position yields the same lowercase hex string.
 */
class ContentHasher {
public:
    static constexpr std::size_t kDigestHexLength = 64;

    std::string hash(const std::vector<std::uint8_t>& bytes) const;

    std::string hash(const SourceFile& file) const { return hash(file.bytes); }

    /**
     * @brief Stream a file from disk through the digest
     *
     * RETURNS: hex digest, or an error if the file cannot be read
     */
    upo::Result<std::string> hash_file(const std::filesystem::path& path) const;

    std::vector<HashedCandidate> hash_batch(const std::vector<SourceFile>& files) const;

    /**
     * @brief Partition a batch against already-known digests
     *
     * Scans in order. A candidate whose digest is already known (from the
     * caller's list or from an earlier candidate in the same batch) is a
     * duplicate; otherwise it is unique and its digest becomes known.
     */
    static DuplicateReport find_duplicates(const std::vector<HashedCandidate>& candidates,
                                           const std::vector<std::string>& known_digests);
};

} // namespace upo::upload
