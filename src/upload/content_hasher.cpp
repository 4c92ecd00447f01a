#include "upo/upload/content_hasher.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace upo::upload {
namespace {

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

std::string to_hex(const unsigned char* data, unsigned int len) {
    std::ostringstream oss;
    for (unsigned int i = 0; i < len; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return oss.str();
}

DigestContext make_sha256_context() {
    DigestContext ctx(EVP_MD_CTX_new());
    if (ctx && EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        ctx.reset();
    }
    return ctx;
}

upo::Result<std::string> finish(EVP_MD_CTX* ctx) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, digest, &len) != 1) {
        return upo::Err<std::string>(std::string("SHA-256 finalisation failed"));
    }
    return upo::Ok(to_hex(digest, len));
}

} // namespace

std::string ContentHasher::hash(const std::vector<std::uint8_t>& bytes) const {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    // One-shot EVP_Digest only fails on allocation failure inside OpenSSL
    if (EVP_Digest(bytes.data(), bytes.size(), digest, &len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return to_hex(digest, len);
}

upo::Result<std::string> ContentHasher::hash_file(const std::filesystem::path& path) const {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return upo::Err<std::string>(std::string("Failed to open file for hashing: ") + path.string());
    }

    auto ctx = make_sha256_context();
    if (!ctx) {
        return upo::Err<std::string>(std::string("Failed to initialise SHA-256 context"));
    }

    char buffer[64 * 1024];
    while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
        const auto count = static_cast<std::size_t>(input.gcount());
        if (EVP_DigestUpdate(ctx.get(), buffer, count) != 1) {
            return upo::Err<std::string>(std::string("SHA-256 update failed for ") + path.string());
        }
    }
    if (input.bad()) {
        return upo::Err<std::string>(std::string("Read error while hashing ") + path.string());
    }

    return finish(ctx.get());
}

std::vector<HashedCandidate> ContentHasher::hash_batch(const std::vector<SourceFile>& files) const {
    std::vector<HashedCandidate> hashed;
    hashed.reserve(files.size());
    for (std::size_t i = 0; i < files.size(); ++i) {
        hashed.push_back(HashedCandidate{i, files[i].name, hash(files[i])});
    }
    return hashed;
}

DuplicateReport ContentHasher::find_duplicates(const std::vector<HashedCandidate>& candidates,
                                               const std::vector<std::string>& known_digests) {
    std::unordered_set<std::string> known(known_digests.begin(), known_digests.end());
    DuplicateReport report;

    for (const auto& candidate : candidates) {
        if (known.count(candidate.digest) > 0) {
            report.duplicates.push_back(candidate);
        } else {
            report.unique.push_back(candidate);
            known.insert(candidate.digest);
        }
    }

    return report;
}

} // namespace upo::upload
