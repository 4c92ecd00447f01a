#pragma once

#include "upo/core/result.hpp"
#include "upo/upload/types.hpp"

#include <cstdint>
#include <string>

namespace upo::upload {

struct CompressionOptions {
    std::uint64_t threshold_bytes = 1024 * 1024;   ///< Only files larger than this are compressed
    std::uint64_t max_output_bytes = 1024 * 1024;  ///< Target size hint for lossy codecs
    std::uint32_t max_dimension = 2000;            ///< Longest image edge hint for image codecs
    std::string mime_prefix = "image/";            ///< Empty matches every MIME type
};

struct CompressionFailure {
    std::string message;
};

/**
 * @brief Best-effort size reduction before upload
 *
 * Implementations return a smaller equivalent payload or a failure. A
 * failure is never fatal for the entry: the scheduler uploads the original.
 */
class CompressionAdapter {
public:
    virtual ~CompressionAdapter() = default;

    virtual upo::Result<SourceFile, CompressionFailure> compress(const SourceFile& source,
                                                                 const CompressionOptions& options) = 0;

    virtual std::string name() const = 0;
};

/// True when the scheduler should route `source` through compression first.
bool should_compress(const SourceFile& source, const CompressionOptions& options) noexcept;

/**
 * @brief gzip (zlib deflate) shim
 *
 * Produces `<name>.gz` with MIME type application/gzip. Fails when the
 * deflated stream is not smaller than the input, which is the common case
 * for already-compressed media.
 */
class DeflateCompressionAdapter : public CompressionAdapter {
public:
    explicit DeflateCompressionAdapter(int level = 6);

    upo::Result<SourceFile, CompressionFailure> compress(const SourceFile& source,
                                                         const CompressionOptions& options) override;

    std::string name() const override { return "deflate"; }

    /// False when `options` routes images (or everything) to compression:
    /// a gzip stream is not an image an image endpoint will accept
    static bool suits(const CompressionOptions& options) noexcept;

private:
    int level_;
};

} // namespace upo::upload
