#include "upo/upload/compression.hpp"

#include <zlib.h>

#include <algorithm>

namespace upo::upload {
namespace {

// windowBits 15 + 16 selects the gzip wrapper
constexpr int kGzipWindowBits = 15 + 16;
constexpr int kMemLevel = 8;

upo::Result<SourceFile, CompressionFailure> fail(std::string message) {
    return upo::Err<SourceFile, CompressionFailure>(CompressionFailure{std::move(message)});
}

} // namespace

bool should_compress(const SourceFile& source, const CompressionOptions& options) noexcept {
    if (source.size() <= options.threshold_bytes) {
        return false;
    }
    if (options.mime_prefix.empty()) {
        return true;
    }
    return source.mime_type.compare(0, options.mime_prefix.size(), options.mime_prefix) == 0;
}

DeflateCompressionAdapter::DeflateCompressionAdapter(int level)
    : level_(std::clamp(level, 1, 9)) {}

bool DeflateCompressionAdapter::suits(const CompressionOptions& options) noexcept {
    if (options.mime_prefix.empty()) {
        return false;
    }
    return options.mime_prefix.rfind("image/", 0) != 0;
}

upo::Result<SourceFile, CompressionFailure> DeflateCompressionAdapter::compress(const SourceFile& source,
                                                                                const CompressionOptions&) {
    if (source.bytes.empty()) {
        return fail("Nothing to compress");
    }

    z_stream stream{};
    if (deflateInit2(&stream, level_, Z_DEFLATED, kGzipWindowBits, kMemLevel, Z_DEFAULT_STRATEGY) != Z_OK) {
        return fail("deflateInit2 failed");
    }

    std::vector<std::uint8_t> output(deflateBound(&stream, static_cast<uLong>(source.bytes.size())));
    stream.next_in = const_cast<Bytef*>(source.bytes.data());
    stream.avail_in = static_cast<uInt>(source.bytes.size());
    stream.next_out = output.data();
    stream.avail_out = static_cast<uInt>(output.size());

    const int rc = deflate(&stream, Z_FINISH);
    const auto produced = static_cast<std::size_t>(stream.total_out);
    deflateEnd(&stream);

    if (rc != Z_STREAM_END) {
        return fail(std::string("deflate failed: ") + (stream.msg ? stream.msg : "unknown error"));
    }
    if (produced >= source.bytes.size()) {
        return fail("Compressed output is not smaller than the original");
    }

    output.resize(produced);
    SourceFile compressed;
    compressed.name = source.name + ".gz";
    compressed.mime_type = "application/gzip";
    compressed.bytes = std::move(output);
    return upo::Ok<SourceFile, CompressionFailure>(std::move(compressed));
}

} // namespace upo::upload
