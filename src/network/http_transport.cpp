#include "upo/network/http_transport.hpp"

#include "upo/network/http_response_parser.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>

namespace upo {
namespace network {

using upload::StatusCategory;
using upload::TransportError;
using upload::UploadReceipt;

namespace {

constexpr std::chrono::milliseconds kPollInterval{50};

TransportError make_error(StatusCategory category, std::string message, int status = 0) {
    TransportError error;
    error.category = category;
    error.http_status = status;
    error.message = std::move(message);
    return error;
}

upo::Result<UploadReceipt, TransportError> fail(TransportError error) {
    return upo::Err<UploadReceipt, TransportError>(std::move(error));
}

} // namespace

HttpUploadTransport::HttpUploadTransport(HttpTransportOptions options)
    : options_(std::move(options)) {
    if (options_.chunk_size == 0) {
        options_.chunk_size = 64 * 1024;
    }
}

std::optional<TransportError> HttpUploadTransport::wait_for(asio::io_context& io,
                                                            tcp::socket& socket,
                                                            PendingOp& op,
                                                            const upload::CancelToken& cancel,
                                                            std::chrono::milliseconds budget,
                                                            const char* stage) const {
    const auto deadline = std::chrono::steady_clock::now() + budget;
    io.restart();

    while (!op.done) {
        io.run_for(kPollInterval);
        if (op.done) {
            break;
        }

        const bool cancelled = cancel.is_cancelled();
        if (cancelled || std::chrono::steady_clock::now() >= deadline) {
            boost::system::error_code close_ec;
            socket.close(close_ec);
            if (close_ec) {
                spdlog::debug("[HttpTransport] close during {} abort: {}", stage, close_ec.message());
            }
            // Let the aborted handler run so nothing outlives this frame
            io.restart();
            io.run();

            if (cancelled) {
                return make_error(StatusCategory::Cancelled, std::string("Upload cancelled during ") + stage);
            }
            return make_error(StatusCategory::Network, std::string("Timed out during ") + stage);
        }
    }

    if (op.ec) {
        return make_error(StatusCategory::Network, std::string(stage) + " failed: " + op.ec.message());
    }
    return std::nullopt;
}

upo::Result<UploadReceipt, TransportError> HttpUploadTransport::upload(const upload::SourceFile& source,
                                                                       const upload::UploadMetadata& metadata,
                                                                       const upload::ProgressCallback& on_progress,
                                                                       const upload::CancelToken& cancel) {
    if (cancel.is_cancelled()) {
        return fail(make_error(StatusCategory::Cancelled, "Upload cancelled before start"));
    }

    const HttpRequest request = build_upload_request(source, metadata, options_.endpoint, make_boundary());
    const std::string head = request.serialize_head();

    asio::io_context io;
    tcp::socket socket(io);

    // Resolution is synchronous; the connect step below carries the timeout
    boost::system::error_code resolve_ec;
    tcp::resolver resolver(io);
    auto endpoints = resolver.resolve(options_.endpoint.host, std::to_string(options_.endpoint.port), resolve_ec);
    if (resolve_ec) {
        return fail(make_error(StatusCategory::Network,
                               "Failed to resolve " + options_.endpoint.host + ": " + resolve_ec.message()));
    }

    PendingOp connect_op;
    asio::async_connect(socket, endpoints,
        [&connect_op](const boost::system::error_code& ec, const tcp::endpoint&) {
            connect_op.ec = ec;
            connect_op.done = true;
        });
    if (auto error = wait_for(io, socket, connect_op, cancel, options_.connect_timeout, "connect")) {
        return fail(std::move(*error));
    }

    spdlog::debug("[HttpTransport] connected host={} port={} file={} bytes={}",
                  options_.endpoint.host, options_.endpoint.port, source.name, request.body.size());

    // Write the head, then the body in chunks so cancellation and progress
    // are observed at chunk granularity
    const std::size_t total = head.size() + request.body.size();
    std::size_t written = 0;
    int last_reported = -1;

    auto report = [&](std::size_t sent) {
        if (!on_progress || total == 0) {
            return;
        }
        const int percent = std::min(99, static_cast<int>((sent * 100) / total));
        if (percent > last_reported) {
            last_reported = percent;
            on_progress(percent);
        }
    };

    auto write_block = [&](const void* data, std::size_t size) -> std::optional<TransportError> {
        PendingOp write_op;
        asio::async_write(socket, asio::buffer(data, size),
            [&write_op](const boost::system::error_code& ec, std::size_t n) {
                write_op.ec = ec;
                write_op.bytes = n;
                write_op.done = true;
            });
        auto error = wait_for(io, socket, write_op, cancel, options_.io_timeout, "send");
        if (!error) {
            written += write_op.bytes;
            report(written);
        }
        return error;
    };

    if (auto error = write_block(head.data(), head.size())) {
        return fail(std::move(*error));
    }
    for (std::size_t offset = 0; offset < request.body.size(); offset += options_.chunk_size) {
        if (cancel.is_cancelled()) {
            return fail(make_error(StatusCategory::Cancelled, "Upload cancelled during send"));
        }
        const std::size_t n = std::min(options_.chunk_size, request.body.size() - offset);
        if (auto error = write_block(request.body.data() + offset, n)) {
            return fail(std::move(*error));
        }
    }

    HttpResponseParser parser;
    std::array<char, 8192> buffer{};
    while (!parser.is_complete()) {
        PendingOp read_op;
        socket.async_read_some(asio::buffer(buffer),
            [&read_op](const boost::system::error_code& ec, std::size_t n) {
                read_op.ec = ec;
                read_op.bytes = n;
                read_op.done = true;
            });
        auto error = wait_for(io, socket, read_op, cancel, options_.io_timeout, "receive");

        // Peer close ends a read-until-close body; anywhere else the parser rejects it
        if (read_op.done && read_op.ec == asio::error::eof) {
            auto finished = parser.finish_on_eof();
            if (finished.is_error()) {
                return fail(make_error(StatusCategory::Network, finished.error()));
            }
            break;
        }
        if (error) {
            return fail(std::move(*error));
        }

        auto parsed = parser.parse(buffer.data(), read_op.bytes);
        if (parsed.is_error()) {
            return fail(make_error(StatusCategory::ServerError, parsed.error()));
        }
    }

    boost::system::error_code shutdown_ec;
    socket.shutdown(tcp::socket::shutdown_both, shutdown_ec);
    if (shutdown_ec && shutdown_ec != asio::error::not_connected) {
        spdlog::debug("[HttpTransport] shutdown: {}", shutdown_ec.message());
    }

    const HttpResponse& response = parser.get_response();
    spdlog::debug("[HttpTransport] response status={} bytes={}", response.status_code, response.body.size());
    return classify_response(response, options_.default_retry_after);
}

} // namespace network
} // namespace upo
