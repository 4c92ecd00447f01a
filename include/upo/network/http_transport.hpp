#pragma once

#include "upo/network/upload_protocol.hpp"
#include "upo/upload/transport.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <chrono>
#include <cstddef>
#include <optional>

namespace upo {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

struct HttpTransportOptions {
    UploadEndpoint endpoint;
    std::size_t chunk_size = 64 * 1024;
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds io_timeout{120000};     ///< Per write/read step, not the whole upload
    std::chrono::seconds default_retry_after{30};
};

/**
 * @brief TransportAdapter speaking the multipart upload contract over TCP
 *
 * Each upload() call owns a private io_context and drives it in short
 * run_for() slices, so the worker thread notices cancellation between
 * slices and aborts the socket. The request body is written in
 * `chunk_size` pieces; progress is the written percentage, capped at 99
 * until the response arrives.
 *
 * THREAD SAFETY: upload() may run concurrently on several workers; calls
 * share nothing but the immutable options.
 */
class HttpUploadTransport : public upload::TransportAdapter {
public:
    explicit HttpUploadTransport(HttpTransportOptions options);

    upo::Result<upload::UploadReceipt, upload::TransportError> upload(const upload::SourceFile& source,
                                                                      const upload::UploadMetadata& metadata,
                                                                      const upload::ProgressCallback& on_progress,
                                                                      const upload::CancelToken& cancel) override;

    const HttpTransportOptions& options() const { return options_; }

private:
    struct PendingOp {
        bool done = false;
        boost::system::error_code ec;
        std::size_t bytes = 0;
    };

    /**
     * @brief Drive `io` until `op` completes, the deadline passes or `cancel` fires
     *
     * RETURNS: nullopt on success, otherwise the error to report
     */
    std::optional<upload::TransportError> wait_for(asio::io_context& io,
                                                   tcp::socket& socket,
                                                   PendingOp& op,
                                                   const upload::CancelToken& cancel,
                                                   std::chrono::milliseconds budget,
                                                   const char* stage) const;

    HttpTransportOptions options_;
};

} // namespace network
} // namespace upo
