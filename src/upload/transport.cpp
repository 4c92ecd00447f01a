#include "upo/upload/transport.hpp"

namespace upo::upload {

const char* to_string(StatusCategory category) noexcept {
    switch (category) {
        case StatusCategory::RateLimited: return "rate_limited";
        case StatusCategory::ClientError: return "client_error";
        case StatusCategory::ServerError: return "server_error";
        case StatusCategory::Network: return "network";
        case StatusCategory::Cancelled: return "cancelled";
        case StatusCategory::Timeout: return "timeout";
    }
    return "unknown";
}

void CancelToken::cancel(Reason reason) noexcept {
    // Reason is published before the flag so a reader that sees the flag sees the reason
    Reason expected = Reason::None;
    reason_.compare_exchange_strong(expected, reason, std::memory_order_acq_rel);
    cancelled_.store(true, std::memory_order_release);
}

} // namespace upo::upload
