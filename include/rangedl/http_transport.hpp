#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace rangedl {

using Headers = std::map<std::string, std::string>;

struct ProbeResult {
    bool ok{false};
    long status_code{0};
    std::string final_url;
    std::uint64_t content_length{0};
    bool accepts_ranges{false};
    std::string content_disposition;
    std::string content_type;
};

struct RangeRequest {
    std::string url;
    Headers headers;
    std::string proxy;
    std::uint64_t offset{0};
    std::optional<std::uint64_t> last_byte; // inclusive; nullopt requests to the end
    std::uint64_t max_bytes_per_second{0};  // 0 = unlimited
};

struct FetchHandlers {
    // Called once with the final status before any body byte; false rejects the body.
    std::function<bool(long status_code)> on_response;
    // Called per received buffer; false aborts the transfer.
    std::function<bool(const char* data, std::size_t size)> on_data;
    // Polled while the transfer is idle; true aborts it.
    std::function<bool()> should_abort;
};

struct FetchResult {
    bool transport_ok{false}; // false on connect/read/timeout failures
    bool aborted{false};      // a handler stopped the transfer
    long status_code{0};
    std::string error_message;
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Metadata request following redirects. Never throws.
    [[nodiscard]] virtual ProbeResult probe(const std::string& url,
                                            const Headers& headers,
                                            const std::string& proxy) = 0;

    // Ranged GET streaming the body into `handlers`. Must be safe to call
    // concurrently from several workers.
    [[nodiscard]] virtual FetchResult fetch(const RangeRequest& request,
                                            const FetchHandlers& handlers) = 0;
};

[[nodiscard]] inline bool isAcceptedRangeStatus(long status_code) {
    return status_code == 200 || status_code == 206;
}

} // namespace rangedl
