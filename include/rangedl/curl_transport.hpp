#pragma once

#include "http_transport.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace rangedl {

struct CurlOptions {
    std::chrono::seconds connect_timeout{30};
    std::chrono::seconds read_timeout{30};
    std::chrono::seconds probe_timeout{15};
    std::string user_agent{"rangedl/1.0"};
};

class CurlTransport final : public HttpTransport {
public:
    explicit CurlTransport(CurlOptions options = {});
    ~CurlTransport() override;

    [[nodiscard]] ProbeResult probe(const std::string& url,
                                    const Headers& headers,
                                    const std::string& proxy) override;
    [[nodiscard]] FetchResult fetch(const RangeRequest& request,
                                    const FetchHandlers& handlers) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rangedl
