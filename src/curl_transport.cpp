#include "rangedl/curl_transport.hpp"
#include "rangedl/detail/curl_utils.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>
#include <vector>

#include <curl/curl.h>
#include <fmt/format.h>

namespace rangedl {

namespace {

constexpr long kReceiveBufferSize = 64 * 1024;

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

class CurlTransport::Impl {
public:
    explicit Impl(CurlOptions options) : options_(std::move(options)) {}

    [[nodiscard]] ProbeResult probe(const std::string& url, const Headers& headers, const std::string& proxy) const {
        ProbeResult meta;
        meta.final_url = url;

        detail::CurlHandle curl = detail::makeCurlHandle();
        if (!curl) {
            return meta;
        }

        detail::CurlHeaderList header_list = buildHeaderList(headers);
        HeaderBlock block;

        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(options_.probe_timeout.count()));
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &Impl::headerCallback);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &block);
        applyCommonOptions(curl.get(), header_list.get(), proxy);

        if (curl_easy_perform(curl.get()) != CURLE_OK) {
            return meta;
        }

        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &meta.status_code);
        char* effective_url = nullptr;
        if (curl_easy_getinfo(curl.get(), CURLINFO_EFFECTIVE_URL, &effective_url) == CURLE_OK && effective_url) {
            meta.final_url = effective_url;
        }

        curl_off_t length = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
        // -1 when the server did not declare a length
        meta.content_length = static_cast<std::uint64_t>(std::max<curl_off_t>(0, length));

        meta.accepts_ranges = toLower(block.value("accept-ranges")) == "bytes";
        meta.content_disposition = block.value("content-disposition");
        meta.content_type = block.value("content-type");
        meta.ok = meta.status_code > 0 && meta.status_code < 400;
        return meta;
    }

    [[nodiscard]] FetchResult fetch(const RangeRequest& request, const FetchHandlers& handlers) const {
        FetchResult result;

        detail::CurlHandle curl = detail::makeCurlHandle();
        if (!curl) {
            result.error_message = "Failed to allocate curl handle";
            return result;
        }

        detail::CurlHeaderList header_list = buildHeaderList(request.headers);
        FetchContext ctx{&handlers, curl.get()};

        const std::string range = request.last_byte
            ? fmt::format("{}-{}", request.offset, *request.last_byte)
            : fmt::format("{}-", request.offset);

        char error_buffer[CURL_ERROR_SIZE] = {0};
        curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &Impl::progressCallback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_BUFFERSIZE, kReceiveBufferSize);
        curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
        // Read timeout: abort when under 1 B/s for read_timeout seconds.
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, static_cast<long>(options_.read_timeout.count()));
        if (request.max_bytes_per_second > 0) {
            curl_easy_setopt(curl.get(), CURLOPT_MAX_RECV_SPEED_LARGE,
                             static_cast<curl_off_t>(request.max_bytes_per_second));
        }
        applyCommonOptions(curl.get(), header_list.get(), request.proxy);

        const CURLcode res = curl_easy_perform(curl.get());
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.status_code);

        if (!ctx.responded && result.status_code > 0 && res == CURLE_OK && handlers.on_response) {
            // Empty body: the handler still gets to judge the status.
            if (!handlers.on_response(result.status_code)) {
                ctx.stopped_by_handler = true;
            }
        }

        result.aborted = ctx.stopped_by_handler;
        result.transport_ok = res == CURLE_OK || ctx.stopped_by_handler;
        if (!result.transport_ok) {
            result.error_message = error_buffer[0] != '\0'
                ? std::string{error_buffer}
                : std::string{curl_easy_strerror(res)};
        }
        return result;
    }

private:
    struct HeaderBlock {
        std::vector<std::pair<std::string, std::string>> fields;

        [[nodiscard]] std::string value(const std::string& lower_name) const {
            for (const auto& [name, value] : fields) {
                if (name == lower_name) {
                    return value;
                }
            }
            return {};
        }
    };

    struct FetchContext {
        const FetchHandlers* handlers{nullptr};
        CURL* curl{nullptr};
        bool responded{false};
        bool stopped_by_handler{false};
    };

    void applyCommonOptions(CURL* curl, curl_slist* headers, const std::string& proxy) const {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        if (headers) {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        }
        if (!proxy.empty()) {
            curl_easy_setopt(curl, CURLOPT_PROXY, proxy.c_str());
        }
    }

    static detail::CurlHeaderList buildHeaderList(const Headers& headers) {
        detail::CurlHeaderList list{nullptr, &curl_slist_free_all};
        for (const auto& [name, value] : headers) {
            const std::string line = fmt::format("{}: {}", name, value);
            curl_slist* appended = curl_slist_append(list.get(), line.c_str());
            if (!appended) {
                break;
            }
            list.release();
            list.reset(appended);
        }
        return list;
    }

    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* block = static_cast<HeaderBlock*>(userdata);
        const size_t total = size * nitems;
        if (!block) {
            return 0;
        }

        const std::string line(buffer, total);
        // Each redirect hop starts a new status line; keep only the last response.
        if (line.rfind("HTTP/", 0) == 0) {
            block->fields.clear();
            return total;
        }

        const auto colon = line.find(':');
        if (colon != std::string::npos) {
            block->fields.emplace_back(toLower(trim(line.substr(0, colon))), trim(line.substr(colon + 1)));
        }
        return total;
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<FetchContext*>(userdata);
        if (!ctx || !ctx->handlers) {
            return 0;
        }

        const size_t total = size * nmemb;
        const FetchHandlers& handlers = *ctx->handlers;

        if (!ctx->responded) {
            ctx->responded = true;
            long code = 0;
            curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &code);
            if (handlers.on_response && !handlers.on_response(code)) {
                ctx->stopped_by_handler = true;
                return 0;
            }
        }

        if (total == 0) {
            return 0;
        }
        if (handlers.on_data && !handlers.on_data(ptr, total)) {
            ctx->stopped_by_handler = true;
            return 0;
        }
        return total;
    }

    static int progressCallback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        auto* ctx = static_cast<FetchContext*>(userdata);
        if (ctx && ctx->handlers && ctx->handlers->should_abort && ctx->handlers->should_abort()) {
            ctx->stopped_by_handler = true;
            return 1;
        }
        return 0;
    }

    CurlOptions options_;
};

CurlTransport::CurlTransport(CurlOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {}

CurlTransport::~CurlTransport() = default;

ProbeResult CurlTransport::probe(const std::string& url, const Headers& headers, const std::string& proxy) {
    return impl_->probe(url, headers, proxy);
}

FetchResult CurlTransport::fetch(const RangeRequest& request, const FetchHandlers& handlers) {
    return impl_->fetch(request, handlers);
}

} // namespace rangedl
