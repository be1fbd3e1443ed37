#include "rangedl/detail/curl_utils.hpp"

#include <cstdlib>
#include <mutex>
#include <stdexcept>

namespace rangedl::detail {

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

CurlHandle makeCurlHandle() {
    ensureCurlInitialized();
    return CurlHandle{curl_easy_init(), &curl_easy_cleanup};
}

std::string unescape(const std::string& text) {
    CurlHandle curl = makeCurlHandle();
    if (!curl) {
        return text;
    }

    int length = 0;
    char* decoded = curl_easy_unescape(curl.get(), text.c_str(), static_cast<int>(text.size()), &length);
    if (!decoded) {
        return text;
    }
    std::string result(decoded, static_cast<std::size_t>(length));
    curl_free(decoded);
    return result;
}

} // namespace rangedl::detail
