#pragma once

#include <curl/curl.h>

#include <memory>
#include <string>

namespace rangedl::detail {

void ensureCurlInitialized();

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlHeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

[[nodiscard]] CurlHandle makeCurlHandle();

// Percent-decodes `text`; returns it unchanged if libcurl cannot.
[[nodiscard]] std::string unescape(const std::string& text);

} // namespace rangedl::detail
