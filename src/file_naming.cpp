#include "rangedl/file_naming.hpp"
#include "rangedl/detail/curl_utils.hpp"
#include "rangedl/state_store.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <regex>
#include <string_view>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace rangedl {

namespace {

constexpr std::size_t kMaxFilenameLength = 200;

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string urlPath(const std::string& url) {
    std::string rest = url;
    const auto scheme = rest.find("://");
    if (scheme != std::string::npos) {
        rest = rest.substr(scheme + 3);
        const auto slash = rest.find('/');
        rest = slash == std::string::npos ? std::string{} : rest.substr(slash);
    }
    const auto query = rest.find_first_of("?#");
    if (query != std::string::npos) {
        rest.resize(query);
    }
    return rest;
}

} // namespace

std::string filenameFromUrl(const std::string& url, const std::string& content_disposition) {
    if (!content_disposition.empty()) {
        static const std::regex encoded{R"(filename\*=UTF-8''([^;\s]+))", std::regex::icase};
        static const std::regex plain{R"(filename=["']?([^"';\r\n]+)["']?)", std::regex::icase};

        std::smatch match;
        if (std::regex_search(content_disposition, match, encoded)) {
            return sanitizeFilename(detail::unescape(match[1].str()));
        }
        if (std::regex_search(content_disposition, match, plain)) {
            return sanitizeFilename(match[1].str());
        }
    }

    std::string path = detail::unescape(urlPath(url));
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    const auto slash = path.find_last_of('/');
    const std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    if (!name.empty() && name.find('.') != std::string::npos) {
        return sanitizeFilename(name);
    }

    const auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return fmt::format("download_{}", now);
}

std::string sanitizeFilename(const std::string& name) {
    std::string cleaned;
    cleaned.reserve(name.size());
    for (const char c : name) {
        const auto uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || std::string_view{"<>:\"/\\|?*"}.find(c) != std::string_view::npos) {
            cleaned.push_back('_');
        } else {
            cleaned.push_back(c);
        }
    }

    const auto first = cleaned.find_first_not_of(". ");
    if (first == std::string::npos) {
        return "download";
    }
    const auto last = cleaned.find_last_not_of(". ");
    cleaned = cleaned.substr(first, last - first + 1);
    if (cleaned.size() > kMaxFilenameLength) {
        cleaned.resize(kMaxFilenameLength);
    }
    return cleaned;
}

std::string categoryFor(const std::string& filename, const std::vector<Category>& categories) {
    const std::string extension = toLower(std::filesystem::path{filename}.extension().string());
    if (extension.size() < 2) {
        return "Other";
    }
    const std::string bare = extension.substr(1);

    for (const auto& category : categories) {
        for (const auto& candidate : category.extensions) {
            if (toLower(candidate) == bare) {
                return category.name;
            }
        }
    }
    return "Other";
}

std::filesystem::path savePathFor(const std::string& filename,
                                  const std::string& category,
                                  const std::vector<Category>& categories,
                                  const std::filesystem::path& base_dir) {
    std::filesystem::path folder = base_dir / category;
    for (const auto& candidate : categories) {
        if (candidate.name == category && !candidate.save_path.empty()) {
            folder = candidate.save_path;
            break;
        }
    }

    std::error_code ec;
    std::filesystem::create_directories(folder, ec);
    if (ec) {
        spdlog::warn("Cannot create download folder {}: {}", folder.string(), ec.message());
    }
    return ensureUnique(folder / filename);
}

std::filesystem::path ensureUnique(const std::filesystem::path& path,
                                   const std::function<bool(const std::filesystem::path&)>& taken) {
    const auto in_use = [&taken](const std::filesystem::path& candidate) {
        std::error_code ec;
        return std::filesystem::exists(candidate, ec) ||
               std::filesystem::exists(StateStore::statePathFor(candidate), ec) ||
               std::filesystem::exists(StateStore::tempDirFor(candidate), ec) ||
               (taken && taken(candidate));
    };
    if (!in_use(path)) {
        return path;
    }

    const auto parent = path.parent_path();
    const std::string stem = path.stem().string();
    const std::string extension = path.extension().string();
    for (int counter = 1;; ++counter) {
        const auto candidate = parent / fmt::format("{} ({}){}", stem, counter, extension);
        if (!in_use(candidate)) {
            return candidate;
        }
    }
}

bool isDownloadableProbe(const ProbeResult& probe) {
    return probe.ok && probe.content_length > 0 &&
           toLower(probe.content_type).find("text/html") == std::string::npos;
}

} // namespace rangedl
