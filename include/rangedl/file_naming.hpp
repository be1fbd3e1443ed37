#pragma once

#include "http_transport.hpp"
#include "task_store.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace rangedl {

// Content-Disposition first (RFC 5987 filename* before filename=), then the
// last URL path segment when it has an extension, else download_<epoch>.
[[nodiscard]] std::string filenameFromUrl(const std::string& url, const std::string& content_disposition = {});

[[nodiscard]] std::string sanitizeFilename(const std::string& name);

[[nodiscard]] std::string categoryFor(const std::string& filename, const std::vector<Category>& categories);

// Category folder (created if missing) joined with a filename that does not
// collide with an existing file.
[[nodiscard]] std::filesystem::path savePathFor(const std::string& filename,
                                                const std::string& category,
                                                const std::vector<Category>& categories,
                                                const std::filesystem::path& base_dir);

// Appends " (1)", " (2)", ... before the extension until the path is free.
// A path is taken when it, its .partinfo or its .parts exists, or when
// `taken` says so.
[[nodiscard]] std::filesystem::path ensureUnique(
    const std::filesystem::path& path,
    const std::function<bool(const std::filesystem::path&)>& taken = {});

// Size-bearing non-HTML responses are direct files.
[[nodiscard]] bool isDownloadableProbe(const ProbeResult& probe);

} // namespace rangedl
