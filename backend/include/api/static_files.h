#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

#include "api/http_message.h"

/**
 * Read-only file server for the bundled front end.
 *
 * Only GET requests are considered (HEAD arrives here already rewritten to
 * GET by the router). Requests that do not name a regular file under the
 * root fall through so that the API routes can answer them.
 */
class StaticFiles {
public:
    explicit StaticFiles(std::filesystem::path root);

    /// Throws std::runtime_error if a resolved file cannot be read.
    [[nodiscard]] std::optional<HttpResponse> serve(const HttpRequest& request) const;

    /// Absolute file for a URL path, or nullopt if it is outside the root,
    /// hidden, or not a regular file.
    [[nodiscard]] std::optional<std::filesystem::path> resolve(std::string_view url_path) const;

    static std::string_view mime_type(const std::filesystem::path& file);

private:
    std::filesystem::path root_;
};
