/**
 * StaticFiles — serves the front-end build directory (dist/ by default).
 *
 * Directories map to their index.html. Segments that are "..", or that start
 * with a dot, never resolve.
 */

#include "api/static_files.h"

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace {

bool is_regular(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

bool is_dir(const fs::path& p) {
    std::error_code ec;
    return fs::is_directory(p, ec);
}

} // namespace

StaticFiles::StaticFiles(fs::path root) : root_(std::move(root)) {}

std::optional<HttpResponse> StaticFiles::serve(const HttpRequest& request) const {
    if (request.method != "GET") {
        return std::nullopt;
    }
    auto file = resolve(request.path);
    if (!file) {
        return std::nullopt;
    }

    std::ifstream stream(*file, std::ios::binary);
    if (!stream.is_open()) {
        throw std::runtime_error("unable to open static file: " + file->string());
    }
    std::string content((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
    if (stream.bad()) {
        throw std::runtime_error("unable to read static file: " + file->string());
    }

    HttpResponse resp;
    resp.status = 200;
    resp.body = std::move(content);
    resp.content_type = std::string(mime_type(*file));
    return resp;
}

std::optional<fs::path> StaticFiles::resolve(std::string_view url_path) const {
    if (!is_dir(root_)) {
        return std::nullopt;
    }
    auto decoded = percent_decode(url_path);
    if (!decoded || decoded->find('\0') != std::string::npos || decoded->find('\\') != std::string::npos) {
        return std::nullopt;
    }

    fs::path candidate = root_;
    std::size_t pos = 0;
    while (pos <= decoded->size()) {
        auto next = decoded->find('/', pos);
        if (next == std::string::npos) {
            next = decoded->size();
        }
        std::string segment = decoded->substr(pos, next - pos);
        pos = next + 1;
        if (segment.empty() || segment == ".") {
            continue;
        }
        if (segment.front() == '.') {
            return std::nullopt;
        }
        candidate /= segment;
    }

    if (is_dir(candidate)) {
        candidate /= "index.html";
    }
    if (!is_regular(candidate)) {
        return std::nullopt;
    }
    return candidate;
}

std::string_view StaticFiles::mime_type(const fs::path& file) {
    auto ext = to_lower_copy(file.extension().string());
    if (ext == ".html" || ext == ".htm") return "text/html; charset=utf-8";
    if (ext == ".css") return "text/css; charset=utf-8";
    if (ext == ".js" || ext == ".mjs") return "application/javascript; charset=utf-8";
    if (ext == ".json" || ext == ".map") return "application/json; charset=utf-8";
    if (ext == ".txt") return "text/plain; charset=utf-8";
    if (ext == ".png") return "image/png";
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".gif") return "image/gif";
    if (ext == ".svg") return "image/svg+xml";
    if (ext == ".ico") return "image/x-icon";
    if (ext == ".webp") return "image/webp";
    if (ext == ".woff") return "font/woff";
    if (ext == ".woff2") return "font/woff2";
    return "application/octet-stream";
}
