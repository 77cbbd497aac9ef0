#include "UrlUtil.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <vector>

namespace Unclutter {

std::string Url::Origin() const {
    std::string out = scheme + "://" + host;
    if (!port.empty()) out += ":" + port;
    return out;
}

namespace UrlUtil {

static inline bool is_scheme_char(unsigned char c) {
    return std::isalnum(c) || c == '+' || c == '-' || c == '.';
}

static inline bool has_valid_escapes(const std::string& s) {
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '%') continue;
        if (i + 2 >= s.size()) return false;
        if (!std::isxdigit(static_cast<unsigned char>(s[i + 1])) ||
            !std::isxdigit(static_cast<unsigned char>(s[i + 2]))) {
            return false;
        }
        i += 2;
    }
    return true;
}

// Returns the scheme length when s starts with "scheme:", 0 otherwise.
static size_t scheme_length(const std::string& s) {
    if (s.empty() || !std::isalpha(static_cast<unsigned char>(s[0]))) return 0;
    size_t i = 1;
    while (i < s.size() && is_scheme_char(static_cast<unsigned char>(s[i]))) ++i;
    if (i < s.size() && s[i] == ':') return i;
    return 0;
}

std::optional<Url> ParseRequestUrl(const std::string& text) {
    if (text.empty()) return std::nullopt;
    for (unsigned char c : text) {
        if (c <= 0x20 || c == 0x7f) return std::nullopt;
    }
    if (!has_valid_escapes(text)) return std::nullopt;

    const size_t scheme_len = scheme_length(text);
    if (scheme_len == 0) return std::nullopt;
    if (text.compare(scheme_len, 3, "://") != 0) return std::nullopt;

    Url url;
    url.href = text;
    url.scheme = text.substr(0, scheme_len);
    std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const size_t auth_start = scheme_len + 3;
    size_t auth_end = text.find_first_of("/?#", auth_start);
    if (auth_end == std::string::npos) auth_end = text.size();
    std::string authority = text.substr(auth_start, auth_end - auth_start);

    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        url.userinfo = authority.substr(0, at);
        authority = authority.substr(at + 1);
    }

    std::string port;
    if (!authority.empty() && authority[0] == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos || close == 1) return std::nullopt;
        url.host = authority.substr(0, close + 1);
        std::string rest = authority.substr(close + 1);
        if (!rest.empty()) {
            if (rest[0] != ':') return std::nullopt;
            port = rest.substr(1);
        }
    } else {
        auto colon = authority.find(':');
        url.host = authority.substr(0, colon);
        if (colon != std::string::npos) port = authority.substr(colon + 1);
        if (url.host.find_first_of("[]") != std::string::npos) return std::nullopt;
    }
    if (url.host.empty()) return std::nullopt;

    if (!port.empty()) {
        if (port.size() > 5) return std::nullopt;
        for (unsigned char c : port) {
            if (!std::isdigit(c)) return std::nullopt;
        }
        if (std::stoul(port) > 65535) return std::nullopt;
        url.port = port;
    }

    std::string rest = text.substr(auth_end);
    auto hash = rest.find('#');
    if (hash != std::string::npos) {
        url.fragment = rest.substr(hash + 1);
        rest.erase(hash);
    }
    auto qmark = rest.find('?');
    if (qmark != std::string::npos) {
        url.query = rest.substr(qmark + 1);
        rest.erase(qmark);
    }
    url.path = rest;
    return url;
}

static inline std::string base_directory(const std::string& path) {
    if (path.empty()) return "/";
    auto slash = path.find_last_of('/');
    if (slash == std::string::npos) return "/";
    return path.substr(0, slash + 1);
}

// Drops "." and ".." segments from an absolute path. ".." never climbs
// above the root.
static std::string remove_dot_segments(const std::string& path) {
    std::vector<std::string> segments;
    bool trailing_slash = false;
    size_t start = path.empty() || path[0] != '/' ? 0 : 1;
    while (true) {
        size_t slash = path.find('/', start);
        const bool last = slash == std::string::npos;
        std::string segment = path.substr(start, last ? std::string::npos : slash - start);
        if (segment == ".") {
            trailing_slash = last;
        } else if (segment == "..") {
            if (!segments.empty()) segments.pop_back();
            trailing_slash = last;
        } else {
            segments.push_back(std::move(segment));
            trailing_slash = false;
        }
        if (last) break;
        start = slash + 1;
    }
    std::string out;
    for (const auto& segment : segments) out += "/" + segment;
    if (trailing_slash || out.empty()) out += "/";
    return out;
}

// dir + reference with dot segments resolved; any "?query#fragment" tail of
// reference is kept verbatim.
static std::string merge_path(const std::string& dir, const std::string& reference) {
    size_t tail = reference.find_first_of("?#");
    if (tail == std::string::npos) return remove_dot_segments(dir + reference);
    return remove_dot_segments(dir + reference.substr(0, tail)) + reference.substr(tail);
}

std::string ResolveAgainst(const std::string& base_url, const std::string& candidate) {
    if (candidate.empty()) return candidate;
    if (scheme_length(candidate) > 0) return candidate;

    auto base = ParseRequestUrl(base_url);
    if (!base) return candidate; // fallback

    if (candidate.compare(0, 2, "//") == 0) {
        return base->scheme + ":" + candidate;
    }

    std::string prefix = base->Origin();
    if (candidate[0] == '/') {
        return prefix + merge_path("", candidate);
    }

    std::string path = base->path.empty() ? "/" : base->path;
    if (candidate[0] == '#') {
        return prefix + path + (base->query.empty() ? "" : "?" + base->query) + candidate;
    }
    if (candidate[0] == '?') {
        return prefix + path + candidate;
    }
    return prefix + merge_path(base_directory(base->path), candidate);
}

}
}
