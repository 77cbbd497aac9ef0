#pragma once
#include <optional>
#include <string>

namespace Unclutter {

struct Url {
    std::string href;     // input as given
    std::string scheme;   // lowercased
    std::string userinfo;
    std::string host;     // IPv6 literals keep their brackets
    std::string port;     // empty when not given
    std::string path;
    std::string query;    // without '?'
    std::string fragment; // without '#'

    // scheme://host[:port]
    std::string Origin() const;
};

namespace UrlUtil {

// Parse an absolute request URL (scheme and authority required).
// Returns std::nullopt for anything else; never touches the network.
std::optional<Url> ParseRequestUrl(const std::string& text);

// Resolve possibly-relative or protocol-relative URL against a base URL (page URL).
// Rules:
// - If candidate carries its own scheme (http:, mailto:, data:, ...), return as-is.
// - If candidate starts with //, prefix the base scheme.
// - If candidate starts with /, return base_scheme://base_host + candidate.
// - If candidate starts with ? or #, replace the base query/fragment.
// - Otherwise, append to base directory: base_scheme://base_host/base_dir/ + candidate.
// On parse failure of the base, returns candidate unchanged.
std::string ResolveAgainst(const std::string& base_url, const std::string& candidate);

}
}
