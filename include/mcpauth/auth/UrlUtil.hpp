//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/mcpauth/auth/UrlUtil.hpp
// Purpose: URL splitting, percent-encoding and query helpers shared by the OAuth client
//==========================================================================================================
#pragma once

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mcpauth::auth {

struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;       // always starts with '/'
    std::string query;      // without the leading '?'
    std::string serverName; // SNI / Host value
    bool hasScheme{false};

    // Request target: path plus query.
    std::string target() const {
        return query.empty() ? path : path + std::string("?") + query;
    }
};

// Split an absolute or scheme-less URL. Defaults: scheme http, port 80/443 by scheme. Fragment is dropped.
UrlParts parseUrl(const std::string& url);

// scheme://host[:port] of a URL (default ports omitted).
std::string originOf(const std::string& url);

// RFC 3986 percent-encoding of everything outside the unreserved set.
std::string urlEncode(const std::string& s);

// application/x-www-form-urlencoded encoding (space becomes '+').
std::string formUrlEncode(const std::string& s);

// Decode %XX escapes and '+' as space. Malformed escapes are kept literally.
std::string urlDecode(const std::string& s);

// Parse "a=1&b=2". Later duplicates do not overwrite the first occurrence.
std::unordered_map<std::string, std::string> parseQueryString(const std::string& query);

// Encode a list of form fields as "k=v&k2=v2".
std::string encodeForm(const std::vector<std::pair<std::string, std::string>>& fields);

// Append percent-encoded query parameters to a URL that may already carry a query.
std::string appendQuery(const std::string& url, const std::vector<std::pair<std::string, std::string>>& params);

} // namespace mcpauth::auth
