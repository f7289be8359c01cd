//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpauth/auth/UrlUtil.cpp
// Purpose: URL splitting, percent-encoding and query helpers
//==========================================================================================================

#include <cctype>
#include "mcpauth/auth/UrlUtil.hpp"

namespace mcpauth::auth {

namespace {

bool isUnreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percentEncode(const std::string& s, bool spaceAsPlus) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if (isUnreserved(c)) {
            out.push_back(static_cast<char>(c));
        } else if (c == ' ' && spaceAsPlus) {
            out.push_back('+');
        } else {
            out.push_back('%');
            out.push_back(hex[(c >> 4) & 0xF]);
            out.push_back(hex[c & 0xF]);
        }
    }
    return out;
}

} // namespace

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;
    std::string rest = url;
    std::size_t hash = rest.find('#');
    if (hash != std::string::npos) {
        rest = rest.substr(0, hash);
    }
    std::size_t pos = 0;
    std::size_t schemeEnd = rest.find("://");
    if (schemeEnd != std::string::npos) {
        parts.scheme = rest.substr(0, schemeEnd);
        for (auto& c : parts.scheme) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
        parts.hasScheme = true;
        pos = schemeEnd + 3;
    } else {
        parts.scheme = std::string("http");
    }
    std::size_t authorityEnd = rest.find_first_of("/?", pos);
    std::string hostPort = rest.substr(pos, authorityEnd == std::string::npos ? std::string::npos : authorityEnd - pos);
    std::string pathQuery = authorityEnd == std::string::npos ? std::string() : rest.substr(authorityEnd);

    std::size_t at = hostPort.rfind('@');
    if (at != std::string::npos) {
        hostPort = hostPort.substr(at + 1);
    }

    std::size_t colon = std::string::npos;
    if (!hostPort.empty() && hostPort.front() == '[') {
        std::size_t close = hostPort.find(']');
        parts.host = hostPort.substr(1, close == std::string::npos ? std::string::npos : close - 1);
        if (close != std::string::npos && close + 1 < hostPort.size() && hostPort[close + 1] == ':') {
            colon = close + 1;
        }
    } else {
        colon = hostPort.find(':');
        parts.host = hostPort.substr(0, colon);
    }
    if (colon == std::string::npos || colon + 1 >= hostPort.size()) {
        parts.port = (parts.scheme == std::string("https")) ? std::string("443") : std::string("80");
    } else {
        parts.port = hostPort.substr(colon + 1);
    }

    std::size_t q = pathQuery.find('?');
    if (q == std::string::npos) {
        parts.path = pathQuery;
    } else {
        parts.path = pathQuery.substr(0, q);
        parts.query = pathQuery.substr(q + 1);
    }
    if (parts.path.empty()) {
        parts.path = std::string("/");
    }
    parts.serverName = parts.host;
    return parts;
}

std::string originOf(const std::string& url) {
    UrlParts u = parseUrl(url);
    std::string host = u.host.find(':') != std::string::npos ? std::string("[") + u.host + std::string("]") : u.host;
    std::string out = u.scheme + std::string("://") + host;
    bool defaultPort = (u.scheme == "https" && u.port == "443") || (u.scheme == "http" && u.port == "80");
    if (!defaultPort) {
        out += std::string(":") + u.port;
    }
    return out;
}

std::string urlEncode(const std::string& s) {
    return percentEncode(s, false);
}

std::string formUrlEncode(const std::string& s) {
    return percentEncode(s, true);
}

std::string urlDecode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < s.size()) {
            int hi = hexValue(s[i + 1]);
            int lo = hexValue(s[i + 2]);
            if (hi < 0 || lo < 0) {
                out.push_back(c);
                continue;
            }
            out.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::unordered_map<std::string, std::string> parseQueryString(const std::string& query) {
    std::unordered_map<std::string, std::string> out;
    std::size_t start = 0;
    while (start <= query.size()) {
        std::size_t amp = query.find('&', start);
        std::string pair = query.substr(start, amp == std::string::npos ? std::string::npos : amp - start);
        if (!pair.empty()) {
            std::size_t eq = pair.find('=');
            std::string key = urlDecode(pair.substr(0, eq));
            std::string value = eq == std::string::npos ? std::string() : urlDecode(pair.substr(eq + 1));
            out.emplace(std::move(key), std::move(value));
        }
        if (amp == std::string::npos) break;
        start = amp + 1;
    }
    return out;
}

std::string encodeForm(const std::vector<std::pair<std::string, std::string>>& fields) {
    std::string out;
    for (const auto& kv : fields) {
        if (!out.empty()) out.push_back('&');
        out += formUrlEncode(kv.first);
        out.push_back('=');
        out += formUrlEncode(kv.second);
    }
    return out;
}

std::string appendQuery(const std::string& url, const std::vector<std::pair<std::string, std::string>>& params) {
    std::string out = url;
    bool hasQuery = out.find('?') != std::string::npos;
    for (const auto& kv : params) {
        out.push_back(hasQuery ? '&' : '?');
        hasQuery = true;
        out += urlEncode(kv.first);
        out.push_back('=');
        out += urlEncode(kv.second);
    }
    return out;
}

} // namespace mcpauth::auth
