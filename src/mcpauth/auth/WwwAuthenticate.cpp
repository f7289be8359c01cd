//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WwwAuthenticate.cpp
// Purpose: Parser for HTTP WWW-Authenticate Bearer challenges (RFC 6750/RFC 9728 parameters)
//==========================================================================================================

#include "mcpauth/auth/WwwAuthenticate.hpp"

#include <cctype>

namespace mcpauth::auth {

static std::string toLower(std::string s) {
    for (size_t i = 0; i < s.size(); ++i) {
        s[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(s[i])));
    }
    return s;
}

static void skipSpaces(const std::string& s, size_t& i) {
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) {
        ++i;
    }
}

static bool parseToken(const std::string& s, size_t& i, std::string& out) {
    size_t start = i;
    while (i < s.size()) {
        unsigned char ch = static_cast<unsigned char>(s[i]);
        if (ch == ' ' || ch == '\t' || ch == '=' || ch == ',' || ch == '"') {
            break;
        }
        ++i;
    }
    out = s.substr(start, i - start);
    return i != start;
}

static bool parseQuotedString(const std::string& s, size_t& i, std::string& out) {
    out.clear();
    ++i; // opening quote
    while (i < s.size()) {
        char ch = s[i];
        if (ch == '\\') {
            if ((i + 1) >= s.size()) {
                return false;
            }
            out.push_back(s[i + 1]);
            i += 2;
            continue;
        }
        if (ch == '"') {
            ++i;
            return true;
        }
        out.push_back(ch);
        ++i;
    }
    return false; // unterminated
}

// True when the text at i is "token" followed by whitespace or end, i.e. the start of a new challenge
// rather than a key=value parameter.
static bool atSchemeStart(const std::string& s, size_t i) {
    size_t j = i;
    std::string tok;
    if (!parseToken(s, j, tok)) {
        return false;
    }
    skipSpaces(s, j);
    return j >= s.size() || s[j] != '=';
}

std::optional<BearerChallenge> parseBearerChallenge(const std::string& header) {
    size_t i = 0;
    while (i < header.size()) {
        skipSpaces(header, i);
        while (i < header.size() && header[i] == ',') {
            ++i;
            skipSpaces(header, i);
        }
        std::string scheme;
        if (!parseToken(header, i, scheme)) {
            return std::nullopt;
        }
        const bool isBearer = toLower(scheme) == std::string("bearer");

        BearerChallenge out;
        // auth-params until the next challenge or end
        for (;;) {
            skipSpaces(header, i);
            while (i < header.size() && header[i] == ',') {
                ++i;
                skipSpaces(header, i);
            }
            if (i >= header.size() || atSchemeStart(header, i)) {
                break;
            }
            std::string key;
            if (!parseToken(header, i, key)) {
                return std::nullopt;
            }
            key = toLower(key);
            skipSpaces(header, i);
            if (i >= header.size() || header[i] != '=') {
                return std::nullopt;
            }
            ++i;
            skipSpaces(header, i);
            std::string value;
            if (i < header.size() && header[i] == '"') {
                if (!parseQuotedString(header, i, value)) {
                    return std::nullopt;
                }
            } else {
                size_t vstart = i;
                while (i < header.size() && header[i] != ',') {
                    ++i;
                }
                size_t vend = i;
                while (vend > vstart && (header[vend - 1] == ' ' || header[vend - 1] == '\t')) {
                    --vend;
                }
                value = header.substr(vstart, vend - vstart);
            }
            out.params[key] = value;
        }

        if (isBearer) {
            auto get = [&out](const char* k) {
                auto it = out.params.find(k);
                return it == out.params.end() ? std::string() : it->second;
            };
            out.realm = get("realm");
            out.error = get("error");
            out.errorDescription = get("error_description");
            out.scope = get("scope");
            out.resourceMetadata = get("resource_metadata");
            return out;
        }
    }
    return std::nullopt;
}

} // namespace mcpauth::auth
