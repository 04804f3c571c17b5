//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/memgate/auth/ServerAuth.cpp
// Purpose: Bearer authentication helpers and the static token verifier
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <chrono>
#include <string>
#include <vector>

#include "memgate/auth/ServerAuth.hpp"

namespace memgate::auth {

namespace {
    bool icaseEqual(char a, char b) {
        return (std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b)));
    }

    bool startsWithBearer(const std::string& s) {
        const std::string pfx = "Bearer ";
        if (s.size() < pfx.size()) {
            return false;
        }
        for (size_t i = 0; i < pfx.size(); ++i) {
            if (!icaseEqual(s[i], pfx[i])) {
                return false;
            }
        }
        return true;
    }

    bool containsAllScopes(const std::vector<std::string>& have, const std::vector<std::string>& need) {
        return std::all_of(need.begin(), need.end(), [&have](const std::string& s) {
            return std::find(have.begin(), have.end(), s) != have.end();
        });
    }

    BearerCheckResult fail(int status, std::string message) {
        BearerCheckResult r;
        r.ok = false;
        r.httpStatus = status;
        r.errorMessage = std::move(message);
        r.includeWWWAuthenticate = true;
        return r;
    }

    std::optional<std::string> extraValue(const TokenInfo& info, const char* key) {
        auto it = info.extra.find(key);
        if (it == info.extra.end() || it->second.empty()) {
            return std::nullopt;
        }
        return it->second;
    }
}

std::optional<std::string> TokenInfo::TenantId() const {
    return extraValue(*this, TenantIdKey);
}

std::optional<std::string> TokenInfo::UserId() const {
    return extraValue(*this, UserIdKey);
}

void StaticTokenVerifier::AddToken(const std::string& token, const std::string& tenantId, const std::string& userId,
                                   std::vector<std::string> scopes) {
    std::lock_guard<std::mutex> lk(mtx);
    tokens[token] = Entry{tenantId, userId, std::move(scopes)};
}

bool StaticTokenVerifier::Verify(const std::string& token, TokenInfo& outInfo, std::string& errorMessage) {
    std::lock_guard<std::mutex> lk(mtx);
    auto it = tokens.find(token);
    if (it == tokens.end()) {
        errorMessage = "invalid token";
        return false;
    }
    outInfo.scopes = it->second.scopes;
    outInfo.expiration = std::chrono::system_clock::now() + std::chrono::hours(1);
    outInfo.extra.clear();
    if (!it->second.tenantId.empty()) {
        outInfo.extra[TenantIdKey] = it->second.tenantId;
    }
    if (!it->second.userId.empty()) {
        outInfo.extra[UserIdKey] = it->second.userId;
    }
    return true;
}

BearerCheckResult CheckBearerAuth(
    const std::string& authHeader,
    ITokenVerifier& verifier,
    const RequireBearerTokenOptions& opts,
    TokenInfo& outInfo) {

    if (authHeader.empty() || !startsWithBearer(authHeader)) {
        return fail(401, "no bearer token");
    }
    std::string token = authHeader.substr(7);
    // Trim leading spaces on token
    token.erase(token.begin(), std::find_if(token.begin(), token.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) == 0;
    }));
    if (token.empty()) {
        return fail(401, "no bearer token");
    }

    std::string err;
    TokenInfo info;
    if (!verifier.Verify(token, info, err)) {
        return fail(401, err.empty() ? std::string("invalid token") : err);
    }

    if (!opts.requiredScopes.empty() && !containsAllScopes(info.scopes, opts.requiredScopes)) {
        return fail(403, "insufficient scope");
    }

    if (info.expiration.time_since_epoch().count() == 0) {
        return fail(401, "token missing expiration");
    }
    if (info.expiration <= std::chrono::system_clock::now()) {
        return fail(401, "token expired");
    }

    outInfo = std::move(info);
    BearerCheckResult r;
    r.ok = true;
    r.httpStatus = 200;
    return r;
}

std::string BuildWwwAuthenticate(const BearerCheckResult& result, const RequireBearerTokenOptions& opts) {
    std::string v = "Bearer realm=\"memgate\"";
    v += (result.httpStatus == 403) ? ", error=\"insufficient_scope\"" : ", error=\"invalid_token\"";
    if (!result.errorMessage.empty()) {
        v += ", error_description=\"" + result.errorMessage + "\"";
    }
    if (!opts.resourceMetadataUrl.empty()) {
        v += ", resource_metadata=\"" + opts.resourceMetadataUrl + "\"";
    }
    return v;
}

} // namespace memgate::auth
