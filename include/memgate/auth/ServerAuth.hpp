//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerAuth.hpp
// Purpose: Bearer authentication seam for the HTTP gateway and the identity it assigns to sessions
//==========================================================================================================

#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace memgate::auth {

// TokenInfo::extra keys carrying the caller identity.
inline constexpr const char* TenantIdKey = "tenant_id";
inline constexpr const char* UserIdKey = "user_id";

//==========================================================================================================
// TokenInfo
// Purpose: Information extracted from a bearer token (scopes, expiration, identity in extra).
//==========================================================================================================
struct TokenInfo {
    std::vector<std::string> scopes;
    std::chrono::system_clock::time_point expiration;
    std::unordered_map<std::string, std::string> extra;

    std::optional<std::string> TenantId() const;
    std::optional<std::string> UserId() const;
};

//==========================================================================================================
// ITokenVerifier
// Purpose: Validates a bearer token and populates TokenInfo when valid.
// Returns: true on success (TokenInfo populated); false on failure (errorMessage set).
// Thread-safety: Verify may be called concurrently from several io threads.
//==========================================================================================================
class ITokenVerifier {
public:
    virtual ~ITokenVerifier() = default;
    virtual bool Verify(const std::string& token, TokenInfo& outInfo, std::string& errorMessage) = 0;
};

//==========================================================================================================
// StaticTokenVerifier
// Purpose: Accepts a fixed set of tokens, each bound to a tenant/user. Tokens never expire; the reported
//          expiration is one hour past the verification time.
//==========================================================================================================
class StaticTokenVerifier : public ITokenVerifier {
public:
    void AddToken(const std::string& token, const std::string& tenantId, const std::string& userId,
                  std::vector<std::string> scopes = {});
    bool Verify(const std::string& token, TokenInfo& outInfo, std::string& errorMessage) override;

private:
    struct Entry {
        std::string tenantId;
        std::string userId;
        std::vector<std::string> scopes;
    };
    std::mutex mtx;
    std::unordered_map<std::string, Entry> tokens;
};

//==========================================================================================================
// RequireBearerTokenOptions
// Fields:
//   resourceMetadataUrl: URL advertised in WWW-Authenticate when returning 401/403 (optional).
//   requiredScopes: All listed scopes must be present in the token.
//==========================================================================================================
struct RequireBearerTokenOptions {
    std::string resourceMetadataUrl;
    std::vector<std::string> requiredScopes;
};

//==========================================================================================================
// BearerCheckResult
// Fields:
//   ok: True if authorization passed.
//   httpStatus: HTTP status to use on failure (401 or 403).
//   errorMessage: Error message to include in payload.
//   includeWWWAuthenticate: Whether the caller should include a WWW-Authenticate header.
//==========================================================================================================
struct BearerCheckResult {
    bool ok{false};
    int httpStatus{401};
    std::string errorMessage;
    bool includeWWWAuthenticate{false};
};

//==========================================================================================================
// CheckBearerAuth
// Purpose: Validates an Authorization header ("Bearer <token>", scheme case-insensitive).
// Args:
//   authHeader: Value of the Authorization header (may be empty).
//   verifier: Token verifier.
//   opts: Required scopes and resource metadata URL.
//   outInfo: Populated on success.
// Returns:
//   401 for a missing, malformed, invalid or expired token; 403 when scopes are insufficient.
//==========================================================================================================
BearerCheckResult CheckBearerAuth(
    const std::string& authHeader,
    ITokenVerifier& verifier,
    const RequireBearerTokenOptions& opts,
    TokenInfo& outInfo);

// Value for the WWW-Authenticate response header matching a failed check.
std::string BuildWwwAuthenticate(const BearerCheckResult& result, const RequireBearerTokenOptions& opts);

} // namespace memgate::auth
