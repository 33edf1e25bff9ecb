#pragma once
#include <string>
#include <jwt-cpp/traits/nlohmann-json/defaults.h>

/// Signed client key carrying the given dimension_id claim.
inline std::string testClientKey(const std::string& dimensionId = "dim-123") {
    return jwt::create()
        .set_type("JWT")
        .set_payload_claim("dimension_id", jwt::claim(dimensionId))
        .sign(jwt::algorithm::hs256{ "test-secret" });
}
