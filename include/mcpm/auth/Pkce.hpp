//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Pkce.hpp
// Purpose: PKCE verifier/challenge generation, OAuth state nonces and base64 helpers (OpenSSL)
//==========================================================================================================

#pragma once

#include <string>

namespace mcpm::auth {

struct PkcePair {
    std::string verifier;   // 64 characters from the unreserved URL set
    std::string challenge;  // base64url(SHA-256(verifier)), no padding
    std::string method{"S256"};
};

//==========================================================================================================
// GeneratePkcePair
// Purpose: Creates a fresh verifier from 48 random bytes and its S256 challenge.
// Returns:
//   The pair. Throws errors::ManagerError(AuthFailed) if the random source fails.
//==========================================================================================================
PkcePair GeneratePkcePair();

// S256 challenge for a given verifier.
std::string ComputeCodeChallenge(const std::string& verifier);

// Random RFC 4122 version 4 UUID, lower-case.
std::string GenerateStateNonce();

std::string Base64Encode(const std::string& data);
// URL alphabet ('-' and '_'), padding stripped.
std::string Base64UrlEncode(const std::string& data);

} // namespace mcpm::auth
