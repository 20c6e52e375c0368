//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Pkce.cpp
// Purpose: PKCE verifier/challenge generation, OAuth state nonces and base64 helpers (OpenSSL)
//==========================================================================================================

#include <array>
#include <cstdio>
#include <vector>

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include "mcpm/auth/Pkce.hpp"
#include "mcpm/errors/Errors.h"

namespace mcpm::auth {

using errors::ErrorCode;
using errors::ManagerError;

namespace {
// 48 bytes encode to exactly 64 base64 characters.
constexpr int VerifierBytes = 48;

std::string randomBytes(int count) {
    std::string out(static_cast<std::size_t>(count), '\0');
    if (::RAND_bytes(reinterpret_cast<unsigned char*>(out.data()), count) != 1) {
        throw ManagerError(ErrorCode::AuthFailed, "Secure random generator unavailable");
    }
    return out;
}
} // namespace

std::string Base64Encode(const std::string& data) {
    std::vector<unsigned char> buf(4 * ((data.size() + 2) / 3) + 1);
    int n = ::EVP_EncodeBlock(buf.data(), reinterpret_cast<const unsigned char*>(data.data()),
                              static_cast<int>(data.size()));
    return std::string(reinterpret_cast<const char*>(buf.data()), static_cast<std::size_t>(n));
}

std::string Base64UrlEncode(const std::string& data) {
    std::string s = Base64Encode(data);
    while (!s.empty() && s.back() == '=') {
        s.pop_back();
    }
    for (char& c : s) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return s;
}

std::string ComputeCodeChallenge(const std::string& verifier) {
    std::array<unsigned char, SHA256_DIGEST_LENGTH> digest{};
    ::SHA256(reinterpret_cast<const unsigned char*>(verifier.data()), verifier.size(), digest.data());
    return Base64UrlEncode(std::string(reinterpret_cast<const char*>(digest.data()), digest.size()));
}

PkcePair GeneratePkcePair() {
    PkcePair p;
    p.verifier = Base64UrlEncode(randomBytes(VerifierBytes));
    p.challenge = ComputeCodeChallenge(p.verifier);
    return p;
}

std::string GenerateStateNonce() {
    std::string b = randomBytes(16);
    b[6] = static_cast<char>((static_cast<unsigned char>(b[6]) & 0x0F) | 0x40);
    b[8] = static_cast<char>((static_cast<unsigned char>(b[8]) & 0x3F) | 0x80);
    char out[37];
    const auto* u = reinterpret_cast<const unsigned char*>(b.data());
    std::snprintf(out, sizeof(out), "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  u[0], u[1], u[2], u[3], u[4], u[5], u[6], u[7], u[8], u[9], u[10], u[11], u[12], u[13], u[14], u[15]);
    return std::string(out);
}

} // namespace mcpm::auth
