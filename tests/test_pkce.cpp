//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_pkce.cpp
// Purpose: GoogleTests for PKCE generation, state nonces and the form/URL helpers
//==========================================================================================================

#include <gtest/gtest.h>

#include <cctype>
#include <set>

#include "mcpm/auth/OAuthClient.hpp"
#include "mcpm/auth/Pkce.hpp"

using namespace mcpm::auth;

TEST(Pkce, Rfc7636AppendixBVector) {
    EXPECT_EQ(ComputeCodeChallenge("dBjftJeZ4CVP-mB92K27uhbUJU1p1r_wW1gFWFOEjXk"),
              "E9Melhoa2OwvFrEMTJguCHaoeK1t8URWbuGJSstw-cM");
}

TEST(Pkce, GeneratedPairIsConsistent) {
    PkcePair p = GeneratePkcePair();
    EXPECT_EQ(p.verifier.size(), 64u);
    EXPECT_EQ(p.method, "S256");
    EXPECT_EQ(p.challenge, ComputeCodeChallenge(p.verifier));
    for (char c : p.verifier) {
        EXPECT_TRUE(std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_') << c;
    }
    EXPECT_NE(GeneratePkcePair().verifier, p.verifier);
}

TEST(Pkce, StateNonceIsUuidV4) {
    std::set<std::string> seen;
    for (int i = 0; i < 32; ++i) {
        std::string s = GenerateStateNonce();
        ASSERT_EQ(s.size(), 36u);
        EXPECT_EQ(s[8], '-');
        EXPECT_EQ(s[14], '4');
        EXPECT_TRUE(s[19] == '8' || s[19] == '9' || s[19] == 'a' || s[19] == 'b');
        seen.insert(s);
    }
    EXPECT_EQ(seen.size(), 32u);
}

TEST(Pkce, Base64Variants) {
    EXPECT_EQ(Base64Encode("hello"), "aGVsbG8=");
    EXPECT_EQ(Base64Encode(""), "");
    EXPECT_EQ(Base64UrlEncode(std::string("\xfb\xff", 2)), "-_8");
}

TEST(FormEncoding, EncodeAndDecode) {
    EXPECT_EQ(UrlEncodeForm("a b&c=d/é"), "a+b%26c%3Dd%2F%C3%A9");
    EXPECT_EQ(UrlEncodeForm("Az09-._~"), "Az09-._~");
    EXPECT_EQ(UrlDecode("a+b%26c%3dd"), "a b&c=d");
}

TEST(FormEncoding, QueryParams) {
    auto params = ParseQueryParams("mcp-app://oauth/callback?code=abc%2F1&state=s1&state=s2#frag");
    EXPECT_EQ(params["code"], "abc/1");
    EXPECT_EQ(params["state"], "s2");
    EXPECT_EQ(params.count("frag"), 0u);
    EXPECT_TRUE(ParseQueryParams("mcp-app://oauth/callback").empty());
}

TEST(FormEncoding, BasicAuthorizationEncodesCredentials) {
    EXPECT_EQ(BasicAuthorization("client", "secret"), "Basic " + Base64Encode("client:secret"));
    EXPECT_EQ(BasicAuthorization("a:b", "c d"), "Basic " + Base64Encode("a%3Ab:c+d"));
}
