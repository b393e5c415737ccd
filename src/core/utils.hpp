#pragma once

#include <optional>
#include <string>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Standard base64 with '=' padding.
std::string base64_encode(const std::string& input);

// Strict decode: whitespace is skipped, any other non-alphabet byte or bad
// padding yields nullopt.
std::optional<std::string> base64_decode(const std::string& input);

// 32 lowercase hex chars from a CSPRNG-seeded generator.
std::string random_hex_id();

// Expand a leading "~/" against the home directory.
std::string expand_home(const std::string& path);
