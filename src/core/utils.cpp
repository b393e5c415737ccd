#include "utils.hpp"
#include <platform/platform.hpp>
#include <openssl/evp.h>
#include <cstdio>
#include <mutex>
#include <random>
#include <stdexcept>

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string base64_encode(const std::string& input) {
    if (input.empty()) return std::string();
    std::string out(4 * ((input.size() + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                            reinterpret_cast<const unsigned char*>(input.data()),
                            static_cast<int>(input.size()));
    out.resize(n > 0 ? static_cast<size_t>(n) : 0);
    return out;
}

std::optional<std::string> base64_decode(const std::string& input) {
    std::string clean;
    clean.reserve(input.size());
    for (char c : input) {
        if (c == '\r' || c == '\n' || c == ' ' || c == '\t') continue;
        clean += c;
    }
    if (clean.empty()) return std::string();
    if (clean.size() % 4 != 0) return std::nullopt;

    // EVP_DecodeBlock reads '=' as a zero digit anywhere; only a one or two
    // byte tail of padding is valid here.
    size_t padding = clean.size() - (clean.find_last_not_of('=') + 1);
    if (padding > 2 || clean.find('=') < clean.size() - padding) return std::nullopt;

    std::string out(clean.size() / 4 * 3, '\0');
    int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                            reinterpret_cast<const unsigned char*>(clean.data()),
                            static_cast<int>(clean.size()));
    if (n < 0) return std::nullopt;
    out.resize(static_cast<size_t>(n) - padding);
    return out;
}

std::string random_hex_id() {
    static std::mutex mtx;
    static std::mt19937_64 rng{std::random_device{}()};
    std::uint64_t hi, lo;
    {
        std::lock_guard<std::mutex> lock(mtx);
        hi = rng();
        lo = rng();
    }
    char buf[33];
    std::snprintf(buf, sizeof(buf), "%016llx%016llx",
                  static_cast<unsigned long long>(hi),
                  static_cast<unsigned long long>(lo));
    return std::string(buf);
}

std::string expand_home(const std::string& path) {
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        return (platform::home_dir() / path.substr(2)).string();
    }
    if (path == "~") return platform::home_dir().string();
    return path;
}
