#pragma once
#include <cstddef>
#include <string>

namespace todochat {

inline constexpr int kPasswordIterations = 100000;

// "pbkdf2_sha256$<iterations>$<salt hex>$<hash hex>"
std::string hash_password(const std::string& password, int iterations = kPasswordIterations);

// Constant-time comparison against a hash_password() string
bool verify_password(const std::string& password, const std::string& encoded);

// Hex string of `bytes` random bytes from the OpenSSL CSPRNG
std::string random_token(size_t bytes = 32);

} // namespace todochat
