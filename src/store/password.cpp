#include "password.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <stdexcept>
#include <vector>

namespace todochat {

static constexpr size_t kSaltBytes = 16;
static constexpr size_t kHashBytes = 32;

static std::string to_hex(const unsigned char* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0f];
    }
    return out;
}

static bool from_hex(const std::string& hex, std::vector<unsigned char>& out) {
    if (hex.size() % 2 != 0) return false;
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    out.clear();
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) return false;
        out.push_back(static_cast<unsigned char>((hi << 4) | lo));
    }
    return true;
}

static std::vector<unsigned char> pbkdf2(const std::string& password, const unsigned char* salt,
                                         size_t salt_len, int iterations) {
    std::vector<unsigned char> out(kHashBytes);
    int ok = PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                               salt, static_cast<int>(salt_len), iterations, EVP_sha256(),
                               static_cast<int>(out.size()), out.data());
    if (ok != 1) throw std::runtime_error("PBKDF2 derivation failed");
    return out;
}

std::string random_token(size_t bytes) {
    std::vector<unsigned char> buf(bytes);
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return to_hex(buf.data(), buf.size());
}

std::string hash_password(const std::string& password, int iterations) {
    unsigned char salt[kSaltBytes];
    if (RAND_bytes(salt, sizeof(salt)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    auto hash = pbkdf2(password, salt, sizeof(salt), iterations);
    return "pbkdf2_sha256$" + std::to_string(iterations) + "$" + to_hex(salt, sizeof(salt)) + "$" +
           to_hex(hash.data(), hash.size());
}

bool verify_password(const std::string& password, const std::string& encoded) {
    // pbkdf2_sha256$iter$salt$hash
    size_t p1 = encoded.find('$');
    size_t p2 = p1 == std::string::npos ? p1 : encoded.find('$', p1 + 1);
    size_t p3 = p2 == std::string::npos ? p2 : encoded.find('$', p2 + 1);
    if (p3 == std::string::npos) return false;
    if (encoded.compare(0, p1, "pbkdf2_sha256") != 0) return false;

    int iterations = 0;
    try {
        iterations = std::stoi(encoded.substr(p1 + 1, p2 - p1 - 1));
    } catch (const std::exception&) {
        return false;
    }
    if (iterations <= 0) return false;

    std::vector<unsigned char> salt, expected;
    if (!from_hex(encoded.substr(p2 + 1, p3 - p2 - 1), salt)) return false;
    if (!from_hex(encoded.substr(p3 + 1), expected)) return false;
    if (expected.size() != kHashBytes) return false;

    auto actual = pbkdf2(password, salt.data(), salt.size(), iterations);
    return CRYPTO_memcmp(actual.data(), expected.data(), kHashBytes) == 0;
}

} // namespace todochat
