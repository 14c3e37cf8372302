#pragma once

#include <string>
#include <vector>
#include <cstdint>

#include "infrastructure/error_handling.h"

namespace liarslie {
namespace crypto {

constexpr size_t ED25519_SEED_SIZE = 32;
constexpr size_t ED25519_PUBLIC_KEY_SIZE = 32;
constexpr size_t ED25519_SIGNATURE_SIZE = 64;

// Both halves are base64 text. privateKey is the 32-byte Ed25519 seed,
// publicKey the 32-byte raw public key.
struct KeyPair {
    std::string privateKey;
    std::string publicKey;
};

// Throws std::runtime_error when the OS CSPRNG or OpenSSL fails.
KeyPair generateKeyPair();
Result<std::string> derivePublicKey(const std::string& privateKey);

Result<std::vector<uint8_t>> sign(const std::string& privateKey, const std::vector<uint8_t>& data);
Result<void> verify(const std::vector<uint8_t>& data,
                    const std::vector<uint8_t>& signature,
                    const std::string& publicKey);

std::string base64Encode(const std::vector<uint8_t>& data);
Result<std::vector<uint8_t>> base64Decode(const std::string& text);

void secureZero(void* ptr, size_t len);

}
}
