#pragma once

#include "crypto/crypto.h"
#include <string>
#include <vector>
#include <cstdint>

namespace liarslie {
namespace crypto {

// An owned Ed25519 identity. The private half never leaves this object except
// through keyPair(), which exists for tests and key hand-off at construction.
class Keys {
public:
    Keys() = default;
    Keys(const Keys& other) = default;
    Keys& operator=(const Keys& other) = default;
    ~Keys();

    static Keys generate();
    static Result<Keys> fromPrivateKey(const std::string& privateKey);

    bool valid() const { return !pair_.privateKey.empty(); }
    const std::string& publicKey() const { return pair_.publicKey; }
    const KeyPair& keyPair() const { return pair_; }

    Result<std::vector<uint8_t>> sign(const std::vector<uint8_t>& message) const;
    Result<void> verify(const std::vector<uint8_t>& message,
                        const std::vector<uint8_t>& signature) const;

private:
    explicit Keys(KeyPair pair) : pair_(std::move(pair)) {}
    KeyPair pair_;
};

}
}
