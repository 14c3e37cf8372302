#include "crypto/keys.h"

namespace liarslie {
namespace crypto {

Keys::~Keys() {
    if (!pair_.privateKey.empty()) {
        secureZero(&pair_.privateKey[0], pair_.privateKey.size());
    }
}

Keys Keys::generate() {
    return Keys(generateKeyPair());
}

Result<Keys> Keys::fromPrivateKey(const std::string& privateKey) {
    auto pub = derivePublicKey(privateKey);
    if (!pub.ok()) return pub.error();
    KeyPair pair;
    pair.privateKey = privateKey;
    pair.publicKey = pub.value();
    return Keys(std::move(pair));
}

Result<std::vector<uint8_t>> Keys::sign(const std::vector<uint8_t>& message) const {
    if (!valid()) {
        return makeError(ErrorCode::INVALID_STATE, "no private key loaded");
    }
    return crypto::sign(pair_.privateKey, message);
}

Result<void> Keys::verify(const std::vector<uint8_t>& message,
                          const std::vector<uint8_t>& signature) const {
    return crypto::verify(message, signature, pair_.publicKey);
}

}
}
