#include "crypto/crypto.h"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <memory>
#include <stdexcept>

namespace liarslie {
namespace crypto {

namespace {

struct PkeyDeleter {
    void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); }
};
struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); }
};
struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

std::string opensslError() {
    unsigned long code = ERR_get_error();
    if (code == 0) return "unknown OpenSSL failure";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

Result<PkeyPtr> loadPrivateKey(const std::string& privateKey) {
    auto seed = base64Decode(privateKey);
    if (!seed.ok() || seed.value().size() != ED25519_SEED_SIZE) {
        return makeError(ErrorCode::CRYPTO_ERROR, "malformed private key");
    }
    PkeyPtr pkey(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                              seed.value().data(), seed.value().size()));
    secureZero(seed.value().data(), seed.value().size());
    if (!pkey) {
        return makeError(ErrorCode::CRYPTO_ERROR, "rejected private key: " + opensslError());
    }
    return Result<PkeyPtr>(std::move(pkey));
}

Result<std::string> rawPublicKey(EVP_PKEY* pkey) {
    std::vector<uint8_t> pub(ED25519_PUBLIC_KEY_SIZE);
    size_t len = pub.size();
    if (EVP_PKEY_get_raw_public_key(pkey, pub.data(), &len) <= 0 || len != ED25519_PUBLIC_KEY_SIZE) {
        return makeError(ErrorCode::CRYPTO_ERROR, "cannot export public key: " + opensslError());
    }
    return base64Encode(pub);
}

}

KeyPair generateKeyPair() {
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0) {
        throw std::runtime_error("Ed25519 keygen init failed: " + opensslError());
    }
    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0) {
        throw std::runtime_error("Ed25519 keygen failed: " + opensslError());
    }
    PkeyPtr pkey(raw);

    std::vector<uint8_t> seed(ED25519_SEED_SIZE);
    size_t seedLen = seed.size();
    if (EVP_PKEY_get_raw_private_key(pkey.get(), seed.data(), &seedLen) <= 0 || seedLen != ED25519_SEED_SIZE) {
        throw std::runtime_error("cannot export Ed25519 seed: " + opensslError());
    }
    auto pub = rawPublicKey(pkey.get());
    if (!pub.ok()) {
        throw std::runtime_error(pub.error().message);
    }

    KeyPair kp;
    kp.privateKey = base64Encode(seed);
    kp.publicKey = pub.value();
    secureZero(seed.data(), seed.size());
    return kp;
}

Result<std::string> derivePublicKey(const std::string& privateKey) {
    auto pkey = loadPrivateKey(privateKey);
    if (!pkey.ok()) return pkey.error();
    return rawPublicKey(pkey.value().get());
}

Result<std::vector<uint8_t>> sign(const std::string& privateKey, const std::vector<uint8_t>& data) {
    auto pkey = loadPrivateKey(privateKey);
    if (!pkey.ok()) return pkey.error();

    MdCtxPtr md(EVP_MD_CTX_new());
    if (!md || EVP_DigestSignInit(md.get(), nullptr, nullptr, nullptr, pkey.value().get()) <= 0) {
        return makeError(ErrorCode::CRYPTO_ERROR, "sign init failed: " + opensslError());
    }
    std::vector<uint8_t> sig(ED25519_SIGNATURE_SIZE);
    size_t sigLen = sig.size();
    static const uint8_t empty = 0;
    const uint8_t* msg = data.empty() ? &empty : data.data();
    if (EVP_DigestSign(md.get(), sig.data(), &sigLen, msg, data.size()) <= 0) {
        return makeError(ErrorCode::CRYPTO_ERROR, "sign failed: " + opensslError());
    }
    sig.resize(sigLen);
    return sig;
}

Result<void> verify(const std::vector<uint8_t>& data,
                    const std::vector<uint8_t>& signature,
                    const std::string& publicKey) {
    auto pub = base64Decode(publicKey);
    if (!pub.ok() || pub.value().size() != ED25519_PUBLIC_KEY_SIZE) {
        return makeError(ErrorCode::AUTH_ERROR, "malformed public key");
    }
    if (signature.size() != ED25519_SIGNATURE_SIZE) {
        return makeError(ErrorCode::AUTH_ERROR, "malformed signature");
    }
    PkeyPtr pkey(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                             pub.value().data(), pub.value().size()));
    if (!pkey) {
        ERR_clear_error();
        return makeError(ErrorCode::AUTH_ERROR, "rejected public key");
    }
    MdCtxPtr md(EVP_MD_CTX_new());
    if (!md || EVP_DigestVerifyInit(md.get(), nullptr, nullptr, nullptr, pkey.get()) <= 0) {
        ERR_clear_error();
        return makeError(ErrorCode::AUTH_ERROR, "verify init failed");
    }
    static const uint8_t empty = 0;
    const uint8_t* msg = data.empty() ? &empty : data.data();
    if (EVP_DigestVerify(md.get(), signature.data(), signature.size(), msg, data.size()) != 1) {
        ERR_clear_error();
        return makeError(ErrorCode::AUTH_ERROR, "signature mismatch");
    }
    return {};
}

std::string base64Encode(const std::vector<uint8_t>& data) {
    if (data.empty()) return "";
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data.data(),
                            static_cast<int>(data.size()));
    out.resize(n > 0 ? static_cast<size_t>(n) : 0);
    return out;
}

Result<std::vector<uint8_t>> base64Decode(const std::string& text) {
    if (text.empty()) return std::vector<uint8_t>{};
    if (text.size() % 4 != 0) {
        return makeError(ErrorCode::DECODE_ERROR, "base64 length is not a multiple of 4");
    }
    std::vector<uint8_t> out(text.size() / 4 * 3);
    int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                            static_cast<int>(text.size()));
    if (n < 0) {
        return makeError(ErrorCode::DECODE_ERROR, "invalid base64");
    }
    size_t padding = 0;
    if (text[text.size() - 1] == '=') padding++;
    if (text[text.size() - 2] == '=') padding++;
    out.resize(static_cast<size_t>(n) - padding);
    // EVP_DecodeBlock tolerates whitespace and non-zero pad bits
    if (base64Encode(out) != text) {
        return makeError(ErrorCode::DECODE_ERROR, "non-canonical base64");
    }
    return out;
}

void secureZero(void* ptr, size_t len) {
    volatile uint8_t* p = static_cast<volatile uint8_t*>(ptr);
    while (len--) *p++ = 0;
}

}
}
