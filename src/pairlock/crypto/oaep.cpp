#include "pairlock/crypto/oaep.hpp"

#include <openssl/err.h>
#include <openssl/rsa.h>

#include "pairlock/crypto/openssl_utils.hpp"

namespace pairlock::crypto {

namespace {

bool set_oaep_sha256(EVP_PKEY_CTX *ctx) {
    return EVP_PKEY_CTX_set_rsa_padding(ctx, RSA_PKCS1_OAEP_PADDING) > 0 &&
           EVP_PKEY_CTX_set_rsa_oaep_md(ctx, EVP_sha256()) > 0 && EVP_PKEY_CTX_set_rsa_mgf1_md(ctx, EVP_sha256()) > 0;
}

} // namespace

Result<std::vector<uint8_t>> oaep_wrap(const utils::SecureBytes &key, const std::string &public_pem) {
    using R = Result<std::vector<uint8_t>>;
    if (key.empty()) {
        return R::failure(Error::InvalidArgument, "Cannot wrap an empty key");
    }

    auto pkey = load_public_key(public_pem);
    if (!pkey) {
        return R::failure(Error::InvalidArgument, "Recipient public key is not an RSA SPKI PEM");
    }

    EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new(pkey.get(), nullptr));
    if (!ctx || EVP_PKEY_encrypt_init(ctx.get()) <= 0 || !set_oaep_sha256(ctx.get())) {
        return R::failure(Error::CryptoFailure, "OAEP setup failed: " + openssl_error());
    }

    size_t out_len = 0;
    if (EVP_PKEY_encrypt(ctx.get(), nullptr, &out_len, key.data(), key.size()) <= 0) {
        return R::failure(Error::CryptoFailure, "OAEP size query failed: " + openssl_error());
    }
    std::vector<uint8_t> wrapped(out_len);
    if (EVP_PKEY_encrypt(ctx.get(), wrapped.data(), &out_len, key.data(), key.size()) <= 0) {
        return R::failure(Error::CryptoFailure, "OAEP wrap failed: " + openssl_error());
    }
    wrapped.resize(out_len);
    return R::ok(std::move(wrapped));
}

Result<utils::SecureBytes> oaep_unwrap(const std::vector<uint8_t> &wrapped, const std::string &private_pem) {
    using R = Result<utils::SecureBytes>;

    auto pkey = load_private_key(private_pem);
    if (!pkey) {
        return R::failure(Error::InvalidArgument, "Private key is not an RSA PKCS#8 PEM");
    }

    EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new(pkey.get(), nullptr));
    if (!ctx || EVP_PKEY_decrypt_init(ctx.get()) <= 0 || !set_oaep_sha256(ctx.get())) {
        return R::failure(Error::CryptoFailure, "OAEP setup failed: " + openssl_error());
    }

    size_t out_len = 0;
    if (wrapped.empty() || EVP_PKEY_decrypt(ctx.get(), nullptr, &out_len, wrapped.data(), wrapped.size()) <= 0) {
        ERR_clear_error();
        return R::failure(Error::DecryptionFailed, "Decryption failed");
    }
    utils::SecureBytes key(out_len);
    if (EVP_PKEY_decrypt(ctx.get(), key.data(), &out_len, wrapped.data(), wrapped.size()) <= 0) {
        ERR_clear_error();
        return R::failure(Error::DecryptionFailed, "Decryption failed");
    }

    utils::SecureBytes exact(key.data(), out_len);
    return R::ok(std::move(exact));
}

} // namespace pairlock::crypto
