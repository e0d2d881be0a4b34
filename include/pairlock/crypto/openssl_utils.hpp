#pragma once

#include <memory>
#include <optional>
#include <string>

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/evp.h>
#include <openssl/param_build.h>

namespace pairlock::crypto {

    struct EvpPkeyDeleter {
        void operator()(EVP_PKEY *key) const { EVP_PKEY_free(key); }
    };
    struct EvpPkeyCtxDeleter {
        void operator()(EVP_PKEY_CTX *ctx) const { EVP_PKEY_CTX_free(ctx); }
    };
    struct EvpCipherCtxDeleter {
        void operator()(EVP_CIPHER_CTX *ctx) const { EVP_CIPHER_CTX_free(ctx); }
    };
    struct BioDeleter {
        void operator()(BIO *bio) const { BIO_free(bio); }
    };
    // Big numbers may hold private factors, so they are always cleared
    struct BnDeleter {
        void operator()(BIGNUM *bn) const { BN_clear_free(bn); }
    };
    struct BnCtxDeleter {
        void operator()(BN_CTX *ctx) const { BN_CTX_free(ctx); }
    };
    struct ParamBldDeleter {
        void operator()(OSSL_PARAM_BLD *bld) const { OSSL_PARAM_BLD_free(bld); }
    };
    struct ParamDeleter {
        void operator()(OSSL_PARAM *params) const { OSSL_PARAM_free(params); }
    };

    using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;
    using EvpPkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, EvpPkeyCtxDeleter>;
    using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, EvpCipherCtxDeleter>;
    using BioPtr = std::unique_ptr<BIO, BioDeleter>;
    using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
    using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;
    using ParamBldPtr = std::unique_ptr<OSSL_PARAM_BLD, ParamBldDeleter>;
    using ParamPtr = std::unique_ptr<OSSL_PARAM, ParamDeleter>;

    // Drains the OpenSSL error queue into one line
    std::string openssl_error();

    // RSA keys only; nullptr on any parse failure
    EvpPkeyPtr load_public_key(const std::string &spki_pem);
    EvpPkeyPtr load_private_key(const std::string &pkcs8_pem);

    std::optional<std::string> public_key_to_pem(EVP_PKEY *key);
    std::optional<std::string> private_key_to_pem(EVP_PKEY *key);

} // namespace pairlock::crypto
