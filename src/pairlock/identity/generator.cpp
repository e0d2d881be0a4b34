#include "pairlock/identity/generator.hpp"

#include <chrono>

#include <openssl/core_names.h>
#include <openssl/err.h>

#include "pairlock/crypto/openssl_utils.hpp"
#include "pairlock/utils/log.hpp"

namespace {

using pairlock::Error;
using pairlock::Result;
using pairlock::crypto::BnCtxPtr;
using pairlock::crypto::BnPtr;
using pairlock::crypto::RandomSource;
using pairlock::identity::KeyPair;
using pairlock::utils::SecureBytes;

namespace constants = pairlock::constants;

Result<KeyPair> crypto_failure(const std::string &what) {
    return Result<KeyPair>::failure(Error::CryptoFailure, what + ": " + pairlock::crypto::openssl_error());
}

// Draws a k bit probable prime p with p mod e != 1 into `out`
bool draw_prime(RandomSource &source, int k, BN_CTX *ctx, BIGNUM *out) {
    SecureBytes buf(static_cast<size_t>(k / 8));
    for (;;) {
        source.fill(buf.data(), buf.size());
        buf[0] |= 0xC0;
        buf[buf.size() - 1] |= 0x01;
        if (BN_bin2bn(buf.data(), static_cast<int>(buf.size()), out) == nullptr) {
            return false;
        }

        while (BN_num_bits(out) == k) {
            const BN_ULONG rem = BN_mod_word(out, constants::RSA_PUBLIC_EXPONENT);
            if (rem == static_cast<BN_ULONG>(-1)) {
                return false;
            }
            if (rem != 1) {
                const int rc = BN_check_prime(out, ctx, nullptr);
                if (rc < 0) {
                    return false;
                }
                if (rc == 1) {
                    return true;
                }
            }
            if (BN_add_word(out, 2) != 1) {
                return false;
            }
        }
    }
}

pairlock::crypto::EvpPkeyPtr assemble_key(const BIGNUM *n, const BIGNUM *e, const BIGNUM *d, const BIGNUM *p,
                                          const BIGNUM *q, const BIGNUM *dmp1, const BIGNUM *dmq1,
                                          const BIGNUM *iqmp) {
    pairlock::crypto::ParamBldPtr bld(OSSL_PARAM_BLD_new());
    if (!bld || OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_N, n) != 1 ||
        OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_E, e) != 1 ||
        OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_D, d) != 1 ||
        OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_FACTOR1, p) != 1 ||
        OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_FACTOR2, q) != 1 ||
        OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_EXPONENT1, dmp1) != 1 ||
        OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_EXPONENT2, dmq1) != 1 ||
        OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_COEFFICIENT1, iqmp) != 1) {
        return nullptr;
    }

    pairlock::crypto::ParamPtr params(OSSL_PARAM_BLD_to_param(bld.get()));
    pairlock::crypto::EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(nullptr, "RSA", nullptr));
    if (!params || !ctx || EVP_PKEY_fromdata_init(ctx.get()) <= 0) {
        return nullptr;
    }

    EVP_PKEY *key = nullptr;
    if (EVP_PKEY_fromdata(ctx.get(), &key, EVP_PKEY_KEYPAIR, params.get()) <= 0) {
        return nullptr;
    }
    return pairlock::crypto::EvpPkeyPtr(key);
}

} // namespace

namespace pairlock::identity {

Result<KeyPair> generate_rsa(crypto::RandomSource &source, int bits) {
    if (bits < 2048 || bits % 16 != 0) {
        return Result<KeyPair>::failure(Error::InvalidArgument, "RSA size must be >= 2048 and a multiple of 16");
    }
    const int k = bits / 2;

    BnCtxPtr ctx(BN_CTX_secure_new());
    BnPtr p(BN_secure_new()), q(BN_secure_new()), e(BN_new()), diff(BN_new()), bound(BN_new());
    BnPtr n(BN_new()), p1(BN_secure_new()), q1(BN_secure_new()), gcd(BN_secure_new()), phi(BN_secure_new());
    BnPtr lcm(BN_secure_new()), dmp1(BN_secure_new()), dmq1(BN_secure_new());
    if (!ctx || !p || !q || !e || !diff || !bound || !n || !p1 || !q1 || !gcd || !phi || !lcm || !dmp1 || !dmq1) {
        return crypto_failure("Big number allocation failed");
    }
    if (BN_set_word(e.get(), constants::RSA_PUBLIC_EXPONENT) != 1 || BN_set_bit(bound.get(), k - 100) != 1) {
        return crypto_failure("Big number setup failed");
    }

    if (!draw_prime(source, k, ctx.get(), p.get())) {
        return crypto_failure("Prime generation failed");
    }
    do {
        if (!draw_prime(source, k, ctx.get(), q.get()) || BN_sub(diff.get(), p.get(), q.get()) != 1) {
            return crypto_failure("Prime generation failed");
        }
        BN_set_negative(diff.get(), 0);
    } while (BN_cmp(diff.get(), bound.get()) <= 0);

    if (BN_cmp(p.get(), q.get()) < 0) {
        BN_swap(p.get(), q.get());
    }

    if (BN_mul(n.get(), p.get(), q.get(), ctx.get()) != 1 || BN_copy(p1.get(), p.get()) == nullptr ||
        BN_sub_word(p1.get(), 1) != 1 || BN_copy(q1.get(), q.get()) == nullptr || BN_sub_word(q1.get(), 1) != 1 ||
        BN_gcd(gcd.get(), p1.get(), q1.get(), ctx.get()) != 1 ||
        BN_mul(phi.get(), p1.get(), q1.get(), ctx.get()) != 1 ||
        BN_div(lcm.get(), nullptr, phi.get(), gcd.get(), ctx.get()) != 1) {
        return crypto_failure("RSA modulus computation failed");
    }
    if (BN_num_bits(n.get()) != bits) {
        return Result<KeyPair>::failure(Error::CryptoFailure, "Generated modulus has the wrong size");
    }

    BnPtr d(BN_mod_inverse(nullptr, e.get(), lcm.get(), ctx.get()));
    BnPtr iqmp(BN_mod_inverse(nullptr, q.get(), p.get(), ctx.get()));
    if (!d || !iqmp || BN_mod(dmp1.get(), d.get(), p1.get(), ctx.get()) != 1 ||
        BN_mod(dmq1.get(), d.get(), q1.get(), ctx.get()) != 1) {
        return crypto_failure("RSA private exponent computation failed");
    }

    auto key = assemble_key(n.get(), e.get(), d.get(), p.get(), q.get(), dmp1.get(), dmq1.get(), iqmp.get());
    if (!key) {
        return crypto_failure("RSA key assembly failed");
    }

    auto public_pem = crypto::public_key_to_pem(key.get());
    auto private_pem = crypto::private_key_to_pem(key.get());
    if (!public_pem || !private_pem) {
        if (private_pem) {
            utils::secure_wipe(private_pem->data(), private_pem->size());
        }
        return crypto_failure("PEM encoding failed");
    }

    KeyPair pair(std::move(*public_pem), std::move(*private_pem));
    return Result<KeyPair>::ok(std::move(pair));
}

IdentityGenerator::IdentityGenerator(crypto::RandomSource &random, int random_bits)
    : random_(random), random_bits_(random_bits) {}

Result<KeyPair> IdentityGenerator::generate_random() const {
    const auto start = std::chrono::steady_clock::now();
    log::logger()->debug("Generating random {}-bit identity", random_bits_);

    auto pair = generate_rsa(random_, random_bits_);
    if (!pair.success) {
        log::logger()->warn("Random identity generation failed: {}", pair.message);
        return pair;
    }

    const auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    log::logger()->debug("Generated random {}-bit identity in {} ms", random_bits_, elapsed.count());
    return pair;
}

Result<KeyPair> IdentityGenerator::generate_from_contact_phrase(const mnemonic::WordPhrase &words) const {
    if (words.size() != constants::CONTACT_PHRASE_WORDS) {
        return Result<KeyPair>::failure(Error::InvalidArgument, "Contact code must be exactly 8 words");
    }
    return generate_from_phrase(words, constants::CONTACT_IDENTITY_BITS);
}

Result<KeyPair> IdentityGenerator::generate_from_full_phrase(const mnemonic::WordPhrase &words) const {
    if (words.size() != constants::FULL_PHRASE_WORDS) {
        return Result<KeyPair>::failure(Error::InvalidArgument, "Full key generation requires 16 words");
    }
    return generate_from_phrase(words, constants::FULL_IDENTITY_BITS);
}

Result<KeyPair> IdentityGenerator::generate_from_phrase(const mnemonic::WordPhrase &words, int bits) const {
    const auto start = std::chrono::steady_clock::now();

    mnemonic::PhraseEngine engine(random_);
    auto seed = engine.derive_seed(words);
    if (!seed.success) {
        return Result<KeyPair>::failure(seed.error, seed.message);
    }

    crypto::ChaCha20Stream stream(seed.value);
    seed.value.wipe();

    auto pair = generate_rsa(stream, bits);
    if (!pair.success) {
        log::logger()->warn("Phrase identity generation failed: {}", pair.message);
        return pair;
    }

    const auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    log::logger()->debug("Derived {}-bit identity from {}-word phrase in {} ms", bits, words.size(), elapsed.count());
    return pair;
}

Result<std::string> public_key_from_private(const std::string &private_pem) {
    auto key = crypto::load_private_key(private_pem);
    if (!key) {
        return Result<std::string>::failure(Error::InvalidArgument, "Not a PKCS#8 RSA private key");
    }
    auto pem = crypto::public_key_to_pem(key.get());
    if (!pem) {
        return Result<std::string>::failure(Error::CryptoFailure, "PEM encoding failed: " + crypto::openssl_error());
    }
    return Result<std::string>::ok(std::move(*pem));
}

Result<int> key_bits(const std::string &pem) {
    auto key = crypto::load_public_key(pem);
    if (!key) {
        key = crypto::load_private_key(pem);
    }
    if (!key) {
        return Result<int>::failure(Error::InvalidArgument, "Not an RSA PEM key");
    }
    return Result<int>::ok(EVP_PKEY_get_bits(key.get()));
}

} // namespace pairlock::identity
