#include "pairlock/crypto/openssl_utils.hpp"

#include <openssl/err.h>
#include <openssl/pem.h>

namespace pairlock::crypto {

namespace {

// Never prompt for a passphrase; encrypted PEM is not a supported input
int no_passphrase(char *, int, int, void *) { return 0; }

std::optional<std::string> drain(BIO *bio) {
    char *data = nullptr;
    const long len = BIO_get_mem_data(bio, &data);
    if (len <= 0 || data == nullptr) {
        return std::nullopt;
    }
    return std::string(data, static_cast<size_t>(len));
}

EvpPkeyPtr only_rsa(EVP_PKEY *key) {
    EvpPkeyPtr owned(key);
    if (!owned || EVP_PKEY_is_a(owned.get(), "RSA") != 1) {
        ERR_clear_error();
        return nullptr;
    }
    return owned;
}

} // namespace

std::string openssl_error() {
    std::string out;
    unsigned long code = 0;
    char buf[256];
    while ((code = ERR_get_error()) != 0) {
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!out.empty()) {
            out += "; ";
        }
        out += buf;
    }
    return out.empty() ? "unknown OpenSSL error" : out;
}

EvpPkeyPtr load_public_key(const std::string &spki_pem) {
    BioPtr bio(BIO_new_mem_buf(spki_pem.data(), static_cast<int>(spki_pem.size())));
    if (!bio) {
        return nullptr;
    }
    return only_rsa(PEM_read_bio_PUBKEY(bio.get(), nullptr, no_passphrase, nullptr));
}

EvpPkeyPtr load_private_key(const std::string &pkcs8_pem) {
    BioPtr bio(BIO_new_mem_buf(pkcs8_pem.data(), static_cast<int>(pkcs8_pem.size())));
    if (!bio) {
        return nullptr;
    }
    return only_rsa(PEM_read_bio_PrivateKey(bio.get(), nullptr, no_passphrase, nullptr));
}

std::optional<std::string> public_key_to_pem(EVP_PKEY *key) {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_PUBKEY(bio.get(), key) != 1) {
        return std::nullopt;
    }
    return drain(bio.get());
}

std::optional<std::string> private_key_to_pem(EVP_PKEY *key) {
    BioPtr bio(BIO_new(BIO_s_secmem()));
    // Unencrypted PKCS#8 ("BEGIN PRIVATE KEY")
    if (!bio || PEM_write_bio_PrivateKey(bio.get(), key, nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        return std::nullopt;
    }
    return drain(bio.get());
}

} // namespace pairlock::crypto
