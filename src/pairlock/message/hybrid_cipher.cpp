#include "pairlock/message/hybrid_cipher.hpp"

#include <algorithm>

#include <openssl/err.h>

#include "pairlock/crypto/oaep.hpp"
#include "pairlock/crypto/openssl_utils.hpp"
#include "pairlock/utils/log.hpp"
#include "pairlock/utils/secure_buffer.hpp"

namespace {

using pairlock::Error;
using pairlock::Result;
using pairlock::crypto::EvpCipherCtxPtr;
using pairlock::message::EncryptedMessage;
using pairlock::utils::Common;
using pairlock::utils::SecureBytes;

namespace constants = pairlock::constants;

Result<EncryptedMessage> gcm_encrypt(const std::string &plaintext, const SecureBytes &key, EncryptedMessage out) {
    EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx || EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(out.nonce.size()), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), out.nonce.data()) != 1) {
        return Result<EncryptedMessage>::failure(Error::CryptoFailure,
                                                 "AES-GCM setup failed: " + pairlock::crypto::openssl_error());
    }

    out.cipher_text.resize(plaintext.size());
    int len = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx.get(), out.cipher_text.data(), &len,
                          reinterpret_cast<const unsigned char *>(plaintext.data()),
                          static_cast<int>(plaintext.size())) != 1) {
        return Result<EncryptedMessage>::failure(Error::CryptoFailure,
                                                 "AES-GCM encryption failed: " + pairlock::crypto::openssl_error());
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), out.cipher_text.data() + len, &final_len) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(out.auth_tag.size()),
                            out.auth_tag.data()) != 1) {
        return Result<EncryptedMessage>::failure(Error::CryptoFailure,
                                                 "AES-GCM finalisation failed: " + pairlock::crypto::openssl_error());
    }
    out.cipher_text.resize(static_cast<size_t>(len + final_len));
    return Result<EncryptedMessage>::ok(std::move(out));
}

Result<SecureBytes> gcm_decrypt(const EncryptedMessage &message, const SecureBytes &key) {
    EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    auto nonce = message.nonce;
    auto tag = message.auth_tag;
    if (!ctx || EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce.size()), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
        return Result<SecureBytes>::failure(Error::CryptoFailure,
                                            "AES-GCM setup failed: " + pairlock::crypto::openssl_error());
    }

    // Output buffer keeps one spare byte so data() is never null
    SecureBytes plain(message.cipher_text.size() + 1);
    int len = 0;
    if (!message.cipher_text.empty() &&
        EVP_DecryptUpdate(ctx.get(), plain.data(), &len, message.cipher_text.data(),
                          static_cast<int>(message.cipher_text.size())) != 1) {
        ERR_clear_error();
        return Result<SecureBytes>::failure(Error::DecryptionFailed, "Decryption failed");
    }
    int final_len = 0;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag.size()), tag.data()) != 1 ||
        EVP_DecryptFinal_ex(ctx.get(), plain.data() + len, &final_len) <= 0) {
        ERR_clear_error();
        return Result<SecureBytes>::failure(Error::DecryptionFailed, "Decryption failed");
    }

    SecureBytes exact(plain.data(), static_cast<size_t>(len + final_len));
    return Result<SecureBytes>::ok(std::move(exact));
}

template <size_t N> bool decode_fixed(const nlohmann::json &json, const char *field, std::array<uint8_t, N> &out) {
    auto bytes = Common::from_base64(json.at(field).get<std::string>());
    if (!bytes || bytes->size() != N) {
        return false;
    }
    std::copy(bytes->begin(), bytes->end(), out.begin());
    return true;
}

} // namespace

namespace pairlock::message {

nlohmann::json EncryptedMessage::to_json() const {
    return nlohmann::json{{"encryptedMessage", Common::to_base64(cipher_text)},
                          {"encryptedKey", Common::to_base64(wrapped_key)},
                          {"iv", Common::to_base64(nonce.data(), nonce.size())},
                          {"authTag", Common::to_base64(auth_tag.data(), auth_tag.size())}};
}

Result<EncryptedMessage> EncryptedMessage::from_json(const nlohmann::json &json) {
    using R = Result<EncryptedMessage>;
    if (!json.is_object()) {
        return R::failure(Error::InvalidArgument, "Encrypted message must be a JSON object");
    }
    for (const char *field : {"encryptedMessage", "encryptedKey", "iv", "authTag"}) {
        if (!json.contains(field) || !json.at(field).is_string()) {
            return R::failure(Error::InvalidArgument, std::string("Missing or non-string field: ") + field);
        }
    }

    EncryptedMessage message;
    auto cipher_text = Common::from_base64(json.at("encryptedMessage").get<std::string>());
    auto wrapped_key = Common::from_base64(json.at("encryptedKey").get<std::string>());
    if (!cipher_text || !wrapped_key) {
        return R::failure(Error::InvalidArgument, "Invalid base64 in encrypted message");
    }
    if (!decode_fixed(json, "iv", message.nonce)) {
        return R::failure(Error::InvalidArgument, "iv must decode to 12 bytes");
    }
    if (!decode_fixed(json, "authTag", message.auth_tag)) {
        return R::failure(Error::InvalidArgument, "authTag must decode to 16 bytes");
    }
    message.cipher_text = std::move(*cipher_text);
    message.wrapped_key = std::move(*wrapped_key);
    return R::ok(std::move(message));
}

HybridCipher::HybridCipher(crypto::RandomSource &random) : random_(random) {}

Result<EncryptedMessage> HybridCipher::encrypt(const std::string &plaintext,
                                               const std::string &recipient_public_key) const {
    if (!Common::is_valid_utf8(plaintext)) {
        return Result<EncryptedMessage>::failure(Error::InvalidArgument, "Plaintext is not valid UTF-8");
    }

    // Key and nonce are drawn here and never accepted from the caller
    auto key = random_.next_secure_bytes(constants::SYMMETRIC_KEY_BYTES);
    EncryptedMessage message;
    random_.fill(message.nonce.data(), message.nonce.size());

    auto wrapped = crypto::oaep_wrap(key, recipient_public_key);
    if (!wrapped.success) {
        log::logger()->warn("Message key wrap failed: {}", wrapped.message);
        return Result<EncryptedMessage>::failure(wrapped.error, wrapped.message);
    }
    message.wrapped_key = std::move(wrapped.value);

    auto sealed = gcm_encrypt(plaintext, key, std::move(message));
    if (!sealed.success) {
        log::logger()->warn("Message encryption failed: {}", sealed.message);
    }
    return sealed;
}

Result<std::string> HybridCipher::decrypt(const EncryptedMessage &message, const std::string &private_key) const {
    auto key = crypto::oaep_unwrap(message.wrapped_key, private_key);
    if (!key.success) {
        return Result<std::string>::failure(key.error, key.message);
    }
    if (key.value.size() != constants::SYMMETRIC_KEY_BYTES) {
        return Result<std::string>::failure(Error::DecryptionFailed, "Decryption failed");
    }

    auto plain = gcm_decrypt(message, key.value);
    key.value.wipe();
    if (!plain.success) {
        return Result<std::string>::failure(plain.error, plain.message);
    }

    std::string text(reinterpret_cast<const char *>(plain.value.data()), plain.value.size());
    if (!Common::is_valid_utf8(text)) {
        utils::secure_wipe(text.data(), text.size());
        return Result<std::string>::failure(Error::EncodingError, "Decrypted message is not valid UTF-8");
    }
    return Result<std::string>::ok(std::move(text));
}

} // namespace pairlock::message
