#include <doctest/doctest.h>

#include <string>

#include <pairlock/crypto/oaep.hpp>
#include <pairlock/crypto/openssl_utils.hpp>
#include <pairlock/pairlock.hpp>

#include "fixtures.hpp"

namespace {
    using pairlock::Error;
    using pairlock::message::EncryptedMessage;
    using pairlock::message::HybridCipher;

    EncryptedMessage seal(const std::string &plaintext) {
        HybridCipher cipher;
        auto message = cipher.encrypt(plaintext, fixtures::bob().public_key);
        if (!message.success)
            throw std::runtime_error(message.message);
        return message.value;
    }

    // Envelope around arbitrary bytes, bypassing the text check in HybridCipher::encrypt
    EncryptedMessage seal_raw_bytes(const std::string &bytes) {
        auto &random = pairlock::crypto::system_random();
        auto key = random.next_secure_bytes(32);
        EncryptedMessage message;
        random.fill(message.nonce.data(), message.nonce.size());

        pairlock::crypto::EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
        message.cipher_text.resize(bytes.size());
        int len = 0;
        int final_len = 0;
        if (!ctx || EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key.data(), message.nonce.data()) != 1 ||
            EVP_EncryptUpdate(ctx.get(), message.cipher_text.data(), &len,
                              reinterpret_cast<const unsigned char *>(bytes.data()),
                              static_cast<int>(bytes.size())) != 1 ||
            EVP_EncryptFinal_ex(ctx.get(), message.cipher_text.data() + len, &final_len) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(message.auth_tag.size()),
                                message.auth_tag.data()) != 1)
            throw std::runtime_error("AES-GCM failed");

        auto wrapped = pairlock::crypto::oaep_wrap(key, fixtures::bob().public_key);
        if (!wrapped.success)
            throw std::runtime_error(wrapped.message);
        message.wrapped_key = wrapped.value;
        return message;
    }

    void check_rejected(const EncryptedMessage &message) {
        auto opened = HybridCipher().decrypt(message, fixtures::bob().private_key);
        CHECK_FALSE(opened.success);
        CHECK(opened.error == Error::DecryptionFailed);
        CHECK(opened.message == "Decryption failed");
        CHECK(opened.value.empty());
    }
} // namespace

TEST_SUITE("Hybrid Encryption") {
    TEST_CASE("Encrypt and decrypt") {
        HybridCipher cipher;
        const std::string texts[] = {"hello", "", "Привет, мир! 你好 🔐", std::string(10000, 'x')};

        for (const auto &text : texts) {
            auto sealed = cipher.encrypt(text, fixtures::bob().public_key);
            REQUIRE(sealed.success);
            CHECK(sealed.value.cipher_text.size() == text.size());
            CHECK(sealed.value.wrapped_key.size() == 256);

            auto opened = cipher.decrypt(sealed.value, fixtures::bob().private_key);
            REQUIRE(opened.success);
            CHECK(opened.value == text);
        }
    }

    TEST_CASE("Fresh key and nonce for every message") {
        auto first = seal("same text");
        auto second = seal("same text");

        CHECK(first.nonce != second.nonce);
        CHECK(first.wrapped_key != second.wrapped_key);
        CHECK(first.cipher_text != second.cipher_text);
        CHECK(first.auth_tag != second.auth_tag);
    }

    TEST_CASE("Tampered cipher text") {
        auto message = seal("attack at dawn");
        message.cipher_text[0] ^= 0x01;
        check_rejected(message);
    }

    TEST_CASE("Tampered authentication tag") {
        auto message = seal("attack at dawn");
        message.auth_tag[15] ^= 0x80;
        check_rejected(message);
    }

    TEST_CASE("Tampered nonce") {
        auto message = seal("attack at dawn");
        message.nonce[0] ^= 0x01;
        check_rejected(message);
    }

    TEST_CASE("Tampered or truncated wrapped key") {
        auto flipped = seal("attack at dawn");
        flipped.wrapped_key[100] ^= 0x01;
        check_rejected(flipped);

        auto truncated = seal("attack at dawn");
        truncated.wrapped_key.resize(128);
        check_rejected(truncated);

        auto missing = seal("attack at dawn");
        missing.wrapped_key.clear();
        check_rejected(missing);
    }

    TEST_CASE("Wrong recipient") {
        auto message = seal("for bob only");
        auto opened = HybridCipher().decrypt(message, fixtures::alice().private_key);
        CHECK_FALSE(opened.success);
        CHECK(opened.error == Error::DecryptionFailed);
    }

    TEST_CASE("Invalid keys") {
        HybridCipher cipher;
        auto sealed = cipher.encrypt("hello", "not a key");
        CHECK_FALSE(sealed.success);
        CHECK(sealed.error == Error::InvalidArgument);

        auto message = seal("hello");
        auto opened = cipher.decrypt(message, fixtures::bob().public_key);
        CHECK_FALSE(opened.success);
        CHECK(opened.error == Error::InvalidArgument);
    }

    TEST_CASE("Plaintext that is not UTF-8 is refused") {
        HybridCipher cipher;
        auto sealed = cipher.encrypt(std::string("\xff\xfe\x80", 3), fixtures::bob().public_key);
        CHECK_FALSE(sealed.success);
        CHECK(sealed.error == Error::InvalidArgument);

        auto truncated = cipher.encrypt("caf\xc3", fixtures::bob().public_key);
        CHECK(truncated.error == Error::InvalidArgument);
    }

    TEST_CASE("Authenticated plaintext that is not UTF-8") {
        auto message = seal_raw_bytes(std::string("\xff\xfe\x80", 3));
        auto opened = HybridCipher().decrypt(message, fixtures::bob().private_key);
        CHECK_FALSE(opened.success);
        CHECK(opened.error == Error::EncodingError);

        auto text = seal_raw_bytes("plain text");
        auto readable = HybridCipher().decrypt(text, fixtures::bob().private_key);
        REQUIRE(readable.success);
        CHECK(readable.value == "plain text");
    }

    TEST_CASE("Deterministic source reproduces the envelope") {
        auto key = pairlock::crypto::system_random().next_secure_bytes(32);
        pairlock::crypto::ChaCha20Stream first(key);
        pairlock::crypto::ChaCha20Stream second(key);

        auto a = HybridCipher(first).encrypt("hello", fixtures::bob().public_key);
        auto b = HybridCipher(second).encrypt("hello", fixtures::bob().public_key);
        REQUIRE(a.success);
        REQUIRE(b.success);
        CHECK(a.value.nonce == b.value.nonce);
        CHECK(a.value.cipher_text == b.value.cipher_text);
        // OAEP padding draws from OpenSSL, not from the supplied source
        CHECK(a.value.wrapped_key != b.value.wrapped_key);
    }
}

TEST_SUITE("Message Envelope") {
    TEST_CASE("JSON fields") {
        auto message = seal("hello");
        auto json = message.to_json();

        REQUIRE(json.contains("encryptedMessage"));
        REQUIRE(json.contains("encryptedKey"));
        REQUIRE(json.contains("iv"));
        REQUIRE(json.contains("authTag"));
        CHECK(json.at("iv").get<std::string>().size() == 16);
        CHECK(json.at("authTag").get<std::string>().size() == 24);

        auto parsed = EncryptedMessage::from_json(nlohmann::json::parse(json.dump()));
        REQUIRE(parsed.success);
        CHECK(parsed.value == message);

        auto opened = HybridCipher().decrypt(parsed.value, fixtures::bob().private_key);
        REQUIRE(opened.success);
        CHECK(opened.value == "hello");
    }

    TEST_CASE("Malformed envelopes") {
        auto json = seal("hello").to_json();

        auto no_tag = json;
        no_tag.erase("authTag");
        CHECK(EncryptedMessage::from_json(no_tag).error == Error::InvalidArgument);

        auto short_iv = json;
        short_iv["iv"] = "AAAA";
        CHECK(EncryptedMessage::from_json(short_iv).error == Error::InvalidArgument);

        auto bad_base64 = json;
        bad_base64["encryptedMessage"] = "!!!";
        CHECK(EncryptedMessage::from_json(bad_base64).error == Error::InvalidArgument);

        auto numeric = json;
        numeric["encryptedKey"] = 42;
        CHECK(EncryptedMessage::from_json(numeric).error == Error::InvalidArgument);

        CHECK(EncryptedMessage::from_json(nlohmann::json::array()).error == Error::InvalidArgument);
    }
}
