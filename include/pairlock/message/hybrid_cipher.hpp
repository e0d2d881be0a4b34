#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "pairlock/core/constants.hpp"
#include "pairlock/core/result.hpp"
#include "pairlock/crypto/random.hpp"

namespace pairlock::message {

    // One encrypted message. cipher_text excludes the GCM tag; cipher_text || auth_tag is
    // the complete AES-256-GCM output.
    struct EncryptedMessage {
        std::vector<uint8_t> cipher_text;
        std::vector<uint8_t> wrapped_key;
        std::array<uint8_t, constants::GCM_NONCE_BYTES> nonce{};
        std::array<uint8_t, constants::GCM_TAG_BYTES> auth_tag{};

        // {"encryptedMessage", "encryptedKey", "iv", "authTag"}, base64 values
        nlohmann::json to_json() const;
        static Result<EncryptedMessage> from_json(const nlohmann::json &json);

        bool operator==(const EncryptedMessage &other) const {
            return cipher_text == other.cipher_text && wrapped_key == other.wrapped_key && nonce == other.nonce &&
                   auth_tag == other.auth_tag;
        }
    };

    // AES-256-GCM under a fresh per-message key and nonce, key wrapped with RSA-OAEP(SHA-256)
    class HybridCipher {
      public:
        explicit HybridCipher(crypto::RandomSource &random = crypto::system_random());

        // InvalidArgument for plaintext that is not UTF-8 or a key that does not load
        Result<EncryptedMessage> encrypt(const std::string &plaintext, const std::string &recipient_public_key) const;

        // DecryptionFailed for a bad tag or a key that does not unwrap; EncodingError when the
        // authenticated plaintext is not UTF-8
        Result<std::string> decrypt(const EncryptedMessage &message, const std::string &private_key) const;

      private:
        crypto::RandomSource &random_;
    };

} // namespace pairlock::message
