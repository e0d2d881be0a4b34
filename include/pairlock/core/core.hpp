#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "pairlock/core/config.hpp"
#include "pairlock/core/result.hpp"
#include "pairlock/crypto/random.hpp"
#include "pairlock/identity/generator.hpp"
#include "pairlock/message/hybrid_cipher.hpp"
#include "pairlock/mnemonic/phrase.hpp"
#include "pairlock/pairing/pairing_codec.hpp"

namespace pairlock {

    // Entry point bundling every operation of the identity and pairing core. Holds no
    // per-call state, so one instance can be shared between threads as long as the
    // random source it was given is thread-safe (SystemRandom is).
    class Core {
      public:
        using KeyPair = identity::KeyPair;
        using WordPhrase = mnemonic::WordPhrase;
        using EncryptedMessage = message::EncryptedMessage;
        using PairingPayload = pairing::PairingPayload;

        // Throws std::invalid_argument when the config does not validate
        explicit Core(Config config = Config{}, crypto::RandomSource &random = crypto::system_random());

        const Config &config() const { return config_; }

        // Word phrases
        Result<WordPhrase> generate_phrase(size_t word_count);
        Result<WordPhrase> generate_contact_code();
        Result<WordPhrase> generate_secret_code();
        Result<utils::SecureBytes> derive_seed(const WordPhrase &words) const;

        // Identities
        Result<KeyPair> generate_random_identity() const;
        Result<KeyPair> generate_contact_identity(const WordPhrase &words) const;
        Result<KeyPair> generate_full_identity(const WordPhrase &words) const;

        // Messages
        Result<EncryptedMessage> encrypt_message(const std::string &plaintext, const std::string &public_key) const;
        Result<std::string> decrypt_message(const EncryptedMessage &message, const std::string &private_key) const;

        // Pairing
        Result<PairingPayload> build_pairing_payload(const std::string &public_key, const std::string &device_id) const;
        std::string serialize_pairing_payload(const PairingPayload &payload) const;
        Result<PairingPayload> parse_pairing_payload(const std::string &raw) const;
        bool validate_verification_message(const std::string &message) const;
        Result<std::vector<uint8_t>> wrap_symmetric_key(const utils::SecureBytes &key,
                                                        const std::string &public_key) const;
        Result<utils::SecureBytes> unwrap_symmetric_key(const std::vector<uint8_t> &wrapped,
                                                        const std::string &private_key) const;
        std::string generate_device_id() const;
        utils::SecureBytes generate_session_key() const;

      private:
        Config config_;
        mnemonic::PhraseEngine phrases_;
        identity::IdentityGenerator identities_;
        message::HybridCipher cipher_;
        pairing::PairingCodec pairing_;
    };

} // namespace pairlock
