#include "pairlock/core/core.hpp"

#include <stdexcept>

#include "pairlock/utils/log.hpp"

namespace pairlock {

namespace {

const Config &checked(const Config &config) {
    auto valid = config.validate();
    if (!valid.success) {
        throw std::invalid_argument(valid.message);
    }
    return config;
}

} // namespace

Core::Core(Config config, crypto::RandomSource &random)
    : config_(checked(config)), phrases_(random), identities_(random, config_.identity_key_bits), cipher_(random),
      pairing_(random) {
    utils::ensure_sodium_init();
    log::set_level(config_.log_level);
}

Result<Core::WordPhrase> Core::generate_phrase(size_t word_count) { return phrases_.generate_phrase(word_count); }

Result<Core::WordPhrase> Core::generate_contact_code() { return phrases_.generate_contact_code(); }

Result<Core::WordPhrase> Core::generate_secret_code() { return phrases_.generate_secret_code(); }

Result<utils::SecureBytes> Core::derive_seed(const WordPhrase &words) const { return phrases_.derive_seed(words); }

Result<Core::KeyPair> Core::generate_random_identity() const { return identities_.generate_random(); }

Result<Core::KeyPair> Core::generate_contact_identity(const WordPhrase &words) const {
    return identities_.generate_from_contact_phrase(words);
}

Result<Core::KeyPair> Core::generate_full_identity(const WordPhrase &words) const {
    return identities_.generate_from_full_phrase(words);
}

Result<Core::EncryptedMessage> Core::encrypt_message(const std::string &plaintext,
                                                     const std::string &public_key) const {
    return cipher_.encrypt(plaintext, public_key);
}

Result<std::string> Core::decrypt_message(const EncryptedMessage &message, const std::string &private_key) const {
    return cipher_.decrypt(message, private_key);
}

Result<Core::PairingPayload> Core::build_pairing_payload(const std::string &public_key,
                                                         const std::string &device_id) const {
    return pairing_.build_pairing_payload(public_key, device_id);
}

std::string Core::serialize_pairing_payload(const PairingPayload &payload) const {
    return pairing_.serialize_pairing_payload(payload);
}

Result<Core::PairingPayload> Core::parse_pairing_payload(const std::string &raw) const {
    return pairing_.parse_pairing_payload(raw);
}

bool Core::validate_verification_message(const std::string &message) const {
    return pairing_.validate_verification_message(message);
}

Result<std::vector<uint8_t>> Core::wrap_symmetric_key(const utils::SecureBytes &key,
                                                      const std::string &public_key) const {
    return pairing_.wrap_symmetric_key(key, public_key);
}

Result<utils::SecureBytes> Core::unwrap_symmetric_key(const std::vector<uint8_t> &wrapped,
                                                      const std::string &private_key) const {
    return pairing_.unwrap_symmetric_key(wrapped, private_key);
}

std::string Core::generate_device_id() const { return pairing_.generate_device_id(); }

utils::SecureBytes Core::generate_session_key() const { return pairing_.generate_session_key(); }

} // namespace pairlock
