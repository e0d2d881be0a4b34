#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "pairlock/core/constants.hpp"
#include "pairlock/core/result.hpp"
#include "pairlock/crypto/random.hpp"
#include "pairlock/utils/secure_buffer.hpp"

namespace pairlock::pairing {

    // QR / contact-code payload. contact_words is left empty by the builder and filled in by
    // the caller with the code chosen for the exchange.
    struct PairingPayload {
        std::string version{constants::PAIRING_VERSION};
        std::string type{constants::PAIRING_MARKER};
        std::string public_key;
        std::string device_id;
        std::vector<std::string> contact_words;
        uint64_t timestamp{0};

        nlohmann::json to_json() const;
    };

    class PairingCodec {
      public:
        explicit PairingCodec(crypto::RandomSource &random = crypto::system_random());

        // Stamps the current Unix time in seconds
        Result<PairingPayload> build_pairing_payload(const std::string &public_key, const std::string &device_id) const;

        std::string serialize_pairing_payload(const PairingPayload &payload) const;

        // WrongPayloadType when `type` is a string other than the pairing marker,
        // MalformedPayload for every other schema violation. contactWords come back as sent.
        Result<PairingPayload> parse_pairing_payload(const std::string &raw) const;

        // Exactly 256 bytes
        bool validate_verification_message(const std::string &message) const;

        // Session key exchange for voice calls. Keys are exactly 32 bytes.
        Result<std::vector<uint8_t>> wrap_symmetric_key(const utils::SecureBytes &key,
                                                        const std::string &public_key) const;
        Result<utils::SecureBytes> unwrap_symmetric_key(const std::vector<uint8_t> &wrapped,
                                                        const std::string &private_key) const;

        // 16 random bytes, lowercase hex
        std::string generate_device_id() const;

        utils::SecureBytes generate_session_key() const;

      private:
        crypto::RandomSource &random_;
    };

} // namespace pairlock::pairing
