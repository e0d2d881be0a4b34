#include "pairlock/pairing/pairing_codec.hpp"

#include <chrono>

#include "pairlock/crypto/oaep.hpp"
#include "pairlock/crypto/openssl_utils.hpp"
#include "pairlock/utils/log.hpp"

namespace pairlock::pairing {

namespace {

using R = Result<PairingPayload>;

R malformed(const std::string &why) {
    log::logger()->warn("Rejected pairing payload: {}", why);
    return R::failure(Error::MalformedPayload, why);
}

bool is_string_field(const nlohmann::json &json, const char *field) {
    return json.contains(field) && json.at(field).is_string();
}

} // namespace

nlohmann::json PairingPayload::to_json() const {
    return nlohmann::json{{"version", version},       {"type", type},
                          {"publicKey", public_key},  {"deviceId", device_id},
                          {"contactWords", contact_words}, {"timestamp", timestamp}};
}

PairingCodec::PairingCodec(crypto::RandomSource &random) : random_(random) {}

Result<PairingPayload> PairingCodec::build_pairing_payload(const std::string &public_key,
                                                           const std::string &device_id) const {
    if (device_id.empty()) {
        return R::failure(Error::InvalidArgument, "Device id must not be empty");
    }
    if (!crypto::load_public_key(public_key)) {
        return R::failure(Error::InvalidArgument, "Public key is not an RSA SPKI PEM");
    }

    PairingPayload payload;
    payload.public_key = public_key;
    payload.device_id = device_id;
    payload.timestamp = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
            .count());
    log::logger()->debug("Built pairing payload for device {}", device_id);
    return R::ok(std::move(payload));
}

std::string PairingCodec::serialize_pairing_payload(const PairingPayload &payload) const {
    return payload.to_json().dump();
}

Result<PairingPayload> PairingCodec::parse_pairing_payload(const std::string &raw) const {
    const auto json = nlohmann::json::parse(raw, nullptr, false);
    if (json.is_discarded()) {
        return malformed("not valid JSON");
    }
    if (!json.is_object()) {
        return malformed("not a JSON object");
    }

    // Valid JSON from another protocol is reported separately from schema errors
    if (!is_string_field(json, "type")) {
        return malformed("missing type");
    }
    if (json.at("type").get<std::string>() != constants::PAIRING_MARKER) {
        log::logger()->warn("Rejected payload with foreign type marker");
        return R::failure(Error::WrongPayloadType, "Not a pairing payload");
    }

    if (!is_string_field(json, "version") || json.at("version").get<std::string>() != constants::PAIRING_VERSION) {
        return malformed("unsupported version");
    }
    if (!is_string_field(json, "publicKey") || !is_string_field(json, "deviceId")) {
        return malformed("missing publicKey or deviceId");
    }
    if (!json.contains("timestamp") || !json.at("timestamp").is_number_unsigned()) {
        return malformed("timestamp must be an unsigned integer");
    }
    if (!json.contains("contactWords") || !json.at("contactWords").is_array()) {
        return malformed("contactWords must be an array");
    }

    PairingPayload payload;
    payload.version = json.at("version").get<std::string>();
    payload.type = json.at("type").get<std::string>();
    payload.public_key = json.at("publicKey").get<std::string>();
    payload.device_id = json.at("deviceId").get<std::string>();
    payload.timestamp = json.at("timestamp").get<uint64_t>();

    if (payload.device_id.empty()) {
        return malformed("empty deviceId");
    }
    if (!crypto::load_public_key(payload.public_key)) {
        return malformed("publicKey is not an RSA SPKI PEM");
    }

    // Shape only; the words are checked when an identity is derived from them
    for (const auto &word : json.at("contactWords")) {
        if (!word.is_string()) {
            return malformed("contactWords must hold strings");
        }
        payload.contact_words.push_back(word.get<std::string>());
    }

    return R::ok(std::move(payload));
}

bool PairingCodec::validate_verification_message(const std::string &message) const {
    return message.size() == constants::VERIFICATION_MESSAGE_LENGTH;
}

Result<std::vector<uint8_t>> PairingCodec::wrap_symmetric_key(const utils::SecureBytes &key,
                                                              const std::string &public_key) const {
    if (key.size() != constants::SYMMETRIC_KEY_BYTES) {
        return Result<std::vector<uint8_t>>::failure(Error::InvalidArgument, "Session key must be 32 bytes");
    }
    return crypto::oaep_wrap(key, public_key);
}

Result<utils::SecureBytes> PairingCodec::unwrap_symmetric_key(const std::vector<uint8_t> &wrapped,
                                                              const std::string &private_key) const {
    auto key = crypto::oaep_unwrap(wrapped, private_key);
    if (key.success && key.value.size() != constants::SYMMETRIC_KEY_BYTES) {
        return Result<utils::SecureBytes>::failure(Error::DecryptionFailed, "Decryption failed");
    }
    return key;
}

std::string PairingCodec::generate_device_id() const {
    return utils::Common::bytes_to_hex(random_.next_bytes(constants::DEVICE_ID_BYTES));
}

utils::SecureBytes PairingCodec::generate_session_key() const {
    return random_.next_secure_bytes(constants::SYMMETRIC_KEY_BYTES);
}

} // namespace pairlock::pairing
