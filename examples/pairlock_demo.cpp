#include "pairlock/pairlock.hpp"
#include <cstdio>
#include <iostream>

namespace {

// Reports a failed step and tells main to bail out
template <typename T> bool failed(const pairlock::Result<T> &result, const char *step) {
    if (result.success) {
        return false;
    }
    pairlock::log::logger()->error("{} failed: {} ({})", step, result.message, pairlock::error_to_string(result.error));
    return true;
}

void print_hex(const std::string &label, const pairlock::SecureBytes &data) {
    std::cout << label << ": ";
    for (size_t i = 0; i < data.size(); ++i)
        printf("%02x", data[i]);
    std::cout << '\n';
}

} // namespace

int main(int argc, char **argv) {
    std::cout << "Pairlock identity and pairing demo\n";
    std::cout << "==================================\n\n";

    pairlock::Config config;
    config.identity_key_bits = 2048;
    config.allow_reduced_identity_bits = true;
    if (argc > 1) {
        auto loaded = pairlock::Config::load(argv[1]);
        if (failed(loaded, "Loading config")) {
            return 1;
        }
        config = loaded.value;
    }
    pairlock::Core core(config);

    // Contact code and the identity it derives
    auto code = core.generate_contact_code();
    if (failed(code, "Contact code generation")) {
        return 1;
    }
    std::cout << "Contact code: " << pairlock::mnemonic::join_phrase(code.value) << '\n';

    auto seed = core.derive_seed(code.value);
    if (failed(seed, "Seed derivation")) {
        return 1;
    }
    print_hex("Seed", seed.value);

    auto sharer = core.generate_contact_identity(code.value);
    if (failed(sharer, "Contact identity")) {
        return 1;
    }
    std::cout << "✓ Derived 2048-bit contact identity\n";

    // QR payload
    auto payload = core.build_pairing_payload(sharer.value.public_key, core.generate_device_id());
    if (failed(payload, "Pairing payload")) {
        return 1;
    }
    payload.value.contact_words = code.value;
    const auto raw = core.serialize_pairing_payload(payload.value);
    std::cout << "Pairing payload: " << raw.size() << " bytes\n";

    auto scanned = core.parse_pairing_payload(raw);
    if (failed(scanned, "Pairing payload parse")) {
        return 1;
    }
    auto rederived = core.generate_contact_identity(scanned.value.contact_words);
    if (failed(rederived, "Contact identity re-derivation")) {
        return 1;
    }
    if (rederived.value.public_key != scanned.value.public_key) {
        pairlock::log::logger()->error("Contact words do not reproduce the advertised key");
        return 1;
    }
    std::cout << "✓ Scanned payload matches the contact code\n";

    // Messaging to a random identity
    auto scanner = core.generate_random_identity();
    if (failed(scanner, "Random identity")) {
        return 1;
    }
    auto message = core.encrypt_message("hello from the sharer", scanner.value.public_key);
    if (failed(message, "Encryption")) {
        return 1;
    }
    std::cout << "Envelope: " << message.value.to_json().dump() << "\n";

    auto opened = core.decrypt_message(message.value, scanner.value.private_key);
    if (failed(opened, "Decryption")) {
        return 1;
    }
    std::cout << "✓ Decrypted: " << opened.value << '\n';

    auto wrong = core.decrypt_message(message.value, sharer.value.private_key);
    if (wrong.success) {
        pairlock::log::logger()->error("Message opened under the wrong key");
        return 1;
    }
    std::cout << "✓ Wrong key rejected (" << pairlock::error_to_string(wrong.error) << ")\n";

    std::cout << "\nAll steps succeeded.\n";
    return 0;
}
