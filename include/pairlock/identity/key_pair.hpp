#pragma once

#include <string>
#include <utility>

#include "pairlock/utils/sodium_utils.hpp"

namespace pairlock::identity {

    // PEM encoded RSA identity: SPKI public key, PKCS#8 private key.
    // The private key text is wiped when the pair is destroyed.
    struct KeyPair {
        std::string public_key;
        std::string private_key;

        KeyPair() = default;
        KeyPair(std::string public_pem, std::string private_pem)
            : public_key(std::move(public_pem)), private_key(std::move(private_pem)) {}

        ~KeyPair() { utils::secure_wipe(private_key.data(), private_key.size()); }

        KeyPair(const KeyPair &) = default;
        KeyPair &operator=(const KeyPair &) = default;
        KeyPair(KeyPair &&) noexcept = default;
        KeyPair &operator=(KeyPair &&) noexcept = default;

        bool operator==(const KeyPair &other) const {
            return public_key == other.public_key && private_key == other.private_key;
        }
        bool operator!=(const KeyPair &other) const { return !(*this == other); }
    };

} // namespace pairlock::identity
