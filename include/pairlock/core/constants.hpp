#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

// Protocol constants. Changing any of these breaks recovery of identities derived from
// existing word phrases or interop with peers on older builds.
namespace pairlock::constants {

    inline constexpr size_t DICTIONARY_SIZE = 2048;
    inline constexpr size_t BITS_PER_WORD = 11;

    // A code group is 8 words: 86 bits of entropy plus a 2 bit checksum
    inline constexpr size_t GROUP_WORDS = 8;
    inline constexpr size_t GROUP_BITS = GROUP_WORDS * BITS_PER_WORD;
    inline constexpr size_t GROUP_CHECKSUM_BITS = GROUP_WORDS / 3;
    inline constexpr size_t GROUP_ENTROPY_BITS = GROUP_BITS - GROUP_CHECKSUM_BITS;
    inline constexpr size_t GROUP_ENTROPY_BYTES = (GROUP_ENTROPY_BITS + 7) / 8;

    inline constexpr size_t CONTACT_PHRASE_WORDS = GROUP_WORDS;
    inline constexpr size_t FULL_PHRASE_WORDS = 2 * GROUP_WORDS;

    inline constexpr char MNEMONIC_SALT[] = "mnemonic";
    inline constexpr unsigned MNEMONIC_ITERATIONS = 2048;
    inline constexpr size_t MNEMONIC_SEED_BYTES = 64;

    inline constexpr char SEED_SALT[] = "nonmessenger-salt";
    inline constexpr unsigned SEED_ITERATIONS = 100000;
    inline constexpr size_t SEED_BYTES = 32;

    // ChaCha20 nonce for the deterministic key generation stream ("nm-keygen-v1")
    inline constexpr std::array<uint8_t, 12> KEYGEN_STREAM_NONCE = {'n', 'm', '-', 'k', 'e', 'y',
                                                                    'g', 'e', 'n', '-', 'v', '1'};

    inline constexpr int RANDOM_IDENTITY_BITS = 4096;
    inline constexpr int CONTACT_IDENTITY_BITS = 2048;
    inline constexpr int FULL_IDENTITY_BITS = 4096;
    inline constexpr unsigned long RSA_PUBLIC_EXPONENT = 65537;

    inline constexpr size_t SYMMETRIC_KEY_BYTES = 32;
    inline constexpr size_t GCM_NONCE_BYTES = 12;
    inline constexpr size_t GCM_TAG_BYTES = 16;

    inline constexpr char PAIRING_VERSION[] = "1.0";
    inline constexpr char PAIRING_MARKER[] = "nonmessenger_contact";
    inline constexpr size_t VERIFICATION_MESSAGE_LENGTH = 256;
    inline constexpr size_t DEVICE_ID_BYTES = 16;

} // namespace pairlock::constants
