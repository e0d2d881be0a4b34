#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "pairlock/core/result.hpp"
#include "pairlock/crypto/random.hpp"
#include "pairlock/utils/secure_buffer.hpp"

namespace pairlock::mnemonic {

    using WordPhrase = std::vector<std::string>;

    // Generic mnemonic encoding over the English dictionary. A sentence of n words carries
    // n / 3 checksum bits (the top bits of SHA-256 over the entropy bytes) and 11n - n/3
    // entropy bits, packed MSB first. For 12/15/18/21/24 words this is exactly BIP39.
    Result<WordPhrase> entropy_to_words(const std::vector<uint8_t> &entropy, size_t word_count);
    Result<utils::SecureBytes> words_to_entropy(const WordPhrase &words);

    // Lowercases ASCII letters; other bytes are left alone
    std::string normalize_word(const std::string &word);

    std::string join_phrase(const WordPhrase &words);

    // Overwrites every word in place and empties the phrase
    void wipe_phrase(WordPhrase &words);

    // Generates and parses code-word phrases and stretches them into 32 byte seeds.
    // Phrases are made of 8 word code groups, each with its own checksum.
    class PhraseEngine {
      public:
        explicit PhraseEngine(crypto::RandomSource &random = crypto::system_random());

        // word_count must be a positive multiple of 8; every group gets fresh entropy
        Result<WordPhrase> generate_phrase(size_t word_count);
        Result<WordPhrase> generate_contact_code();
        Result<WordPhrase> generate_secret_code();

        // Returns the normalised phrase when every group decodes with a valid checksum
        Result<WordPhrase> validate_phrase(const WordPhrase &words) const;

        // PBKDF2-HMAC-SHA256(BIP39 seed with empty passphrase, "nonmessenger-salt", 100000) -> 32 bytes
        Result<utils::SecureBytes> derive_seed(const WordPhrase &words) const;

      private:
        crypto::RandomSource &random_;
    };

} // namespace pairlock::mnemonic
