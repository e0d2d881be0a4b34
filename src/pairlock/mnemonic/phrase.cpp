#include "pairlock/mnemonic/phrase.hpp"

#include <array>
#include <cstring>

#include <openssl/evp.h>
#include <sodium.h>

#include "pairlock/core/constants.hpp"
#include "pairlock/mnemonic/wordlist.hpp"
#include "pairlock/utils/log.hpp"

namespace {

using pairlock::Error;
using pairlock::Result;
using pairlock::mnemonic::WordPhrase;
using pairlock::utils::Common;
using pairlock::utils::SecureBytes;

namespace constants = pairlock::constants;

struct Layout {
    size_t checksum_bits;
    size_t entropy_bits;
    size_t entropy_bytes;
};

Layout layout_for(size_t word_count) {
    const size_t total = word_count * constants::BITS_PER_WORD;
    const size_t checksum = word_count / 3;
    const size_t entropy = total - checksum;
    return {checksum, entropy, (entropy + 7) / 8};
}

bool get_bit(const uint8_t *bytes, size_t bit) { return (bytes[bit / 8] >> (7 - bit % 8)) & 1U; }

void set_bit(uint8_t *bytes, size_t bit) { bytes[bit / 8] |= static_cast<uint8_t>(0x80U >> (bit % 8)); }

void clear_padding(uint8_t *bytes, const Layout &layout) {
    const size_t padding = layout.entropy_bytes * 8 - layout.entropy_bits;
    if (padding > 0) {
        bytes[layout.entropy_bytes - 1] &= static_cast<uint8_t>(0xFFU << padding);
    }
}

static_assert(crypto_hash_sha256_BYTES == Common::SHA256_DIGEST_SIZE, "unexpected SHA-256 size");

// Top checksum_bits of SHA-256(entropy), left aligned in a byte array
std::array<uint8_t, Common::SHA256_DIGEST_SIZE> checksum_of(const uint8_t *entropy, const Layout &layout) {
    std::array<uint8_t, Common::SHA256_DIGEST_SIZE> digest{};
    crypto_hash_sha256(digest.data(), entropy, layout.entropy_bytes);
    std::array<uint8_t, Common::SHA256_DIGEST_SIZE> checksum{};
    for (size_t i = 0; i < layout.checksum_bits; ++i) {
        if (get_bit(digest.data(), i)) {
            set_bit(checksum.data(), i);
        }
    }
    return checksum;
}

Result<SecureBytes> pbkdf2(const uint8_t *password, size_t password_len, const char *salt, unsigned iterations,
                           const EVP_MD *digest, size_t out_len) {
    SecureBytes out(out_len);
    if (PKCS5_PBKDF2_HMAC(reinterpret_cast<const char *>(password), static_cast<int>(password_len),
                          reinterpret_cast<const unsigned char *>(salt), static_cast<int>(std::strlen(salt)),
                          static_cast<int>(iterations), digest, static_cast<int>(out.size()), out.data()) != 1) {
        return Result<SecureBytes>::failure(Error::CryptoFailure, "PBKDF2 derivation failed");
    }
    return Result<SecureBytes>::ok(std::move(out));
}

} // namespace

namespace pairlock::mnemonic {

Result<WordPhrase> entropy_to_words(const std::vector<uint8_t> &entropy, size_t word_count) {
    if (word_count < 3) {
        return Result<WordPhrase>::failure(Error::InvalidArgument, "A phrase needs at least 3 words");
    }
    const Layout layout = layout_for(word_count);
    if (entropy.size() != layout.entropy_bytes) {
        return Result<WordPhrase>::failure(Error::InvalidArgument, "Entropy size does not match word count");
    }

    utils::ensure_sodium_init();
    SecureBytes bits(entropy.data(), entropy.size());
    clear_padding(bits.data(), layout);
    const auto checksum = checksum_of(bits.data(), layout);

    const auto &dictionary = english_wordlist();
    WordPhrase words;
    words.reserve(word_count);
    for (size_t w = 0; w < word_count; ++w) {
        uint16_t index = 0;
        for (size_t k = 0; k < constants::BITS_PER_WORD; ++k) {
            const size_t bit = w * constants::BITS_PER_WORD + k;
            const bool value = bit < layout.entropy_bits ? get_bit(bits.data(), bit)
                                                         : get_bit(checksum.data(), bit - layout.entropy_bits);
            index = static_cast<uint16_t>((index << 1) | (value ? 1U : 0U));
        }
        words.emplace_back(dictionary[index]);
    }
    return Result<WordPhrase>::ok(std::move(words));
}

Result<SecureBytes> words_to_entropy(const WordPhrase &words) {
    if (words.size() < 3) {
        return Result<SecureBytes>::failure(Error::InvalidPhrase, "A phrase needs at least 3 words");
    }
    const Layout layout = layout_for(words.size());

    std::vector<uint16_t> indices;
    indices.reserve(words.size());
    for (const auto &word : words) {
        std::string lowered = normalize_word(word);
        auto index = word_index(lowered);
        utils::secure_wipe(lowered.data(), lowered.size());
        if (!index) {
            utils::secure_wipe(indices.data(), indices.size() * sizeof(uint16_t));
            return Result<SecureBytes>::failure(Error::InvalidPhrase, "Word is not in the dictionary");
        }
        indices.push_back(*index);
    }

    SecureBytes entropy(layout.entropy_bytes);
    std::array<uint8_t, Common::SHA256_DIGEST_SIZE> claimed{};
    for (size_t w = 0; w < indices.size(); ++w) {
        for (size_t k = 0; k < constants::BITS_PER_WORD; ++k) {
            if (((indices[w] >> (constants::BITS_PER_WORD - 1 - k)) & 1U) == 0) {
                continue;
            }
            const size_t bit = w * constants::BITS_PER_WORD + k;
            if (bit < layout.entropy_bits) {
                set_bit(entropy.data(), bit);
            } else {
                set_bit(claimed.data(), bit - layout.entropy_bits);
            }
        }
    }
    utils::secure_wipe(indices.data(), indices.size() * sizeof(uint16_t));

    utils::ensure_sodium_init();
    const auto expected = checksum_of(entropy.data(), layout);
    if (!utils::constant_time_equal(expected.data(), claimed.data(), expected.size())) {
        return Result<SecureBytes>::failure(Error::InvalidPhrase, "Phrase checksum mismatch");
    }
    return Result<SecureBytes>::ok(std::move(entropy));
}

std::string normalize_word(const std::string &word) {
    std::string out = word;
    for (auto &c : out) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return out;
}

void wipe_phrase(WordPhrase &words) {
    for (auto &word : words) {
        utils::secure_wipe(word.data(), word.size());
    }
    words.clear();
}

std::string join_phrase(const WordPhrase &words) {
    std::string sentence;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i > 0) {
            sentence.push_back(' ');
        }
        sentence += words[i];
    }
    return sentence;
}

PhraseEngine::PhraseEngine(crypto::RandomSource &random) : random_(random) {}

Result<WordPhrase> PhraseEngine::generate_phrase(size_t word_count) {
    if (word_count == 0 || word_count % constants::GROUP_WORDS != 0) {
        return Result<WordPhrase>::failure(Error::InvalidArgument, "Word count must be a positive multiple of 8");
    }

    WordPhrase phrase;
    phrase.reserve(word_count);
    for (size_t group = 0; group < word_count / constants::GROUP_WORDS; ++group) {
        auto entropy = random_.next_secure_bytes(constants::GROUP_ENTROPY_BYTES);
        std::vector<uint8_t> raw(entropy.data(), entropy.data() + entropy.size());
        auto words = entropy_to_words(raw, constants::GROUP_WORDS);
        utils::secure_wipe(raw.data(), raw.size());
        if (!words.success) {
            wipe_phrase(phrase);
            return words;
        }
        phrase.insert(phrase.end(), words.value.begin(), words.value.end());
        wipe_phrase(words.value);
    }
    return Result<WordPhrase>::ok(std::move(phrase));
}

Result<WordPhrase> PhraseEngine::generate_contact_code() { return generate_phrase(constants::CONTACT_PHRASE_WORDS); }

Result<WordPhrase> PhraseEngine::generate_secret_code() { return generate_phrase(constants::GROUP_WORDS); }

Result<WordPhrase> PhraseEngine::validate_phrase(const WordPhrase &words) const {
    if (words.empty() || words.size() % constants::GROUP_WORDS != 0) {
        return Result<WordPhrase>::failure(Error::InvalidArgument, "Phrase length must be a positive multiple of 8");
    }

    WordPhrase normalized;
    normalized.reserve(words.size());
    for (const auto &word : words) {
        normalized.push_back(normalize_word(word));
    }

    for (size_t start = 0; start < normalized.size(); start += constants::GROUP_WORDS) {
        WordPhrase group(normalized.begin() + static_cast<std::ptrdiff_t>(start),
                         normalized.begin() + static_cast<std::ptrdiff_t>(start + constants::GROUP_WORDS));
        auto entropy = words_to_entropy(group);
        wipe_phrase(group);
        if (!entropy.success) {
            wipe_phrase(normalized);
            return Result<WordPhrase>::failure(entropy.error, entropy.message);
        }
    }
    return Result<WordPhrase>::ok(std::move(normalized));
}

Result<SecureBytes> PhraseEngine::derive_seed(const WordPhrase &words) const {
    auto normalized = validate_phrase(words);
    if (!normalized.success) {
        log::logger()->warn("Seed derivation rejected a {}-word phrase: {}", words.size(), normalized.message);
        return Result<SecureBytes>::failure(normalized.error, normalized.message);
    }

    std::string sentence = join_phrase(normalized.value);
    auto mnemonic_seed =
        pbkdf2(reinterpret_cast<const uint8_t *>(sentence.data()), sentence.size(), constants::MNEMONIC_SALT,
               constants::MNEMONIC_ITERATIONS, EVP_sha512(), constants::MNEMONIC_SEED_BYTES);
    utils::secure_wipe(sentence.data(), sentence.size());
    wipe_phrase(normalized.value);
    if (!mnemonic_seed.success) {
        return mnemonic_seed;
    }

    auto seed = pbkdf2(mnemonic_seed.value.data(), mnemonic_seed.value.size(), constants::SEED_SALT,
                       constants::SEED_ITERATIONS, EVP_sha256(), constants::SEED_BYTES);
    if (seed.success) {
        log::logger()->debug("Derived seed from {}-word phrase", words.size());
    }
    return seed;
}

} // namespace pairlock::mnemonic
