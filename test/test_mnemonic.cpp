#include <doctest/doctest.h>

#include <set>

#include <pairlock/mnemonic/wordlist.hpp>
#include <pairlock/pairlock.hpp>

#include "fixtures.hpp"

namespace {
    using pairlock::Error;
    using pairlock::mnemonic::PhraseEngine;
    using pairlock::utils::Common;

    pairlock::WordPhrase split(const std::string &sentence) {
        pairlock::WordPhrase words;
        size_t start = 0;
        while (start < sentence.size()) {
            size_t end = sentence.find(' ', start);
            if (end == std::string::npos)
                end = sentence.size();
            words.push_back(sentence.substr(start, end - start));
            start = end + 1;
        }
        return words;
    }

    std::string hex(const pairlock::SecureBytes &bytes) {
        return Common::bytes_to_hex(std::vector<uint8_t>(bytes.data(), bytes.data() + bytes.size()));
    }
} // namespace

TEST_SUITE("Mnemonic Encoding") {
    TEST_CASE("Dictionary") {
        const auto &words = pairlock::mnemonic::english_wordlist();
        CHECK(words.size() == 2048);
        CHECK(words.front() == "abandon");
        CHECK(words.back() == "zoo");

        CHECK(pairlock::mnemonic::word_index("abandon") == uint16_t{0});
        CHECK(pairlock::mnemonic::word_index("zoo") == uint16_t{2047});
        CHECK_FALSE(pairlock::mnemonic::word_index("abandoned").has_value());
        CHECK_FALSE(pairlock::mnemonic::word_index("").has_value());
    }

    TEST_CASE("Twelve word encoding matches BIP39") {
        struct Vector {
            const char *entropy;
            const char *sentence;
        };
        const Vector vectors[] = {
            {"00000000000000000000000000000000",
             "abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon about"},
            {"7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f",
             "legal winner thank year wave sausage worth useful legal winner thank yellow"},
            {"80808080808080808080808080808080",
             "letter advice cage absurd amount doctor acoustic avoid letter advice cage above"},
            {"ffffffffffffffffffffffffffffffff", "zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo wrong"},
            {"9e885d952ad362caeb4efe34a8e91bd2",
             "ozone drill grab fiber curtain grace pudding thank cruise elder eight picnic"},
        };

        for (const auto &vector : vectors) {
            CAPTURE(vector.sentence);
            auto words = pairlock::mnemonic::entropy_to_words(Common::hex_to_bytes(vector.entropy), 12);
            REQUIRE(words.success);
            CHECK(pairlock::mnemonic::join_phrase(words.value) == vector.sentence);

            auto entropy = pairlock::mnemonic::words_to_entropy(split(vector.sentence));
            REQUIRE(entropy.success);
            CHECK(hex(entropy.value) == vector.entropy);
        }
    }

    TEST_CASE("Encoding rejects mismatched sizes") {
        auto short_entropy = pairlock::mnemonic::entropy_to_words(std::vector<uint8_t>(10), 8);
        CHECK(short_entropy.error == Error::InvalidArgument);

        auto too_few_words = pairlock::mnemonic::entropy_to_words(std::vector<uint8_t>(1), 2);
        CHECK(too_few_words.error == Error::InvalidArgument);
    }

    TEST_CASE("Eight word code groups") {
        CHECK(pairlock::mnemonic::words_to_entropy(fixtures::CONTACT_CODE).success);
        CHECK(pairlock::mnemonic::words_to_entropy(fixtures::SECRET_CODE).success);
        CHECK(pairlock::mnemonic::words_to_entropy(split("zoo zoo zoo zoo zoo zoo zoo zebra")).success);

        auto bad_checksum = pairlock::mnemonic::words_to_entropy(
            split("abandon ability able about above absent absorb abstract"));
        CHECK_FALSE(bad_checksum.success);
        CHECK(bad_checksum.error == Error::InvalidPhrase);

        auto altered = fixtures::CONTACT_CODE;
        altered.back() = "dose";
        CHECK(pairlock::mnemonic::words_to_entropy(altered).error == Error::InvalidPhrase);
        altered.back() = "double";
        CHECK(pairlock::mnemonic::words_to_entropy(altered).success);
    }
}

TEST_SUITE("Phrase Generation") {
    TEST_CASE("Contact and secret codes") {
        PhraseEngine engine;

        auto contact = engine.generate_contact_code();
        auto secret = engine.generate_secret_code();
        REQUIRE(contact.success);
        REQUIRE(secret.success);
        CHECK(contact.value.size() == 8);
        CHECK(secret.value.size() == 8);
        CHECK(contact.value != secret.value);

        for (const auto &word : contact.value) {
            CHECK(pairlock::mnemonic::word_index(word).has_value());
        }

        CHECK(engine.validate_phrase(contact.value).success);
        CHECK(engine.validate_phrase(secret.value).success);
    }

    TEST_CASE("Generated phrases are distinct") {
        PhraseEngine engine;
        std::set<std::string> seen;
        for (int i = 0; i < 32; ++i) {
            auto phrase = engine.generate_contact_code();
            REQUIRE(phrase.success);
            seen.insert(pairlock::mnemonic::join_phrase(phrase.value));
        }
        CHECK(seen.size() == 32);
    }

    TEST_CASE("Multi-group phrases validate group by group") {
        PhraseEngine engine;
        auto phrase = engine.generate_phrase(16);
        REQUIRE(phrase.success);
        CHECK(phrase.value.size() == 16);
        CHECK(engine.validate_phrase(phrase.value).success);

        auto phrase24 = engine.generate_phrase(24);
        REQUIRE(phrase24.success);
        CHECK(engine.validate_phrase(phrase24.value).success);
    }

    TEST_CASE("Word counts that are not whole groups") {
        PhraseEngine engine;
        CHECK(engine.generate_phrase(0).error == Error::InvalidArgument);
        CHECK(engine.generate_phrase(7).error == Error::InvalidArgument);
        CHECK(engine.generate_phrase(12).error == Error::InvalidArgument);
    }

    TEST_CASE("Generation follows the random source") {
        auto key = pairlock::crypto::system_random().next_secure_bytes(32);
        pairlock::crypto::ChaCha20Stream first(key);
        pairlock::crypto::ChaCha20Stream second(key);

        auto a = PhraseEngine(first).generate_contact_code();
        auto b = PhraseEngine(second).generate_contact_code();
        REQUIRE(a.success);
        REQUIRE(b.success);
        CHECK(a.value == b.value);
    }
}

TEST_SUITE("Phrase Hygiene") {
    TEST_CASE("Wiping a phrase") {
        auto phrase = fixtures::full_phrase();
        REQUIRE(phrase.size() == 16);
        pairlock::mnemonic::wipe_phrase(phrase);
        CHECK(phrase.empty());

        pairlock::WordPhrase empty;
        pairlock::mnemonic::wipe_phrase(empty);
        CHECK(empty.empty());
    }

    TEST_CASE("Rejected phrases leave nothing behind") {
        PhraseEngine engine;
        auto altered = fixtures::full_phrase();
        altered[15] = "zoo";

        auto result = engine.validate_phrase(altered);
        CHECK(result.error == Error::InvalidPhrase);
        CHECK(result.value.empty());

        // The caller's phrase is untouched
        CHECK(altered[0] == "absurd");
        CHECK(altered.size() == 16);
    }

    TEST_CASE("Validation and derivation still agree after wiping copies") {
        PhraseEngine engine;
        auto mixed = fixtures::CONTACT_CODE;
        mixed[1] = "AVOID";

        auto normalized = engine.validate_phrase(mixed);
        REQUIRE(normalized.success);
        CHECK(normalized.value == fixtures::CONTACT_CODE);
        CHECK(mixed[1] == "AVOID");

        auto first = engine.derive_seed(mixed);
        auto second = engine.derive_seed(mixed);
        REQUIRE(first.success);
        REQUIRE(second.success);
        CHECK(first.value == second.value);
    }
}

TEST_SUITE("Seed Derivation") {
    TEST_CASE("Contact code seed is pinned") {
        PhraseEngine engine;
        auto seed = engine.derive_seed(fixtures::CONTACT_CODE);
        REQUIRE(seed.success);
        CHECK(seed.value.size() == 32);
        CHECK(hex(seed.value) == "c04141f22496b4d08f826df1c92c0295cf5ad9723a04e8c7cfd0b95a95310667");
    }

    TEST_CASE("Full phrase seed is pinned") {
        PhraseEngine engine;
        auto seed = engine.derive_seed(fixtures::full_phrase());
        REQUIRE(seed.success);
        CHECK(hex(seed.value) == "bb75d006ec18ee0b55d29f9cfe94f36e69fa2e3417a4c781759ccba960f5f782");
    }

    TEST_CASE("Word order matters") {
        PhraseEngine engine;
        auto swapped = fixtures::SECRET_CODE;
        swapped.insert(swapped.end(), fixtures::CONTACT_CODE.begin(), fixtures::CONTACT_CODE.end());

        auto a = engine.derive_seed(fixtures::full_phrase());
        auto b = engine.derive_seed(swapped);
        REQUIRE(a.success);
        REQUIRE(b.success);
        CHECK(a.value != b.value);
    }

    TEST_CASE("Case is normalised before derivation") {
        PhraseEngine engine;
        auto shouting = fixtures::CONTACT_CODE;
        for (auto &word : shouting) {
            for (auto &c : word)
                c = static_cast<char>(c - 'a' + 'A');
        }
        shouting[3] = "Anxiety";

        auto a = engine.derive_seed(fixtures::CONTACT_CODE);
        auto b = engine.derive_seed(shouting);
        REQUIRE(b.success);
        CHECK(a.value == b.value);

        auto normalized = engine.validate_phrase(shouting);
        REQUIRE(normalized.success);
        CHECK(normalized.value == fixtures::CONTACT_CODE);
    }

    TEST_CASE("Rejected phrases") {
        PhraseEngine engine;

        auto seven = fixtures::CONTACT_CODE;
        seven.pop_back();
        CHECK(engine.derive_seed(seven).error == Error::InvalidArgument);

        auto nine = fixtures::CONTACT_CODE;
        nine.push_back("zoo");
        CHECK(engine.derive_seed(nine).error == Error::InvalidArgument);

        CHECK(engine.derive_seed({}).error == Error::InvalidArgument);

        auto unknown = fixtures::CONTACT_CODE;
        unknown[2] = "scissor";
        CHECK(engine.derive_seed(unknown).error == Error::InvalidPhrase);

        auto broken_second_group = fixtures::full_phrase();
        broken_second_group[15] = "zoo";
        auto result = engine.derive_seed(broken_second_group);
        CHECK_FALSE(result.success);
        CHECK(result.error == Error::InvalidPhrase);
        CHECK(result.value.empty());
    }
}
