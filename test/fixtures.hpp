#pragma once

#include <stdexcept>
#include <string>

#include <pairlock/pairlock.hpp>

namespace fixtures {

    // Valid 8 word codes (entropy 0x01..0x0b and 0x20..0x2a)
    inline const pairlock::WordPhrase CONTACT_CODE = {"absurd", "avoid", "scissors", "anxiety",
                                                      "gather", "lottery", "category", "door"};
    inline const pairlock::WordPhrase SECRET_CODE = {"cage", "animal", "match", "embark",
                                                     "fame", "bean", "pass", "census"};

    inline pairlock::WordPhrase full_phrase() {
        pairlock::WordPhrase words = CONTACT_CODE;
        words.insert(words.end(), SECRET_CODE.begin(), SECRET_CODE.end());
        return words;
    }

    // 2048 bit random identities shared across suites; generated once per process
    inline pairlock::KeyPair make_identity() {
        pairlock::identity::IdentityGenerator generator(pairlock::crypto::system_random(), 2048);
        auto pair = generator.generate_random();
        if (!pair.success) {
            throw std::runtime_error("fixture identity generation failed: " + pair.message);
        }
        return pair.value;
    }

    inline const pairlock::KeyPair &alice() {
        static const pairlock::KeyPair pair = make_identity();
        return pair;
    }

    inline const pairlock::KeyPair &bob() {
        static const pairlock::KeyPair pair = make_identity();
        return pair;
    }

} // namespace fixtures
