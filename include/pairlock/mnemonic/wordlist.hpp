#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

#include "pairlock/core/constants.hpp"

namespace pairlock::mnemonic {

    using Wordlist = std::array<std::string_view, constants::DICTIONARY_SIZE>;

    // BIP39 English wordlist, sorted
    const Wordlist &english_wordlist();

    // Index of a lowercase word, or nullopt when it is not in the dictionary
    std::optional<uint16_t> word_index(std::string_view word);

} // namespace pairlock::mnemonic
