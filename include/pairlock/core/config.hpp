#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "pairlock/core/constants.hpp"
#include "pairlock/core/result.hpp"

namespace pairlock {

    // Runtime settings. Protocol constants live in constants.hpp and are not configurable.
    struct Config {
        std::string log_level{"info"};
        int identity_key_bits{constants::RANDOM_IDENTITY_BITS};
        // 2048 and 3072 bit random identities are for tests and demos only; without this
        // flag identity_key_bits must be 4096
        bool allow_reduced_identity_bits{false};

        Result<bool> validate() const;
        nlohmann::json to_json() const;

        // Missing keys keep their defaults; unknown keys are ignored
        static Result<Config> from_json(const nlohmann::json &json);
        static Result<Config> load(const std::string &path);
    };

} // namespace pairlock
