#include "pairlock/core/config.hpp"

#include <fstream>

#include <spdlog/spdlog.h>

namespace pairlock {

Result<bool> Config::validate() const {
    if (identity_key_bits != 2048 && identity_key_bits != 3072 && identity_key_bits != 4096) {
        return Result<bool>::failure(Error::InvalidArgument, "identity_key_bits must be 2048, 3072 or 4096");
    }
    if (identity_key_bits != constants::RANDOM_IDENTITY_BITS && !allow_reduced_identity_bits) {
        return Result<bool>::failure(Error::InvalidArgument,
                                     "identity_key_bits below 4096 requires allow_reduced_identity_bits");
    }
    const auto level = spdlog::level::from_str(log_level);
    if (level == spdlog::level::off && log_level != "off") {
        return Result<bool>::failure(Error::InvalidArgument, "Unknown log_level: " + log_level);
    }
    return Result<bool>::ok(true);
}

nlohmann::json Config::to_json() const {
    return nlohmann::json{{"log_level", log_level},
                          {"identity_key_bits", identity_key_bits},
                          {"allow_reduced_identity_bits", allow_reduced_identity_bits}};
}

Result<Config> Config::from_json(const nlohmann::json &json) {
    if (!json.is_object()) {
        return Result<Config>::failure(Error::InvalidArgument, "Config must be a JSON object");
    }

    Config config;
    if (json.contains("log_level")) {
        if (!json.at("log_level").is_string()) {
            return Result<Config>::failure(Error::InvalidArgument, "log_level must be a string");
        }
        config.log_level = json.at("log_level").get<std::string>();
    }
    if (json.contains("identity_key_bits")) {
        if (!json.at("identity_key_bits").is_number_integer()) {
            return Result<Config>::failure(Error::InvalidArgument, "identity_key_bits must be an integer");
        }
        config.identity_key_bits = json.at("identity_key_bits").get<int>();
    }

    if (json.contains("allow_reduced_identity_bits")) {
        if (!json.at("allow_reduced_identity_bits").is_boolean()) {
            return Result<Config>::failure(Error::InvalidArgument, "allow_reduced_identity_bits must be a boolean");
        }
        config.allow_reduced_identity_bits = json.at("allow_reduced_identity_bits").get<bool>();
    }

    auto valid = config.validate();
    if (!valid.success) {
        return Result<Config>::failure(valid.error, valid.message);
    }
    return Result<Config>::ok(std::move(config));
}

Result<Config> Config::load(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<Config>::failure(Error::InvalidArgument, "Cannot open config file: " + path);
    }
    const auto json = nlohmann::json::parse(file, nullptr, false);
    if (json.is_discarded()) {
        return Result<Config>::failure(Error::InvalidArgument, "Config file is not valid JSON: " + path);
    }
    return from_json(json);
}

} // namespace pairlock
