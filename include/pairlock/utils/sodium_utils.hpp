#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace pairlock::utils {

    // Raised when the operating system entropy source cannot be brought up.
    // Never caught inside the library.
    class EntropyError : public std::runtime_error {
      public:
        explicit EntropyError(const std::string &what) : std::runtime_error(what) {}
    };

    // Initialise libsodium once per process. Throws EntropyError on failure.
    void ensure_sodium_init();

    void secure_wipe(void *data, size_t size);

    bool constant_time_equal(const uint8_t *a, const uint8_t *b, size_t size);

    struct Common {
        static constexpr size_t SHA256_DIGEST_SIZE = 32;
        static constexpr size_t CHACHA20_KEY_SIZE = 32;
        static constexpr size_t CHACHA20_BLOCK_SIZE = 64;

        static std::string bytes_to_hex(const std::vector<uint8_t> &data);
        static std::vector<uint8_t> hex_to_bytes(const std::string &hex);

        // Standard alphabet, padded
        static std::string to_base64(const uint8_t *data, size_t size);
        static std::string to_base64(const std::vector<uint8_t> &data) { return to_base64(data.data(), data.size()); }
        static std::optional<std::vector<uint8_t>> from_base64(const std::string &encoded);

        static bool is_valid_utf8(std::string_view text);
    };

} // namespace pairlock::utils
