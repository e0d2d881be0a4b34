#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "pairlock/utils/secure_buffer.hpp"

namespace pairlock::crypto {

    // Source of random bytes handed explicitly to every component that needs entropy
    class RandomSource {
      public:
        virtual ~RandomSource() = default;

        virtual void fill(uint8_t *out, size_t size) = 0;

        std::vector<uint8_t> next_bytes(size_t size) {
            std::vector<uint8_t> out(size);
            fill(out.data(), out.size());
            return out;
        }

        utils::SecureBytes next_secure_bytes(size_t size) {
            utils::SecureBytes out(size);
            fill(out.data(), out.size());
            return out;
        }
    };

    // Operating system CSPRNG through libsodium. Stateless and safe to share across threads.
    class SystemRandom final : public RandomSource {
      public:
        SystemRandom();
        void fill(uint8_t *out, size_t size) override;
    };

    // Process-wide system source
    SystemRandom &system_random();

    // Deterministic byte stream: the ChaCha20 (RFC 8439) keystream under a 32 byte key,
    // nonce constants::KEYGEN_STREAM_NONCE, block counter starting at zero. The byte
    // sequence is part of the identity recovery contract. Not thread-safe.
    class ChaCha20Stream final : public RandomSource {
      public:
        explicit ChaCha20Stream(const utils::SecureBytes &key);
        ~ChaCha20Stream() override;

        ChaCha20Stream(const ChaCha20Stream &) = delete;
        ChaCha20Stream &operator=(const ChaCha20Stream &) = delete;

        void fill(uint8_t *out, size_t size) override;

      private:
        void refill_block();

        std::array<uint8_t, utils::Common::CHACHA20_KEY_SIZE> key_{};
        std::array<uint8_t, utils::Common::CHACHA20_BLOCK_SIZE> block_{};
        size_t block_offset_{utils::Common::CHACHA20_BLOCK_SIZE};
        uint32_t counter_{0};
    };

} // namespace pairlock::crypto
