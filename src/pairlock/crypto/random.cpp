#include "pairlock/crypto/random.hpp"

#include <algorithm>
#include <stdexcept>

#include <sodium.h>

#include "pairlock/core/constants.hpp"

namespace pairlock::crypto {

SystemRandom::SystemRandom() { utils::ensure_sodium_init(); }

void SystemRandom::fill(uint8_t *out, size_t size) {
    utils::ensure_sodium_init();
    randombytes_buf(out, size);
}

SystemRandom &system_random() {
    static SystemRandom instance;
    return instance;
}

ChaCha20Stream::ChaCha20Stream(const utils::SecureBytes &key) {
    static_assert(crypto_stream_chacha20_ietf_KEYBYTES == utils::Common::CHACHA20_KEY_SIZE,
                  "unexpected ChaCha20 key size");
    static_assert(crypto_stream_chacha20_ietf_NONCEBYTES == constants::KEYGEN_STREAM_NONCE.size(),
                  "unexpected ChaCha20 nonce size");
    utils::ensure_sodium_init();
    if (key.size() != key_.size()) {
        throw std::invalid_argument("ChaCha20Stream requires a 32 byte key");
    }
    std::copy(key.data(), key.data() + key.size(), key_.begin());
}

ChaCha20Stream::~ChaCha20Stream() {
    utils::secure_wipe(key_.data(), key_.size());
    utils::secure_wipe(block_.data(), block_.size());
}

void ChaCha20Stream::refill_block() {
    std::array<uint8_t, utils::Common::CHACHA20_BLOCK_SIZE> zeros{};
    crypto_stream_chacha20_ietf_xor_ic(block_.data(), zeros.data(), zeros.size(),
                                       constants::KEYGEN_STREAM_NONCE.data(), counter_, key_.data());
    ++counter_;
    block_offset_ = 0;
}

void ChaCha20Stream::fill(uint8_t *out, size_t size) {
    while (size > 0) {
        if (block_offset_ == block_.size()) {
            refill_block();
        }
        const size_t take = std::min(size, block_.size() - block_offset_);
        std::copy(block_.begin() + block_offset_, block_.begin() + block_offset_ + take, out);
        block_offset_ += take;
        out += take;
        size -= take;
    }
}

} // namespace pairlock::crypto
