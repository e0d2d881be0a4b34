#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "pairlock/utils/sodium_utils.hpp"

namespace pairlock::utils {

    // Owning byte buffer for key material. Contents are wiped on destruction and
    // before being overwritten by a move. Copies must be explicit (clone()).
    class SecureBytes {
      public:
        SecureBytes() = default;
        explicit SecureBytes(size_t size) : bytes_(size) {}
        SecureBytes(const uint8_t *data, size_t size) : bytes_(data, data + size) {}
        explicit SecureBytes(const std::vector<uint8_t> &bytes) : bytes_(bytes) {}

        ~SecureBytes() { wipe(); }

        SecureBytes(const SecureBytes &) = delete;
        SecureBytes &operator=(const SecureBytes &) = delete;

        SecureBytes(SecureBytes &&other) noexcept : bytes_(std::move(other.bytes_)) { other.bytes_.clear(); }
        SecureBytes &operator=(SecureBytes &&other) noexcept {
            if (this != &other) {
                wipe();
                bytes_ = std::move(other.bytes_);
                other.bytes_.clear();
            }
            return *this;
        }

        uint8_t *data() { return bytes_.data(); }
        const uint8_t *data() const { return bytes_.data(); }
        size_t size() const { return bytes_.size(); }
        bool empty() const { return bytes_.empty(); }

        uint8_t &operator[](size_t i) { return bytes_[i]; }
        const uint8_t &operator[](size_t i) const { return bytes_[i]; }

        SecureBytes clone() const { return SecureBytes(bytes_.data(), bytes_.size()); }

        void wipe() { secure_wipe(bytes_.data(), bytes_.size()); }

        bool operator==(const SecureBytes &other) const {
            return size() == other.size() && constant_time_equal(data(), other.data(), size());
        }
        bool operator!=(const SecureBytes &other) const { return !(*this == other); }

      private:
        std::vector<uint8_t> bytes_;
    };

} // namespace pairlock::utils
