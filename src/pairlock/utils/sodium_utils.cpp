#include "pairlock/utils/sodium_utils.hpp"

#include <mutex>

#include <sodium.h>

namespace pairlock::utils {

void ensure_sodium_init() {
    static std::once_flag sodium_flag;
    static int status = -1;
    std::call_once(sodium_flag, []() { status = sodium_init(); });

    if (status < 0) {
        throw EntropyError("libsodium initialization failed");
    }
}

void secure_wipe(void *data, size_t size) {
    if (data != nullptr && size > 0) {
        sodium_memzero(data, size);
    }
}

bool constant_time_equal(const uint8_t *a, const uint8_t *b, size_t size) {
    if (size == 0) {
        return true;
    }
    return sodium_memcmp(a, b, size) == 0;
}

std::string Common::bytes_to_hex(const std::vector<uint8_t> &data) {
    std::string hex(data.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), data.data(), data.size());
    hex.resize(data.size() * 2);
    return hex;
}

std::vector<uint8_t> Common::hex_to_bytes(const std::string &hex) {
    std::vector<uint8_t> out(hex.size() / 2);
    size_t out_len = 0;
    if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(), nullptr, &out_len, nullptr) != 0) {
        return {};
    }
    out.resize(out_len);
    return out;
}

std::string Common::to_base64(const uint8_t *data, size_t size) {
    const size_t encoded_len = sodium_base64_ENCODED_LEN(size, sodium_base64_VARIANT_ORIGINAL);
    std::string encoded(encoded_len, '\0');
    sodium_bin2base64(encoded.data(), encoded.size(), data, size, sodium_base64_VARIANT_ORIGINAL);
    encoded.resize(encoded_len - 1);
    return encoded;
}

std::optional<std::vector<uint8_t>> Common::from_base64(const std::string &encoded) {
    std::vector<uint8_t> out(encoded.size() / 4 * 3 + 3);
    size_t out_len = 0;
    const char *end = nullptr;
    if (sodium_base642bin(out.data(), out.size(), encoded.data(), encoded.size(), nullptr, &out_len, &end,
                          sodium_base64_VARIANT_ORIGINAL) != 0) {
        return std::nullopt;
    }
    if (end != encoded.data() + encoded.size()) {
        return std::nullopt;
    }
    out.resize(out_len);
    return out;
}

bool Common::is_valid_utf8(std::string_view text) {
    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<uint8_t>(text[i]);
        size_t extra = 0;
        uint32_t cp = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            cp = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            cp = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            cp = lead & 0x07;
        } else {
            return false;
        }

        if (i + extra >= text.size()) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            const auto cont = static_cast<uint8_t>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cont & 0x3F);
        }

        // Overlong forms, surrogates and values past U+10FFFF
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

} // namespace pairlock::utils
