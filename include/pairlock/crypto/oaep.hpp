#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "pairlock/core/result.hpp"
#include "pairlock/utils/secure_buffer.hpp"

namespace pairlock::crypto {

    // RSA-OAEP with SHA-256 as both the label digest and MGF1 digest
    Result<std::vector<uint8_t>> oaep_wrap(const utils::SecureBytes &key, const std::string &public_pem);

    // Any unwrap failure is reported as DecryptionFailed without further detail
    Result<utils::SecureBytes> oaep_unwrap(const std::vector<uint8_t> &wrapped, const std::string &private_pem);

} // namespace pairlock::crypto
