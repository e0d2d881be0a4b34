#pragma once

#include "pairlock/core/core.hpp"
#include "pairlock/utils/log.hpp"

namespace pairlock {

    using KeyPair = identity::KeyPair;
    using WordPhrase = mnemonic::WordPhrase;
    using EncryptedMessage = message::EncryptedMessage;
    using PairingPayload = pairing::PairingPayload;
    using SecureBytes = utils::SecureBytes;
    using RandomSource = crypto::RandomSource;

} // namespace pairlock
