#include "pairlock/core/result.hpp"

namespace pairlock {

const char *error_to_string(Error error) {
    switch (error) {
    case Error::None:
        return "None";
    case Error::InvalidArgument:
        return "InvalidArgument";
    case Error::InvalidPhrase:
        return "InvalidPhrase";
    case Error::CryptoFailure:
        return "CryptoFailure";
    case Error::DecryptionFailed:
        return "DecryptionFailed";
    case Error::MalformedPayload:
        return "MalformedPayload";
    case Error::WrongPayloadType:
        return "WrongPayloadType";
    case Error::EncodingError:
        return "EncodingError";
    }
    return "Unknown";
}

} // namespace pairlock
