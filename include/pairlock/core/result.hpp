#pragma once

#include <string>
#include <utility>

namespace pairlock {

    enum class Error {
        None,
        InvalidArgument,
        InvalidPhrase,
        CryptoFailure,
        DecryptionFailed,
        MalformedPayload,
        WrongPayloadType,
        EncodingError,
    };

    const char *error_to_string(Error error);

    // Result type shared by every operation in the library
    template <typename T> struct Result {
        bool success{false};
        T value{};
        Error error{Error::None};
        std::string message;

        static Result<T> ok(T val) { return Result<T>{true, std::move(val), Error::None, ""}; }

        static Result<T> failure(Error err, std::string msg) { return Result<T>{false, {}, err, std::move(msg)}; }

        explicit operator bool() const { return success; }
    };

} // namespace pairlock
