#pragma once

#include <stdexcept>
#include <string>

#include <kvcall/core/types.h>

namespace kvcall {

// Root of everything thrown across the call path.
class KvError : public std::runtime_error {
public:
    KvError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

    Error toError() const { return Error{code_, what()}; }

private:
    ErrorCode code_;
};

// Operation is not valid for the client's connection mode. Raised before any I/O.
class ClientUsageError : public KvError {
public:
    explicit ClientUsageError(const std::string& message)
        : KvError(ErrorCode::InvalidOperation, message) {}
};

// Error reply returned by the store.
class ServerError : public KvError {
public:
    explicit ServerError(const std::string& message) : KvError(ErrorCode::ServerError, message) {}
};

// A value has no viable conversion to or from its wire form.
class CodecError : public KvError {
public:
    explicit CodecError(const std::string& message) : KvError(ErrorCode::InvalidData, message) {}
};

} // namespace kvcall
