#pragma once

#include <stdexcept>
#include <string>

#include "native_engine.h"

namespace speechbridge {

// A native engine call returned a failure status.
class SpeechError : public std::runtime_error {
public:
    SpeechError(NativeStatus status, const std::string& operation);

    NativeStatus Status() const { return status_; }

private:
    NativeStatus status_;
};

// Stale/revoked handle or an object used after it was closed.
class InvalidHandleError : public std::logic_error {
public:
    explicit InvalidHandleError(const std::string& what) : std::logic_error(what) {}
};

// Throws SpeechError when status is not success.
void ThrowIfFail(NativeStatus status, const char* operation);

// Throws InvalidHandleError when handle is null.
void ThrowIfNull(const void* handle, const char* message);

// Teardown path: report the failure on stderr and keep going.
void LogErrorIfFail(NativeStatus status, const char* operation);

void LogError(NativeStatus status, const char* operation);

std::string FormatNativeStatus(NativeStatus status);

} // namespace speechbridge
