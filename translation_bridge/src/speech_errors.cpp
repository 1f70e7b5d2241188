#include "speech_errors.h"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace speechbridge {

std::string FormatNativeStatus(NativeStatus status) {
    std::ostringstream ss;
    ss << "0x" << std::hex << std::setw(3) << std::setfill('0') << status;
    switch (status) {
        case kNativeErrorInvalidArg:    ss << " (INVALID_ARG)"; break;
        case kNativeErrorInvalidHandle: ss << " (INVALID_HANDLE)"; break;
        default: break;
    }
    return ss.str();
}

SpeechError::SpeechError(NativeStatus status, const std::string& operation)
  : std::runtime_error(operation + " failed with native error code " + FormatNativeStatus(status)),
    status_(status) {}

void ThrowIfFail(NativeStatus status, const char* operation) {
    if (!NativeSucceeded(status)) {
        throw SpeechError(status, operation);
    }
}

void ThrowIfNull(const void* handle, const char* message) {
    if (handle == nullptr) {
        throw InvalidHandleError(message);
    }
}

void LogError(NativeStatus status, const char* operation) {
    std::cerr << "❌ speechbridge: " << operation << " -> native error "
              << FormatNativeStatus(status) << std::endl;
}

void LogErrorIfFail(NativeStatus status, const char* operation) {
    if (!NativeSucceeded(status)) {
        LogError(status, operation);
    }
}

const char* ToString(RecognizerEvent event) {
    switch (event) {
        case RecognizerEvent::Recognizing:         return "Recognizing";
        case RecognizerEvent::Recognized:          return "Recognized";
        case RecognizerEvent::Canceled:            return "Canceled";
        case RecognizerEvent::Synthesizing:        return "Synthesizing";
        case RecognizerEvent::SessionStarted:      return "SessionStarted";
        case RecognizerEvent::SessionStopped:      return "SessionStopped";
        case RecognizerEvent::SpeechStartDetected: return "SpeechStartDetected";
        case RecognizerEvent::SpeechEndDetected:   return "SpeechEndDetected";
    }
    return "Unknown";
}

} // namespace speechbridge
