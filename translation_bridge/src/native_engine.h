#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "speech_enums.h"

namespace speechbridge {

class SpeechConfig;
class AudioConfig;
class KeywordRecognitionModel;

// Opaque handles owned by the native engine.
using RecoHandle = void*;
using EventHandle = void*;
using ResultHandle = void*;
using PropertyBagHandle = void*;

// Status returned by every native call. 0 is success, anything else is an
// engine specific error code.
using NativeStatus = std::uintptr_t;

constexpr NativeStatus kNativeOk = 0;
constexpr NativeStatus kNativeErrorInvalidArg = 0x005;
constexpr NativeStatus kNativeErrorInvalidHandle = 0x021;

inline bool NativeSucceeded(NativeStatus status) { return status == kNativeOk; }

// Native callback signature: (recognizer, event, context).
// The event handle is only valid for the duration of the call.
using NativeCallback = void (*)(RecoHandle, EventHandle, void*);

enum class RecognizerKind {
    Speech,
    Translation,
    Intent
};

enum class RecognizerEvent {
    Recognizing,
    Recognized,
    Canceled,
    Synthesizing,
    SessionStarted,
    SessionStopped,
    SpeechStartDetected,
    SpeechEndDetected
};

const char* ToString(RecognizerEvent event);

// Handle based interface of the native speech engine.
// AzureSpeechEngine forwards to the Speech SDK C API; tests substitute a mock.
// Implementations must be callable from any thread.
class NativeEngine {
public:
    virtual ~NativeEngine() = default;

    // --- recognizer lifetime ---
    virtual NativeStatus CreateRecognizer(RecognizerKind kind,
                                          const SpeechConfig& config,
                                          const AudioConfig* audio_config,
                                          RecoHandle* handle) = 0;
    virtual bool IsRecognizerValid(RecoHandle handle) = 0;
    virtual NativeStatus ReleaseRecognizer(RecoHandle handle) = 0;

    // Passing a null callback uninstalls the callback for that event.
    virtual NativeStatus SetEventCallback(RecoHandle handle,
                                          RecognizerEvent event,
                                          NativeCallback callback,
                                          void* context) = 0;

    // --- property bag ---
    virtual NativeStatus GetPropertyBag(RecoHandle handle, PropertyBagHandle* bag) = 0;
    virtual NativeStatus GetProperty(PropertyBagHandle bag, PropertyId id,
                                     const std::string& default_value, std::string* value) = 0;
    virtual NativeStatus GetNamedProperty(PropertyBagHandle bag, const std::string& name,
                                          const std::string& default_value, std::string* value) = 0;
    virtual NativeStatus SetProperty(PropertyBagHandle bag, PropertyId id, const std::string& value) = 0;
    virtual NativeStatus SetNamedProperty(PropertyBagHandle bag, const std::string& name,
                                          const std::string& value) = 0;
    virtual NativeStatus ReleasePropertyBag(PropertyBagHandle bag) = 0;

    // --- recognition (blocking) ---
    virtual NativeStatus RecognizeOnce(RecoHandle handle, ResultHandle* result) = 0;
    virtual NativeStatus StartContinuousRecognition(RecoHandle handle) = 0;
    virtual NativeStatus StopContinuousRecognition(RecoHandle handle) = 0;
    virtual NativeStatus StartKeywordRecognition(RecoHandle handle,
                                                 const KeywordRecognitionModel& model) = 0;
    virtual NativeStatus StopKeywordRecognition(RecoHandle handle) = 0;
    virtual NativeStatus AddPhraseIntent(RecoHandle handle, const std::string& phrase,
                                         const std::string& intent_id) = 0;

    // --- events ---
    virtual NativeStatus GetEventSessionId(EventHandle event, std::string* session_id) = 0;
    virtual NativeStatus GetEventOffset(EventHandle event, uint64_t* offset) = 0;
    virtual NativeStatus GetEventResult(EventHandle event, ResultHandle* result) = 0;
    virtual NativeStatus ReleaseEvent(EventHandle event) = 0;

    // --- results ---
    virtual NativeStatus GetResultId(ResultHandle result, std::string* result_id) = 0;
    virtual NativeStatus GetResultReason(ResultHandle result, ResultReason* reason) = 0;
    virtual NativeStatus GetResultText(ResultHandle result, std::string* text) = 0;
    virtual NativeStatus GetResultTiming(ResultHandle result, uint64_t* offset, uint64_t* duration) = 0;
    virtual NativeStatus GetResultProperty(ResultHandle result, PropertyId id, std::string* value) = 0;
    virtual NativeStatus GetTranslations(ResultHandle result,
                                         std::map<std::string, std::string>* translations) = 0;
    virtual NativeStatus GetSynthesisAudio(ResultHandle result, std::vector<uint8_t>* audio) = 0;
    virtual NativeStatus GetIntentId(ResultHandle result, std::string* intent_id) = 0;
    virtual NativeStatus GetCancellationDetails(ResultHandle result,
                                                CancellationReason* reason,
                                                CancellationErrorCode* error_code) = 0;
    virtual NativeStatus ReleaseResult(ResultHandle result) = 0;
};

} // namespace speechbridge
