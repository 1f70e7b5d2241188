#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "native_engine.h"
#include "speech_enums.h"

namespace speechbridge {

// Owns a native result handle for the scope of one read.
class ScopedResultHandle {
public:
    ScopedResultHandle(NativeEngine& engine, ResultHandle handle) : engine_(engine), handle_(handle) {}
    ~ScopedResultHandle();

    ScopedResultHandle(const ScopedResultHandle&) = delete;
    ScopedResultHandle& operator=(const ScopedResultHandle&) = delete;

    ResultHandle Get() const { return handle_; }

private:
    NativeEngine& engine_;
    ResultHandle handle_;
};

class CancellationDetails {
public:
    CancellationDetails(CancellationReason reason, CancellationErrorCode error_code, std::string error_details);

    static std::shared_ptr<CancellationDetails> FromResult(NativeEngine& engine, ResultHandle result);

    CancellationReason Reason() const { return reason_; }
    CancellationErrorCode ErrorCode() const { return error_code_; }
    const std::string& ErrorDetails() const { return error_details_; }

private:
    const CancellationReason reason_;
    const CancellationErrorCode error_code_;
    const std::string error_details_;
};

// Values are copied out of the native result at construction; the object
// does not keep the native handle.
class RecognitionResult {
public:
    RecognitionResult(NativeEngine& engine, ResultHandle result);
    virtual ~RecognitionResult() = default;

    const std::string& ResultId() const { return result_id_; }
    ResultReason Reason() const { return reason_; }
    const std::string& Text() const { return text_; }
    // In 100-nanosecond ticks.
    uint64_t Offset() const { return offset_; }
    uint64_t Duration() const { return duration_; }
    // Raw service response (may be empty).
    const std::string& Json() const { return json_; }
    // Only set when Reason() == ResultReason::Canceled.
    std::shared_ptr<CancellationDetails> Cancellation() const { return cancellation_; }

private:
    std::string result_id_;
    ResultReason reason_ = ResultReason::NoMatch;
    std::string text_;
    uint64_t offset_ = 0;
    uint64_t duration_ = 0;
    std::string json_;
    std::shared_ptr<CancellationDetails> cancellation_;
};

class SpeechRecognitionResult : public RecognitionResult {
public:
    using RecognitionResult::RecognitionResult;
};

class TranslationRecognitionResult : public RecognitionResult {
public:
    TranslationRecognitionResult(NativeEngine& engine, ResultHandle result);

    // target language -> translated text
    const std::map<std::string, std::string>& Translations() const { return translations_; }

private:
    std::map<std::string, std::string> translations_;
};

class IntentRecognitionResult : public RecognitionResult {
public:
    IntentRecognitionResult(NativeEngine& engine, ResultHandle result);

    const std::string& IntentId() const { return intent_id_; }
    const std::string& IntentJson() const { return intent_json_; }

private:
    std::string intent_id_;
    std::string intent_json_;
};

class TranslationSynthesisResult {
public:
    TranslationSynthesisResult(NativeEngine& engine, ResultHandle result);

    ResultReason Reason() const { return reason_; }
    // An empty buffer marks the end of the synthesized audio.
    const std::vector<uint8_t>& Audio() const { return audio_; }

private:
    ResultReason reason_ = ResultReason::SynthesizingAudio;
    std::vector<uint8_t> audio_;
};

} // namespace speechbridge
