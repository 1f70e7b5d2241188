#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "native_engine.h"
#include "recognition_result.h"

namespace speechbridge {

// Event payloads. Each one is built once, inside the native callback, from the
// event handle the engine passed in; everything is copied out so the payload
// stays valid after the callback returns.

class SessionEventArgs {
public:
    SessionEventArgs(NativeEngine& engine, EventHandle event);
    virtual ~SessionEventArgs() = default;

    const std::string& SessionId() const { return session_id_; }

    virtual std::string ToString() const;

private:
    std::string session_id_;
};

class RecognitionEventArgs : public SessionEventArgs {
public:
    RecognitionEventArgs(NativeEngine& engine, EventHandle event);

    // Offset of the event into the audio stream, in 100-nanosecond ticks.
    uint64_t Offset() const { return offset_; }

    std::string ToString() const override;

private:
    uint64_t offset_ = 0;
};

// --- speech ---

class SpeechRecognitionEventArgs : public RecognitionEventArgs {
public:
    SpeechRecognitionEventArgs(NativeEngine& engine, EventHandle event);

    std::shared_ptr<SpeechRecognitionResult> Result() const { return result_; }

    std::string ToString() const override;

private:
    std::shared_ptr<SpeechRecognitionResult> result_;
};

class SpeechRecognitionCanceledEventArgs : public SpeechRecognitionEventArgs {
public:
    SpeechRecognitionCanceledEventArgs(NativeEngine& engine, EventHandle event);

    CancellationReason Reason() const { return details_->Reason(); }
    CancellationErrorCode ErrorCode() const { return details_->ErrorCode(); }
    const std::string& ErrorDetails() const { return details_->ErrorDetails(); }

    std::string ToString() const override;

private:
    std::shared_ptr<CancellationDetails> details_;
};

// --- translation ---

class TranslationRecognitionEventArgs : public RecognitionEventArgs {
public:
    TranslationRecognitionEventArgs(NativeEngine& engine, EventHandle event);

    std::shared_ptr<TranslationRecognitionResult> Result() const { return result_; }

    std::string ToString() const override;

private:
    std::shared_ptr<TranslationRecognitionResult> result_;
};

class TranslationRecognitionCanceledEventArgs : public TranslationRecognitionEventArgs {
public:
    TranslationRecognitionCanceledEventArgs(NativeEngine& engine, EventHandle event);

    CancellationReason Reason() const { return details_->Reason(); }
    CancellationErrorCode ErrorCode() const { return details_->ErrorCode(); }
    const std::string& ErrorDetails() const { return details_->ErrorDetails(); }

    std::string ToString() const override;

private:
    std::shared_ptr<CancellationDetails> details_;
};

class TranslationSynthesisEventArgs : public SessionEventArgs {
public:
    TranslationSynthesisEventArgs(NativeEngine& engine, EventHandle event);

    std::shared_ptr<TranslationSynthesisResult> Result() const { return result_; }

    std::string ToString() const override;

private:
    std::shared_ptr<TranslationSynthesisResult> result_;
};

// --- intent ---

class IntentRecognitionEventArgs : public RecognitionEventArgs {
public:
    IntentRecognitionEventArgs(NativeEngine& engine, EventHandle event);

    std::shared_ptr<IntentRecognitionResult> Result() const { return result_; }

    // SessionId:<id> ResultId:<id> Status:<reason> IntentId:<intent> Recognized text:<text>.
    std::string ToString() const override;

private:
    std::shared_ptr<IntentRecognitionResult> result_;
};

class IntentRecognitionCanceledEventArgs : public IntentRecognitionEventArgs {
public:
    IntentRecognitionCanceledEventArgs(NativeEngine& engine, EventHandle event);

    CancellationReason Reason() const { return details_->Reason(); }
    CancellationErrorCode ErrorCode() const { return details_->ErrorCode(); }
    const std::string& ErrorDetails() const { return details_->ErrorDetails(); }

    std::string ToString() const override;

private:
    std::shared_ptr<CancellationDetails> details_;
};

} // namespace speechbridge
