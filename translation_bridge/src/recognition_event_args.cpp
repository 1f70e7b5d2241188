#include "recognition_event_args.h"

#include <sstream>

#include "speech_errors.h"

namespace speechbridge {

namespace {

template <typename ResultT>
std::shared_ptr<ResultT> ReadEventResult(NativeEngine& engine, EventHandle event) {
    ResultHandle handle = nullptr;
    ThrowIfFail(engine.GetEventResult(event, &handle), "recognizer_recognition_event_get_result");
    ScopedResultHandle scoped(engine, handle);
    return std::make_shared<ResultT>(engine, scoped.Get());
}

// Canceled events always carry a canceled result; fall back to a generic error
// if the engine reported some other reason.
std::shared_ptr<CancellationDetails> DetailsOf(const RecognitionResult& result) {
    auto details = result.Cancellation();
    if (!details) {
        details = std::make_shared<CancellationDetails>(CancellationReason::Error,
                                                        CancellationErrorCode::RuntimeError,
                                                        "Canceled event without cancellation details.");
    }
    return details;
}

std::string FormatResult(const std::string& session_id, const RecognitionResult& result) {
    std::ostringstream ss;
    ss << "SessionId:" << session_id
       << " ResultId:" << result.ResultId()
       << " Status:" << ToString(result.Reason())
       << " Recognized text:<" << result.Text() << ">.";
    return ss.str();
}

std::string FormatCancellation(const CancellationDetails& details) {
    std::ostringstream ss;
    ss << " CancellationReason:" << ToString(details.Reason())
       << " ErrorCode:" << ToString(details.ErrorCode())
       << " ErrorDetails:<" << details.ErrorDetails() << ">.";
    return ss.str();
}

} // namespace

SessionEventArgs::SessionEventArgs(NativeEngine& engine, EventHandle event) {
    ThrowIfNull(event, "Invalid event handle");
    ThrowIfFail(engine.GetEventSessionId(event, &session_id_), "recognizer_session_event_get_session_id");
}

std::string SessionEventArgs::ToString() const {
    return "SessionId:" + session_id_ + ".";
}

RecognitionEventArgs::RecognitionEventArgs(NativeEngine& engine, EventHandle event)
  : SessionEventArgs(engine, event)
{
    ThrowIfFail(engine.GetEventOffset(event, &offset_), "recognizer_recognition_event_get_offset");
}

std::string RecognitionEventArgs::ToString() const {
    return "SessionId:" + SessionId() + " Offset:" + std::to_string(offset_) + ".";
}

// --- speech ---

SpeechRecognitionEventArgs::SpeechRecognitionEventArgs(NativeEngine& engine, EventHandle event)
  : RecognitionEventArgs(engine, event),
    result_(ReadEventResult<SpeechRecognitionResult>(engine, event)) {}

std::string SpeechRecognitionEventArgs::ToString() const {
    return FormatResult(SessionId(), *result_);
}

SpeechRecognitionCanceledEventArgs::SpeechRecognitionCanceledEventArgs(NativeEngine& engine, EventHandle event)
  : SpeechRecognitionEventArgs(engine, event),
    details_(DetailsOf(*Result())) {}

std::string SpeechRecognitionCanceledEventArgs::ToString() const {
    return SpeechRecognitionEventArgs::ToString() + FormatCancellation(*details_);
}

// --- translation ---

TranslationRecognitionEventArgs::TranslationRecognitionEventArgs(NativeEngine& engine, EventHandle event)
  : RecognitionEventArgs(engine, event),
    result_(ReadEventResult<TranslationRecognitionResult>(engine, event)) {}

std::string TranslationRecognitionEventArgs::ToString() const {
    std::string text = FormatResult(SessionId(), *result_);
    for (const auto& translation : result_->Translations()) {
        text += " [" + translation.first + "]<" + translation.second + ">";
    }
    return text;
}

TranslationRecognitionCanceledEventArgs::TranslationRecognitionCanceledEventArgs(NativeEngine& engine,
                                                                                 EventHandle event)
  : TranslationRecognitionEventArgs(engine, event),
    details_(DetailsOf(*Result())) {}

std::string TranslationRecognitionCanceledEventArgs::ToString() const {
    return TranslationRecognitionEventArgs::ToString() + FormatCancellation(*details_);
}

TranslationSynthesisEventArgs::TranslationSynthesisEventArgs(NativeEngine& engine, EventHandle event)
  : SessionEventArgs(engine, event)
{
    ResultHandle handle = nullptr;
    ThrowIfFail(engine.GetEventResult(event, &handle), "recognizer_recognition_event_get_result");
    ScopedResultHandle scoped(engine, handle);
    result_ = std::make_shared<TranslationSynthesisResult>(engine, scoped.Get());
}

std::string TranslationSynthesisEventArgs::ToString() const {
    return "SessionId:" + SessionId() + " Status:" + speechbridge::ToString(result_->Reason()) +
           " AudioSize:" + std::to_string(result_->Audio().size()) + ".";
}

// --- intent ---

IntentRecognitionEventArgs::IntentRecognitionEventArgs(NativeEngine& engine, EventHandle event)
  : RecognitionEventArgs(engine, event),
    result_(ReadEventResult<IntentRecognitionResult>(engine, event)) {}

std::string IntentRecognitionEventArgs::ToString() const {
    std::ostringstream ss;
    ss << "SessionId:" << SessionId()
       << " ResultId:" << result_->ResultId()
       << " Status:" << speechbridge::ToString(result_->Reason())
       << " IntentId:<" << result_->IntentId() << ">"
       << " Recognized text:<" << result_->Text() << ">.";
    return ss.str();
}

IntentRecognitionCanceledEventArgs::IntentRecognitionCanceledEventArgs(NativeEngine& engine, EventHandle event)
  : IntentRecognitionEventArgs(engine, event),
    details_(DetailsOf(*Result())) {}

std::string IntentRecognitionCanceledEventArgs::ToString() const {
    return IntentRecognitionEventArgs::ToString() + FormatCancellation(*details_);
}

} // namespace speechbridge
