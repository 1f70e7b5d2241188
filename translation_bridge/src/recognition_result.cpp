#include "recognition_result.h"

#include "speech_errors.h"

namespace speechbridge {

ScopedResultHandle::~ScopedResultHandle() {
    if (handle_ != nullptr) {
        LogErrorIfFail(engine_.ReleaseResult(handle_), "recognizer_result_handle_release");
    }
}

CancellationDetails::CancellationDetails(CancellationReason reason,
                                         CancellationErrorCode error_code,
                                         std::string error_details)
  : reason_(reason), error_code_(error_code), error_details_(std::move(error_details)) {}

std::shared_ptr<CancellationDetails> CancellationDetails::FromResult(NativeEngine& engine, ResultHandle result) {
    CancellationReason reason = CancellationReason::Error;
    CancellationErrorCode code = CancellationErrorCode::NoError;
    std::string details;
    ThrowIfFail(engine.GetCancellationDetails(result, &reason, &code), "result_get_reason_canceled");
    ThrowIfFail(engine.GetResultProperty(result, PropertyId::SpeechServiceResponse_JsonErrorDetails, &details),
                "result_get_property_bag");
    return std::make_shared<CancellationDetails>(reason, code, details);
}

RecognitionResult::RecognitionResult(NativeEngine& engine, ResultHandle result) {
    ThrowIfNull(result, "Invalid result handle");
    ThrowIfFail(engine.GetResultId(result, &result_id_), "result_get_result_id");
    ThrowIfFail(engine.GetResultReason(result, &reason_), "result_get_reason");
    ThrowIfFail(engine.GetResultText(result, &text_), "result_get_text");
    ThrowIfFail(engine.GetResultTiming(result, &offset_, &duration_), "result_get_offset");
    ThrowIfFail(engine.GetResultProperty(result, PropertyId::SpeechServiceResponse_JsonResult, &json_),
                "result_get_property_bag");
    if (reason_ == ResultReason::Canceled) {
        cancellation_ = CancellationDetails::FromResult(engine, result);
    }
}

TranslationRecognitionResult::TranslationRecognitionResult(NativeEngine& engine, ResultHandle result)
  : RecognitionResult(engine, result)
{
    ThrowIfFail(engine.GetTranslations(result, &translations_), "translation_text_result_get_translation");
}

IntentRecognitionResult::IntentRecognitionResult(NativeEngine& engine, ResultHandle result)
  : RecognitionResult(engine, result)
{
    ThrowIfFail(engine.GetIntentId(result, &intent_id_), "intent_result_get_intent_id");
    ThrowIfFail(engine.GetResultProperty(result, PropertyId::LanguageUnderstandingServiceResponse_JsonResult,
                                         &intent_json_),
                "result_get_property_bag");
}

TranslationSynthesisResult::TranslationSynthesisResult(NativeEngine& engine, ResultHandle result) {
    ThrowIfNull(result, "Invalid synthesis result handle");
    ThrowIfFail(engine.GetResultReason(result, &reason_), "result_get_reason");
    ThrowIfFail(engine.GetSynthesisAudio(result, &audio_), "translation_synthesis_result_get_audio_data");
}

} // namespace speechbridge
