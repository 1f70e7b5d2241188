#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "native_engine.h"

namespace speechbridge {

// NativeEngine over the Azure Speech SDK C API (speechapi_c.h).
//
// The SDK callback signature uses typed handles, so every installed callback
// goes through a forwarding thunk with a CallbackSlot as its context. Slots
// live until the recognizer handle is released; uninstalling only clears them.
struct CallbackSlot;

class AzureSpeechEngine : public NativeEngine {
public:
    AzureSpeechEngine();
    ~AzureSpeechEngine() override;

    AzureSpeechEngine(const AzureSpeechEngine&) = delete;
    AzureSpeechEngine& operator=(const AzureSpeechEngine&) = delete;

    NativeStatus CreateRecognizer(RecognizerKind kind,
                                  const SpeechConfig& config,
                                  const AudioConfig* audio_config,
                                  RecoHandle* handle) override;
    bool IsRecognizerValid(RecoHandle handle) override;
    NativeStatus ReleaseRecognizer(RecoHandle handle) override;
    NativeStatus SetEventCallback(RecoHandle handle, RecognizerEvent event,
                                  NativeCallback callback, void* context) override;

    NativeStatus GetPropertyBag(RecoHandle handle, PropertyBagHandle* bag) override;
    NativeStatus GetProperty(PropertyBagHandle bag, PropertyId id,
                             const std::string& default_value, std::string* value) override;
    NativeStatus GetNamedProperty(PropertyBagHandle bag, const std::string& name,
                                  const std::string& default_value, std::string* value) override;
    NativeStatus SetProperty(PropertyBagHandle bag, PropertyId id, const std::string& value) override;
    NativeStatus SetNamedProperty(PropertyBagHandle bag, const std::string& name, const std::string& value) override;
    NativeStatus ReleasePropertyBag(PropertyBagHandle bag) override;

    NativeStatus RecognizeOnce(RecoHandle handle, ResultHandle* result) override;
    NativeStatus StartContinuousRecognition(RecoHandle handle) override;
    NativeStatus StopContinuousRecognition(RecoHandle handle) override;
    NativeStatus StartKeywordRecognition(RecoHandle handle, const KeywordRecognitionModel& model) override;
    NativeStatus StopKeywordRecognition(RecoHandle handle) override;
    NativeStatus AddPhraseIntent(RecoHandle handle, const std::string& phrase,
                                 const std::string& intent_id) override;

    NativeStatus GetEventSessionId(EventHandle event, std::string* session_id) override;
    NativeStatus GetEventOffset(EventHandle event, uint64_t* offset) override;
    NativeStatus GetEventResult(EventHandle event, ResultHandle* result) override;
    NativeStatus ReleaseEvent(EventHandle event) override;

    NativeStatus GetResultId(ResultHandle result, std::string* result_id) override;
    NativeStatus GetResultReason(ResultHandle result, ResultReason* reason) override;
    NativeStatus GetResultText(ResultHandle result, std::string* text) override;
    NativeStatus GetResultTiming(ResultHandle result, uint64_t* offset, uint64_t* duration) override;
    NativeStatus GetResultProperty(ResultHandle result, PropertyId id, std::string* value) override;
    NativeStatus GetTranslations(ResultHandle result, std::map<std::string, std::string>* translations) override;
    NativeStatus GetSynthesisAudio(ResultHandle result, std::vector<uint8_t>* audio) override;
    NativeStatus GetIntentId(ResultHandle result, std::string* intent_id) override;
    NativeStatus GetCancellationDetails(ResultHandle result, CancellationReason* reason,
                                        CancellationErrorCode* error_code) override;
    NativeStatus ReleaseResult(ResultHandle result) override;

private:
    NativeStatus ReleaseKeywordModel(RecoHandle handle);

    std::mutex mutex_;
    std::map<std::pair<RecoHandle, RecognizerEvent>, std::unique_ptr<CallbackSlot>> slots_;
    // Keyword model handles kept alive while keyword recognition runs.
    std::map<RecoHandle, void*> keyword_models_;
};

} // namespace speechbridge
