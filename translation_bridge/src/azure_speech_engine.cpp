#include "azure_speech_engine.h"

#include <speechapi_c.h>

#include <iostream>

#include "native_string.h"
#include "speech_config.h"
#include "speech_errors.h"

namespace speechbridge {

struct CallbackSlot {
    std::mutex mutex;
    NativeCallback callback = nullptr;
    void* context = nullptr;
};

namespace {

// Ids, result ids and intent ids are short. Recognized text starts at 16K and
// grows, since result_get_text truncates without reporting it.
constexpr uint32_t kIdBufferSize = 1024;
constexpr uint32_t kTextBufferSize = 16 * 1024;
constexpr uint32_t kMaxTextBufferSize = 4 * 1024 * 1024;

constexpr int kNamedPropertyId = -1;

template <typename SpxHandle>
SpxHandle ToSpx(void* handle) {
    return reinterpret_cast<SpxHandle>(handle);
}

template <typename SpxHandle>
void* FromSpx(SpxHandle handle) {
    return reinterpret_cast<void*>(handle);
}

// SDK -> speechbridge trampoline. A cleared slot still owns the event handle.
void ForwardEvent(SPXRECOHANDLE hreco, SPXEVENTHANDLE hevent, void* pv_context) {
    auto* slot = static_cast<CallbackSlot*>(pv_context);
    NativeCallback callback = nullptr;
    void* context = nullptr;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        callback = slot->callback;
        context = slot->context;
    }
    if (callback != nullptr) {
        callback(FromSpx(hreco), FromSpx(hevent), context);
    } else {
        recognizer_event_handle_release(hevent);
    }
}

SPXHR InstallSdkCallback(SPXRECOHANDLE hreco, RecognizerEvent event, PRECOGNITION_CALLBACK_FUNC fn, void* context) {
    switch (event) {
        case RecognizerEvent::Recognizing:         return recognizer_recognizing_set_callback(hreco, fn, context);
        case RecognizerEvent::Recognized:          return recognizer_recognized_set_callback(hreco, fn, context);
        case RecognizerEvent::Canceled:            return recognizer_canceled_set_callback(hreco, fn, context);
        case RecognizerEvent::Synthesizing:        return translator_synthesizing_audio_set_callback(hreco, fn, context);
        case RecognizerEvent::SessionStarted:      return recognizer_session_started_set_callback(hreco, fn, context);
        case RecognizerEvent::SessionStopped:      return recognizer_session_stopped_set_callback(hreco, fn, context);
        case RecognizerEvent::SpeechStartDetected: return recognizer_speech_start_detected_set_callback(hreco, fn, context);
        case RecognizerEvent::SpeechEndDetected:   return recognizer_speech_end_detected_set_callback(hreco, fn, context);
    }
    return SPXERR_INVALID_ARG;
}

SPXHR CreateSdkConfig(RecognizerKind kind, const SpeechConfig& config, SPXSPEECHCONFIGHANDLE* hconfig) {
    const bool translation = kind == RecognizerKind::Translation;
    const std::string key = config.GetProperty(PropertyId::SpeechServiceConnection_Key);
    const std::string region = config.GetProperty(PropertyId::SpeechServiceConnection_Region);

    switch (config.GetSource()) {
        case SpeechConfig::Source::Subscription:
            return translation
                ? speech_translation_config_from_subscription(hconfig, key.c_str(), region.c_str())
                : speech_config_from_subscription(hconfig, key.c_str(), region.c_str());
        case SpeechConfig::Source::Endpoint: {
            const std::string endpoint = config.GetProperty(PropertyId::SpeechServiceConnection_Endpoint);
            return translation
                ? speech_translation_config_from_endpoint(hconfig, endpoint.c_str(), key.c_str())
                : speech_config_from_endpoint(hconfig, endpoint.c_str(), key.c_str());
        }
        case SpeechConfig::Source::AuthorizationToken: {
            const std::string token = config.GetProperty(PropertyId::SpeechServiceAuthorization_Token);
            return translation
                ? speech_translation_config_from_authorization_token(hconfig, token.c_str(), region.c_str())
                : speech_config_from_authorization_token(hconfig, token.c_str(), region.c_str());
        }
    }
    return SPXERR_INVALID_ARG;
}

// Copies every property of config into the SDK config's property bag.
SPXHR ApplyProperties(SPXSPEECHCONFIGHANDLE hconfig, const SpeechConfig& config) {
    SPXPROPERTYBAGHANDLE hbag = SPXHANDLE_INVALID;
    SPXHR hr = speech_config_get_property_bag(hconfig, &hbag);
    if (SPX_FAILED(hr)) {
        return hr;
    }
    for (const auto& property : config.Properties()) {
        hr = property_bag_set_string(hbag, static_cast<int>(property.first), nullptr, property.second.c_str());
        if (SPX_FAILED(hr)) break;
    }
    if (SPX_SUCCEEDED(hr)) {
        for (const auto& property : config.NamedProperties()) {
            hr = property_bag_set_string(hbag, kNamedPropertyId, property.first.c_str(), property.second.c_str());
            if (SPX_FAILED(hr)) break;
        }
    }
    LogErrorIfFail(property_bag_release(hbag), "property_bag_release");
    return hr;
}

SPXHR CreateSdkAudioConfig(const AudioConfig* audio_config, SPXAUDIOCONFIGHANDLE* haudio) {
    if (audio_config == nullptr || audio_config->GetSource() == AudioConfig::Source::DefaultMicrophone) {
        return audio_config_create_audio_input_from_default_microphone(haudio);
    }
    return audio_config_create_audio_input_from_wav_file_name(haudio, audio_config->FilePath().c_str());
}

SPXHR ReadBagString(SPXPROPERTYBAGHANDLE hbag, int id, const char* name,
                    const std::string& default_value, std::string* value) {
    const char* raw = property_bag_get_string(hbag, id, name, default_value.c_str());
    if (raw == nullptr) {
        *value = default_value;
        return SPX_NOERROR;
    }
    *value = raw;
    return property_bag_free_string(raw);
}

} // namespace

AzureSpeechEngine::AzureSpeechEngine() = default;

AzureSpeechEngine::~AzureSpeechEngine() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : keyword_models_) {
        LogErrorIfFail(keyword_recognition_model_handle_release(ToSpx<SPXKEYWORDHANDLE>(entry.second)),
                       "keyword_recognition_model_handle_release");
    }
    keyword_models_.clear();
    if (!slots_.empty()) {
        std::cerr << "⚠️ AzureSpeechEngine destroyed with " << slots_.size()
                  << " callback slot(s) of unreleased recognizers." << std::endl;
    }
}

// --- recognizer lifetime ---

NativeStatus AzureSpeechEngine::CreateRecognizer(RecognizerKind kind,
                                                 const SpeechConfig& config,
                                                 const AudioConfig* audio_config,
                                                 RecoHandle* handle) {
    if (handle == nullptr) {
        return SPXERR_INVALID_ARG;
    }
    *handle = nullptr;

    SPXSPEECHCONFIGHANDLE hconfig = SPXHANDLE_INVALID;
    SPXHR hr = CreateSdkConfig(kind, config, &hconfig);
    if (SPX_FAILED(hr)) {
        return hr;
    }
    hr = ApplyProperties(hconfig, config);

    SPXAUDIOCONFIGHANDLE haudio = SPXHANDLE_INVALID;
    if (SPX_SUCCEEDED(hr)) {
        hr = CreateSdkAudioConfig(audio_config, &haudio);
    }

    SPXRECOHANDLE hreco = SPXHANDLE_INVALID;
    if (SPX_SUCCEEDED(hr)) {
        switch (kind) {
            case RecognizerKind::Speech:
                hr = recognizer_create_speech_recognizer_from_config(&hreco, hconfig, haudio);
                break;
            case RecognizerKind::Translation:
                hr = recognizer_create_translation_recognizer_from_config(&hreco, hconfig, haudio);
                break;
            case RecognizerKind::Intent:
                hr = recognizer_create_intent_recognizer_from_config(&hreco, hconfig, haudio);
                break;
        }
    }

    // 인식기가 설정을 복사하므로 여기서 해제
    if (haudio != SPXHANDLE_INVALID) {
        LogErrorIfFail(audio_config_release(haudio), "audio_config_release");
    }
    LogErrorIfFail(speech_config_release(hconfig), "speech_config_release");

    if (SPX_SUCCEEDED(hr)) {
        *handle = FromSpx(hreco);
    }
    return hr;
}

bool AzureSpeechEngine::IsRecognizerValid(RecoHandle handle) {
    return handle != nullptr && recognizer_handle_is_valid(ToSpx<SPXRECOHANDLE>(handle));
}

NativeStatus AzureSpeechEngine::ReleaseRecognizer(RecoHandle handle) {
    LogErrorIfFail(ReleaseKeywordModel(handle), "keyword_recognition_model_handle_release");
    SPXHR hr = recognizer_handle_release(ToSpx<SPXRECOHANDLE>(handle));

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = slots_.begin(); it != slots_.end();) {
        if (it->first.first == handle) {
            it = slots_.erase(it);
        } else {
            ++it;
        }
    }
    return hr;
}

NativeStatus AzureSpeechEngine::SetEventCallback(RecoHandle handle, RecognizerEvent event,
                                                 NativeCallback callback, void* context) {
    CallbackSlot* slot = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& entry = slots_[std::make_pair(handle, event)];
        if (!entry) {
            entry = std::make_unique<CallbackSlot>();
        }
        slot = entry.get();
    }
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        slot->callback = callback;
        slot->context = context;
    }
    return InstallSdkCallback(ToSpx<SPXRECOHANDLE>(handle), event,
                              callback != nullptr ? &ForwardEvent : nullptr,
                              callback != nullptr ? slot : nullptr);
}

// --- property bag ---

NativeStatus AzureSpeechEngine::GetPropertyBag(RecoHandle handle, PropertyBagHandle* bag) {
    SPXPROPERTYBAGHANDLE hbag = SPXHANDLE_INVALID;
    SPXHR hr = recognizer_get_property_bag(ToSpx<SPXRECOHANDLE>(handle), &hbag);
    if (SPX_SUCCEEDED(hr)) {
        *bag = FromSpx(hbag);
    }
    return hr;
}

NativeStatus AzureSpeechEngine::GetProperty(PropertyBagHandle bag, PropertyId id,
                                            const std::string& default_value, std::string* value) {
    return ReadBagString(ToSpx<SPXPROPERTYBAGHANDLE>(bag), static_cast<int>(id), nullptr, default_value, value);
}

NativeStatus AzureSpeechEngine::GetNamedProperty(PropertyBagHandle bag, const std::string& name,
                                                 const std::string& default_value, std::string* value) {
    return ReadBagString(ToSpx<SPXPROPERTYBAGHANDLE>(bag), kNamedPropertyId, name.c_str(), default_value, value);
}

NativeStatus AzureSpeechEngine::SetProperty(PropertyBagHandle bag, PropertyId id, const std::string& value) {
    return property_bag_set_string(ToSpx<SPXPROPERTYBAGHANDLE>(bag), static_cast<int>(id), nullptr, value.c_str());
}

NativeStatus AzureSpeechEngine::SetNamedProperty(PropertyBagHandle bag, const std::string& name,
                                                 const std::string& value) {
    return property_bag_set_string(ToSpx<SPXPROPERTYBAGHANDLE>(bag), kNamedPropertyId, name.c_str(), value.c_str());
}

NativeStatus AzureSpeechEngine::ReleasePropertyBag(PropertyBagHandle bag) {
    return property_bag_release(ToSpx<SPXPROPERTYBAGHANDLE>(bag));
}

// --- recognition ---

NativeStatus AzureSpeechEngine::RecognizeOnce(RecoHandle handle, ResultHandle* result) {
    SPXRESULTHANDLE hresult = SPXHANDLE_INVALID;
    SPXHR hr = recognizer_recognize_once(ToSpx<SPXRECOHANDLE>(handle), &hresult);
    if (SPX_SUCCEEDED(hr)) {
        *result = FromSpx(hresult);
    }
    return hr;
}

NativeStatus AzureSpeechEngine::StartContinuousRecognition(RecoHandle handle) {
    return recognizer_start_continuous_recognition(ToSpx<SPXRECOHANDLE>(handle));
}

NativeStatus AzureSpeechEngine::StopContinuousRecognition(RecoHandle handle) {
    return recognizer_stop_continuous_recognition(ToSpx<SPXRECOHANDLE>(handle));
}

NativeStatus AzureSpeechEngine::StartKeywordRecognition(RecoHandle handle, const KeywordRecognitionModel& model) {
    SPXKEYWORDHANDLE hkeyword = SPXHANDLE_INVALID;
    SPXHR hr = keyword_recognition_model_create_from_file(model.FilePath().c_str(), &hkeyword);
    if (SPX_FAILED(hr)) {
        return hr;
    }
    hr = recognizer_start_keyword_recognition(ToSpx<SPXRECOHANDLE>(handle), hkeyword);
    if (SPX_FAILED(hr)) {
        LogErrorIfFail(keyword_recognition_model_handle_release(hkeyword), "keyword_recognition_model_handle_release");
        return hr;
    }

    // 이전 모델은 새 모델로 교체
    LogErrorIfFail(ReleaseKeywordModel(handle), "keyword_recognition_model_handle_release");
    std::lock_guard<std::mutex> lock(mutex_);
    keyword_models_[handle] = FromSpx(hkeyword);
    return hr;
}

NativeStatus AzureSpeechEngine::StopKeywordRecognition(RecoHandle handle) {
    SPXHR hr = recognizer_stop_keyword_recognition(ToSpx<SPXRECOHANDLE>(handle));
    if (SPX_SUCCEEDED(hr)) {
        LogErrorIfFail(ReleaseKeywordModel(handle), "keyword_recognition_model_handle_release");
    }
    return hr;
}

NativeStatus AzureSpeechEngine::ReleaseKeywordModel(RecoHandle handle) {
    void* model = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = keyword_models_.find(handle);
        if (it == keyword_models_.end()) {
            return SPX_NOERROR;
        }
        model = it->second;
        keyword_models_.erase(it);
    }
    return keyword_recognition_model_handle_release(ToSpx<SPXKEYWORDHANDLE>(model));
}

NativeStatus AzureSpeechEngine::AddPhraseIntent(RecoHandle handle, const std::string& phrase,
                                                const std::string& intent_id) {
    SPXTRIGGERHANDLE htrigger = SPXHANDLE_INVALID;
    SPXHR hr = intent_trigger_create_from_phrase(&htrigger, phrase.c_str());
    if (SPX_FAILED(hr)) {
        return hr;
    }
    hr = intent_recognizer_add_intent(ToSpx<SPXRECOHANDLE>(handle), intent_id.c_str(), htrigger);
    LogErrorIfFail(intent_trigger_handle_release(htrigger), "intent_trigger_handle_release");
    return hr;
}

// --- events ---

NativeStatus AzureSpeechEngine::GetEventSessionId(EventHandle event, std::string* session_id) {
    char buffer[kIdBufferSize] = {};
    SPXHR hr = recognizer_session_event_get_session_id(ToSpx<SPXEVENTHANDLE>(event), buffer, kIdBufferSize);
    if (SPX_SUCCEEDED(hr)) {
        *session_id = buffer;
    }
    return hr;
}

NativeStatus AzureSpeechEngine::GetEventOffset(EventHandle event, uint64_t* offset) {
    return recognizer_recognition_event_get_offset(ToSpx<SPXEVENTHANDLE>(event), offset);
}

NativeStatus AzureSpeechEngine::GetEventResult(EventHandle event, ResultHandle* result) {
    SPXRESULTHANDLE hresult = SPXHANDLE_INVALID;
    SPXHR hr = recognizer_recognition_event_get_result(ToSpx<SPXEVENTHANDLE>(event), &hresult);
    if (SPX_SUCCEEDED(hr)) {
        *result = FromSpx(hresult);
    }
    return hr;
}

NativeStatus AzureSpeechEngine::ReleaseEvent(EventHandle event) {
    return recognizer_event_handle_release(ToSpx<SPXEVENTHANDLE>(event));
}

// --- results ---

NativeStatus AzureSpeechEngine::GetResultId(ResultHandle result, std::string* result_id) {
    char buffer[kIdBufferSize] = {};
    SPXHR hr = result_get_result_id(ToSpx<SPXRESULTHANDLE>(result), buffer, kIdBufferSize);
    if (SPX_SUCCEEDED(hr)) {
        *result_id = buffer;
    }
    return hr;
}

NativeStatus AzureSpeechEngine::GetResultReason(ResultHandle result, ResultReason* reason) {
    Result_Reason native_reason = ResultReason_NoMatch;
    SPXHR hr = result_get_reason(ToSpx<SPXRESULTHANDLE>(result), &native_reason);
    if (SPX_SUCCEEDED(hr)) {
        *reason = static_cast<ResultReason>(native_reason);
    }
    return hr;
}

NativeStatus AzureSpeechEngine::GetResultText(ResultHandle result, std::string* text) {
    const SPXRESULTHANDLE hresult = ToSpx<SPXRESULTHANDLE>(result);
    return ReadNativeString(
        [hresult](char* buffer, uint32_t size) -> NativeStatus { return result_get_text(hresult, buffer, size); },
        kTextBufferSize, kMaxTextBufferSize, SPXERR_BUFFER_TOO_SMALL, text);
}

NativeStatus AzureSpeechEngine::GetResultTiming(ResultHandle result, uint64_t* offset, uint64_t* duration) {
    SPXHR hr = result_get_offset(ToSpx<SPXRESULTHANDLE>(result), offset);
    if (SPX_FAILED(hr)) {
        return hr;
    }
    return result_get_duration(ToSpx<SPXRESULTHANDLE>(result), duration);
}

NativeStatus AzureSpeechEngine::GetResultProperty(ResultHandle result, PropertyId id, std::string* value) {
    SPXPROPERTYBAGHANDLE hbag = SPXHANDLE_INVALID;
    SPXHR hr = result_get_property_bag(ToSpx<SPXRESULTHANDLE>(result), &hbag);
    if (SPX_FAILED(hr)) {
        return hr;
    }
    hr = ReadBagString(hbag, static_cast<int>(id), nullptr, "", value);
    LogErrorIfFail(property_bag_release(hbag), "property_bag_release");
    return hr;
}

NativeStatus AzureSpeechEngine::GetTranslations(ResultHandle result,
                                                std::map<std::string, std::string>* translations) {
    const SPXRESULTHANDLE hresult = ToSpx<SPXRESULTHANDLE>(result);
    size_t count = 0;
    SPXHR hr = translation_text_result_get_translation_count(hresult, &count);
    if (SPX_FAILED(hr)) {
        return hr;
    }

    translations->clear();
    for (size_t i = 0; i < count; ++i) {
        size_t language_size = 0;
        size_t text_size = 0;
        // 첫 호출은 버퍼 크기만 조회
        hr = translation_text_result_get_translation(hresult, i, nullptr, nullptr, &language_size, &text_size);
        if (hr != SPXERR_BUFFER_TOO_SMALL && SPX_FAILED(hr)) {
            return hr;
        }
        std::vector<char> language(language_size + 1, '\0');
        std::vector<char> text(text_size + 1, '\0');
        hr = translation_text_result_get_translation(hresult, i, language.data(), text.data(),
                                                     &language_size, &text_size);
        if (SPX_FAILED(hr)) {
            return hr;
        }
        (*translations)[language.data()] = text.data();
    }
    return SPX_NOERROR;
}

NativeStatus AzureSpeechEngine::GetSynthesisAudio(ResultHandle result, std::vector<uint8_t>* audio) {
    const SPXRESULTHANDLE hresult = ToSpx<SPXRESULTHANDLE>(result);
    size_t size = 0;
    SPXHR hr = translation_synthesis_result_get_audio_data(hresult, nullptr, &size);
    if (hr != SPXERR_BUFFER_TOO_SMALL && SPX_FAILED(hr)) {
        return hr;
    }
    audio->assign(size, 0);
    if (size == 0) {
        return SPX_NOERROR;
    }
    return translation_synthesis_result_get_audio_data(hresult, audio->data(), &size);
}

NativeStatus AzureSpeechEngine::GetIntentId(ResultHandle result, std::string* intent_id) {
    char buffer[kIdBufferSize] = {};
    SPXHR hr = intent_result_get_intent_id(ToSpx<SPXRESULTHANDLE>(result), buffer, kIdBufferSize);
    if (SPX_SUCCEEDED(hr)) {
        *intent_id = buffer;
    }
    return hr;
}

NativeStatus AzureSpeechEngine::GetCancellationDetails(ResultHandle result, CancellationReason* reason,
                                                       CancellationErrorCode* error_code) {
    const SPXRESULTHANDLE hresult = ToSpx<SPXRESULTHANDLE>(result);
    Result_CancellationReason native_reason = CancellationReason_Error;
    SPXHR hr = result_get_reason_canceled(hresult, &native_reason);
    if (SPX_FAILED(hr)) {
        return hr;
    }
    Result_CancellationErrorCode native_code = CancellationErrorCode_NoError;
    hr = result_get_canceled_error_code(hresult, &native_code);
    if (SPX_FAILED(hr)) {
        return hr;
    }
    *reason = static_cast<CancellationReason>(native_reason);
    *error_code = static_cast<CancellationErrorCode>(native_code);
    return SPX_NOERROR;
}

NativeStatus AzureSpeechEngine::ReleaseResult(ResultHandle result) {
    return recognizer_result_handle_release(ToSpx<SPXRESULTHANDLE>(result));
}

} // namespace speechbridge
