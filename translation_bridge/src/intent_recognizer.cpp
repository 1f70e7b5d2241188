#include "intent_recognizer.h"

#include <stdexcept>

namespace speechbridge {

std::shared_ptr<IntentRecognizer> IntentRecognizer::FromConfig(std::shared_ptr<NativeEngine> engine,
                                                               std::shared_ptr<SpeechConfig> config,
                                                               std::shared_ptr<AudioConfig> audio_config)
{
    if (!config) {
        throw std::invalid_argument("SpeechConfig must not be null.");
    }
    RecognizerHandle handle = CreateNativeRecognizer(engine, RecognizerKind::Intent, *config, audio_config.get());
    std::shared_ptr<IntentRecognizer> recognizer(new IntentRecognizer(std::move(handle), std::move(audio_config)));
    recognizer->Initialize();
    return recognizer;
}

IntentRecognizer::IntentRecognizer(RecognizerHandle handle, std::shared_ptr<AudioConfig> audio_config)
  : Recognizer(std::move(handle)), audio_config_(std::move(audio_config)) {}

std::vector<Recognizer::CallbackBinding> IntentRecognizer::CallbackBindings() const {
    auto bindings = Recognizer::CallbackBindings();
    bindings.emplace_back(RecognizerEvent::Recognizing, &IntentRecognizer::FireEvent_Recognizing);
    bindings.emplace_back(RecognizerEvent::Recognized, &IntentRecognizer::FireEvent_Recognized);
    bindings.emplace_back(RecognizerEvent::Canceled, &IntentRecognizer::FireEvent_Canceled);
    return bindings;
}

void IntentRecognizer::AddIntent(const std::string& phrase, const std::string& intent_id) {
    if (phrase.empty()) {
        throw std::invalid_argument("Intent phrase must not be empty.");
    }
    // 문구 자체를 intent id 로 쓰는 경우
    const std::string& id = intent_id.empty() ? phrase : intent_id;
    // Close() 와 겹치지 않도록 진행 중 작업으로 등록
    DoAsyncRecognitionAction([&]() {
        ThrowIfFail(Engine().AddPhraseIntent(Handle(), phrase, id), "intent_recognizer_add_intent");
    });
}

std::future<std::shared_ptr<IntentRecognitionResult>> IntentRecognizer::RecognizeOnceAsync() {
    return RecognizeOnceAsyncAs<IntentRecognitionResult>();
}

void IntentRecognizer::FireEvent_Recognizing(RecoHandle, EventHandle hevent, void* context) {
    DispatchNativeEvent<IntentRecognizer>(RecognizerEvent::Recognizing, hevent, context,
        [hevent](IntentRecognizer& recognizer) {
            IntentRecognitionEventArgs args(recognizer.Engine(), hevent);
            recognizer.Recognizing.Signal(args);
        });
}

void IntentRecognizer::FireEvent_Recognized(RecoHandle, EventHandle hevent, void* context) {
    DispatchNativeEvent<IntentRecognizer>(RecognizerEvent::Recognized, hevent, context,
        [hevent](IntentRecognizer& recognizer) {
            IntentRecognitionEventArgs args(recognizer.Engine(), hevent);
            recognizer.Recognized.Signal(args);
        });
}

void IntentRecognizer::FireEvent_Canceled(RecoHandle, EventHandle hevent, void* context) {
    DispatchNativeEvent<IntentRecognizer>(RecognizerEvent::Canceled, hevent, context,
        [hevent](IntentRecognizer& recognizer) {
            IntentRecognitionCanceledEventArgs args(recognizer.Engine(), hevent);
            recognizer.Canceled.Signal(args);
        });
}

} // namespace speechbridge
