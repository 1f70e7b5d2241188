#include "translation_recognizer.h"

#include <stdexcept>

namespace speechbridge {

std::shared_ptr<TranslationRecognizer> TranslationRecognizer::FromConfig(
    std::shared_ptr<NativeEngine> engine,
    std::shared_ptr<SpeechTranslationConfig> config,
    std::shared_ptr<AudioConfig> audio_config)
{
    if (!config) {
        throw std::invalid_argument("SpeechTranslationConfig must not be null.");
    }
    RecognizerHandle handle = CreateNativeRecognizer(engine, RecognizerKind::Translation, *config, audio_config.get());
    std::shared_ptr<TranslationRecognizer> recognizer(
        new TranslationRecognizer(std::move(handle), std::move(audio_config)));
    recognizer->Initialize();
    return recognizer;
}

TranslationRecognizer::TranslationRecognizer(RecognizerHandle handle, std::shared_ptr<AudioConfig> audio_config)
  : Recognizer(std::move(handle)), audio_config_(std::move(audio_config)) {}

std::vector<Recognizer::CallbackBinding> TranslationRecognizer::CallbackBindings() const {
    auto bindings = Recognizer::CallbackBindings();
    bindings.emplace_back(RecognizerEvent::Recognizing, &TranslationRecognizer::FireEvent_Recognizing);
    bindings.emplace_back(RecognizerEvent::Recognized, &TranslationRecognizer::FireEvent_Recognized);
    bindings.emplace_back(RecognizerEvent::Canceled, &TranslationRecognizer::FireEvent_Canceled);
    bindings.emplace_back(RecognizerEvent::Synthesizing, &TranslationRecognizer::FireEvent_SynthesisResult);
    return bindings;
}

std::string TranslationRecognizer::SpeechRecognitionLanguage() {
    return Properties().GetProperty(PropertyId::SpeechServiceConnection_RecoLanguage);
}

std::vector<std::string> TranslationRecognizer::TargetLanguages() {
    return SplitCommaList(Properties().GetProperty(PropertyId::SpeechServiceConnection_TranslationToLanguages));
}

std::string TranslationRecognizer::VoiceName() {
    return Properties().GetProperty(PropertyId::SpeechServiceConnection_TranslationVoice);
}

std::future<std::shared_ptr<TranslationRecognitionResult>> TranslationRecognizer::RecognizeOnceAsync() {
    return RecognizeOnceAsyncAs<TranslationRecognitionResult>();
}

// Native -> C++ event trampolines.

void TranslationRecognizer::FireEvent_Recognizing(RecoHandle, EventHandle hevent, void* context) {
    DispatchNativeEvent<TranslationRecognizer>(RecognizerEvent::Recognizing, hevent, context,
        [hevent](TranslationRecognizer& recognizer) {
            TranslationRecognitionEventArgs args(recognizer.Engine(), hevent);
            recognizer.Recognizing.Signal(args);
        });
}

void TranslationRecognizer::FireEvent_Recognized(RecoHandle, EventHandle hevent, void* context) {
    DispatchNativeEvent<TranslationRecognizer>(RecognizerEvent::Recognized, hevent, context,
        [hevent](TranslationRecognizer& recognizer) {
            TranslationRecognitionEventArgs args(recognizer.Engine(), hevent);
            recognizer.Recognized.Signal(args);
        });
}

void TranslationRecognizer::FireEvent_Canceled(RecoHandle, EventHandle hevent, void* context) {
    DispatchNativeEvent<TranslationRecognizer>(RecognizerEvent::Canceled, hevent, context,
        [hevent](TranslationRecognizer& recognizer) {
            TranslationRecognitionCanceledEventArgs args(recognizer.Engine(), hevent);
            recognizer.Canceled.Signal(args);
        });
}

void TranslationRecognizer::FireEvent_SynthesisResult(RecoHandle, EventHandle hevent, void* context) {
    DispatchNativeEvent<TranslationRecognizer>(RecognizerEvent::Synthesizing, hevent, context,
        [hevent](TranslationRecognizer& recognizer) {
            TranslationSynthesisEventArgs args(recognizer.Engine(), hevent);
            recognizer.Synthesizing.Signal(args);
        });
}

} // namespace speechbridge
