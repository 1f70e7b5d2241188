#include "speech_recognizer.h"

#include <stdexcept>

namespace speechbridge {

std::shared_ptr<SpeechRecognizer> SpeechRecognizer::FromConfig(std::shared_ptr<NativeEngine> engine,
                                                               std::shared_ptr<SpeechConfig> config,
                                                               std::shared_ptr<AudioConfig> audio_config)
{
    if (!config) {
        throw std::invalid_argument("SpeechConfig must not be null.");
    }
    RecognizerHandle handle = CreateNativeRecognizer(engine, RecognizerKind::Speech, *config, audio_config.get());
    std::shared_ptr<SpeechRecognizer> recognizer(new SpeechRecognizer(std::move(handle), std::move(audio_config)));
    recognizer->Initialize();
    return recognizer;
}

SpeechRecognizer::SpeechRecognizer(RecognizerHandle handle, std::shared_ptr<AudioConfig> audio_config)
  : Recognizer(std::move(handle)), audio_config_(std::move(audio_config)) {}

std::vector<Recognizer::CallbackBinding> SpeechRecognizer::CallbackBindings() const {
    auto bindings = Recognizer::CallbackBindings();
    bindings.emplace_back(RecognizerEvent::Recognizing, &SpeechRecognizer::FireEvent_Recognizing);
    bindings.emplace_back(RecognizerEvent::Recognized, &SpeechRecognizer::FireEvent_Recognized);
    bindings.emplace_back(RecognizerEvent::Canceled, &SpeechRecognizer::FireEvent_Canceled);
    return bindings;
}

std::string SpeechRecognizer::SpeechRecognitionLanguage() {
    return Properties().GetProperty(PropertyId::SpeechServiceConnection_RecoLanguage);
}

std::future<std::shared_ptr<SpeechRecognitionResult>> SpeechRecognizer::RecognizeOnceAsync() {
    return RecognizeOnceAsyncAs<SpeechRecognitionResult>();
}

void SpeechRecognizer::FireEvent_Recognizing(RecoHandle, EventHandle hevent, void* context) {
    DispatchNativeEvent<SpeechRecognizer>(RecognizerEvent::Recognizing, hevent, context,
        [hevent](SpeechRecognizer& recognizer) {
            SpeechRecognitionEventArgs args(recognizer.Engine(), hevent);
            recognizer.Recognizing.Signal(args);
        });
}

void SpeechRecognizer::FireEvent_Recognized(RecoHandle, EventHandle hevent, void* context) {
    DispatchNativeEvent<SpeechRecognizer>(RecognizerEvent::Recognized, hevent, context,
        [hevent](SpeechRecognizer& recognizer) {
            SpeechRecognitionEventArgs args(recognizer.Engine(), hevent);
            recognizer.Recognized.Signal(args);
        });
}

void SpeechRecognizer::FireEvent_Canceled(RecoHandle, EventHandle hevent, void* context) {
    DispatchNativeEvent<SpeechRecognizer>(RecognizerEvent::Canceled, hevent, context,
        [hevent](SpeechRecognizer& recognizer) {
            SpeechRecognitionCanceledEventArgs args(recognizer.Engine(), hevent);
            recognizer.Canceled.Signal(args);
        });
}

} // namespace speechbridge
