#pragma once

#include <future>
#include <memory>
#include <string>
#include <vector>

#include "recognizer.h"

namespace speechbridge {

// Speech translation: recognizes speech in the source language and raises
// translated text (and optionally synthesized audio) for each target language.
//
//   auto config = SpeechTranslationConfig::FromSubscription(key, region);
//   config->SetSpeechRecognitionLanguage("en-US");
//   config->AddTargetLanguage("de");
//   auto recognizer = TranslationRecognizer::FromConfig(engine, config);
//   recognizer->Recognized.Connect([](const TranslationRecognitionEventArgs& e) { ... });
//   recognizer->StartContinuousRecognitionAsync().get();
class TranslationRecognizer : public Recognizer {
public:
    // Uses the default microphone when audio_config is null.
    static std::shared_ptr<TranslationRecognizer> FromConfig(std::shared_ptr<NativeEngine> engine,
                                                             std::shared_ptr<SpeechTranslationConfig> config,
                                                             std::shared_ptr<AudioConfig> audio_config = nullptr);

    EventSignal<const TranslationRecognitionEventArgs&> Recognizing;
    EventSignal<const TranslationRecognitionEventArgs&> Recognized;
    EventSignal<const TranslationRecognitionCanceledEventArgs&> Canceled;
    EventSignal<const TranslationSynthesisEventArgs&> Synthesizing;

    std::string SpeechRecognitionLanguage();
    // Split literally on ','; an empty property yields {""}.
    std::vector<std::string> TargetLanguages();
    std::string VoiceName();

    // Returns after a single utterance. End of utterance (trailing silence or
    // the length limit) is decided by the native engine.
    std::future<std::shared_ptr<TranslationRecognitionResult>> RecognizeOnceAsync();

protected:
    std::vector<CallbackBinding> CallbackBindings() const override;

private:
    TranslationRecognizer(RecognizerHandle handle, std::shared_ptr<AudioConfig> audio_config);

    static void FireEvent_Recognizing(RecoHandle hreco, EventHandle hevent, void* context);
    static void FireEvent_Recognized(RecoHandle hreco, EventHandle hevent, void* context);
    static void FireEvent_Canceled(RecoHandle hreco, EventHandle hevent, void* context);
    static void FireEvent_SynthesisResult(RecoHandle hreco, EventHandle hevent, void* context);

    std::shared_ptr<AudioConfig> audio_config_;
};

} // namespace speechbridge
