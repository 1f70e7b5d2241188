#pragma once

#include <future>
#include <memory>
#include <string>
#include <vector>

#include "recognizer.h"

namespace speechbridge {

// Speech-to-text in a single language.
class SpeechRecognizer : public Recognizer {
public:
    // Uses the default microphone when audio_config is null.
    static std::shared_ptr<SpeechRecognizer> FromConfig(std::shared_ptr<NativeEngine> engine,
                                                        std::shared_ptr<SpeechConfig> config,
                                                        std::shared_ptr<AudioConfig> audio_config = nullptr);

    EventSignal<const SpeechRecognitionEventArgs&> Recognizing;
    EventSignal<const SpeechRecognitionEventArgs&> Recognized;
    EventSignal<const SpeechRecognitionCanceledEventArgs&> Canceled;

    std::string SpeechRecognitionLanguage();

    std::future<std::shared_ptr<SpeechRecognitionResult>> RecognizeOnceAsync();

protected:
    std::vector<CallbackBinding> CallbackBindings() const override;

private:
    SpeechRecognizer(RecognizerHandle handle, std::shared_ptr<AudioConfig> audio_config);

    static void FireEvent_Recognizing(RecoHandle hreco, EventHandle hevent, void* context);
    static void FireEvent_Recognized(RecoHandle hreco, EventHandle hevent, void* context);
    static void FireEvent_Canceled(RecoHandle hreco, EventHandle hevent, void* context);

    std::shared_ptr<AudioConfig> audio_config_;
};

} // namespace speechbridge
