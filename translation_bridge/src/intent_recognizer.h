#pragma once

#include <future>
#include <memory>
#include <string>
#include <vector>

#include "recognizer.h"

namespace speechbridge {

// Recognizes speech and matches it against registered phrase intents.
class IntentRecognizer : public Recognizer {
public:
    static std::shared_ptr<IntentRecognizer> FromConfig(std::shared_ptr<NativeEngine> engine,
                                                        std::shared_ptr<SpeechConfig> config,
                                                        std::shared_ptr<AudioConfig> audio_config = nullptr);

    EventSignal<const IntentRecognitionEventArgs&> Recognizing;
    EventSignal<const IntentRecognitionEventArgs&> Recognized;
    EventSignal<const IntentRecognitionCanceledEventArgs&> Canceled;

    // An utterance equal to phrase is reported with IntentId() == intent_id.
    // Must be called before recognition starts.
    void AddIntent(const std::string& phrase, const std::string& intent_id);

    std::future<std::shared_ptr<IntentRecognitionResult>> RecognizeOnceAsync();

protected:
    std::vector<CallbackBinding> CallbackBindings() const override;

private:
    IntentRecognizer(RecognizerHandle handle, std::shared_ptr<AudioConfig> audio_config);

    static void FireEvent_Recognizing(RecoHandle hreco, EventHandle hevent, void* context);
    static void FireEvent_Recognized(RecoHandle hreco, EventHandle hevent, void* context);
    static void FireEvent_Canceled(RecoHandle hreco, EventHandle hevent, void* context);

    std::shared_ptr<AudioConfig> audio_config_;
};

} // namespace speechbridge
