#include "intent_recognition_samples.h"

#include <iostream>

#include "intent_recognizer.h"
#include "result_json.h"

using namespace speechbridge;

namespace recognizer_console {

std::future<void> IntentRecognitionAsync(std::shared_ptr<NativeEngine> engine,
                                         ConsoleSettings settings,
                                         std::string wav_file) {
    return std::async(std::launch::async, [engine, settings, wav_file]() {
        auto recognizer = IntentRecognizer::FromConfig(engine, MakeSpeechConfig(settings),
                                                       AudioConfig::FromWavFileInput(wav_file));

        if (settings.intent_phrases.empty()) {
            std::cout << "⚠️ No intent phrases configured; results will carry no intent id." << std::endl;
        }
        for (const auto& intent : settings.intent_phrases) {
            recognizer->AddIntent(intent.second, intent.first);
            std::cout << "   Intent <" << intent.first << ">: \"" << intent.second << "\"" << std::endl;
        }

        recognizer->Recognized.Connect([](const IntentRecognitionEventArgs& e) {
            std::cout << "ℹ️ " << e.ToString() << std::endl;
        });
        recognizer->Canceled.Connect([](const IntentRecognitionCanceledEventArgs& e) {
            std::cerr << "❌ Intent recognition canceled: " << e.ToString() << std::endl;
        });

        std::cout << "⏳ Recognizing intent from " << wav_file << "..." << std::endl;
        auto result = recognizer->RecognizeOnceAsync().get();

        if (result->Reason() == ResultReason::RecognizedIntent) {
            std::cout << "✅ Intent: " << result->IntentId() << " Text: " << result->Text() << std::endl;
        } else if (result->Reason() == ResultReason::RecognizedSpeech) {
            std::cout << "⚠️ Speech recognized but no intent matched: " << result->Text() << std::endl;
        } else {
            std::cout << "⚠️ Intent recognition finished with status " << ToString(result->Reason()) << std::endl;
        }
        std::cout << "   " << FormatJsonResultSummary(SummarizeJsonResult(result->Json())) << std::endl;
        recognizer->Close();
    });
}

} // namespace recognizer_console
