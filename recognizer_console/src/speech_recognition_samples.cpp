#include "speech_recognition_samples.h"

#include <atomic>
#include <chrono>
#include <iostream>

#include "result_json.h"
#include "speech_recognizer.h"
#include "translation_recognizer.h"

using namespace speechbridge;

namespace recognizer_console {

namespace {

// 파일 하나를 끝까지 번역하는 데 허용하는 최대 시간
constexpr auto kTranslationTimeout = std::chrono::minutes(5);

void RecognizeOnceFromFile(const std::shared_ptr<NativeEngine>& engine,
                           const ConsoleSettings& settings,
                           const std::string& wav_file) {
    auto config = MakeSpeechConfig(settings);
    config->SetProperty(PropertyId::SpeechServiceResponse_RequestDetailedResultTrueFalse, "true");

    auto recognizer = SpeechRecognizer::FromConfig(engine, config, AudioConfig::FromWavFileInput(wav_file));
    recognizer->SessionStarted.Connect([](const SessionEventArgs& e) {
        std::cout << "ℹ️ Speech session started. " << e.ToString() << std::endl;
    });
    recognizer->SessionStopped.Connect([](const SessionEventArgs& e) {
        std::cout << "ℹ️ Speech session stopped. " << e.ToString() << std::endl;
    });
    recognizer->Recognizing.Connect([](const SpeechRecognitionEventArgs& e) {
        std::cout << "   Recognizing: " << e.Result()->Text() << std::endl;
    });

    std::cout << "⏳ Recognizing one utterance from " << wav_file << " (" << settings.recognition_language << ")..."
              << std::endl;
    auto result = recognizer->RecognizeOnceAsync().get();

    switch (result->Reason()) {
        case ResultReason::RecognizedSpeech:
            std::cout << "✅ Recognized: " << result->Text() << std::endl;
            std::cout << "   " << FormatJsonResultSummary(SummarizeJsonResult(result->Json())) << std::endl;
            break;
        case ResultReason::NoMatch:
            std::cout << "⚠️ No speech could be recognized." << std::endl;
            break;
        case ResultReason::Canceled: {
            auto details = result->Cancellation();
            std::cerr << "❌ Recognition canceled: " << ToString(details->Reason())
                      << " ErrorCode:" << ToString(details->ErrorCode())
                      << " ErrorDetails:" << details->ErrorDetails() << std::endl;
            break;
        }
        default:
            std::cout << "ℹ️ Recognition finished with status " << ToString(result->Reason()) << std::endl;
            break;
    }
    recognizer->Close();
}

void TranslateFile(const std::shared_ptr<NativeEngine>& engine,
                   const ConsoleSettings& settings,
                   const std::string& wav_file) {
    auto config = MakeTranslationConfig(settings);
    auto recognizer = TranslationRecognizer::FromConfig(engine, config, AudioConfig::FromWavFileInput(wav_file));

    // Shared with the handlers; a late engine callback may outlive this frame.
    struct StopSignal {
        std::promise<void> promise;
        std::atomic<bool> signaled{false};
    };
    auto stop = std::make_shared<StopSignal>();
    std::future<void> stopped_future = stop->promise.get_future();
    auto signal_stop = [stop]() {
        if (!stop->signaled.exchange(true)) {
            stop->promise.set_value();
        }
    };

    recognizer->Recognized.Connect([](const TranslationRecognitionEventArgs& e) {
        const auto& result = *e.Result();
        if (result.Reason() != ResultReason::TranslatedSpeech) {
            return;
        }
        std::cout << "✅ Translated: " << result.Text() << std::endl;
        for (const auto& translation : result.Translations()) {
            std::cout << "   [" << translation.first << "] " << translation.second << std::endl;
        }
    });
    recognizer->Synthesizing.Connect([](const TranslationSynthesisEventArgs& e) {
        std::cout << "   Synthesized audio: " << e.Result()->Audio().size() << " bytes" << std::endl;
    });
    recognizer->Canceled.Connect([signal_stop](const TranslationRecognitionCanceledEventArgs& e) {
        if (e.Reason() == CancellationReason::Error) {
            std::cerr << "❌ Translation canceled: " << e.ToString() << std::endl;
        }
        signal_stop();
    });
    recognizer->SessionStopped.Connect([signal_stop](const SessionEventArgs&) {
        signal_stop();
    });

    std::cout << "⏳ Translating " << wav_file << " into " << JoinCommaList(settings.target_languages) << "..."
              << std::endl;
    recognizer->StartContinuousRecognitionAsync().get();
    if (stopped_future.wait_for(kTranslationTimeout) != std::future_status::ready) {
        std::cerr << "⚠️ Translation did not finish in time; stopping." << std::endl;
    }
    recognizer->StopContinuousRecognitionAsync().get();
    recognizer->Close();
    std::cout << "✅ Translation finished." << std::endl;
}

} // namespace

std::future<void> SpeechRecognitionAsync(std::shared_ptr<NativeEngine> engine,
                                         ConsoleSettings settings,
                                         std::string wav_file) {
    return std::async(std::launch::async, [engine, settings, wav_file]() {
        RecognizeOnceFromFile(engine, settings, wav_file);
        if (settings.target_languages.empty()) {
            std::cout << "ℹ️ No target languages configured; skipping translation." << std::endl;
            return;
        }
        TranslateFile(engine, settings, wav_file);
    });
}

} // namespace recognizer_console
