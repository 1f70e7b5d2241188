// recognizer_console/src/main.cpp
#include <exception>
#include <iostream>
#include <memory>

#include "azure_speech_engine.h"
#include "console_settings.h"
#include "intent_recognition_samples.h"
#include "speech_recognition_samples.h"

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cout << "Usage: recognizer_console wavfile" << std::endl;
        return 1;
    }
    const std::string wav_file = argv[1];

    // 1) 설정 로딩 (YAML + 환경 변수)
    recognizer_console::ConsoleSettings settings;
    try {
        settings = recognizer_console::LoadConsoleSettings();
    } catch (const std::exception& e) {
        std::cerr << "❌ Failed to load console settings: " << e.what() << std::endl;
        return 1;
    }

    auto engine = std::make_shared<speechbridge::AzureSpeechEngine>();

    // 2) 샘플 순서대로 실행
    try {
        recognizer_console::SpeechRecognitionAsync(engine, settings, wav_file).get();
        recognizer_console::IntentRecognitionAsync(engine, settings, wav_file).get();
    } catch (const std::exception& e) {
        std::cerr << "❌ Sample failed: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "✅ All samples finished." << std::endl;
    return 0;
}
