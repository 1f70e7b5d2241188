#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "speech_config.h"

namespace recognizer_console {

// Settings for the sample runs. Values come from the YAML file named by
// RECOGNIZER_CONSOLE_CONFIG (if set), then the AZURE_SPEECH_* environment
// variables override them.
struct ConsoleSettings {
    std::string subscription_key;
    std::string region;
    std::string endpoint;
    std::string recognition_language = "en-US";
    std::vector<std::string> target_languages;
    std::string voice;
    // intent id -> phrase
    std::map<std::string, std::string> intent_phrases;
};

// speech / recognition / translation / intent 섹션을 읽는다. 없는 키는 기본값 유지.
ConsoleSettings ParseConsoleSettings(const YAML::Node& root);

void ApplyEnvironmentOverrides(ConsoleSettings& settings);

// Throws std::invalid_argument when the key or both region and endpoint are missing.
void ValidateConsoleSettings(const ConsoleSettings& settings);

// Full load: config file (optional) + environment + validation.
ConsoleSettings LoadConsoleSettings();

std::shared_ptr<speechbridge::SpeechConfig> MakeSpeechConfig(const ConsoleSettings& settings);
std::shared_ptr<speechbridge::SpeechTranslationConfig> MakeTranslationConfig(const ConsoleSettings& settings);

} // namespace recognizer_console
