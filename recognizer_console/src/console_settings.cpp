#include "console_settings.h"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace recognizer_console {

namespace {

void ReadString(const YAML::Node& node, const char* key, std::string& out) {
    if (node && node[key]) {
        out = node[key].as<std::string>();
    }
}

void OverrideFromEnv(const char* name, std::string& out) {
    const char* value = std::getenv(name);
    if (value != nullptr && value[0] != '\0') {
        out = value;
    }
}

template <typename ConfigT>
std::shared_ptr<ConfigT> CreateConfig(const ConsoleSettings& settings) {
    ValidateConsoleSettings(settings);
    std::shared_ptr<ConfigT> config = settings.endpoint.empty()
        ? ConfigT::FromSubscription(settings.subscription_key, settings.region)
        : ConfigT::FromEndpoint(settings.endpoint, settings.subscription_key);
    if (!settings.recognition_language.empty()) {
        config->SetSpeechRecognitionLanguage(settings.recognition_language);
    }
    return config;
}

} // namespace

ConsoleSettings ParseConsoleSettings(const YAML::Node& root) {
    ConsoleSettings settings;
    if (!root || root.IsNull()) {
        return settings;
    }
    if (!root.IsMap()) {
        throw std::invalid_argument("Console config must be a YAML mapping.");
    }

    const YAML::Node speech = root["speech"];
    ReadString(speech, "subscription_key", settings.subscription_key);
    ReadString(speech, "region", settings.region);
    ReadString(speech, "endpoint", settings.endpoint);

    ReadString(root["recognition"], "language", settings.recognition_language);

    const YAML::Node translation = root["translation"];
    if (translation && translation["target_languages"]) {
        settings.target_languages = translation["target_languages"].as<std::vector<std::string>>();
    }
    ReadString(translation, "voice", settings.voice);

    const YAML::Node intent = root["intent"];
    if (intent && intent["phrases"]) {
        settings.intent_phrases = intent["phrases"].as<std::map<std::string, std::string>>();
    }
    return settings;
}

void ApplyEnvironmentOverrides(ConsoleSettings& settings) {
    OverrideFromEnv("AZURE_SPEECH_KEY", settings.subscription_key);
    OverrideFromEnv("AZURE_SPEECH_REGION", settings.region);
    OverrideFromEnv("AZURE_SPEECH_ENDPOINT", settings.endpoint);
}

void ValidateConsoleSettings(const ConsoleSettings& settings) {
    if (settings.subscription_key.empty()) {
        throw std::invalid_argument("Missing subscription key (speech.subscription_key or AZURE_SPEECH_KEY).");
    }
    if (settings.region.empty() && settings.endpoint.empty()) {
        throw std::invalid_argument(
            "Missing region (speech.region or AZURE_SPEECH_REGION) or endpoint (speech.endpoint or AZURE_SPEECH_ENDPOINT).");
    }
}

ConsoleSettings LoadConsoleSettings() {
    ConsoleSettings settings;
    const char* config_path = std::getenv("RECOGNIZER_CONSOLE_CONFIG");
    if (config_path != nullptr && config_path[0] != '\0') {
        std::cout << "ℹ️ Loading console config: " << config_path << std::endl;
        settings = ParseConsoleSettings(YAML::LoadFile(config_path));
    }
    ApplyEnvironmentOverrides(settings);
    ValidateConsoleSettings(settings);
    return settings;
}

std::shared_ptr<speechbridge::SpeechConfig> MakeSpeechConfig(const ConsoleSettings& settings) {
    return CreateConfig<speechbridge::SpeechConfig>(settings);
}

std::shared_ptr<speechbridge::SpeechTranslationConfig> MakeTranslationConfig(const ConsoleSettings& settings) {
    auto config = CreateConfig<speechbridge::SpeechTranslationConfig>(settings);
    for (const auto& language : settings.target_languages) {
        config->AddTargetLanguage(language);
    }
    if (!settings.voice.empty()) {
        config->SetVoiceName(settings.voice);
    }
    return config;
}

} // namespace recognizer_console
