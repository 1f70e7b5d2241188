#include "speech_config.h"

#include <algorithm>
#include <stdexcept>

namespace speechbridge {

namespace {

void RequireNonEmpty(const std::string& value, const char* what) {
    if (value.empty()) {
        throw std::invalid_argument(std::string(what) + " must not be empty.");
    }
}

} // namespace

std::vector<std::string> SplitCommaList(const std::string& joined) {
    std::vector<std::string> items;
    std::string::size_type start = 0;
    while (true) {
        const auto comma = joined.find(',', start);
        if (comma == std::string::npos) {
            items.push_back(joined.substr(start));
            break;
        }
        items.push_back(joined.substr(start, comma - start));
        start = comma + 1;
    }
    return items;
}

std::string JoinCommaList(const std::vector<std::string>& items) {
    std::string joined;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) joined += ',';
        joined += items[i];
    }
    return joined;
}

// --- SpeechConfig ---

void SpeechConfig::InitFromSubscription(SpeechConfig& config, const std::string& key, const std::string& region) {
    RequireNonEmpty(key, "Subscription key");
    RequireNonEmpty(region, "Region");
    config.source_ = Source::Subscription;
    config.SetProperty(PropertyId::SpeechServiceConnection_Key, key);
    config.SetProperty(PropertyId::SpeechServiceConnection_Region, region);
}

void SpeechConfig::InitFromEndpoint(SpeechConfig& config, const std::string& endpoint, const std::string& key) {
    RequireNonEmpty(endpoint, "Endpoint");
    RequireNonEmpty(key, "Subscription key");
    config.source_ = Source::Endpoint;
    config.SetProperty(PropertyId::SpeechServiceConnection_Endpoint, endpoint);
    config.SetProperty(PropertyId::SpeechServiceConnection_Key, key);
}

void SpeechConfig::InitFromAuthorizationToken(SpeechConfig& config, const std::string& token, const std::string& region) {
    RequireNonEmpty(token, "Authorization token");
    RequireNonEmpty(region, "Region");
    config.source_ = Source::AuthorizationToken;
    config.SetProperty(PropertyId::SpeechServiceAuthorization_Token, token);
    config.SetProperty(PropertyId::SpeechServiceConnection_Region, region);
}

std::shared_ptr<SpeechConfig> SpeechConfig::FromSubscription(const std::string& subscription_key,
                                                             const std::string& region) {
    std::shared_ptr<SpeechConfig> config(new SpeechConfig());
    InitFromSubscription(*config, subscription_key, region);
    return config;
}

std::shared_ptr<SpeechConfig> SpeechConfig::FromEndpoint(const std::string& endpoint,
                                                         const std::string& subscription_key) {
    std::shared_ptr<SpeechConfig> config(new SpeechConfig());
    InitFromEndpoint(*config, endpoint, subscription_key);
    return config;
}

std::shared_ptr<SpeechConfig> SpeechConfig::FromAuthorizationToken(const std::string& token,
                                                                   const std::string& region) {
    std::shared_ptr<SpeechConfig> config(new SpeechConfig());
    InitFromAuthorizationToken(*config, token, region);
    return config;
}

void SpeechConfig::SetSpeechRecognitionLanguage(const std::string& language) {
    SetProperty(PropertyId::SpeechServiceConnection_RecoLanguage, language);
}

std::string SpeechConfig::GetSpeechRecognitionLanguage() const {
    return GetProperty(PropertyId::SpeechServiceConnection_RecoLanguage);
}

void SpeechConfig::SetAuthorizationToken(const std::string& token) {
    SetProperty(PropertyId::SpeechServiceAuthorization_Token, token);
}

std::string SpeechConfig::GetAuthorizationToken() const {
    return GetProperty(PropertyId::SpeechServiceAuthorization_Token);
}

void SpeechConfig::SetProperty(PropertyId id, const std::string& value) {
    properties_[id] = value;
}

std::string SpeechConfig::GetProperty(PropertyId id) const {
    auto it = properties_.find(id);
    return it != properties_.end() ? it->second : std::string();
}

void SpeechConfig::SetProperty(const std::string& name, const std::string& value) {
    RequireNonEmpty(name, "Property name");
    named_properties_[name] = value;
}

std::string SpeechConfig::GetProperty(const std::string& name) const {
    auto it = named_properties_.find(name);
    return it != named_properties_.end() ? it->second : std::string();
}

// --- SpeechTranslationConfig ---

std::shared_ptr<SpeechTranslationConfig> SpeechTranslationConfig::FromSubscription(
    const std::string& subscription_key, const std::string& region) {
    std::shared_ptr<SpeechTranslationConfig> config(new SpeechTranslationConfig());
    InitFromSubscription(*config, subscription_key, region);
    return config;
}

std::shared_ptr<SpeechTranslationConfig> SpeechTranslationConfig::FromEndpoint(
    const std::string& endpoint, const std::string& subscription_key) {
    std::shared_ptr<SpeechTranslationConfig> config(new SpeechTranslationConfig());
    InitFromEndpoint(*config, endpoint, subscription_key);
    return config;
}

std::shared_ptr<SpeechTranslationConfig> SpeechTranslationConfig::FromAuthorizationToken(
    const std::string& token, const std::string& region) {
    std::shared_ptr<SpeechTranslationConfig> config(new SpeechTranslationConfig());
    InitFromAuthorizationToken(*config, token, region);
    return config;
}

std::vector<std::string> SpeechTranslationConfig::GetTargetLanguages() const {
    const std::string joined = GetProperty(PropertyId::SpeechServiceConnection_TranslationToLanguages);
    if (joined.empty()) {
        return {};
    }
    return SplitCommaList(joined);
}

void SpeechTranslationConfig::StoreTargetLanguages(const std::vector<std::string>& languages) {
    SetProperty(PropertyId::SpeechServiceConnection_TranslationToLanguages, JoinCommaList(languages));
}

void SpeechTranslationConfig::AddTargetLanguage(const std::string& language) {
    RequireNonEmpty(language, "Target language");
    auto languages = GetTargetLanguages();
    if (std::find(languages.begin(), languages.end(), language) == languages.end()) {
        languages.push_back(language);
        StoreTargetLanguages(languages);
    }
}

void SpeechTranslationConfig::RemoveTargetLanguage(const std::string& language) {
    auto languages = GetTargetLanguages();
    languages.erase(std::remove(languages.begin(), languages.end(), language), languages.end());
    StoreTargetLanguages(languages);
}

void SpeechTranslationConfig::SetVoiceName(const std::string& voice) {
    SetProperty(PropertyId::SpeechServiceConnection_TranslationVoice, voice);
}

std::string SpeechTranslationConfig::GetVoiceName() const {
    return GetProperty(PropertyId::SpeechServiceConnection_TranslationVoice);
}

// --- AudioConfig / KeywordRecognitionModel ---

AudioConfig::AudioConfig(Source source, std::string file_path)
  : source_(source), file_path_(std::move(file_path)) {}

std::shared_ptr<AudioConfig> AudioConfig::FromDefaultMicrophoneInput() {
    return std::shared_ptr<AudioConfig>(new AudioConfig(Source::DefaultMicrophone, ""));
}

std::shared_ptr<AudioConfig> AudioConfig::FromWavFileInput(const std::string& file_path) {
    RequireNonEmpty(file_path, "Wav file path");
    return std::shared_ptr<AudioConfig>(new AudioConfig(Source::WavFile, file_path));
}

KeywordRecognitionModel::KeywordRecognitionModel(std::string file_path)
  : file_path_(std::move(file_path)) {}

std::shared_ptr<KeywordRecognitionModel> KeywordRecognitionModel::FromFile(const std::string& file_path) {
    RequireNonEmpty(file_path, "Keyword model file path");
    return std::shared_ptr<KeywordRecognitionModel>(new KeywordRecognitionModel(file_path));
}

} // namespace speechbridge
