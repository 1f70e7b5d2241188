#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "speech_enums.h"

namespace speechbridge {

// Speech service configuration. Plain value object; it is read once when a
// recognizer is created and copied into the native recognizer.
class SpeechConfig {
public:
    enum class Source {
        Subscription,
        Endpoint,
        AuthorizationToken
    };

    static std::shared_ptr<SpeechConfig> FromSubscription(const std::string& subscription_key,
                                                          const std::string& region);
    static std::shared_ptr<SpeechConfig> FromEndpoint(const std::string& endpoint,
                                                      const std::string& subscription_key);
    static std::shared_ptr<SpeechConfig> FromAuthorizationToken(const std::string& token,
                                                                const std::string& region);

    virtual ~SpeechConfig() = default;

    Source GetSource() const { return source_; }

    void SetSpeechRecognitionLanguage(const std::string& language);
    std::string GetSpeechRecognitionLanguage() const;

    void SetAuthorizationToken(const std::string& token);
    std::string GetAuthorizationToken() const;

    void SetProperty(PropertyId id, const std::string& value);
    std::string GetProperty(PropertyId id) const;

    void SetProperty(const std::string& name, const std::string& value);
    std::string GetProperty(const std::string& name) const;

    const std::map<PropertyId, std::string>& Properties() const { return properties_; }
    const std::map<std::string, std::string>& NamedProperties() const { return named_properties_; }

protected:
    SpeechConfig() = default;

    static void InitFromSubscription(SpeechConfig& config, const std::string& key, const std::string& region);
    static void InitFromEndpoint(SpeechConfig& config, const std::string& endpoint, const std::string& key);
    static void InitFromAuthorizationToken(SpeechConfig& config, const std::string& token, const std::string& region);

private:
    Source source_ = Source::Subscription;
    std::map<PropertyId, std::string> properties_;
    std::map<std::string, std::string> named_properties_;
};

// Adds target languages and the synthesis voice used by translation.
class SpeechTranslationConfig : public SpeechConfig {
public:
    static std::shared_ptr<SpeechTranslationConfig> FromSubscription(const std::string& subscription_key,
                                                                     const std::string& region);
    static std::shared_ptr<SpeechTranslationConfig> FromEndpoint(const std::string& endpoint,
                                                                 const std::string& subscription_key);
    static std::shared_ptr<SpeechTranslationConfig> FromAuthorizationToken(const std::string& token,
                                                                           const std::string& region);

    // Languages are BCP-47 codes ("de", "fr-FR"); duplicates are ignored.
    void AddTargetLanguage(const std::string& language);
    void RemoveTargetLanguage(const std::string& language);
    std::vector<std::string> GetTargetLanguages() const;

    void SetVoiceName(const std::string& voice);
    std::string GetVoiceName() const;

private:
    SpeechTranslationConfig() = default;
    void StoreTargetLanguages(const std::vector<std::string>& languages);
};

// Where the recognizer reads audio from.
class AudioConfig {
public:
    enum class Source {
        DefaultMicrophone,
        WavFile
    };

    static std::shared_ptr<AudioConfig> FromDefaultMicrophoneInput();
    static std::shared_ptr<AudioConfig> FromWavFileInput(const std::string& file_path);

    Source GetSource() const { return source_; }
    const std::string& FilePath() const { return file_path_; }

private:
    AudioConfig(Source source, std::string file_path);

    Source source_;
    std::string file_path_;
};

class KeywordRecognitionModel {
public:
    static std::shared_ptr<KeywordRecognitionModel> FromFile(const std::string& file_path);

    const std::string& FilePath() const { return file_path_; }

private:
    explicit KeywordRecognitionModel(std::string file_path);

    std::string file_path_;
};

// Comma separated list -> items, split literally: "" yields a single empty item.
std::vector<std::string> SplitCommaList(const std::string& joined);
std::string JoinCommaList(const std::vector<std::string>& items);

} // namespace speechbridge
