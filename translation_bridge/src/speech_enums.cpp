#include "speech_enums.h"

namespace speechbridge {

std::string ToString(ResultReason reason) {
    switch (reason) {
        case ResultReason::NoMatch:                    return "NoMatch";
        case ResultReason::Canceled:                   return "Canceled";
        case ResultReason::RecognizingSpeech:          return "RecognizingSpeech";
        case ResultReason::RecognizedSpeech:           return "RecognizedSpeech";
        case ResultReason::RecognizingIntent:          return "RecognizingIntent";
        case ResultReason::RecognizedIntent:           return "RecognizedIntent";
        case ResultReason::TranslatingSpeech:          return "TranslatingSpeech";
        case ResultReason::TranslatedSpeech:           return "TranslatedSpeech";
        case ResultReason::SynthesizingAudio:          return "SynthesizingAudio";
        case ResultReason::SynthesizingAudioCompleted: return "SynthesizingAudioCompleted";
    }
    return "Unknown(" + std::to_string(static_cast<int>(reason)) + ")";
}

std::string ToString(CancellationReason reason) {
    switch (reason) {
        case CancellationReason::Error:       return "Error";
        case CancellationReason::EndOfStream: return "EndOfStream";
    }
    return "Unknown(" + std::to_string(static_cast<int>(reason)) + ")";
}

std::string ToString(CancellationErrorCode code) {
    switch (code) {
        case CancellationErrorCode::NoError:               return "NoError";
        case CancellationErrorCode::AuthenticationFailure: return "AuthenticationFailure";
        case CancellationErrorCode::BadRequest:            return "BadRequest";
        case CancellationErrorCode::TooManyRequests:       return "TooManyRequests";
        case CancellationErrorCode::Forbidden:             return "Forbidden";
        case CancellationErrorCode::ConnectionFailure:     return "ConnectionFailure";
        case CancellationErrorCode::ServiceTimeout:        return "ServiceTimeout";
        case CancellationErrorCode::ServiceError:          return "ServiceError";
        case CancellationErrorCode::ServiceUnavailable:    return "ServiceUnavailable";
        case CancellationErrorCode::RuntimeError:          return "RuntimeError";
    }
    return "Unknown(" + std::to_string(static_cast<int>(code)) + ")";
}

} // namespace speechbridge
