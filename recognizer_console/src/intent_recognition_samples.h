#pragma once

#include <future>
#include <memory>
#include <string>

#include "console_settings.h"
#include "native_engine.h"

namespace recognizer_console {

// Registers the configured phrase intents and recognizes one utterance from wav_file.
std::future<void> IntentRecognitionAsync(std::shared_ptr<speechbridge::NativeEngine> engine,
                                         ConsoleSettings settings,
                                         std::string wav_file);

} // namespace recognizer_console
