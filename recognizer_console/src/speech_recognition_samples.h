#pragma once

#include <future>
#include <memory>
#include <string>

#include "console_settings.h"
#include "native_engine.h"

namespace recognizer_console {

// Recognizes one utterance from wav_file, then translates the whole file when
// target languages are configured.
std::future<void> SpeechRecognitionAsync(std::shared_ptr<speechbridge::NativeEngine> engine,
                                         ConsoleSettings settings,
                                         std::string wav_file);

} // namespace recognizer_console
