#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "native_engine.h"

namespace speechbridge {

// Copies a string out of a native call that fills a caller buffer and
// truncates silently. The buffer doubles (up to max_size) while the call
// reports buffer_too_small or fills it completely.
//
//   read(buffer, size) must write a NUL terminated string into buffer.
NativeStatus ReadNativeString(const std::function<NativeStatus(char*, uint32_t)>& read,
                              uint32_t initial_size,
                              uint32_t max_size,
                              NativeStatus buffer_too_small,
                              std::string* value);

} // namespace speechbridge
