#include "native_string.h"

#include <algorithm>
#include <vector>

namespace speechbridge {

NativeStatus ReadNativeString(const std::function<NativeStatus(char*, uint32_t)>& read,
                              uint32_t initial_size,
                              uint32_t max_size,
                              NativeStatus buffer_too_small,
                              std::string* value) {
    if (value == nullptr || initial_size < 2 || max_size < initial_size) {
        return kNativeErrorInvalidArg;
    }

    uint32_t size = initial_size;
    while (true) {
        std::vector<char> buffer(size, '\0');
        const NativeStatus status = read(buffer.data(), size);
        if (status != buffer_too_small && !NativeSucceeded(status)) {
            return status;
        }

        const auto length = static_cast<std::size_t>(std::find(buffer.begin(), buffer.end(), '\0') - buffer.begin());
        // 버퍼를 꽉 채웠으면 잘렸을 수 있음
        const bool maybe_truncated = status == buffer_too_small || length + 1 >= size;
        if (!maybe_truncated) {
            value->assign(buffer.data(), length);
            return kNativeOk;
        }
        if (size >= max_size) {
            return buffer_too_small;
        }
        size = size > max_size / 2 ? max_size : size * 2;
    }
}

} // namespace speechbridge
