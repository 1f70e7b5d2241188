#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>

#include "speech_errors.h"

namespace speechbridge {

// Maps opaque context tokens (the void* handed to the native engine) to weak
// references. The native side never holds an owning reference, and a token
// that outlives its object resolves to null instead of dangling.
//
//   Resolve() on a live token      -> shared_ptr to the object
//   Resolve() after object expired -> nullptr
//   Resolve() on a revoked token   -> throws InvalidHandleError
//
// Each entry may also carry a Companion value (owned, not weak) that stays
// available while the object is already expired but the token is not revoked.
template <typename T, typename Companion = std::nullptr_t>
class WeakContextTable {
public:
    WeakContextTable() = default;
    WeakContextTable(const WeakContextTable&) = delete;
    WeakContextTable& operator=(const WeakContextTable&) = delete;

    void* Register(const std::weak_ptr<T>& object, Companion companion = Companion()) {
        std::lock_guard<std::mutex> lock(mutex_);
        const std::uintptr_t token = ++last_token_;  // 0 is never issued
        entries_[token] = Entry{object, std::move(companion)};
        return reinterpret_cast<void*>(token);
    }

    std::shared_ptr<T> Resolve(void* context) const {
        return Resolve(context, nullptr);
    }

    // Same as Resolve(context); also copies the entry's companion out when
    // companion is not null, even if the object has expired.
    std::shared_ptr<T> Resolve(void* context, Companion* companion) const {
        const auto token = reinterpret_cast<std::uintptr_t>(context);
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(token);
        if (it == entries_.end()) {
            throw InvalidHandleError("Callback context is not registered or was already revoked.");
        }
        if (companion != nullptr) {
            *companion = it->second.companion;
        }
        return it->second.object.lock();
    }

    bool Revoke(void* context) {
        const auto token = reinterpret_cast<std::uintptr_t>(context);
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.erase(token) > 0;
    }

    std::size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

private:
    struct Entry {
        std::weak_ptr<T> object;
        Companion companion;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::uintptr_t, Entry> entries_;
    std::uintptr_t last_token_ = 0;
};

} // namespace speechbridge
