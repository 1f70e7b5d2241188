#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace speechbridge {

// Multicast event. Handlers may be connected/disconnected from any thread,
// including from inside a handler; Signal() invokes a snapshot of the handlers
// taken under the lock, in connection order.
//
//   recognizer->Recognized.Connect([](const TranslationRecognitionEventArgs& e) { ... });
template <typename T>
class EventSignal {
public:
    using Handler = std::function<void(T)>;
    using ConnectionId = std::size_t;

    EventSignal() = default;
    EventSignal(const EventSignal&) = delete;
    EventSignal& operator=(const EventSignal&) = delete;

    ConnectionId Connect(Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        const ConnectionId id = ++last_id_;
        handlers_.emplace_back(id, std::move(handler));
        return id;
    }

    bool Disconnect(ConnectionId id) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = handlers_.begin(); it != handlers_.end(); ++it) {
            if (it->first == id) {
                handlers_.erase(it);
                return true;
            }
        }
        return false;
    }

    void DisconnectAll() {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_.clear();
    }

    bool IsConnected() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return !handlers_.empty();
    }

    void Signal(T args) const {
        std::vector<std::pair<ConnectionId, Handler>> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshot = handlers_;
        }
        for (const auto& entry : snapshot) {
            if (entry.second) {
                entry.second(args);
            }
        }
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<ConnectionId, Handler>> handlers_;
    ConnectionId last_id_ = 0;
};

} // namespace speechbridge
