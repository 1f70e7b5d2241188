#pragma once

#include <atomic>
#include <functional>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "event_signal.h"
#include "native_engine.h"
#include "property_collection.h"
#include "recognition_event_args.h"
#include "recognition_result.h"
#include "speech_config.h"
#include "speech_errors.h"
#include "weak_context_table.h"

namespace speechbridge {

// Unique owner of a native recognizer handle. Released exactly once.
class RecognizerHandle {
public:
    RecognizerHandle(std::shared_ptr<NativeEngine> engine, RecoHandle handle);
    ~RecognizerHandle();

    RecognizerHandle(RecognizerHandle&& other) noexcept;
    RecognizerHandle(const RecognizerHandle&) = delete;
    RecognizerHandle& operator=(const RecognizerHandle&) = delete;
    RecognizerHandle& operator=(RecognizerHandle&&) = delete;

    RecoHandle Get() const { return handle_; }
    const std::shared_ptr<NativeEngine>& Engine() const { return engine_; }
    bool IsValid() const;
    void Release();

private:
    std::shared_ptr<NativeEngine> engine_;
    RecoHandle handle_;
};

// Base of all recognizer facades.
//
// Owns the native handle, the property bag and the callback context token.
// Blocking native calls run on std::async workers; native callbacks arrive on
// engine threads and are re-raised as EventSignal events.
//
// Instances are always held by std::shared_ptr (see the FromConfig factories),
// because the callback context is a weak reference to the instance.
class Recognizer : public std::enable_shared_from_this<Recognizer> {
public:
    virtual ~Recognizer();

    Recognizer(const Recognizer&) = delete;
    Recognizer& operator=(const Recognizer&) = delete;

    EventSignal<const SessionEventArgs&> SessionStarted;
    EventSignal<const SessionEventArgs&> SessionStopped;
    EventSignal<const RecognitionEventArgs&> SpeechStartDetected;
    EventSignal<const RecognitionEventArgs&> SpeechEndDetected;

    // Only valid until the recognizer is closed.
    PropertyCollection& Properties();

    // The caller must refresh the token before it expires, otherwise
    // recognition fails with an authentication error.
    std::string AuthorizationToken();
    void SetAuthorizationToken(const std::string& token);
    // Throws std::invalid_argument for nullptr.
    void SetAuthorizationToken(const char* token);

    std::future<void> StartContinuousRecognitionAsync();
    std::future<void> StopContinuousRecognitionAsync();
    std::future<void> StartKeywordRecognitionAsync(std::shared_ptr<KeywordRecognitionModel> model);
    std::future<void> StopKeywordRecognitionAsync();

    // Explicit teardown: closes the property bag, uninstalls every native
    // callback and releases the handle. Idempotent. Throws InvalidHandleError
    // (and changes nothing) while an async operation is still running.
    void Close();
    bool IsClosed() const;

    using CallbackBinding = std::pair<RecognizerEvent, NativeCallback>;

protected:
    explicit Recognizer(RecognizerHandle handle);

    static RecognizerHandle CreateNativeRecognizer(const std::shared_ptr<NativeEngine>& engine,
                                                   RecognizerKind kind,
                                                   const SpeechConfig& config,
                                                   const AudioConfig* audio_config);

    // Must be called once by the factory right after the shared_ptr exists.
    // Installs every binding from CallbackBindings() and fetches the property
    // bag; on failure everything already installed is rolled back.
    void Initialize();

    // Trampolines to install. Overrides append to the base list.
    virtual std::vector<CallbackBinding> CallbackBindings() const;

    NativeEngine& Engine() const { return *engine_; }
    RecoHandle Handle() const { return handle_.Get(); }

    // Uniform seam for every blocking native action: rejects disposed
    // recognizers and keeps the in-flight count Close() checks.
    void DoAsyncRecognitionAction(const std::function<void()>& action);

    std::future<void> RunAsync(std::function<void()> action);

    template <typename ResultT>
    std::future<std::shared_ptr<ResultT>> RecognizeOnceAsyncAs();

    // Boundary wrapper used by every trampoline: resolves the owning
    // recognizer from the context token, skips recognizers being torn down,
    // releases the event handle, and never lets an exception escape to the
    // native caller.
    template <typename T, typename Fire>
    static void DispatchNativeEvent(RecognizerEvent event, EventHandle hevent, void* context, Fire&& fire) noexcept;

    // Each token also keeps the engine, so an event that arrives while the
    // recognizer is being destroyed can still be released.
    using ContextTableType = WeakContextTable<Recognizer, std::shared_ptr<NativeEngine>>;
    static ContextTableType& ContextTable();

private:
    // Teardown shared by Close() (disposing == true) and the destructor.
    void Dispose(bool disposing);
    void DisposeLocked(bool disposing);
    void UninstallAllCallbacks();

    static void FireEvent_SessionStarted(RecoHandle hreco, EventHandle hevent, void* context);
    static void FireEvent_SessionStopped(RecoHandle hreco, EventHandle hevent, void* context);
    static void FireEvent_SpeechStartDetected(RecoHandle hreco, EventHandle hevent, void* context);
    static void FireEvent_SpeechEndDetected(RecoHandle hreco, EventHandle hevent, void* context);

    std::shared_ptr<NativeEngine> engine_;
    RecognizerHandle handle_;
    std::unique_ptr<PropertyCollection> properties_;
    void* context_ = nullptr;

    // Installed trampolines; cleared on teardown.
    std::map<RecognizerEvent, NativeCallback> callbacks_;

    std::mutex dispose_mutex_;
    std::atomic<bool> disposing_{false};
    bool disposed_ = false;
    std::atomic<int> active_async_operations_{0};
};

// Releases a native event handle when the callback returns.
class ScopedEventHandle {
public:
    ScopedEventHandle(NativeEngine& engine, EventHandle handle) : engine_(engine), handle_(handle) {}
    ~ScopedEventHandle() {
        if (handle_ != nullptr) {
            LogErrorIfFail(engine_.ReleaseEvent(handle_), "recognizer_event_handle_release");
        }
    }

    ScopedEventHandle(const ScopedEventHandle&) = delete;
    ScopedEventHandle& operator=(const ScopedEventHandle&) = delete;

private:
    NativeEngine& engine_;
    EventHandle handle_;
};

template <typename ResultT>
std::future<std::shared_ptr<ResultT>> Recognizer::RecognizeOnceAsyncAs() {
    auto self = shared_from_this();
    return std::async(std::launch::async, [self]() {
        std::shared_ptr<ResultT> result;
        self->DoAsyncRecognitionAction([&]() {
            ResultHandle raw = nullptr;
            ThrowIfFail(self->Engine().RecognizeOnce(self->Handle(), &raw), "recognizer_recognize_once");
            ScopedResultHandle scoped(self->Engine(), raw);
            result = std::make_shared<ResultT>(self->Engine(), scoped.Get());
        });
        return result;
    });
}

template <typename T, typename Fire>
void Recognizer::DispatchNativeEvent(RecognizerEvent event, EventHandle hevent, void* context, Fire&& fire) noexcept {
    try {
        std::shared_ptr<NativeEngine> engine;
        std::shared_ptr<Recognizer> resolved = ContextTable().Resolve(context, &engine);
        if (!engine) {
            return;
        }
        // 소멸 중(토큰 회수 전)이어도 이벤트 핸들은 해제
        ScopedEventHandle scoped(*engine, hevent);
        auto recognizer = std::dynamic_pointer_cast<T>(resolved);
        if (!recognizer) {
            return;
        }
        Recognizer& base = *recognizer;
        if (base.disposing_.load(std::memory_order_acquire)) {
            return;
        }
        fire(*recognizer);
    } catch (const InvalidHandleError& e) {
        LogError(kNativeErrorInvalidHandle, ToString(event));
        std::cerr << "   " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "❌ speechbridge: exception while dispatching " << ToString(event)
                  << " event: " << e.what() << std::endl;
    } catch (...) {
        std::cerr << "❌ speechbridge: unknown exception while dispatching " << ToString(event)
                  << " event." << std::endl;
    }
}

} // namespace speechbridge
