#include "recognizer.h"

#include <stdexcept>

namespace speechbridge {

namespace {

// Every event kind the native engine can call back for. Teardown uninstalls
// all of them regardless of which ones were installed.
constexpr RecognizerEvent kAllEvents[] = {
    RecognizerEvent::Recognizing,
    RecognizerEvent::Recognized,
    RecognizerEvent::Canceled,
    RecognizerEvent::Synthesizing,
    RecognizerEvent::SessionStarted,
    RecognizerEvent::SessionStopped,
    RecognizerEvent::SpeechStartDetected,
    RecognizerEvent::SpeechEndDetected,
};

class ActiveOperationGuard {
public:
    explicit ActiveOperationGuard(std::atomic<int>& counter) : counter_(counter) {}
    ~ActiveOperationGuard() { counter_.fetch_sub(1); }

private:
    std::atomic<int>& counter_;
};

} // namespace

// --- RecognizerHandle ---

RecognizerHandle::RecognizerHandle(std::shared_ptr<NativeEngine> engine, RecoHandle handle)
  : engine_(std::move(engine)), handle_(handle) {}

RecognizerHandle::RecognizerHandle(RecognizerHandle&& other) noexcept
  : engine_(std::move(other.engine_)), handle_(other.handle_)
{
    other.handle_ = nullptr;
}

RecognizerHandle::~RecognizerHandle() {
    Release();
}

bool RecognizerHandle::IsValid() const {
    return handle_ != nullptr && engine_ && engine_->IsRecognizerValid(handle_);
}

void RecognizerHandle::Release() {
    if (handle_ == nullptr || !engine_) {
        return;
    }
    LogErrorIfFail(engine_->ReleaseRecognizer(handle_), "recognizer_handle_release");
    handle_ = nullptr;
}

// --- Recognizer: construction ---

Recognizer::ContextTableType& Recognizer::ContextTable() {
    static ContextTableType table;
    return table;
}

RecognizerHandle Recognizer::CreateNativeRecognizer(const std::shared_ptr<NativeEngine>& engine,
                                                    RecognizerKind kind,
                                                    const SpeechConfig& config,
                                                    const AudioConfig* audio_config) {
    if (!engine) {
        throw std::invalid_argument("Recognizer requires a native engine.");
    }
    RecoHandle raw = nullptr;
    ThrowIfFail(engine->CreateRecognizer(kind, config, audio_config, &raw), "recognizer_create_from_config");
    RecognizerHandle handle(engine, raw);
    ThrowIfNull(raw, "Invalid recognizer handle");
    if (!handle.IsValid()) {
        throw InvalidHandleError("Native engine returned an invalid recognizer handle.");
    }
    return handle;
}

Recognizer::Recognizer(RecognizerHandle handle)
  : engine_(handle.Engine()), handle_(std::move(handle))
{
    ThrowIfNull(handle_.Get(), "Invalid recognizer handle");
}

Recognizer::~Recognizer() {
    Dispose(false);
}

void Recognizer::Initialize() {
    context_ = ContextTable().Register(weak_from_this(), engine_);
    try {
        for (const auto& binding : CallbackBindings()) {
            ThrowIfFail(engine_->SetEventCallback(handle_.Get(), binding.first, binding.second, context_),
                        ToString(binding.first));
            callbacks_[binding.first] = binding.second;
        }

        PropertyBagHandle bag = nullptr;
        ThrowIfFail(engine_->GetPropertyBag(handle_.Get(), &bag), "recognizer_get_property_bag");
        properties_ = std::make_unique<PropertyCollection>(engine_, bag);
    } catch (const std::exception& e) {
        std::cerr << "❌ speechbridge: recognizer initialization failed: " << e.what() << std::endl;
        // Roll back so no trampoline outlives the failed construction.
        Dispose(true);
        throw;
    }
}

std::vector<Recognizer::CallbackBinding> Recognizer::CallbackBindings() const {
    return {
        {RecognizerEvent::SessionStarted, &Recognizer::FireEvent_SessionStarted},
        {RecognizerEvent::SessionStopped, &Recognizer::FireEvent_SessionStopped},
        {RecognizerEvent::SpeechStartDetected, &Recognizer::FireEvent_SpeechStartDetected},
        {RecognizerEvent::SpeechEndDetected, &Recognizer::FireEvent_SpeechEndDetected},
    };
}

// --- Recognizer: properties ---

PropertyCollection& Recognizer::Properties() {
    if (!properties_) {
        throw InvalidHandleError("Recognizer has no property collection.");
    }
    return *properties_;
}

std::string Recognizer::AuthorizationToken() {
    return Properties().GetProperty(PropertyId::SpeechServiceAuthorization_Token, "");
}

void Recognizer::SetAuthorizationToken(const std::string& token) {
    Properties().SetProperty(PropertyId::SpeechServiceAuthorization_Token, token);
}

void Recognizer::SetAuthorizationToken(const char* token) {
    if (token == nullptr) {
        throw std::invalid_argument("Authorization token must not be null.");
    }
    SetAuthorizationToken(std::string(token));
}

// --- Recognizer: async operations ---

void Recognizer::DoAsyncRecognitionAction(const std::function<void()>& action) {
    {
        std::lock_guard<std::mutex> lock(dispose_mutex_);
        if (disposed_ || disposing_.load(std::memory_order_acquire)) {
            throw InvalidHandleError("Recognizer has been closed.");
        }
        active_async_operations_.fetch_add(1);
    }
    ActiveOperationGuard guard(active_async_operations_);
    action();
}

std::future<void> Recognizer::RunAsync(std::function<void()> action) {
    auto self = shared_from_this();
    return std::async(std::launch::async, [self, action]() {
        self->DoAsyncRecognitionAction(action);
    });
}

std::future<void> Recognizer::StartContinuousRecognitionAsync() {
    return RunAsync([this]() {
        ThrowIfFail(engine_->StartContinuousRecognition(handle_.Get()), "recognizer_start_continuous_recognition");
    });
}

std::future<void> Recognizer::StopContinuousRecognitionAsync() {
    return RunAsync([this]() {
        ThrowIfFail(engine_->StopContinuousRecognition(handle_.Get()), "recognizer_stop_continuous_recognition");
    });
}

std::future<void> Recognizer::StartKeywordRecognitionAsync(std::shared_ptr<KeywordRecognitionModel> model) {
    if (!model) {
        throw std::invalid_argument("Keyword recognition model must not be null.");
    }
    return RunAsync([this, model]() {
        ThrowIfFail(engine_->StartKeywordRecognition(handle_.Get(), *model), "recognizer_start_keyword_recognition");
    });
}

std::future<void> Recognizer::StopKeywordRecognitionAsync() {
    return RunAsync([this]() {
        ThrowIfFail(engine_->StopKeywordRecognition(handle_.Get()), "recognizer_stop_keyword_recognition");
    });
}

// --- Recognizer: teardown ---

void Recognizer::Close() {
    std::lock_guard<std::mutex> lock(dispose_mutex_);
    if (active_async_operations_.load() != 0) {
        throw InvalidHandleError(
            "Cannot close a recognizer while async recognition is running. "
            "Wait for pending futures before closing.");
    }
    DisposeLocked(true);
}

bool Recognizer::IsClosed() const {
    return disposing_.load(std::memory_order_acquire);
}

void Recognizer::Dispose(bool disposing) {
    std::lock_guard<std::mutex> lock(dispose_mutex_);
    DisposeLocked(disposing);
}

void Recognizer::DisposeLocked(bool disposing) {
    if (disposed_) {
        return;
    }

    // In-flight callbacks check this first and bail out.
    disposing_.store(true, std::memory_order_release);

    if (disposing && properties_) {
        properties_->Close();
    }

    if (handle_.IsValid()) {
        UninstallAllCallbacks();
    }
    callbacks_.clear();

    if (context_ != nullptr) {
        ContextTable().Revoke(context_);
        context_ = nullptr;
    }
    handle_.Release();
    disposed_ = true;
}

void Recognizer::UninstallAllCallbacks() {
    for (RecognizerEvent event : kAllEvents) {
        LogErrorIfFail(engine_->SetEventCallback(handle_.Get(), event, nullptr, nullptr), ToString(event));
    }
}

// --- Recognizer: session trampolines ---

void Recognizer::FireEvent_SessionStarted(RecoHandle, EventHandle hevent, void* context) {
    DispatchNativeEvent<Recognizer>(RecognizerEvent::SessionStarted, hevent, context, [hevent](Recognizer& recognizer) {
        SessionEventArgs args(recognizer.Engine(), hevent);
        recognizer.SessionStarted.Signal(args);
    });
}

void Recognizer::FireEvent_SessionStopped(RecoHandle, EventHandle hevent, void* context) {
    DispatchNativeEvent<Recognizer>(RecognizerEvent::SessionStopped, hevent, context, [hevent](Recognizer& recognizer) {
        SessionEventArgs args(recognizer.Engine(), hevent);
        recognizer.SessionStopped.Signal(args);
    });
}

void Recognizer::FireEvent_SpeechStartDetected(RecoHandle, EventHandle hevent, void* context) {
    DispatchNativeEvent<Recognizer>(RecognizerEvent::SpeechStartDetected, hevent, context, [hevent](Recognizer& recognizer) {
        RecognitionEventArgs args(recognizer.Engine(), hevent);
        recognizer.SpeechStartDetected.Signal(args);
    });
}

void Recognizer::FireEvent_SpeechEndDetected(RecoHandle, EventHandle hevent, void* context) {
    DispatchNativeEvent<Recognizer>(RecognizerEvent::SpeechEndDetected, hevent, context, [hevent](Recognizer& recognizer) {
        RecognitionEventArgs args(recognizer.Engine(), hevent);
        recognizer.SpeechEndDetected.Signal(args);
    });
}

} // namespace speechbridge
