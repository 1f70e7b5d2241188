// translation_bridge/tests/translation_recognizer_test.cpp

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "mock_native_engine.h"
#include "translation_recognizer.h"

using namespace speechbridge;
using speechbridge::testing_support::FakeEvent;
using speechbridge::testing_support::FakeResult;
using speechbridge::testing_support::MockNativeEngine;
using ::testing::_;
using ::testing::AnyNumber;
using ::testing::DoAll;
using ::testing::InvokeWithoutArgs;
using ::testing::IsNull;
using ::testing::NiceMock;
using ::testing::NotNull;
using ::testing::Return;

// ===== Test Fixture =====
class TranslationRecognizerTest : public ::testing::Test {
protected:
    std::shared_ptr<NiceMock<MockNativeEngine>> engine_;
    std::shared_ptr<SpeechTranslationConfig> config_;

    void SetUp() override {
        engine_ = std::make_shared<NiceMock<MockNativeEngine>>();
        config_ = SpeechTranslationConfig::FromSubscription("test-key", "westus");
        config_->SetSpeechRecognitionLanguage("en-US");
        config_->AddTargetLanguage("de");
        config_->SetVoiceName("de-DE-Hedda");
    }

    std::shared_ptr<TranslationRecognizer> Create() {
        return TranslationRecognizer::FromConfig(engine_, config_, AudioConfig::FromWavFileInput("whatstheweatherlike.wav"));
    }

    static FakeEvent TranslatedEvent(const std::string& session_id, const std::string& text) {
        FakeEvent event;
        event.session_id = session_id;
        event.offset = 1200000;
        event.has_result = true;
        event.result.result_id = "r-" + session_id;
        event.result.reason = ResultReason::TranslatedSpeech;
        event.result.text = text;
        event.result.translations = {{"de", "Wie ist das Wetter?"}};
        return event;
    }
};
// ===== End Test Fixture =====


// --- construction ---

TEST_F(TranslationRecognizerTest, ConstructionInstallsTranslationTrampolines) {
    auto recognizer = Create();

    EXPECT_EQ(engine_->CreatedKind(), RecognizerKind::Translation);
    EXPECT_NE(engine_->InstalledCallback(RecognizerEvent::Recognizing), nullptr);
    EXPECT_NE(engine_->InstalledCallback(RecognizerEvent::Recognized), nullptr);
    EXPECT_NE(engine_->InstalledCallback(RecognizerEvent::Canceled), nullptr);
    EXPECT_NE(engine_->InstalledCallback(RecognizerEvent::Synthesizing), nullptr);
    // session 이벤트 4개 포함
    EXPECT_EQ(engine_->InstalledCallbackCount(), 8u);
    EXPECT_FALSE(recognizer->IsClosed());
}

TEST_F(TranslationRecognizerTest, CallbacksShareOneContextToken) {
    auto recognizer = Create();
    void* context = engine_->InstalledContext(RecognizerEvent::Recognized);
    ASSERT_NE(context, nullptr);
    EXPECT_EQ(engine_->InstalledContext(RecognizerEvent::Synthesizing), context);
    EXPECT_EQ(engine_->InstalledContext(RecognizerEvent::SessionStarted), context);
}

TEST_F(TranslationRecognizerTest, FailedCallbackRegistrationRollsBack) {
    ON_CALL(*engine_, SetEventCallback(_, RecognizerEvent::Canceled, NotNull(), _))
        .WillByDefault(Return(kNativeErrorInvalidArg));

    EXPECT_THROW(Create(), SpeechError);

    EXPECT_EQ(engine_->InstalledCallbackCount(), 0u);
    EXPECT_TRUE(engine_->RecognizerReleased());
}

TEST_F(TranslationRecognizerTest, InvalidNativeHandleFailsConstruction) {
    EXPECT_CALL(*engine_, IsRecognizerValid(_)).WillRepeatedly(Return(false));
    EXPECT_CALL(*engine_, SetEventCallback(_, _, NotNull(), _)).Times(0);

    EXPECT_THROW(Create(), InvalidHandleError);
    EXPECT_TRUE(engine_->RecognizerReleased());
}

TEST_F(TranslationRecognizerTest, NativeCreateFailureSurfacesStatus) {
    EXPECT_CALL(*engine_, CreateRecognizer(_, _, _, _)).WillOnce(Return(static_cast<NativeStatus>(0x01B)));
    try {
        Create();
        FAIL() << "FromConfig should have thrown";
    } catch (const SpeechError& e) {
        EXPECT_EQ(e.Status(), static_cast<NativeStatus>(0x01B));
    }
    EXPECT_EQ(engine_->InstalledCallbackCount(), 0u);
}

TEST_F(TranslationRecognizerTest, NullConfigRejected) {
    EXPECT_THROW(TranslationRecognizer::FromConfig(engine_, nullptr), std::invalid_argument);
}

// --- properties ---

TEST_F(TranslationRecognizerTest, TargetLanguagesSplitOnCommas) {
    config_->AddTargetLanguage("fr");
    config_->AddTargetLanguage("es");
    auto recognizer = Create();

    EXPECT_EQ(recognizer->TargetLanguages(), (std::vector<std::string>{"de", "fr", "es"}));
}

TEST_F(TranslationRecognizerTest, EmptyTargetLanguagesYieldOneEmptyItem) {
    auto recognizer = Create();
    recognizer->Properties().SetProperty(PropertyId::SpeechServiceConnection_TranslationToLanguages, "");

    EXPECT_EQ(recognizer->TargetLanguages(), (std::vector<std::string>{""}));
}

TEST_F(TranslationRecognizerTest, LanguageAndVoiceComeFromConfig) {
    auto recognizer = Create();
    EXPECT_EQ(recognizer->SpeechRecognitionLanguage(), "en-US");
    EXPECT_EQ(recognizer->VoiceName(), "de-DE-Hedda");
}

TEST_F(TranslationRecognizerTest, AuthorizationTokenIsWrittenToPropertyBag) {
    auto recognizer = Create();
    recognizer->SetAuthorizationToken("token-abc");

    EXPECT_EQ(engine_->BagValue(PropertyId::SpeechServiceAuthorization_Token), "token-abc");
    EXPECT_EQ(recognizer->AuthorizationToken(), "token-abc");
}

TEST_F(TranslationRecognizerTest, NullAuthorizationTokenRejectedWithoutWrite) {
    auto recognizer = Create();
    EXPECT_CALL(*engine_, SetProperty(_, _, _)).Times(0);

    EXPECT_THROW(recognizer->SetAuthorizationToken(static_cast<const char*>(nullptr)), std::invalid_argument);
}

// --- events ---

TEST_F(TranslationRecognizerTest, RecognizedCallbackDeliversPayload) {
    auto recognizer = Create();
    std::string session_id;
    std::string text;
    std::string german;
    int calls = 0;
    recognizer->Recognized.Connect([&](const TranslationRecognitionEventArgs& e) {
        ++calls;
        session_id = e.SessionId();
        text = e.Result()->Text();
        german = e.Result()->Translations().at("de");
    });

    ASSERT_TRUE(engine_->Fire(RecognizerEvent::Recognized, TranslatedEvent("S-42", "What's the weather like?")));

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(session_id, "S-42");
    EXPECT_EQ(text, "What's the weather like?");
    EXPECT_EQ(german, "Wie ist das Wetter?");
    EXPECT_EQ(engine_->LiveEventCount(), 0u);
    EXPECT_EQ(engine_->LiveResultCount(), 0u);
}

TEST_F(TranslationRecognizerTest, CallbackWithoutSubscribersReleasesEvent) {
    auto recognizer = Create();
    ASSERT_TRUE(engine_->Fire(RecognizerEvent::Recognizing, TranslatedEvent("S-1", "what's")));
    EXPECT_EQ(engine_->LiveEventCount(), 0u);
}

TEST_F(TranslationRecognizerTest, SubscriberExceptionStaysInsideTrampoline) {
    auto recognizer = Create();
    int later_calls = 0;
    recognizer->Recognized.Connect([](const TranslationRecognitionEventArgs&) {
        throw std::runtime_error("subscriber failure");
    });
    recognizer->Recognized.Connect([&](const TranslationRecognitionEventArgs&) { ++later_calls; });

    EXPECT_NO_THROW(engine_->Fire(RecognizerEvent::Recognized, TranslatedEvent("S-1", "hello")));
    EXPECT_EQ(later_calls, 0);
    EXPECT_EQ(engine_->LiveEventCount(), 0u);
}

TEST_F(TranslationRecognizerTest, UnreadablePayloadIsLoggedNotThrown) {
    auto recognizer = Create();
    int calls = 0;
    recognizer->Recognized.Connect([&](const TranslationRecognitionEventArgs&) { ++calls; });

    FakeEvent without_result;
    without_result.has_result = false;
    EXPECT_NO_THROW(engine_->Fire(RecognizerEvent::Recognized, without_result));
    EXPECT_EQ(calls, 0);
}

TEST_F(TranslationRecognizerTest, CanceledCallbackCarriesDetails) {
    auto recognizer = Create();
    CancellationReason reason = CancellationReason::EndOfStream;
    CancellationErrorCode code = CancellationErrorCode::NoError;
    std::string details;
    recognizer->Canceled.Connect([&](const TranslationRecognitionCanceledEventArgs& e) {
        reason = e.Reason();
        code = e.ErrorCode();
        details = e.ErrorDetails();
    });

    FakeEvent event;
    event.has_result = true;
    event.result.reason = ResultReason::Canceled;
    event.result.cancellation_reason = CancellationReason::Error;
    event.result.error_code = CancellationErrorCode::AuthenticationFailure;
    event.result.error_details = "401 Unauthorized";
    ASSERT_TRUE(engine_->Fire(RecognizerEvent::Canceled, event));

    EXPECT_EQ(reason, CancellationReason::Error);
    EXPECT_EQ(code, CancellationErrorCode::AuthenticationFailure);
    EXPECT_EQ(details, "401 Unauthorized");
}

TEST_F(TranslationRecognizerTest, SynthesizingCallbackCarriesAudio) {
    auto recognizer = Create();
    size_t audio_size = 0;
    ResultReason reason = ResultReason::NoMatch;
    recognizer->Synthesizing.Connect([&](const TranslationSynthesisEventArgs& e) {
        audio_size = e.Result()->Audio().size();
        reason = e.Result()->Reason();
    });

    FakeEvent event;
    event.has_result = true;
    event.result.reason = ResultReason::SynthesizingAudio;
    event.result.audio.assign(320, 0x7f);
    ASSERT_TRUE(engine_->Fire(RecognizerEvent::Synthesizing, event));

    EXPECT_EQ(audio_size, 320u);
    EXPECT_EQ(reason, ResultReason::SynthesizingAudio);
}

TEST_F(TranslationRecognizerTest, SessionEventsAreRaised) {
    auto recognizer = Create();
    std::vector<std::string> seen;
    recognizer->SessionStarted.Connect([&](const SessionEventArgs& e) { seen.push_back("start:" + e.SessionId()); });
    recognizer->SessionStopped.Connect([&](const SessionEventArgs& e) { seen.push_back("stop:" + e.SessionId()); });

    FakeEvent event;
    event.session_id = "S-9";
    engine_->Fire(RecognizerEvent::SessionStarted, event);
    engine_->Fire(RecognizerEvent::SessionStopped, event);

    EXPECT_EQ(seen, (std::vector<std::string>{"start:S-9", "stop:S-9"}));
}

// --- async operations ---

TEST_F(TranslationRecognizerTest, RecognizeOnceCompletesAfterEngineDelay) {
    FakeResult result;
    result.result_id = "once-1";
    result.reason = ResultReason::TranslatedSpeech;
    result.text = "What's the weather like?";
    result.translations = {{"de", "Wie ist das Wetter?"}};
    engine_->SetRecognizeOnceResult(result, std::chrono::milliseconds(300));
    auto recognizer = Create();

    const auto started = std::chrono::steady_clock::now();
    auto future = recognizer->RecognizeOnceAsync();
    EXPECT_EQ(future.wait_for(std::chrono::milliseconds(50)), std::future_status::timeout);

    auto translated = future.get();
    EXPECT_GE(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(300));
    ASSERT_NE(translated, nullptr);
    EXPECT_EQ(translated->ResultId(), "once-1");
    EXPECT_EQ(translated->Text(), "What's the weather like?");
    EXPECT_EQ(translated->Translations().at("de"), "Wie ist das Wetter?");
    EXPECT_EQ(engine_->LiveResultCount(), 0u);
}

TEST_F(TranslationRecognizerTest, RecognizeOnceFailureSurfacesThroughFuture) {
    auto recognizer = Create();
    EXPECT_CALL(*engine_, RecognizeOnce(_, _)).WillOnce(Return(static_cast<NativeStatus>(0x00E)));

    auto future = recognizer->RecognizeOnceAsync();
    EXPECT_THROW(future.get(), SpeechError);
}

TEST_F(TranslationRecognizerTest, ContinuousRecognitionForwardsToEngine) {
    auto recognizer = Create();
    EXPECT_CALL(*engine_, StartContinuousRecognition(engine_->Handle())).Times(1);
    EXPECT_CALL(*engine_, StopContinuousRecognition(engine_->Handle())).Times(1);

    recognizer->StartContinuousRecognitionAsync().get();
    recognizer->StopContinuousRecognitionAsync().get();
}

TEST_F(TranslationRecognizerTest, KeywordRecognitionForwardsModel) {
    auto recognizer = Create();
    auto model = KeywordRecognitionModel::FromFile("computer.table");
    EXPECT_CALL(*engine_, StartKeywordRecognition(engine_->Handle(), _))
        .WillOnce([](RecoHandle, const KeywordRecognitionModel& m) {
            return m.FilePath() == "computer.table" ? kNativeOk : kNativeErrorInvalidArg;
        });
    EXPECT_CALL(*engine_, StopKeywordRecognition(engine_->Handle())).Times(1);

    recognizer->StartKeywordRecognitionAsync(model).get();
    recognizer->StopKeywordRecognitionAsync().get();
    EXPECT_THROW(recognizer->StartKeywordRecognitionAsync(nullptr), std::invalid_argument);
}

TEST_F(TranslationRecognizerTest, CloseWhileRecognizeOnceRunningThrows) {
    engine_->SetRecognizeOnceResult(FakeResult(), std::chrono::milliseconds(300));
    auto recognizer = Create();

    auto future = recognizer->RecognizeOnceAsync();
    ASSERT_TRUE(engine_->WaitForRecognizeOnceEntered(std::chrono::seconds(5)));

    EXPECT_THROW(recognizer->Close(), InvalidHandleError);
    EXPECT_FALSE(recognizer->IsClosed());

    future.get();
    EXPECT_NO_THROW(recognizer->Close());
    EXPECT_TRUE(recognizer->IsClosed());
}

TEST_F(TranslationRecognizerTest, AsyncOperationKeepsRecognizerAlive) {
    engine_->SetRecognizeOnceResult(FakeResult(), std::chrono::milliseconds(100));
    auto recognizer = Create();
    {
        auto future = recognizer->RecognizeOnceAsync();
        recognizer.reset();
        EXPECT_FALSE(engine_->RecognizerReleased());
        EXPECT_NE(future.get(), nullptr);
    }
    // 마지막 참조는 future 의 작업 상태가 들고 있다
    EXPECT_TRUE(engine_->RecognizerReleased());
}

// --- teardown ---

TEST_F(TranslationRecognizerTest, CloseUninstallsEveryCallbackAndReleasesHandles) {
    auto recognizer = Create();
    for (auto event : {RecognizerEvent::Recognizing, RecognizerEvent::Recognized, RecognizerEvent::Canceled,
                       RecognizerEvent::Synthesizing, RecognizerEvent::SessionStarted,
                       RecognizerEvent::SessionStopped, RecognizerEvent::SpeechStartDetected,
                       RecognizerEvent::SpeechEndDetected}) {
        EXPECT_CALL(*engine_, SetEventCallback(engine_->Handle(), event, IsNull(), IsNull())).Times(1);
    }

    recognizer->Close();

    EXPECT_TRUE(recognizer->IsClosed());
    EXPECT_EQ(engine_->InstalledCallbackCount(), 0u);
    EXPECT_TRUE(engine_->PropertyBagReleased());
    EXPECT_TRUE(engine_->RecognizerReleased());
}

TEST_F(TranslationRecognizerTest, SecondCloseMakesNoNativeCalls) {
    auto recognizer = Create();
    recognizer->Close();
    ::testing::Mock::VerifyAndClearExpectations(engine_.get());

    EXPECT_CALL(*engine_, SetEventCallback(_, _, _, _)).Times(0);
    EXPECT_CALL(*engine_, ReleaseRecognizer(_)).Times(0);
    EXPECT_CALL(*engine_, ReleasePropertyBag(_)).Times(0);
    EXPECT_CALL(*engine_, IsRecognizerValid(_)).Times(0);

    recognizer->Close();
    recognizer.reset();
}

TEST_F(TranslationRecognizerTest, OperationsAfterCloseFail) {
    auto recognizer = Create();
    recognizer->Close();

    EXPECT_THROW(recognizer->StartContinuousRecognitionAsync().get(), InvalidHandleError);
    EXPECT_THROW(recognizer->StopContinuousRecognitionAsync().get(), InvalidHandleError);
    EXPECT_THROW(recognizer->RecognizeOnceAsync().get(), InvalidHandleError);
    EXPECT_THROW(recognizer->TargetLanguages(), InvalidHandleError);
    EXPECT_THROW(recognizer->SetAuthorizationToken("late"), InvalidHandleError);
}

TEST_F(TranslationRecognizerTest, StaleCallbackAfterCloseRaisesNothing) {
    auto recognizer = Create();
    NativeCallback stale = engine_->InstalledCallback(RecognizerEvent::Recognized);
    void* context = engine_->InstalledContext(RecognizerEvent::Recognized);
    ASSERT_NE(stale, nullptr);

    std::atomic<int> calls{0};
    recognizer->Recognized.Connect([&](const TranslationRecognitionEventArgs&) { ++calls; });
    recognizer->Close();

    EventHandle event = engine_->MakeEvent(TranslatedEvent("S-late", "too late"));
    EXPECT_NO_THROW(stale(engine_->Handle(), event, context));
    EXPECT_EQ(calls.load(), 0);
}

TEST_F(TranslationRecognizerTest, StaleCallbackAfterDestructionRaisesNothing) {
    auto recognizer = Create();
    NativeCallback stale = engine_->InstalledCallback(RecognizerEvent::SessionStarted);
    void* context = engine_->InstalledContext(RecognizerEvent::SessionStarted);
    recognizer.reset();

    EXPECT_TRUE(engine_->RecognizerReleased());
    EXPECT_EQ(engine_->InstalledCallbackCount(), 0u);
    EXPECT_NO_THROW(stale(engine_->Handle(), engine_->MakeEvent(FakeEvent()), context));
}

TEST_F(TranslationRecognizerTest, CallbacksRacingCloseAndDestructionStayContained) {
    auto recognizer = Create();
    NativeCallback recognized = engine_->InstalledCallback(RecognizerEvent::Recognized);
    void* context = engine_->InstalledContext(RecognizerEvent::Recognized);
    ASSERT_NE(recognized, nullptr);

    std::atomic<bool> closed{false};
    std::atomic<int> delivered{0};
    std::atomic<int> late{0};
    recognizer->Recognized.Connect([&](const TranslationRecognitionEventArgs&) {
        ++delivered;
        if (closed.load()) ++late;
    });

    std::atomic<bool> stop{false};
    std::thread engine_thread([&]() {
        while (!stop.load()) {
            recognized(engine_->Handle(), engine_->MakeEvent(TranslatedEvent("S-race", "hello")), context);
            std::this_thread::sleep_for(std::chrono::microseconds(200));
        }
    });

    // 엔진 스레드가 실제로 이벤트를 전달하는 중에 Close()
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (delivered.load() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::yield();
    }
    ASSERT_GT(delivered.load(), 0);

    EXPECT_NO_THROW(recognizer->Close());
    closed.store(true);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_NO_THROW(recognizer.reset());
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    stop.store(true);
    engine_thread.join();

    // Close() 가 반환될 때 이미 진행 중이던 전달 하나까지만 허용
    EXPECT_LE(late.load(), 1);
    EXPECT_TRUE(engine_->RecognizerReleased());
}

TEST_F(TranslationRecognizerTest, EventDuringDestructionIsStillReleased) {
    auto recognizer = Create();
    NativeCallback recognized = engine_->InstalledCallback(RecognizerEvent::Recognized);
    void* context = engine_->InstalledContext(RecognizerEvent::Recognized);
    ASSERT_NE(recognized, nullptr);

    std::atomic<int> calls{0};
    recognizer->Recognized.Connect([&](const TranslationRecognitionEventArgs&) { ++calls; });

    // Fires while the destructor uninstalls callbacks: the weak reference has
    // expired but the context token is not revoked yet.
    EXPECT_CALL(*engine_, SetEventCallback(_, _, _, _)).Times(AnyNumber());
    EXPECT_CALL(*engine_, SetEventCallback(_, RecognizerEvent::Recognizing, IsNull(), IsNull()))
        .WillOnce(DoAll(InvokeWithoutArgs([&]() {
                            recognized(engine_->Handle(),
                                       engine_->MakeEvent(TranslatedEvent("S-dying", "bye")), context);
                        }),
                        Return(kNativeOk)));

    recognizer.reset();

    EXPECT_EQ(calls.load(), 0);
    EXPECT_EQ(engine_->LiveEventCount(), 0u);
    EXPECT_TRUE(engine_->RecognizerReleased());
}
