// translation_bridge/tests/recognizers_test.cpp

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "intent_recognizer.h"
#include "mock_native_engine.h"
#include "speech_recognizer.h"

using namespace speechbridge;
using speechbridge::testing_support::FakeEvent;
using speechbridge::testing_support::FakeResult;
using speechbridge::testing_support::MockNativeEngine;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

class SpeechRecognizerTest : public ::testing::Test {
protected:
    std::shared_ptr<NiceMock<MockNativeEngine>> engine_ = std::make_shared<NiceMock<MockNativeEngine>>();
    std::shared_ptr<SpeechConfig> config_ = SpeechConfig::FromSubscription("test-key", "westus");
};

TEST_F(SpeechRecognizerTest, InstallsSpeechAndSessionCallbacksOnly) {
    auto recognizer = SpeechRecognizer::FromConfig(engine_, config_);

    EXPECT_EQ(engine_->CreatedKind(), RecognizerKind::Speech);
    EXPECT_EQ(engine_->InstalledCallbackCount(), 7u);
    EXPECT_EQ(engine_->InstalledCallback(RecognizerEvent::Synthesizing), nullptr);
}

TEST_F(SpeechRecognizerTest, RecognizedEventCarriesResult) {
    auto recognizer = SpeechRecognizer::FromConfig(engine_, config_);
    std::string text;
    uint64_t duration = 0;
    recognizer->Recognized.Connect([&](const SpeechRecognitionEventArgs& e) {
        text = e.Result()->Text();
        duration = e.Result()->Duration();
    });

    FakeEvent event;
    event.has_result = true;
    event.result.text = "What's the weather like?";
    event.result.duration = 15000000;
    ASSERT_TRUE(engine_->Fire(RecognizerEvent::Recognized, event));

    EXPECT_EQ(text, "What's the weather like?");
    EXPECT_EQ(duration, 15000000u);
}

TEST_F(SpeechRecognizerTest, SpeechStartAndEndCarryOffset) {
    auto recognizer = SpeechRecognizer::FromConfig(engine_, config_);
    uint64_t start = 0;
    uint64_t end = 0;
    recognizer->SpeechStartDetected.Connect([&](const RecognitionEventArgs& e) { start = e.Offset(); });
    recognizer->SpeechEndDetected.Connect([&](const RecognitionEventArgs& e) { end = e.Offset(); });

    FakeEvent event;
    event.offset = 500;
    engine_->Fire(RecognizerEvent::SpeechStartDetected, event);
    event.offset = 9000;
    engine_->Fire(RecognizerEvent::SpeechEndDetected, event);

    EXPECT_EQ(start, 500u);
    EXPECT_EQ(end, 9000u);
}

TEST_F(SpeechRecognizerTest, RecognizeOnceReturnsCanceledDetails) {
    FakeResult canceled;
    canceled.reason = ResultReason::Canceled;
    canceled.cancellation_reason = CancellationReason::Error;
    canceled.error_code = CancellationErrorCode::ConnectionFailure;
    canceled.error_details = "connection refused";
    engine_->SetRecognizeOnceResult(canceled);
    auto recognizer = SpeechRecognizer::FromConfig(engine_, config_);

    auto result = recognizer->RecognizeOnceAsync().get();

    ASSERT_NE(result->Cancellation(), nullptr);
    EXPECT_EQ(result->Cancellation()->ErrorCode(), CancellationErrorCode::ConnectionFailure);
    EXPECT_EQ(result->Cancellation()->ErrorDetails(), "connection refused");
}

TEST_F(SpeechRecognizerTest, RecognizedResultHasNoCancellation) {
    FakeResult recognized;
    recognized.text = "hello";
    engine_->SetRecognizeOnceResult(recognized);
    auto recognizer = SpeechRecognizer::FromConfig(engine_, config_);

    auto result = recognizer->RecognizeOnceAsync().get();
    EXPECT_EQ(result->Reason(), ResultReason::RecognizedSpeech);
    EXPECT_EQ(result->Cancellation(), nullptr);
}

TEST_F(SpeechRecognizerTest, NamedPropertiesReachTheRecognizer) {
    config_->SetProperty("SPEECH-CustomSetting", "42");
    auto recognizer = SpeechRecognizer::FromConfig(engine_, config_);

    EXPECT_EQ(recognizer->Properties().GetProperty("SPEECH-CustomSetting"), "42");
    EXPECT_EQ(recognizer->Properties().GetProperty("missing", "fallback"), "fallback");
}


class IntentRecognizerTest : public ::testing::Test {
protected:
    std::shared_ptr<NiceMock<MockNativeEngine>> engine_ = std::make_shared<NiceMock<MockNativeEngine>>();
    std::shared_ptr<SpeechConfig> config_ = SpeechConfig::FromSubscription("test-key", "westus");
};

TEST_F(IntentRecognizerTest, AddIntentForwardsPhraseAndId) {
    auto recognizer = IntentRecognizer::FromConfig(engine_, config_);
    EXPECT_EQ(engine_->CreatedKind(), RecognizerKind::Intent);

    EXPECT_CALL(*engine_, AddPhraseIntent(engine_->Handle(), "turn on the lights", "Lights.On")).Times(1);
    recognizer->AddIntent("turn on the lights", "Lights.On");
}

TEST_F(IntentRecognizerTest, EmptyIntentIdUsesPhrase) {
    auto recognizer = IntentRecognizer::FromConfig(engine_, config_);

    EXPECT_CALL(*engine_, AddPhraseIntent(_, "stop", "stop")).Times(1);
    recognizer->AddIntent("stop", "");
}

TEST_F(IntentRecognizerTest, AddIntentValidatesInputAndState) {
    auto recognizer = IntentRecognizer::FromConfig(engine_, config_);
    EXPECT_THROW(recognizer->AddIntent("", "Empty"), std::invalid_argument);

    EXPECT_CALL(*engine_, AddPhraseIntent(_, _, _)).WillOnce(Return(kNativeErrorInvalidArg));
    EXPECT_THROW(recognizer->AddIntent("lights", "Lights"), SpeechError);

    recognizer->Close();
    EXPECT_THROW(recognizer->AddIntent("lights", "Lights"), InvalidHandleError);
}

TEST_F(IntentRecognizerTest, CloseWhileAddIntentRunningThrows) {
    auto recognizer = IntentRecognizer::FromConfig(engine_, config_);

    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    EXPECT_CALL(*engine_, AddPhraseIntent(_, "lights", "Lights"))
        .WillOnce(Invoke([&](RecoHandle, const std::string&, const std::string&) {
            entered.set_value();
            released.wait();
            return kNativeOk;
        }));

    std::thread adder([&]() { recognizer->AddIntent("lights", "Lights"); });
    ASSERT_EQ(entered.get_future().wait_for(std::chrono::seconds(5)), std::future_status::ready);

    // 네이티브 호출 도중에는 핸들을 해제하지 않음
    EXPECT_THROW(recognizer->Close(), InvalidHandleError);
    EXPECT_FALSE(recognizer->IsClosed());
    EXPECT_FALSE(engine_->RecognizerReleased());

    release.set_value();
    adder.join();

    EXPECT_NO_THROW(recognizer->Close());
    EXPECT_TRUE(engine_->RecognizerReleased());
}

TEST_F(IntentRecognizerTest, RecognizedEventCarriesIntentId) {
    auto recognizer = IntentRecognizer::FromConfig(engine_, config_);
    std::string intent_id;
    std::string formatted;
    recognizer->Recognized.Connect([&](const IntentRecognitionEventArgs& e) {
        intent_id = e.Result()->IntentId();
        formatted = e.ToString();
    });

    FakeEvent event;
    event.session_id = "abc";
    event.has_result = true;
    event.result.result_id = "r1";
    event.result.reason = ResultReason::RecognizedIntent;
    event.result.text = "turn on";
    event.result.intent_id = "Lights";
    ASSERT_TRUE(engine_->Fire(RecognizerEvent::Recognized, event));

    EXPECT_EQ(intent_id, "Lights");
    EXPECT_EQ(formatted, "SessionId:abc ResultId:r1 Status:RecognizedIntent IntentId:<Lights> Recognized text:<turn on>.");
}

TEST_F(IntentRecognizerTest, RecognizeOnceReturnsIntentResult) {
    FakeResult result;
    result.reason = ResultReason::RecognizedIntent;
    result.text = "turn on the lights";
    result.intent_id = "Lights.On";
    result.intent_json = "{\"topScoringIntent\":{\"intent\":\"Lights.On\"}}";
    engine_->SetRecognizeOnceResult(result);
    auto recognizer = IntentRecognizer::FromConfig(engine_, config_);

    auto intent = recognizer->RecognizeOnceAsync().get();
    EXPECT_EQ(intent->IntentId(), "Lights.On");
    EXPECT_EQ(intent->IntentJson(), result.intent_json);
    EXPECT_EQ(intent->Text(), "turn on the lights");
}
