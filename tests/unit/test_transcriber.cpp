#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "stt/transcriber.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include "mock_inference_gateway.hpp"
#include "scripted_gateway.hpp"
#include <memory>
#include <vector>

using namespace streamscribe;
using namespace streamscribe::stt;
using fixtures::MockInferenceGateway;
using fixtures::ScriptedGateway;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SizeIs;

class TranscriberTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::setLevel(utils::LogLevel::OFF);
        gateway_ = std::make_shared<NiceMock<MockInferenceGateway>>();
        gateway_->succeedByDefault();
    }

    std::shared_ptr<NiceMock<MockInferenceGateway>> gateway_;
};

TEST_F(TranscriberTest, LoadsModelWithArchAndOptions) {
    EXPECT_CALL(*gateway_, loadModel("model.bin", ModelArch::TINY_STREAMING,
                                     ElementsAre(Field(&TranscriberOption::name, "n_threads")), _));

    Transcriber transcriber(gateway_, "model.bin", ModelArch::TINY_STREAMING, {{"n_threads", "2"}});

    EXPECT_EQ(transcriber.modelHandle(), 1);
    EXPECT_EQ(transcriber.arch(), ModelArch::TINY_STREAMING);
    EXPECT_EQ(transcriber.modelPath(), "model.bin");
    EXPECT_EQ(transcriber.version(), GATEWAY_HEADER_VERSION);
}

TEST_F(TranscriberTest, LoadFailureThrows) {
    EXPECT_CALL(*gateway_, loadModel(_, _, _, _)).WillOnce(Return(-4));
    EXPECT_CALL(*gateway_, freeModel(_)).Times(0);

    try {
        Transcriber transcriber(gateway_, "missing.bin");
        FAIL() << "expected GatewayException";
    } catch (const utils::GatewayException& e) {
        EXPECT_EQ(e.getCode(), utils::GatewayErrorCode::CUSTOM);
        EXPECT_EQ(e.getStatus(), -4);
    }
}

TEST_F(TranscriberTest, EmptyOneShotDoesNotCallGateway) {
    Transcriber transcriber(gateway_, "model.bin");

    EXPECT_CALL(*gateway_, transcribeOneShot(_, _, _, _, _)).Times(0);
    Transcript transcript = transcriber.transcribeWithoutStreaming({});
    EXPECT_TRUE(transcript.empty());
}

TEST_F(TranscriberTest, OneShotForwardsSamplesAndRate) {
    Transcriber transcriber(gateway_, "model.bin");

    EXPECT_CALL(*gateway_, transcribeOneShot(1, SizeIs(800), 8000, 0u, _));
    transcriber.transcribeWithoutStreaming(std::vector<float>(800, 0.0f), 8000);
}

TEST_F(TranscriberTest, OneShotFailureThrows) {
    Transcriber transcriber(gateway_, "model.bin");

    EXPECT_CALL(*gateway_, transcribeOneShot(_, _, _, _, _)).WillOnce(Return(STATUS_UNKNOWN_ERROR));
    EXPECT_THROW(transcriber.transcribeWithoutStreaming(std::vector<float>(10, 0.0f)),
                 utils::GatewayException);
    EXPECT_THROW(transcriber.transcribeWithoutStreaming(std::vector<float>(10, 0.0f), -1),
                 utils::GatewayException);
}

TEST_F(TranscriberTest, DefaultStreamIsCreatedLazilyOnce) {
    Transcriber transcriber(gateway_, "model.bin");
    EXPECT_FALSE(transcriber.hasDefaultStream());

    EXPECT_CALL(*gateway_, createStream(1, _, _)).Times(1);
    transcriber.addListener([](const TranscriptEvent&) {});
    transcriber.start();
    transcriber.addAudio(std::vector<float>(1600, 0.0f));

    EXPECT_TRUE(transcriber.hasDefaultStream());
    EXPECT_TRUE(transcriber.defaultStream().isRunning());
    EXPECT_EQ(transcriber.defaultStream().listenerCount(), 1u);

    transcriber.stop();
    EXPECT_EQ(transcriber.defaultStream().state(), SessionState::STOPPED);
}

TEST_F(TranscriberTest, CloseReleasesStreamsBeforeModelOnce) {
    Transcriber transcriber(gateway_, "model.bin");
    auto session = transcriber.createStream();
    session->start();

    {
        InSequence seq;
        EXPECT_CALL(*gateway_, freeStream(1, 7)).Times(1);
        EXPECT_CALL(*gateway_, freeModel(1)).Times(1);
    }

    transcriber.close();
    transcriber.close();

    EXPECT_TRUE(transcriber.isClosed());
    EXPECT_TRUE(session->isClosed());
}

TEST_F(TranscriberTest, OperationsAfterCloseThrow) {
    Transcriber transcriber(gateway_, "model.bin");
    transcriber.close();

    EXPECT_THROW(transcriber.transcribeWithoutStreaming({0.1f}), utils::SessionStateException);
    EXPECT_THROW(transcriber.createStream(), utils::SessionStateException);
    EXPECT_THROW(transcriber.start(), utils::SessionStateException);
}

TEST_F(TranscriberTest, DestructorFreesModel) {
    EXPECT_CALL(*gateway_, freeModel(1)).Times(1);
    {
        Transcriber transcriber(gateway_, "model.bin");
    }
}

TEST_F(TranscriberTest, CloseReportsFreeFailure) {
    utils::ErrorHandler::getInstance().clearErrorHistory();
    Transcriber transcriber(gateway_, "model.bin");

    EXPECT_CALL(*gateway_, freeModel(_)).WillOnce(Return(STATUS_INVALID_HANDLE));
    EXPECT_NO_THROW(transcriber.close());
    EXPECT_EQ(utils::ErrorHandler::getInstance().getErrorCount(utils::ErrorCategory::MODEL_LOADING), 1u);
}

TEST(TranscriberScriptedTest, OneShotReturnsCompletedLines) {
    utils::Logger::setLevel(utils::LogLevel::OFF);
    auto gateway = std::make_shared<ScriptedGateway>();
    gateway->scriptOneShot({"first sentence", "second sentence"});

    Transcriber transcriber(gateway, "model.bin");
    Transcript transcript = transcriber.transcribeWithoutStreaming(std::vector<float>(32000, 0.0f));

    ASSERT_EQ(transcript.size(), 2u);
    EXPECT_EQ(transcript.lines[0].text, "first sentence");
    EXPECT_TRUE(transcript.lines[0].isComplete);
    EXPECT_FLOAT_EQ(transcript.lines[1].startTime, 1.0f);
    EXPECT_NE(transcript.lines[0].lineId, transcript.lines[1].lineId);
    EXPECT_EQ(transcript.text(), "first sentence\nsecond sentence");

    transcriber.close();
    EXPECT_EQ(gateway->loadedModels(), 0u);
}
