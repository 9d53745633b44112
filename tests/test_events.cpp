#include <gtest/gtest.h>
#include <dock/console_sink.h>
#include <dock/error_types.h>
#include <dock/event_channel.h>
#include <dock/events.h>
#include <atomic>
#include <sstream>
#include <thread>

using namespace dock;

TEST(EventsTest, InstallProgressPayload) {
    InstallProgress progress;
    progress.model_id = "tiny-chat";
    progress.status = InstallStatus::INSTALLING_DEPS;
    progress.progress = 100;
    progress.message = "Installing dependencies...";

    json j = progress;
    EXPECT_EQ(j["model_id"], "tiny-chat");
    EXPECT_EQ(j["status"], "installing_deps");
    EXPECT_EQ(j["progress"], 100);
    EXPECT_EQ(j["message"], "Installing dependencies...");
    EXPECT_EQ(j["indeterminate"], false);
    EXPECT_FALSE(progress.is_terminal());

    progress.status = InstallStatus::COMPLETED;
    EXPECT_TRUE(progress.is_terminal());
}

TEST(EventsTest, ChatFinishedPayload) {
    ChatFinished finished;
    finished.reason = FinishReason::MAX_TOKENS;
    finished.tokens = 200;

    json j = finished;
    EXPECT_EQ(j["reason"], "max_tokens");
    EXPECT_EQ(j["tokens"], 200);

    EXPECT_EQ(json(ChatToken{"hello"})["token"], "hello");
    EXPECT_FALSE(j.contains("error"));
}

TEST(EventsTest, TerminalErrorEventsCarryErrorObject) {
    ChatFinished finished;
    finished.reason = FinishReason::ERROR;
    finished.error_code = "model_not_loaded";
    finished.error_message = "No model loaded";

    json chat = finished;
    EXPECT_EQ(chat["reason"], "error");
    EXPECT_EQ(chat["error"]["code"], "model_not_loaded");
    EXPECT_EQ(chat["error"]["message"], "No model loaded");

    InstallProgress progress;
    progress.model_id = "tiny-chat";
    progress.status = InstallStatus::ERROR;
    progress.message = "Failed to download";
    progress.error_code = "download_error";

    json install = progress;
    EXPECT_EQ(install["status"], "error");
    EXPECT_EQ(install["error"]["code"], "download_error");
    EXPECT_EQ(install["error"]["message"], "Failed to download");
}

TEST(ErrorResponseTest, CarriesCodeAndMessage) {
    HealthCheckTimeoutException error("worker", 30);
    json j = ErrorResponse::from_exception(error);
    EXPECT_EQ(j["error"]["code"], "health_check_timeout");
    EXPECT_EQ(j["error"]["message"], error.what());
    EXPECT_EQ(ErrorResponse::http_status(error.code()), 504);
}

TEST(ErrorResponseTest, PlainExceptionIsInternal) {
    std::runtime_error error("boom");
    json j = ErrorResponse::from_exception(error);
    EXPECT_EQ(j["error"]["code"], "internal_error");
    EXPECT_EQ(j["error"]["message"], "boom");
}

TEST(ErrorResponseTest, DispatchesThroughBaseReference) {
    NotFoundException not_found("Model not found: x");
    const std::exception& base = not_found;
    EXPECT_EQ(ErrorResponse::from_exception(base)["error"]["code"], "not_found");
    EXPECT_EQ(ErrorResponse::http_status(ErrorCode::NOT_FOUND), 404);
    EXPECT_EQ(ErrorResponse::http_status(ErrorCode::INVALID_REQUEST), 400);
}

TEST(ErrorResponseTest, DependencyErrorKeepsOutput) {
    DependencyInstallException error("Package install failed (exit code 1)", "No matching distribution");
    EXPECT_EQ(error.output(), "No matching distribution");
    EXPECT_NE(std::string(error.what()).find("No matching distribution"), std::string::npos);
}

TEST(EventChannelTest, DeliversInOrderAcrossThreads) {
    EventChannel channel;

    std::thread producer([&channel]() {
        for (int i = 0; i < 50; ++i) {
            channel.on_chat_token(ChatToken{std::to_string(i)});
        }
        ChatFinished finished;
        finished.tokens = 50;
        channel.on_chat_finished(finished);
        channel.close();
    });

    std::vector<Event> events;
    Event event;
    while (channel.pop(event)) {
        events.push_back(event);
    }
    producer.join();

    ASSERT_EQ(events.size(), 51u);
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(events[i].name, EVENT_CHAT_TOKEN);
        EXPECT_EQ(events[i].data["token"], std::to_string(i));
    }
    EXPECT_EQ(events.back().name, EVENT_CHAT_FINISHED);
    EXPECT_EQ(events.back().data["tokens"], 50);
}

TEST(EventChannelTest, CancelRefusesFurtherEvents) {
    EventChannel channel;
    EXPECT_TRUE(channel.on_chat_token(ChatToken{"a"}));
    channel.cancel();
    EXPECT_TRUE(channel.is_cancelled());
    EXPECT_FALSE(channel.on_chat_token(ChatToken{"b"}));

    InstallProgress progress;
    EXPECT_FALSE(channel.on_install_progress(progress));
}

TEST(EventChannelTest, TracksTerminalEvents) {
    EventChannel channel;
    InstallProgress progress;
    progress.status = InstallStatus::DOWNLOADING;
    channel.on_install_progress(progress);
    channel.on_chat_token(ChatToken{"a"});
    EXPECT_FALSE(channel.terminal_sent());

    progress.status = InstallStatus::ERROR;
    channel.on_install_progress(progress);
    EXPECT_TRUE(channel.terminal_sent());

    EventChannel chat;
    chat.on_chat_finished(ChatFinished());
    EXPECT_TRUE(chat.terminal_sent());
}

TEST(EventChannelTest, FormatsServerSentEvents) {
    Event event{EVENT_CHAT_TOKEN, json{{"token", "hi"}}};
    EXPECT_EQ(event.to_sse(), "event: chat-token\ndata: {\"token\":\"hi\"}\n\n");
}

TEST(ConsoleEventSinkTest, InterruptStopsTheOperation) {
    std::ostringstream out;
    std::atomic<bool> interrupted(false);
    ConsoleEventSink sink(out, false, &interrupted);

    InstallProgress progress;
    progress.model_id = "tiny-chat";
    progress.progress = 10;
    EXPECT_TRUE(sink.on_install_progress(progress));
    EXPECT_TRUE(sink.on_chat_token(ChatToken{"hi"}));

    interrupted = true;
    progress.progress = 20;
    EXPECT_FALSE(sink.on_install_progress(progress));
    EXPECT_FALSE(sink.on_chat_token(ChatToken{" there"}));
    EXPECT_NE(out.str().find("hi there"), std::string::npos);
}

TEST(ConsoleEventSinkTest, WithoutFlagAcceptsEverything) {
    std::ostringstream out;
    ConsoleEventSink sink(out);
    EXPECT_TRUE(sink.on_chat_token(ChatToken{"a"}));

    ChatFinished finished;
    sink.on_chat_finished(finished);
    EXPECT_EQ(out.str(), "a\n");
}
