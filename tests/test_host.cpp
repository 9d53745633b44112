#include <gtest/gtest.h>
#include <httplib.h>
#include <dock/error_types.h>
#include <dock/host.h>
#include <dock/server.h>
#include <thread>
#include "fake_engine.h"
#include "test_helpers.h"

using namespace dock;
using namespace dock::testing;

namespace {

constexpr uint64_t GB = 1024ull * 1024 * 1024;

SystemSpecs test_machine() {
    SystemSpecs specs;
    specs.os_name = "Linux";
    specs.os_version = "6.1.0 (Test 1)";
    specs.cpu_model = "Test CPU";
    specs.cpu_cores = 8;
    specs.total_memory = 16 * GB;
    specs.used_memory = 4 * GB;
    return specs;
}

json test_catalog() {
    auto entry = [](const std::string& id, const std::string& task) {
        return json{
            {"id", id},
            {"name", id},
            {"description", "test model"},
            {"version", "1"},
            {"task_type", task},
            {"source", {{"url", "http://127.0.0.1:9/" + id + ".gguf"}, {"filename", id + ".gguf"}}},
            {"dependencies", json::array()}
        };
    };
    json other = entry("other-chat", "text-generation");
    other["requirements"] = {{"min_ram", 64ull * GB}, {"min_vram", 0}, {"disk_space", 0}};
    return json{{"models", {entry("tiny-chat", "text-generation"), other}}};
}

size_t count_occurrences(const std::string& haystack, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) {
        count++;
    }
    return count;
}

// The final "event: ...\ndata: ...\n\n" frame of an SSE body
std::string last_frame(const std::string& body) {
    size_t end = body.rfind("\n\n");
    if (end == std::string::npos) {
        return "";
    }
    size_t start = body.rfind("\n\n", end == 0 ? 0 : end - 1);
    start = start == std::string::npos ? 0 : start + 2;
    return body.substr(start, end - start);
}

json frame_data(const std::string& frame) {
    size_t pos = frame.find("data: ");
    return pos == std::string::npos ? json() : json::parse(frame.substr(pos + 6));
}

} // namespace

class HostTest : public ::testing::Test {
protected:
    void SetUp() override {
        write_file(dir_ / "catalog.json", test_catalog().dump());

        engine_state_ = std::make_shared<FakeEngineState>();
        engine_state_->script = {5, 6, 7, FAKE_EOS};

        HostOptions options;
        options.data_dir = dir_ / "data";
        options.catalog_path = dir_ / "catalog.json";
        options.python = dir_ / "no-python";
        options.system_info = std::make_shared<StaticSystemInfo>(test_machine());
        host_ = std::make_unique<Host>(options, fake_engine_factory(engine_state_));
    }

    void install_weights(const std::string& model_id) {
        const ModelDescriptor& model = host_->catalog().get(model_id);
        write_file(host_->store().weights_path(model), "weights");
        fs::create_directories(host_->store().environment_dir());
        host_->store().mark_dependencies_installed(model);
    }

    TempDir dir_;
    std::shared_ptr<FakeEngineState> engine_state_;
    std::unique_ptr<Host> host_;
};

TEST_F(HostTest, ListsCatalogWithInstallationState) {
    install_weights("tiny-chat");

    json models = host_->list_models();
    ASSERT_EQ(models.size(), 2u);
    EXPECT_EQ(models[0]["id"], "tiny-chat");
    EXPECT_EQ(models[0]["state"], "installed");
    EXPECT_EQ(models[1]["id"], "other-chat");
    EXPECT_EQ(models[1]["state"], "absent");
}

TEST_F(HostTest, WeightsWithoutDepsMarkerAreIncomplete) {
    const ModelDescriptor& model = host_->catalog().get("tiny-chat");
    write_file(host_->store().weights_path(model), "weights");
    fs::create_directories(host_->store().environment_dir());

    EXPECT_EQ(host_->list_models()[0]["state"], "incomplete");
}

TEST_F(HostTest, ListFlagsModelsThisMachineCannotHold) {
    json models = host_->list_models();
    ASSERT_EQ(models.size(), 2u);

    EXPECT_EQ(models[0]["compatible"], true);
    EXPECT_EQ(models[0]["reason"], "");

    EXPECT_EQ(models[1]["compatible"], false);
    EXPECT_NE(models[1]["reason"].get<std::string>().find("Insufficient RAM"), std::string::npos);
}

TEST_F(HostTest, InstallingUnknownModelEmitsErrorEvent) {
    RecordingSink sink;
    EXPECT_THROW(host_->install("llama-99b", sink), NotFoundException);

    auto events = sink.progress();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].status, InstallStatus::ERROR);
    EXPECT_EQ(events[0].model_id, "llama-99b");
}

TEST_F(HostTest, LoadAndGenerate) {
    install_weights("tiny-chat");
    host_->load("tiny-chat");

    RecordingSink sink;
    GenerationResult result = host_->generate("hello", sink);
    EXPECT_EQ(result.text, "t5t6t7");

    json status = host_->status();
    EXPECT_EQ(status["session"]["loaded"], true);
    EXPECT_EQ(status["session"]["model"], "tiny-chat");
    EXPECT_EQ(status["service"]["state"], "idle");
    EXPECT_EQ(status["service"]["port"], 0);
}

TEST_F(HostTest, GenerateWithoutModelThrowsAfterFinished) {
    RecordingSink sink;
    EXPECT_THROW(host_->generate("hello", sink), ModelNotLoadedException);
    EXPECT_EQ(sink.finished().size(), 1u);
}

TEST_F(HostTest, RemoveRefusesLoadedModel) {
    install_weights("tiny-chat");
    install_weights("other-chat");
    host_->load("tiny-chat");

    EXPECT_THROW(host_->remove("tiny-chat"), InvalidRequestException);
    EXPECT_TRUE(host_->store().has_weights(host_->catalog().get("tiny-chat")));

    host_->remove("other-chat");
    EXPECT_FALSE(host_->store().has_weights(host_->catalog().get("other-chat")));
    EXPECT_THROW(host_->remove("other-chat"), NotFoundException);
}

TEST_F(HostTest, LoadingUninstalledModelKeepsCurrentOne) {
    install_weights("tiny-chat");
    host_->load("tiny-chat");

    EXPECT_THROW(host_->load("other-chat"), NotFoundException);
    json status = host_->status();
    EXPECT_EQ(status["session"]["loaded"], true);
    EXPECT_EQ(status["session"]["model"], "tiny-chat");
}

TEST_F(HostTest, StatusFollowsSessionUnderConcurrentLoads) {
    install_weights("tiny-chat");
    install_weights("other-chat");

    std::thread a([this]() {
        for (int i = 0; i < 20; ++i) {
            host_->load("tiny-chat");
        }
    });
    std::thread b([this]() {
        for (int i = 0; i < 20; ++i) {
            host_->load("other-chat");
        }
    });
    a.join();
    b.join();

    json status = host_->status();
    std::string reported = status["session"]["model"];
    ASSERT_FALSE(reported.empty());
    EXPECT_EQ(host_->store().weights_path(host_->catalog().get(reported)),
              host_->session().loaded_model_path());
}

TEST_F(HostTest, FailedLoadClearsReportedModel) {
    install_weights("tiny-chat");
    host_->load("tiny-chat");

    // The fake engine refuses any path containing "broken"
    EXPECT_THROW(host_->session().load_model(dir_ / "broken.gguf", TaskType::TEXT_GENERATION),
                 ModelLoadException);

    json status = host_->status();
    EXPECT_EQ(status["session"]["loaded"], false);
    EXPECT_EQ(status["session"]["model"], "");
}

TEST_F(HostTest, SystemSpecsComeFromSystemInfo) {
    const SystemSpecs& specs = host_->system_specs();
    EXPECT_EQ(specs.cpu_model, "Test CPU");
    EXPECT_EQ(specs.total_memory, 16 * GB);
}

class ServerTest : public HostTest {
protected:
    void SetUp() override {
        HostTest::SetUp();
        server_ = std::make_unique<Server>(*host_, 0, "127.0.0.1", "info");
        port_ = server_->bind_to_any_port();
        thread_ = std::thread([this]() { server_->run(); });

        httplib::Client ready("127.0.0.1", port_);
        for (int i = 0; i < 200; ++i) {
            if (ready.Get("/api/v1/health")) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    void TearDown() override {
        server_->stop();
        if (thread_.joinable()) {
            thread_.join();
        }
        server_.reset();
    }

    httplib::Client client() { return httplib::Client("127.0.0.1", port_); }

    std::unique_ptr<Server> server_;
    int port_ = 0;
    std::thread thread_;
};

TEST_F(ServerTest, HealthReportsVersion) {
    auto res = client().Get("/api/v1/health");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    json body = json::parse(res->body);
    EXPECT_EQ(body["status"], "ok");
    EXPECT_TRUE(body.contains("version"));
}

TEST_F(ServerTest, ModelsEndpointListsCatalog) {
    auto res = client().Get("/api/v1/models");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(json::parse(res->body)["models"].size(), 2u);
}

TEST_F(ServerTest, ErrorsUseErrorResponseShape) {
    auto res = client().Post("/api/v1/launch", R"({"model": "llama-99b"})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
    EXPECT_EQ(json::parse(res->body)["error"]["code"], "not_found");

    res = client().Post("/api/v1/load", "{not json", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_EQ(json::parse(res->body)["error"]["code"], "invalid_request");

    res = client().Get("/api/v1/nowhere");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
    EXPECT_EQ(json::parse(res->body)["error"]["code"], "not_found");
}

TEST_F(ServerTest, GenerateStreamsServerSentEvents) {
    install_weights("tiny-chat");
    auto res = client().Post("/api/v1/load", R"({"model": "tiny-chat"})", "application/json");
    ASSERT_TRUE(res);
    ASSERT_EQ(res->status, 200);

    res = client().Post("/api/v1/generate", R"({"prompt": "hello"})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(count_occurrences(res->body, "event: chat-token\n"), 3u);
    EXPECT_EQ(count_occurrences(res->body, "event: chat-finished\n"), 1u);
    EXPECT_NE(res->body.find("data: {\"token\":\"t5\"}"), std::string::npos);
    EXPECT_LT(res->body.find("event: chat-token"), res->body.find("event: chat-finished"));
}

TEST_F(ServerTest, InstallOfUnknownModelStreamsErrors) {
    auto res = client().Post("/api/v1/install", R"({"model": "llama-99b"})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(count_occurrences(res->body, "event: install-progress\n"), 1u);
    EXPECT_EQ(res->body.find("event: error\n"), std::string::npos);

    // The terminal event is the last frame and carries the error itself
    std::string frame = last_frame(res->body);
    EXPECT_EQ(frame.rfind("event: install-progress\n", 0), 0u);
    json data = frame_data(frame);
    EXPECT_EQ(data["status"], "error");
    EXPECT_EQ(data["error"]["code"], "not_found");
}

TEST_F(ServerTest, GenerateErrorEndsWithChatFinished) {
    auto res = client().Post("/api/v1/generate", R"({"prompt": "hello"})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->body.find("event: error\n"), std::string::npos);

    std::string frame = last_frame(res->body);
    EXPECT_EQ(frame.rfind("event: chat-finished\n", 0), 0u);
    json data = frame_data(frame);
    EXPECT_EQ(data["reason"], "error");
    EXPECT_EQ(data["error"]["code"], "model_not_loaded");
}

TEST_F(ServerTest, SystemEndpointReportsSpecs) {
    auto res = client().Get("/api/v1/system");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    json body = json::parse(res->body);
    EXPECT_EQ(body["cpu_model"], "Test CPU");
    EXPECT_EQ(body["cpu_cores"], 8);
    EXPECT_EQ(body["total_memory"], 16 * GB);
    EXPECT_TRUE(body["gpus"].is_array());
}

TEST_F(ServerTest, ShutdownStopsServer) {
    auto res = client().Post("/api/v1/shutdown", "", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    thread_.join();
    EXPECT_FALSE(server_->is_running());
}
