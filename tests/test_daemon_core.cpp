#include <catch2/catch_test_macros.hpp>

#include "daemon_core.hpp"
#include "platform/linux/posix_process.hpp"
#include "test_helpers.hpp"

#include <atomic>
#include <map>
#include <nlohmann/json.hpp>
#include <vector>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

// Records replies instead of writing them to sockets.
class CapturingIpcServer : public IpcServer {
public:
    bool start(const std::string&) override { return true; }
    void stop() override {}
    int server_fd() const override { return -1; }
    int accept_client() override { return -1; }
    ReadResult read_command(int, json&) override { return ReadResult::Closed; }
    bool send_response(int client_fd, const json& response) override {
        replies[client_fd].push_back(response);
        return true;
    }
    void close_client(int) override {}

    std::map<int, std::vector<json>> replies;
};

constexpr const char* kRecorder = R"(printf 'RIFF0000WAVEfmt ' > "$1"; exec sleep 30)";

struct Harness {
    test::TmpDir dir{"daemon_core"};
    Config config;
    PosixProcessLauncher launcher;
    CapturingIpcServer ipc;
    std::atomic<int> notified{0};
    std::unique_ptr<CaptureController> capture;
    std::unique_ptr<DaemonCore> core;

    Harness() {
        config.storage.settings_db = (dir.path / "settings.db").string();
        config.recorder.output_dir = dir.path.string();
        // Nothing listens here; no test may reach the real API.
        config.transcription.endpoint = "http://127.0.0.1:1/v1/audio/transcriptions";
        config.transcription.connect_timeout_s = 2;

        capture = std::make_unique<CaptureController>(launcher, RecorderOptions{
            .program = "/bin/sh",
            .args = {"-c", kRecorder, "recorder"},
            .output_dir = dir.path,
        });
        core = std::make_unique<DaemonCore>(config, false, *capture, ipc, [this] { ++notified; });
    }

    ~Harness() { core->shutdown(); }

    // Plays the event loop's part until `fd` receives a deferred reply.
    std::optional<json> await_reply(int fd) {
        bool got = test::wait_for([&] {
            core->on_tasks_complete();
            return !ipc.replies[fd].empty();
        });
        if (!got) return std::nullopt;
        return ipc.replies[fd].back();
    }
};

} // namespace

TEST_CASE("DaemonCore commands", "[daemon]") {
    Harness h;
    REQUIRE(h.core->init());

    SECTION("StatusIdle") {
        auto reply = h.core->handle_command(1, {{"cmd", "status"}});
        REQUIRE(reply["status"] == "ok");
        REQUIRE(reply["state"] == "idle");
        REQUIRE_FALSE(reply.contains("path"));
        REQUIRE(reply["pending_tasks"] == 0);
    }

    SECTION("UnknownCommand") {
        auto reply = h.core->handle_command(1, {{"cmd", "dance"}});
        REQUIRE(reply["status"] == "error");
    }

    SECTION("InvalidFieldType") {
        auto reply = h.core->handle_command(1, {{"cmd", "stop"}, {"transcribe", "yes"}});
        REQUIRE(reply["status"] == "error");
        REQUIRE(reply["message"].get<std::string>().starts_with("invalid request"));
    }

    SECTION("StopWithoutRecording") {
        auto reply = h.core->handle_command(1, {{"cmd", "stop"}});
        REQUIRE(reply["status"] == "pending");

        auto done = h.await_reply(1);
        REQUIRE(done);
        REQUIRE((*done)["status"] == "error");
        REQUIRE((*done)["code"] == "no_active_session");
        REQUIRE(h.notified > 0);
    }

    SECTION("CancelWithoutRecording") {
        REQUIRE(h.core->handle_command(1, {{"cmd", "cancel"}})["status"] == "pending");
        auto done = h.await_reply(1);
        REQUIRE(done);
        REQUIRE((*done)["status"] == "ok");
        REQUIRE((*done)["cancelled"] == false);
    }

    SECTION("StartStatusStop") {
        auto started = h.core->handle_command(1, {{"cmd", "start"}});
        REQUIRE(started["status"] == "ok");
        std::string path = started["path"];

        auto status = h.core->handle_command(1, {{"cmd", "status"}});
        REQUIRE(status["state"] == "recording");
        REQUIRE(status["path"] == path);
        REQUIRE(status["pid"].get<int>() > 0);

        REQUIRE(test::wait_for([&] { return test::has_content(path); }));

        REQUIRE(h.core->handle_command(2, {{"cmd", "stop"}})["status"] == "pending");
        auto done = h.await_reply(2);
        REQUIRE(done);
        REQUIRE((*done)["status"] == "ok");
        REQUIRE((*done)["path"] == path);

        REQUIRE(h.core->handle_command(1, {{"cmd", "status"}})["state"] == "idle");
    }

    SECTION("SecondStartRejected") {
        REQUIRE(h.core->handle_command(1, {{"cmd", "start"}})["status"] == "ok");
        auto again = h.core->handle_command(1, {{"cmd", "start"}});
        REQUIRE(again["status"] == "error");
        REQUIRE(again["code"] == "session_already_active");
    }

    SECTION("CancelDiscardsRecording") {
        auto started = h.core->handle_command(1, {{"cmd", "start"}});
        std::string path = started["path"];
        REQUIRE(test::wait_for([&] { return fs::exists(path); }));

        REQUIRE(h.core->handle_command(1, {{"cmd", "cancel"}})["status"] == "pending");
        auto done = h.await_reply(1);
        REQUIRE(done);
        REQUIRE((*done)["cancelled"] == true);
        REQUIRE_FALSE(fs::exists(path));
    }

    SECTION("StopAndTranscribeWithoutKeyKeepsFile") {
        auto started = h.core->handle_command(1, {{"cmd", "start"}});
        std::string path = started["path"];
        REQUIRE(test::wait_for([&] { return test::has_content(path); }));

        h.core->handle_command(1, {{"cmd", "stop"}, {"transcribe", true}});
        auto done = h.await_reply(1);
        REQUIRE(done);
        REQUIRE((*done)["status"] == "error");
        REQUIRE((*done)["code"] == "missing_api_key");
        REQUIRE((*done)["path"] == path);
        REQUIRE(fs::exists(path));
    }

    SECTION("TranscribeWithoutKey") {
        h.core->handle_command(1, {{"cmd", "transcribe"}, {"path", "/tmp/whatever.wav"}});
        auto done = h.await_reply(1);
        REQUIRE(done);
        REQUIRE((*done)["code"] == "missing_api_key");
    }

    SECTION("TranscribeMissingFile") {
        h.core->handle_command(1, {{"cmd", "transcribe"},
                                   {"path", (h.dir.path / "missing.wav").string()},
                                   {"api_key", "K"}});
        auto done = h.await_reply(1);
        REQUIRE(done);
        REQUIRE((*done)["code"] == "file_not_found");
    }

    SECTION("TranscribeUsesStoredKey") {
        REQUIRE(h.core->handle_command(1, {{"cmd", "save_settings"}, {"provider", "mistral"},
                                           {"model", "voxtral-mini-latest"},
                                           {"api_key", "stored"}})["status"] == "ok");

        // The key is found, so the failure comes from the missing file instead.
        h.core->handle_command(1, {{"cmd", "transcribe"},
                                   {"path", (h.dir.path / "missing.wav").string()}});
        auto done = h.await_reply(1);
        REQUIRE(done);
        REQUIRE((*done)["code"] == "file_not_found");
    }

    SECTION("TranscribeUnreachableApi") {
        auto clip = h.dir.path / "clip.wav";
        test::write_file(clip, "RIFF");

        h.core->handle_command(1, {{"cmd", "transcribe"}, {"path", clip.string()},
                                   {"api_key", "K"}});
        auto done = h.await_reply(1);
        REQUIRE(done);
        REQUIRE((*done)["code"] == "http_request");
    }

    SECTION("SettingsRoundTrip") {
        auto initial = h.core->handle_command(1, {{"cmd", "get_settings"}});
        REQUIRE(initial["provider"] == "mistral");
        REQUIRE(initial["model"] == "voxtral-mini-latest");
        REQUIRE(initial["api_key"].is_null());
        REQUIRE(initial["language"].is_null());

        auto saved = h.core->handle_command(1, {{"cmd", "save_settings"}, {"provider", "mistral"},
                                                {"model", "voxtral-mini-latest"},
                                                {"api_key", "K"}, {"language", "en"}});
        REQUIRE(saved["status"] == "ok");

        // Omitted api_key and language keep their stored values.
        h.core->handle_command(1, {{"cmd", "save_settings"}, {"provider", "mistral"},
                                   {"model", "voxtral-mini-latest"}});

        auto loaded = h.core->handle_command(1, {{"cmd", "get_settings"}});
        REQUIRE(loaded["api_key"] == "K");
        REQUIRE(loaded["language"] == "en");
    }

    SECTION("SaveSettingsRequiresModel") {
        auto reply = h.core->handle_command(1, {{"cmd", "save_settings"}, {"provider", "mistral"}});
        REQUIRE(reply["status"] == "error");
    }

    SECTION("SaveAudio") {
        auto reply = h.core->handle_command(1, {{"cmd", "save_audio"}, {"data", "TWFu"},
                                                {"file_name", "upload.wav"}});
        REQUIRE(reply["status"] == "ok");
        REQUIRE(test::read_file(reply["path"].get<std::string>()) == "Man");
    }

    SECTION("SaveAudioBadData") {
        auto reply = h.core->handle_command(1, {{"cmd", "save_audio"}, {"data", "%%%"},
                                                {"file_name", "upload.wav"}});
        REQUIRE(reply["status"] == "error");
        REQUIRE(reply["code"] == "base64_decode");
    }

    SECTION("ReplyDroppedForDisconnectedClient") {
        REQUIRE(h.core->handle_command(7, {{"cmd", "stop"}})["status"] == "pending");
        h.core->remove_client(7);

        REQUIRE(test::wait_for([&] {
            h.core->on_tasks_complete();
            return h.core->pending_tasks() == 0;
        }));
        REQUIRE(h.ipc.replies[7].empty());
    }

    SECTION("ShutdownDiscardsActiveRecording") {
        auto started = h.core->handle_command(1, {{"cmd", "start"}});
        std::string path = started["path"];
        REQUIRE(test::wait_for([&] { return fs::exists(path); }));

        h.core->shutdown();
        REQUIRE_FALSE(fs::exists(path));
        REQUIRE(h.core->handle_command(1, {{"cmd", "status"}})["state"] == "idle");
    }
}
