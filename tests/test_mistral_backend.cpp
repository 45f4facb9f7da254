#include <catch2/catch_test_macros.hpp>

#include "mock_http_server.hpp"
#include "stt/mistral_backend.hpp"
#include "test_helpers.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

constexpr const char* kOkBody = R"({
    "model": "voxtral-mini-2507",
    "text": "hello world",
    "language": "en",
    "usage": {"prompt_audio_seconds": 3.5, "prompt_tokens": 4,
              "total_tokens": 10, "completion_tokens": 6}
})";

size_t count_of(const std::string& haystack, const std::string& needle) {
    size_t n = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++n;
    }
    return n;
}

} // namespace

TEST_CASE("MistralBackend", "[stt]") {
    test::TmpDir dir("mistral");
    auto clip = dir.path / "clip.wav";
    test::write_file(clip, std::string("RIFF\x24\0\0\0WAVEfmt ", 16) + "pcm-bytes");

    SECTION("RequestWithoutLanguage") {
        test::MockHttpServer server;
        REQUIRE(server.ok());
        server.serve_once(200, kOkBody);

        MistralBackend backend(server.url(), "voxtral-mini-latest");
        auto result = backend.transcribe(clip, "test-key", std::nullopt);
        REQUIRE(result);
        REQUIRE(result->text == "hello world");
        REQUIRE(result->language == "en");
        REQUIRE(result->duration_s == 3.5);

        const auto& req = server.request();
        REQUIRE(req.starts_with("POST /v1/audio/transcriptions HTTP/1.1\r\n"));
        REQUIRE(req.find("Authorization: Bearer test-key\r\n") != std::string::npos);
        REQUIRE(req.find("name=\"model\"\r\n\r\nvoxtral-mini-latest\r\n") != std::string::npos);
        REQUIRE(req.find("name=\"file\"; filename=\"clip.wav\"") != std::string::npos);
        REQUIRE(req.find("Content-Type: audio/wav") != std::string::npos);
        REQUIRE(req.find("pcm-bytes") != std::string::npos);
        REQUIRE(req.find("name=\"language\"") == std::string::npos);
    }

    SECTION("RequestWithLanguage") {
        test::MockHttpServer server;
        REQUIRE(server.ok());
        server.serve_once(200, kOkBody);

        MistralBackend backend(server.url(), "voxtral-mini-latest");
        REQUIRE(backend.transcribe(clip, "test-key", std::string("en")));

        const auto& req = server.request();
        REQUIRE(count_of(req, "name=\"language\"") == 1);
        REQUIRE(req.find("name=\"language\"\r\n\r\nen\r\n") != std::string::npos);
    }

    SECTION("HttpErrorCarriesStatusAndBody") {
        test::MockHttpServer server;
        REQUIRE(server.ok());
        server.serve_once(400, "bad request");

        MistralBackend backend(server.url(), "voxtral-mini-latest");
        auto result = backend.transcribe(clip, "test-key", std::nullopt);
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code == ErrorCode::HttpStatus);
        REQUIRE(result.error().http_status == 400);
        REQUIRE(result.error().body == "bad request");
        REQUIRE(result.error().message.find("400") != std::string::npos);
        REQUIRE(result.error().message.find("bad request") != std::string::npos);
    }

    SECTION("UnauthorizedIsNotParsed") {
        test::MockHttpServer server;
        REQUIRE(server.ok());
        server.serve_once(401, R"({"message": "Unauthorized"})");

        MistralBackend backend(server.url(), "voxtral-mini-latest");
        auto result = backend.transcribe(clip, "wrong-key", std::nullopt);
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code == ErrorCode::HttpStatus);
        REQUIRE(result.error().http_status == 401);
    }

    SECTION("MalformedSuccessBody") {
        test::MockHttpServer server;
        REQUIRE(server.ok());
        server.serve_once(200, "not json");

        MistralBackend backend(server.url(), "voxtral-mini-latest");
        auto result = backend.transcribe(clip, "test-key", std::nullopt);
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code == ErrorCode::JsonParse);
        REQUIRE(result.error().body == "not json");
    }

    SECTION("SchemaMismatch") {
        test::MockHttpServer server;
        REQUIRE(server.ok());
        server.serve_once(200, R"({"text": "no model field"})");

        MistralBackend backend(server.url(), "voxtral-mini-latest");
        auto result = backend.transcribe(clip, "test-key", std::nullopt);
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code == ErrorCode::JsonParse);
    }

    SECTION("ConcurrentUploads") {
        constexpr int kUploads = 4;
        std::vector<std::unique_ptr<test::MockHttpServer>> servers;
        std::vector<std::unique_ptr<MistralBackend>> backends;
        for (int i = 0; i < kUploads; ++i) {
            servers.push_back(std::make_unique<test::MockHttpServer>());
            REQUIRE(servers.back()->ok());
            servers.back()->serve_once(200, kOkBody);
            backends.push_back(std::make_unique<MistralBackend>(
                servers.back()->url(), "voxtral-mini-latest", 10, 2));
        }

        std::atomic<int> ok{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < kUploads; ++i) {
            threads.emplace_back([&, i] {
                auto result = backends[i]->transcribe(clip, "test-key", std::nullopt);
                if (result && result->text == "hello world") ++ok;
            });
        }
        for (auto& t : threads) t.join();

        REQUIRE(ok == kUploads);
    }

    SECTION("ConnectionRefused") {
        MistralBackend backend("http://127.0.0.1:1/v1/audio/transcriptions",
                               "voxtral-mini-latest", 5, 2);
        auto result = backend.transcribe(clip, "test-key", std::nullopt);
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code == ErrorCode::HttpRequest);
    }

    // No server is listening on these: the checks must fail before any request.
    SECTION("MissingFileCheckedFirst") {
        MistralBackend backend("http://127.0.0.1:1/v1/audio/transcriptions", "m", 5, 2);
        auto result = backend.transcribe(dir.path / "missing.wav", "test-key", std::nullopt);
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code == ErrorCode::FileNotFound);
    }

    SECTION("EmptyFileCheckedFirst") {
        auto empty = dir.path / "empty.wav";
        test::write_file(empty, "");

        MistralBackend backend("http://127.0.0.1:1/v1/audio/transcriptions", "m", 5, 2);
        auto result = backend.transcribe(empty, "test-key", std::nullopt);
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code == ErrorCode::EmptyRecording);
    }
}
