#include "stt/mistral_backend.hpp"
#include "stt/transcription_response.hpp"

#include <chrono>
#include <curl/curl.h>
#include <format>
#include <fstream>
#include <iterator>
#include <print>

namespace fs = std::filesystem;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

static std::expected<std::string, Error> read_file(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected(make_error(ErrorCode::FileRead,
                                          "failed to open audio file: " + path.string()));
    }
    std::string data((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (f.bad()) {
        return std::unexpected(make_error(ErrorCode::FileRead,
                                          "failed to read audio file: " + path.string()));
    }
    return data;
}

MistralBackend::MistralBackend(std::string endpoint, std::string model,
                               long timeout_s, long connect_timeout_s)
    : endpoint_(std::move(endpoint)), model_(std::move(model)),
      timeout_s_(timeout_s), connect_timeout_s_(connect_timeout_s) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

MistralBackend::~MistralBackend() {
    curl_global_cleanup();
}

std::expected<TranscriptResult, Error>
MistralBackend::transcribe(const fs::path& audio_path, const std::string& api_key,
                           const std::optional<std::string>& language) {
    // Validate before touching the network.
    std::error_code ec;
    if (!fs::exists(audio_path, ec)) {
        return std::unexpected(make_error(ErrorCode::FileNotFound,
                                          "audio file does not exist: " + audio_path.string()));
    }
    auto size = fs::file_size(audio_path, ec);
    if (ec) {
        return std::unexpected(make_error(ErrorCode::FileRead,
                                          "failed to read file metadata: " + ec.message()));
    }
    if (size == 0) {
        return std::unexpected(make_error(ErrorCode::EmptyRecording, "audio file is empty"));
    }

    auto audio = read_file(audio_path);
    if (!audio) return std::unexpected(audio.error());

    std::string file_name = audio_path.filename().string();
    if (file_name.empty()) file_name = "audio.wav";

    auto start = std::chrono::steady_clock::now();

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected(make_error(ErrorCode::HttpRequest, "curl_easy_init failed"));
    }

    curl_mime* mime = curl_mime_init(curl);
    curl_mimepart* part;

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "model");
    curl_mime_data(part, model_.c_str(), CURL_ZERO_TERMINATED);

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    curl_mime_data(part, audio->data(), audio->size());
    curl_mime_filename(part, file_name.c_str());
    curl_mime_type(part, "audio/wav");

    // No hint means no language part at all, not an empty one.
    if (language) {
        part = curl_mime_addpart(mime);
        curl_mime_name(part, "language");
        curl_mime_data(part, language->c_str(), CURL_ZERO_TERMINATED);
    }

    std::string auth = "Authorization: Bearer " + api_key;
    curl_slist* headers = curl_slist_append(nullptr, auth.c_str());
    headers = curl_slist_append(headers, "Expect:");

    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint_.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, connect_timeout_s_);
    // Several uploads may run at once on task threads.
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_slist_free_all(headers);
    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    auto end = std::chrono::steady_clock::now();
    double processing_s = std::chrono::duration<double>(end - start).count();

    if (res != CURLE_OK) {
        return std::unexpected(make_error(
            ErrorCode::HttpRequest,
            std::string("failed to send transcription request: ") + curl_easy_strerror(res)));
    }

    if (status < 200 || status >= 300) {
        std::println(stderr, "stt: API error ({}): {}", status, response_body);
        return std::unexpected(Error{
            .code = ErrorCode::HttpStatus,
            .message = std::format("transcription API error ({}): {}", status, response_body),
            .http_status = status,
            .body = response_body,
        });
    }

    auto parsed = parse_transcription_response(response_body);
    if (!parsed) {
        std::println(stderr, "stt: {}", parsed.error().message);
        return std::unexpected(parsed.error());
    }

    return TranscriptResult{
        .text = std::move(parsed->text),
        .language = parsed->language.value_or(""),
        .duration_s = parsed->usage ? parsed->usage->prompt_audio_seconds : 0.0,
        .processing_s = processing_s,
    };
}
