#include "stt/transcription_response.hpp"

#include <format>
#include <stdexcept>

using json = nlohmann::json;

namespace {

struct SchemaError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

std::optional<std::string> optional_string(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<std::string>();
}

uint64_t read_count(const json& usage, const char* key) {
    const auto& v = usage.at(key);
    if (!v.is_number_unsigned()) {
        throw SchemaError(std::format("usage.{} must be a non-negative integer", key));
    }
    return v.get<uint64_t>();
}

TranscriptionUsage read_usage(const json& u) {
    if (!u.is_object()) throw SchemaError("usage must be an object");

    const auto& seconds = u.at("prompt_audio_seconds");
    if (!seconds.is_number()) throw SchemaError("usage.prompt_audio_seconds must be a number");

    return TranscriptionUsage{
        .prompt_audio_seconds = seconds.get<double>(),
        .prompt_tokens = read_count(u, "prompt_tokens"),
        .total_tokens = read_count(u, "total_tokens"),
        .completion_tokens = read_count(u, "completion_tokens"),
    };
}

Error parse_error(const std::string& reason, const std::string& raw) {
    return Error{
        .code = ErrorCode::JsonParse,
        .message = std::format("failed to parse transcription response: {}. Raw response: {}",
                               reason, raw),
        .body = raw,
    };
}

} // namespace

std::expected<TranscriptionResponse, Error> parse_transcription_response(const std::string& raw) {
    try {
        auto j = json::parse(raw);
        if (!j.is_object()) throw SchemaError("response is not a JSON object");

        TranscriptionResponse resp;
        resp.model = j.at("model").get<std::string>();
        resp.text = j.at("text").get<std::string>();
        resp.language = optional_string(j, "language");
        resp.finish_reason = optional_string(j, "finish_reason");

        if (j.contains("usage") && !j["usage"].is_null()) {
            resp.usage = read_usage(j["usage"]);
        }

        if (j.contains("segments")) {
            if (!j["segments"].is_array()) throw SchemaError("segments must be an array");
            resp.segments = j["segments"].get<std::vector<json>>();
        }

        return resp;
    } catch (const json::exception& e) {
        return std::unexpected(parse_error(e.what(), raw));
    } catch (const SchemaError& e) {
        return std::unexpected(parse_error(e.what(), raw));
    }
}
