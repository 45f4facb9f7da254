#include "audio_file.hpp"
#include "base64.hpp"

#include <fstream>

namespace fs = std::filesystem;

std::expected<fs::path, Error>
save_audio_temp_file(std::string_view base64_data, const std::string& file_name,
                     const fs::path& dir) {
    auto bytes = base64::decode(base64_data);
    if (!bytes) {
        return std::unexpected(make_error(ErrorCode::Base64Decode,
                                          "failed to decode base64 audio data"));
    }

    auto name = fs::path(file_name).filename();
    if (name.empty() || name == "." || name == "..") {
        return std::unexpected(make_error(ErrorCode::FileWrite,
                                          "invalid audio file name: '" + file_name + "'"));
    }

    fs::path target_dir = dir;
    if (target_dir.empty()) {
        std::error_code ec;
        target_dir = fs::temp_directory_path(ec);
        if (ec) {
            return std::unexpected(make_error(ErrorCode::FileWrite,
                                              "no temporary directory: " + ec.message()));
        }
    }

    std::error_code ec;
    auto path = fs::absolute(target_dir / name, ec);
    if (ec) path = target_dir / name;

    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
        return std::unexpected(make_error(ErrorCode::FileWrite,
                                          "failed to write audio file: " + path.string()));
    }
    f.write(reinterpret_cast<const char*>(bytes->data()),
            static_cast<std::streamsize>(bytes->size()));
    f.close();
    if (!f) {
        return std::unexpected(make_error(ErrorCode::FileWrite,
                                          "failed to write audio file: " + path.string()));
    }

    return path;
}
