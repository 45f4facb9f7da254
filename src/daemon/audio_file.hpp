#pragma once

#include "errors.hpp"

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

// Decodes `base64_data` and writes it to `dir`/<file_name>. Only the last
// component of `file_name` is used. An empty `dir` means the OS temp directory.
std::expected<std::filesystem::path, Error>
save_audio_temp_file(std::string_view base64_data, const std::string& file_name,
                     const std::filesystem::path& dir = {});
