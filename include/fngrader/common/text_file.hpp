#pragma once

#include <fngrader/common/expected.hpp>
#include <fngrader/logging.hpp>

#include <fmt/format.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>

namespace fngrader {

// The value and error types coincide here, so errors are tagged with `unexpected`

/// Reads a whole file. Errors are human-readable and name the path.
inline Expected<std::string, std::string> read_text_file(const std::filesystem::path& path) {
    std::ifstream in_file{path, std::ios::binary};

    if (!in_file.is_open()) {
        return {unexpected, fmt::format("Failed to open {:?} for reading", path.string())};
    }

    std::string contents{std::istreambuf_iterator<char>{in_file}, std::istreambuf_iterator<char>{}};

    if (in_file.bad()) {
        return {unexpected, fmt::format("IO error in reading {:?}", path.string())};
    }

    LOG_DEBUG("Read {} bytes from {:?}", contents.size(), path.string());

    return contents;
}

/// Replaces the contents of a file
inline Expected<void, std::string> write_text_file(const std::filesystem::path& path, std::string_view contents) {
    std::ofstream out_file{path, std::ios::binary | std::ios::trunc};

    if (!out_file.is_open()) {
        return fmt::format("Failed to open {:?} for writing", path.string());
    }

    out_file.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    out_file.flush();

    if (!out_file) {
        return fmt::format("IO error in writing {:?}", path.string());
    }

    LOG_DEBUG("Wrote {} bytes to {:?}", contents.size(), path.string());

    return {};
}

} // namespace fngrader
