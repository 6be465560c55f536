#include "output/file_sink.hpp"

#include "logging.hpp"

#include <fmt/format.h>

#include <filesystem>
#include <fstream>
#include <ios>
#include <mutex>
#include <stdexcept>
#include <string_view>

namespace assessgrader {

FileSink::FileSink(const std::filesystem::path& path)
    : out_{path, std::ios::out | std::ios::app} {
    if (!out_) {
        throw std::runtime_error(fmt::format("could not open {} for writing: {}", path.string(), get_err_msg()));
    }

    LOG_DEBUG("Writing scoring events to {}", path.string());
}

void FileSink::write(std::string_view str) {
    std::scoped_lock lock{mutex_};
    out_.write(str.data(), static_cast<std::streamsize>(str.size()));

    if (!out_) {
        LOG_WARN("Failed to write {} bytes of event output", str.size());
        out_.clear();
    }
}

void FileSink::flush() {
    std::scoped_lock lock{mutex_};
    out_.flush();
}

} // namespace assessgrader
