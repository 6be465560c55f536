#pragma once

#include "output/sink.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string_view>

namespace assessgrader {

/// Appends to a file, creating it if needed. Throws std::runtime_error if the file cannot be opened
class FileSink : public Sink
{
public:
    explicit FileSink(const std::filesystem::path& path);

    void write(std::string_view str) override;
    void flush() override;

    ~FileSink() override = default;

private:
    std::mutex mutex_;
    std::ofstream out_;
};

} // namespace assessgrader
