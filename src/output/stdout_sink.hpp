#pragma once

#include "output/sink.hpp"

#include <mutex>
#include <string_view>

namespace assessgrader {

class StdoutSink : public Sink
{
public:
    void write(std::string_view str) override;
    void flush() override;

    ~StdoutSink() override = default;

private:
    std::mutex mutex_;
};

} // namespace assessgrader
