#include "output/stdout_sink.hpp"

#include <iostream>
#include <mutex>
#include <string_view>

namespace assessgrader {

void StdoutSink::write(std::string_view str) {
    std::scoped_lock lock{mutex_};
    std::cout << str;
}

void StdoutSink::flush() {
    std::scoped_lock lock{mutex_};
    std::cout.flush();
}

} // namespace assessgrader
