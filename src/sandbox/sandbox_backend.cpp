#include "sandbox/sandbox_backend.hpp"

#include <range/v3/algorithm/find.hpp>

#include <string>
#include <string_view>

namespace assessgrader {

bool SandboxBackend::supports(std::string_view language) const {
    const auto langs = languages();
    return ranges::find(langs, language) != langs.end();
}

} // namespace assessgrader
