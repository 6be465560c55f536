#include "model/attempt.hpp"

#include "common/overloaded.hpp"

#include <string_view>
#include <variant>

namespace assessgrader {

std::string_view activity_name(const ActivityKind& kind) {
    using namespace std::string_view_literals;

    return std::visit(Overloaded{
                          [](const activity::TabSwitch&) { return "tab_switch"sv; },
                          [](const activity::IpChange&) { return "ip_change"sv; },
                          [](const activity::CopyPaste&) { return "copy_paste"sv; },
                          [](const activity::FullScreenExit&) { return "full_screen_exit"sv; },
                          [](const activity::Disqualified&) { return "disqualified"sv; },
                      },
                      kind);
}

} // namespace assessgrader
