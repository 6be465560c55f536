#include "proctoring/anti_cheat_monitor.hpp"

#include "common/overloaded.hpp"
#include "logging.hpp"

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace assessgrader {

namespace {

/// Fisher-Yates with an explicit engine, since std::shuffle's output differs between standard libraries
template <typename T>
void stable_shuffle(std::vector<T>& items, std::mt19937_64& rng) {
    for (std::size_t i = items.size(); i > 1; --i) {
        const auto j = static_cast<std::size_t>(rng() % i);
        std::swap(items[i - 1], items[j]);
    }
}

} // namespace

AntiCheatMonitor::AntiCheatMonitor(ClockFn clock)
    : clock_{std::move(clock)} {}

MonitorVerdict AntiCheatMonitor::on_tab_switch(Attempt& attempt, const AntiCheatConfig& config) const {
    ++attempt.tab_switch_count;

    if (!config.track_tab_switches || attempt.tab_switch_count < config.max_tab_switches) {
        LOG_DEBUG("Attempt {}: tab switch {}", attempt.id, attempt.tab_switch_count);
        return MonitorVerdict::Continue;
    }

    attempt.suspicious_activities.push_back(
        SuspiciousActivity{.timestamp = clock_(), .kind = activity::TabSwitch{.count = attempt.tab_switch_count}});
    attempt.flagged_for_review = true;

    LOG_INFO("Attempt {} reached {} tab switches (limit {})", attempt.id, attempt.tab_switch_count,
             config.max_tab_switches);

    return MonitorVerdict::Disqualify;
}

void AntiCheatMonitor::on_ip_observed(Attempt& attempt, const AntiCheatConfig& config, std::string_view ip) const {
    if (ip.empty() || attempt.ip_address == ip) {
        return;
    }

    if (attempt.ip_address.empty()) {
        attempt.ip_address = ip;
        return;
    }

    if (config.track_ip_changes) {
        attempt.suspicious_activities.push_back(SuspiciousActivity{
            .timestamp = clock_(),
            .kind = activity::IpChange{.previous_ip = attempt.ip_address, .new_ip = std::string{ip}}});
        attempt.flagged_for_review = true;

        LOG_INFO("Attempt {}: IP changed from {} to {}", attempt.id, attempt.ip_address, ip);
    }

    attempt.ip_address = ip;
}

void AntiCheatMonitor::on_copy_paste(Attempt& attempt, std::string details) const {
    attempt.suspicious_activities.push_back(
        SuspiciousActivity{.timestamp = clock_(), .kind = activity::CopyPaste{.details = std::move(details)}});
}

void AntiCheatMonitor::on_full_screen_exit(Attempt& attempt) const {
    attempt.suspicious_activities.push_back(
        SuspiciousActivity{.timestamp = clock_(), .kind = activity::FullScreenExit{}});
}

std::uint64_t stable_seed(std::string_view key) {
    constexpr std::uint64_t FNV_OFFSET = 14695981039346656037ULL;
    constexpr std::uint64_t FNV_PRIME = 1099511628211ULL;

    std::uint64_t hash = FNV_OFFSET;
    for (char chr : key) {
        hash ^= static_cast<unsigned char>(chr);
        hash *= FNV_PRIME;
    }

    return hash;
}

std::vector<Question> randomize_order(const AssessmentDefinition& definition, std::string_view attempt_seed) {
    std::vector<Question> questions = definition.questions;
    std::mt19937_64 rng{stable_seed(attempt_seed)};

    if (definition.randomize_questions) {
        stable_shuffle(questions, rng);
    }

    for (auto& question : questions) {
        std::visit(Overloaded{
                       [&rng](McqSingle& mcq) {
                           if (mcq.randomize_options) {
                               stable_shuffle(mcq.options, rng);
                           }
                       },
                       [&rng](McqMultiple& mcq) {
                           if (mcq.randomize_options) {
                               stable_shuffle(mcq.options, rng);
                           }
                       },
                       [](auto& /*other*/) {},
                   },
                   question.payload);
    }

    return questions;
}

} // namespace assessgrader
