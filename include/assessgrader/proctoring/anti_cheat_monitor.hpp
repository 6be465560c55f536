#pragma once

#include <assessgrader/common/formatters/macros.hpp>
#include <assessgrader/common/time.hpp>
#include <assessgrader/model/assessment.hpp>
#include <assessgrader/model/attempt.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace assessgrader {

enum class MonitorVerdict { Continue, Disqualify };

/// Decisions over an attempt's proctoring counters. Mutates the attempt it is given and leaves
/// persistence, locking and finalization to the caller.
class AntiCheatMonitor
{
public:
    explicit AntiCheatMonitor(ClockFn clock = system_clock_fn());

    /// Counts the switch. Reaching ``max_tab_switches`` (with tracking on) records the event,
    /// flags the attempt and asks for disqualification
    MonitorVerdict on_tab_switch(Attempt& attempt, const AntiCheatConfig& config) const;

    /// A changed address is recorded and flagged, never disqualified. The first address seen is just stored
    void on_ip_observed(Attempt& attempt, const AntiCheatConfig& config, std::string_view ip) const;

    void on_copy_paste(Attempt& attempt, std::string details) const;

    void on_full_screen_exit(Attempt& attempt) const;

private:
    ClockFn clock_;
};

/// 64-bit FNV-1a, stable across platforms and runs
std::uint64_t stable_seed(std::string_view key);

/// Questions in the order one attempt sees them, options shuffled where the question asks for it.
/// Deterministic for a given ``attempt_seed``
std::vector<Question> randomize_order(const AssessmentDefinition& definition, std::string_view attempt_seed);

} // namespace assessgrader

FMT_SERIALIZE_ENUM(::assessgrader::MonitorVerdict, Continue, Disqualify);
