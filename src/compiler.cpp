#include "compiler.hpp"
#include "expander.hpp"
#include "time_util.hpp"
#include "validator.hpp"

CompiledSchedule compile_schedule(const Config& cfg) {
    CompiledSchedule cs;
    cs.intervals = normalize(cfg.schedules, cfg.host_blacklist);
    cs.triggers  = expand(cs.intervals);
    return cs;
}

std::optional<ActiveWindow> active_at(const CompiledSchedule& cs, int minute_of_week) {
    int m = ((minute_of_week % kMinutesPerWeek) + kMinutesPerWeek) % kMinutesPerWeek;
    for (const auto& iv : cs.intervals) {
        if (iv.start <= m && m < iv.end)
            return ActiveWindow{iv, iv.end - m};
        if (iv.end > kMinutesPerWeek && m < iv.end - kMinutesPerWeek)
            return ActiveWindow{iv, iv.end - kMinutesPerWeek - m};
    }
    return std::nullopt;
}

int total_blocked_minutes(const CompiledSchedule& cs) {
    int total = 0;
    for (const auto& iv : cs.intervals) total += iv.duration();
    return total;
}
