#include "expander.hpp"
#include "time_util.hpp"
#include "validator.hpp"
#include <algorithm>

int trigger_minute_of_week(const TriggerInstant& t) {
    return minute_of_week(t.weekday, t.hour, t.minute);
}

std::vector<TriggerInstant> expand(const std::vector<NormalizedInterval>& intervals) {
    check_intervals(intervals);

    std::vector<TriggerInstant> out;
    out.reserve(intervals.size()*2);

    for (const auto& iv : intervals) {
        TriggerInstant on;
        split_minute_of_week(iv.start, on.weekday, on.hour, on.minute);
        on.action = TriggerAction::Start;
        // Длительность считается по целому окну, даже если оно переходит через конец недели
        on.duration_minutes  = (iv.end - iv.start) % kMinutesPerWeek;
        on.hosts             = iv.hosts;
        on.block_as_whitelist = iv.block_as_whitelist;
        on.source_index      = iv.source_index;
        on.source_id         = iv.source_id;
        out.push_back(std::move(on));

        TriggerInstant off;
        split_minute_of_week(iv.end % kMinutesPerWeek, off.weekday, off.hour, off.minute);
        off.action       = TriggerAction::Stop;
        off.source_index = iv.source_index;
        off.source_id    = iv.source_id;
        out.push_back(std::move(off));
    }

    std::stable_sort(out.begin(), out.end(), [](const TriggerInstant& a, const TriggerInstant& b){
        int ma = trigger_minute_of_week(a), mb = trigger_minute_of_week(b);
        if (ma != mb) return ma < mb;
        return a.action == TriggerAction::Stop && b.action == TriggerAction::Start;
    });
    return out;
}
