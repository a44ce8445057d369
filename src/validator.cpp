#include "validator.hpp"
#include "errors.hpp"
#include "time_util.hpp"
#include <algorithm>
#include <sstream>
#include <utility>

namespace {

struct Piece {
    int start;
    int end;
    std::size_t interval;   // индекс в массиве интервалов
};

std::string describe(const BlockSchedule& e) {
    std::ostringstream os;
    os<<"schedule '"<<e.id<<"' #"<<e.index<<" ("<<(e.weekday ? weekday_name(*e.weekday) : "every day")<<" "
      <<format_hhmm(e.start_hour, e.start_minute)<<"-"
      <<format_hhmm(e.end_hour, e.end_minute)<<")";
    return os.str();
}

std::string describe(const NormalizedInterval& iv) {
    Weekday d1, d2; int h1, m1, h2, m2;
    split_minute_of_week(iv.start, d1, h1, m1);
    split_minute_of_week(iv.end,   d2, h2, m2);
    std::ostringstream os;
    os<<"schedule '"<<iv.source_id<<"' #"<<iv.source_index<<" ("
      <<weekday_name(d1)<<" "<<format_hhmm(h1, m1)<<"-"
      <<weekday_name(d2)<<" "<<format_hhmm(h2, m2)<<")";
    return os.str();
}

bool in_domain(int hour, int minute) {
    return hour>=0 && hour<=23 && minute>=0 && minute<=59;
}

// Окна, переходящие через конец недели, режутся на [start,10080) и [0,end-10080),
// после чего пересечения ищутся одним проходом по отсортированным кускам.
std::optional<std::pair<std::size_t,std::size_t>>
find_overlap(const std::vector<NormalizedInterval>& ivs) {
    std::vector<Piece> pieces;
    pieces.reserve(ivs.size()*2);
    for (std::size_t i=0;i<ivs.size();++i) {
        const auto& iv = ivs[i];
        if (iv.end > kMinutesPerWeek) {
            pieces.push_back({iv.start, kMinutesPerWeek, i});
            pieces.push_back({0, iv.end - kMinutesPerWeek, i});
        } else {
            pieces.push_back({iv.start, iv.end, i});
        }
    }
    std::stable_sort(pieces.begin(), pieces.end(),
                     [](const Piece& a, const Piece& b){ return a.start < b.start; });

    for (std::size_t i=1;i<pieces.size();++i) {
        const Piece& prev = pieces[i-1];
        const Piece& cur  = pieces[i];
        if (cur.start < prev.end)
            return std::make_pair(prev.interval, cur.interval);
    }
    return std::nullopt;
}

} // namespace

std::vector<NormalizedInterval> normalize(
    const std::vector<BlockSchedule>& entries,
    const std::optional<std::vector<std::string>>& global_hosts)
{
    std::vector<NormalizedInterval> out;

    for (const auto& e : entries) {
        std::vector<Weekday> days;
        if (e.weekday) days.push_back(*e.weekday);
        else for (int d=0; d<7; ++d) days.push_back(static_cast<Weekday>(d));

        if (!in_domain(e.start_hour, e.start_minute))
            throw InvalidTimeError(describe(e)+": start time out of range");
        if (!in_domain(e.end_hour, e.end_minute))
            throw InvalidTimeError(describe(e)+": end time out of range");
        if (e.start_hour==e.end_hour && e.start_minute==e.end_minute)
            throw DegenerateIntervalError(describe(e)+": start equals end");

        for (Weekday d : days) {
            NormalizedInterval iv;
            iv.start = minute_of_week(d, e.start_hour, e.start_minute);
            iv.end   = minute_of_week(d, e.end_hour, e.end_minute);
            if (iv.end <= iv.start) iv.end += kMinutesPerDay;   // через полночь

            iv.source_index = e.index;
            iv.source_id    = e.id;
            iv.weekday      = d;
            if (e.host_blacklist)   iv.hosts = *e.host_blacklist;
            else if (global_hosts)  iv.hosts = *global_hosts;
            iv.block_as_whitelist = e.block_as_whitelist.value_or(false);
            out.push_back(std::move(iv));
        }
    }

    std::stable_sort(out.begin(), out.end(),
                     [](const NormalizedInterval& a, const NormalizedInterval& b){ return a.start < b.start; });

    if (auto hit = find_overlap(out)) {
        const auto& a = out[hit->first];
        const auto& b = out[hit->second];
        throw OverlapError(describe(a)+" overlaps "+describe(b),
                           a.source_index, a.source_id, b.source_index, b.source_id);
    }
    return out;
}

void check_intervals(const std::vector<NormalizedInterval>& ivs) {
    for (std::size_t i=0;i<ivs.size();++i) {
        const auto& iv = ivs[i];
        if (iv.start < 0 || iv.start >= kMinutesPerWeek)
            throw InternalConsistencyFault(describe(iv)+": start outside the week");
        if (iv.duration() <= 0 || iv.duration() >= kMinutesPerDay)
            throw InternalConsistencyFault(describe(iv)+": bad length "+std::to_string(iv.duration()));
        if (i>0 && ivs[i-1].start > iv.start)
            throw InternalConsistencyFault(describe(iv)+": intervals not sorted");
    }
    if (auto hit = find_overlap(ivs))
        throw InternalConsistencyFault(describe(ivs[hit->first])+" overlaps "+describe(ivs[hit->second]));
}

BlockSchedule to_block_schedule(const NormalizedInterval& iv) {
    BlockSchedule b;
    b.id    = iv.source_id;
    b.index = iv.source_index;
    Weekday d, end_day;
    split_minute_of_week(iv.start, d, b.start_hour, b.start_minute);
    split_minute_of_week(iv.end, end_day, b.end_hour, b.end_minute);
    b.weekday = d;
    b.host_blacklist = iv.hosts;
    b.block_as_whitelist = iv.block_as_whitelist;
    return b;
}
