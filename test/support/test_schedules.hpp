#pragma once
#include <cstddef>
#include <exception>
#include <optional>

#include "model.hpp"

inline BlockSchedule sched(const char* id, std::size_t index, std::optional<Weekday> d,
                           int sh, int sm, int eh, int em)
{
    BlockSchedule s;
    s.id = id;
    s.index = index;
    s.weekday = d;
    s.start_hour = sh; s.start_minute = sm;
    s.end_hour = eh;   s.end_minute = em;
    return s;
}

template <typename E, typename F>
bool throws(F&& f)
{
    try { f(); }
    catch (const E&) { return true; }
    catch (const std::exception&) { return false; }
    return false;
}
