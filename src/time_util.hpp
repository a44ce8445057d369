#pragma once
#include "model.hpp"
#include <ctime>
#include <string>
#include <utility>

constexpr int kMinutesPerDay  = 24 * 60;
constexpr int kMinutesPerWeek = 7 * kMinutesPerDay;

struct LocalClock {
    static std::pair<std::tm,std::time_t> now_tm();
    static int  now_minute_of_week();
    static void parse_hhmm(const std::string& hhmm, int& h, int& m);
};

Weekday     parse_weekday(const std::string& s);   // "mon", "Monday", "1".."7"
Weekday     weekday_from_iso(int iso);             // 1=Mon..7=Sun
int         weekday_iso(Weekday d);
const char* weekday_name(Weekday d);

int  minute_of_week(Weekday d, int hour, int minute);
void split_minute_of_week(int offset, Weekday& d, int& hour, int& minute);

std::string format_hhmm(int hour, int minute);
