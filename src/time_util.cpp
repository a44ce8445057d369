#include "time_util.hpp"
#include "errors.hpp"
#include "ini.hpp"
#include <cstdio>

std::pair<std::tm,std::time_t> LocalClock::now_tm() {
    std::time_t t = std::time(nullptr);
    std::tm lt{};
#if defined(_WIN32)
    localtime_s(&lt, &t);
#else
    localtime_r(&t, &lt);
#endif
    return {lt, t};
}

int LocalClock::now_minute_of_week() {
    auto [lt, now] = now_tm();
    (void)now;
    // tm_wday: 0=Sun..6=Sat, неделя у нас начинается с понедельника
    int day = (lt.tm_wday + 6) % 7;
    return day*kMinutesPerDay + lt.tm_hour*60 + lt.tm_min;
}

void LocalClock::parse_hhmm(const std::string& hhmm, int& h, int& m) {
    char tail = 0;
    if (std::sscanf(hhmm.c_str(), "%d:%d%c", &h, &m, &tail) != 2)
        throw ConfigError("Bad time: "+hhmm);
}

Weekday parse_weekday(const std::string& s0) {
    std::string s = to_lower(s0);
    if (s=="mon"||s=="mo"||s=="monday"    ||s=="1") return Weekday::Monday;
    if (s=="tue"||s=="tu"||s=="tuesday"   ||s=="2") return Weekday::Tuesday;
    if (s=="wed"||s=="we"||s=="wednesday" ||s=="3") return Weekday::Wednesday;
    if (s=="thu"||s=="th"||s=="thursday"  ||s=="4") return Weekday::Thursday;
    if (s=="fri"||s=="fr"||s=="friday"    ||s=="5") return Weekday::Friday;
    if (s=="sat"||s=="sa"||s=="saturday"  ||s=="6") return Weekday::Saturday;
    if (s=="sun"||s=="su"||s=="sunday"    ||s=="7") return Weekday::Sunday;
    throw ConfigError("Unknown day: "+s0);
}

Weekday weekday_from_iso(int iso) {
    if (iso<1 || iso>7) throw ConfigError("Weekday out of range: "+std::to_string(iso));
    return static_cast<Weekday>(iso-1);
}

int weekday_iso(Weekday d) { return static_cast<int>(d) + 1; }

const char* weekday_name(Weekday d) {
    static const char* names[] = {"Mon","Tue","Wed","Thu","Fri","Sat","Sun"};
    return names[static_cast<int>(d)];
}

int minute_of_week(Weekday d, int hour, int minute) {
    return static_cast<int>(d)*kMinutesPerDay + hour*60 + minute;
}

void split_minute_of_week(int offset, Weekday& d, int& hour, int& minute) {
    int m = ((offset % kMinutesPerWeek) + kMinutesPerWeek) % kMinutesPerWeek;
    d      = static_cast<Weekday>(m / kMinutesPerDay);
    hour   = (m % kMinutesPerDay) / 60;
    minute = m % 60;
}

std::string format_hhmm(int hour, int minute) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", hour, minute);
    return buf;
}
