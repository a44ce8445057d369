#include "loader.hpp"
#include "errors.hpp"
#include "time_util.hpp"
#include <cctype>
#include <iostream>
#include <set>

static inline bool ieq(const std::string& a, const std::string& b) {
    if (a.size()!=b.size()) return false;
    for (size_t i=0;i<a.size();++i)
        if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i]))
            return false;
    return true;
}

static bool to_bool(const std::string& s0) {
    std::string s = to_lower(s0);
    if (s=="1"||s=="true"||s=="yes"||s=="on")  return true;
    if (s=="0"||s=="false"||s=="no"||s=="off") return false;
    throw ConfigError("Bad boolean: "+s0);
}

static std::vector<std::string> split_list(const std::string& s) {
    std::vector<std::string> out;
    for (auto& it : split(s, ',')) {
        auto t = trim(it);
        if (!t.empty()) out.push_back(t);
    }
    return out;
}

static const std::string* find_key(const std::map<std::string,std::string>& sec, const std::string& key) {
    for (auto& kv : sec)
        if (ieq(kv.first, key)) return &kv.second;
    return nullptr;
}

Config load_config_ini(const std::string& path) {
    return load_config(read_ini(path));
}

Config load_config(const Ini& ini) {
    Config c;

    // General
    auto gen = ini.sec.find("General");
    if (gen == ini.sec.end()) throw ConfigError("[General] section required");
    const auto& G = gen->second;

    if (auto v = find_key(G, "username"); v && !v->empty()) c.username = *v;
    else throw ConfigError("No username specified in config");

    if (auto v = find_key(G, "selfcontrol_path"); v && !v->empty()) c.selfcontrol_path = *v;
    else throw ConfigError("The setting 'selfcontrol_path' is required and must point to the location of SelfControl");

    if (auto v = find_key(G, "host_blacklist")) c.host_blacklist = split_list(*v);
    else std::cerr<<"WARNING: no host_blacklist in [General]; SelfControl's own blacklist will be used\n";

    if (auto v = find_key(G, "legacy_mode")) c.legacy_mode = to_bool(*v);

    // Schedules
    std::size_t index = 0;
    for (auto& kv : ini.schedules) {
        BlockSchedule s;
        s.id    = kv.first;
        s.index = index++;

        std::set<int> days;
        bool has_start = false, has_end = false;

        for (auto& p : split(kv.second, ';')) {
            auto t = trim(p);
            if (t.empty()) continue;
            auto eq = t.find('=');
            if (eq==std::string::npos) throw ConfigError("schedule "+s.id+": expected key=value, got '"+t+"'");
            auto key = trim(t.substr(0,eq));
            auto val = trim(t.substr(eq+1));

            if (ieq(key,"days") || ieq(key,"day")) {
                for (auto& d : split_list(val)) days.insert(static_cast<int>(parse_weekday(d)));
            }
            else if (ieq(key,"start")) { LocalClock::parse_hhmm(val, s.start_hour, s.start_minute); has_start = true; }
            else if (ieq(key,"end"))   { LocalClock::parse_hhmm(val, s.end_hour, s.end_minute);     has_end = true; }
            else if (ieq(key,"hosts")) s.host_blacklist = split_list(val);
            else if (ieq(key,"whitelist")) s.block_as_whitelist = to_bool(val);
            else throw ConfigError("schedule "+s.id+": unknown key '"+key+"'");
        }

        if (!has_start) throw ConfigError("schedule "+s.id+" without start");
        if (!has_end)   throw ConfigError("schedule "+s.id+" without end");

        if (days.empty() || days.size()==7) {
            c.schedules.push_back(std::move(s));
        } else {
            for (int d : days) {
                BlockSchedule one = s;
                one.weekday = static_cast<Weekday>(d);
                c.schedules.push_back(std::move(one));
            }
        }
    }

    if (c.schedules.empty())
        throw ConfigError("You need at least one schedule in [Schedule]");
    return c;
}
