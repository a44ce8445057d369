#include "ini.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

std::string trim(std::string s) {
    auto issp = [](unsigned char c){ return std::isspace(c); };
    while(!s.empty() && issp(s.front())) s.erase(s.begin());
    while(!s.empty() && issp(s.back()))  s.pop_back();
    return s;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split(const std::string& s, char d) {
    std::vector<std::string> out; std::stringstream ss(s); std::string it;
    while (std::getline(ss,it,d)) out.push_back(it);
    return out;
}

Ini read_ini(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw ConfigError("Cannot open config: "+path);
    return parse_ini(f);
}

Ini parse_ini(std::istream& in) {
    Ini ini;
    std::string line, cur;
    int lineno = 0;
    while (std::getline(in,line)) {
        ++lineno;
        line = trim(line);
        if (line.empty() || line[0]==';' || line[0]=='#') continue;
        if (line.front()=='[' && line.back()==']') {
            cur = trim(line.substr(1, line.size()-2));
            continue;
        }
        auto pos = line.find('=');
        if (pos==std::string::npos)
            throw ConfigError("line "+std::to_string(lineno)+": expected key = value");
        std::string k = trim(line.substr(0,pos));
        std::string v = trim(line.substr(pos+1));
        if (k.empty())
            throw ConfigError("line "+std::to_string(lineno)+": empty key");
        if (cur=="Schedule") ini.schedules.emplace_back(k, v);
        else ini.sec[cur][k]=v;
    }
    return ini;
}
