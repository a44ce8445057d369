#pragma once
#include <istream>
#include <map>
#include <string>
#include <utility>
#include <vector>

struct Ini {
    std::map<std::string, std::map<std::string,std::string>> sec;
    std::vector<std::pair<std::string,std::string>> schedules; // [Schedule]: key -> value(line), в порядке файла
};

Ini read_ini(const std::string& path);
Ini parse_ini(std::istream& in);

std::string trim(std::string s);
std::string to_lower(std::string s);
std::vector<std::string> split(const std::string& s, char d);
