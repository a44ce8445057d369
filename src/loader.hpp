#pragma once
#include "ini.hpp"
#include "model.hpp"
#include <string>

Config load_config_ini(const std::string& path);
Config load_config(const Ini& ini);
