#pragma once
#include "model.hpp"
#include <functional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

class App {
public:
    int run(int argc, char** argv);
    int run_command(Config cfg, const std::vector<std::string>& args, std::ostream& out);

    // Источник текущей минуты недели для status (по умолчанию локальные часы)
    void set_clock(std::function<int()> clock) { clock_ = std::move(clock); }

private:
    int cmd_compile(std::ostream& out);
    int cmd_plist(const std::vector<std::string>& args, std::ostream& out);
    int cmd_status(std::ostream& out);

private:
    Config cfg_;
    std::string self_path_{"auto-selfcontrol"};
    std::string cfg_path_{"config/auto-selfcontrol.ini"};
    std::function<int()> clock_;
};
