#pragma once
#include "model.hpp"
#include <string>
#include <vector>

struct LaunchdOptions {
    std::string label{"com.parrot-bytes.auto-selfcontrol"};
    std::vector<std::string> program_arguments;
    bool run_at_load{true};
};

// Property list для launchd: один StartCalendarInterval на каждый момент
// срабатывания с нужным action. Weekday в формате launchd: 1=Mon..7=Sun.
std::string render_launchd_plist(const CompiledSchedule& cs, TriggerAction action,
                                 const LaunchdOptions& opt);

std::string xml_escape(const std::string& s);
