#include "app.hpp"
#include "compiler.hpp"
#include "launchd.hpp"
#include "loader.hpp"
#include "time_util.hpp"
#include <filesystem>
#include <iostream>
#include <system_error>
#include <utility>

static void usage(std::ostream& os) {
    os<<"usage: auto-selfcontrol [--config PATH] <command>\n"
        "  compile            print the trigger instants of the weekly schedule\n"
        "  plist [start|stop] print the launchd job for the start or stop instants\n"
        "  status             print the window active right now\n";
}

static std::string join(const std::vector<std::string>& v) {
    std::string s;
    for (auto& x : v) { if (!s.empty()) s += ","; s += x; }
    return s;
}

namespace fs = std::filesystem;

// launchd запускает задания с рабочим каталогом "/", относительные пути там не работают
static std::string absolute_path(const std::string& p) {
    return fs::absolute(fs::path(p)).lexically_normal().string();
}

static std::string self_executable(const std::string& argv0) {
    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (!ec && !exe.empty()) return exe.string();
    return absolute_path(argv0);
}

int App::cmd_compile(std::ostream& out) {
    CompiledSchedule cs = compile_schedule(cfg_);
    out<<"[CONFIG] user="<<cfg_.username<<" selfcontrol="<<cfg_.selfcontrol_path
       <<" legacy_mode="<<(cfg_.legacy_mode?1:0)<<"\n";
    for (const auto& t : cs.triggers) {
        if (t.action == TriggerAction::Start) {
            out<<"START "<<weekday_name(t.weekday)<<" "<<format_hhmm(t.hour, t.minute)
               <<" duration="<<t.duration_minutes
               <<" whitelist="<<(t.block_as_whitelist?1:0)
               <<" hosts="<<join(t.hosts)
               <<" ["<<t.source_id<<"]\n";
        } else {
            out<<"STOP  "<<weekday_name(t.weekday)<<" "<<format_hhmm(t.hour, t.minute)
               <<" ["<<t.source_id<<"]\n";
        }
    }
    out<<"[OK] "<<cs.intervals.size()<<" window(s), "<<cs.triggers.size()
       <<" trigger(s), "<<total_blocked_minutes(cs)<<" minute(s) blocked per week\n";
    return 0;
}

int App::cmd_plist(const std::vector<std::string>& args, std::ostream& out) {
    TriggerAction action = TriggerAction::Start;
    if (args.size() > 1) {
        if (args[1]=="start") action = TriggerAction::Start;
        else if (args[1]=="stop") action = TriggerAction::Stop;
        else { usage(std::cerr); return 1; }
    }

    CompiledSchedule cs = compile_schedule(cfg_);

    LaunchdOptions opt;
    if (action == TriggerAction::Stop) opt.label += ".stop";
    opt.program_arguments = {self_executable(self_path_), "--config", absolute_path(cfg_path_), "status"};
    out<<render_launchd_plist(cs, action, opt);
    return 0;
}

int App::cmd_status(std::ostream& out) {
    CompiledSchedule cs = compile_schedule(cfg_);
    auto win = active_at(cs, clock_ ? clock_() : LocalClock::now_minute_of_week());
    if (!win) {
        out<<"[IDLE] No schedule is active at the moment\n";
        return 2;
    }
    Weekday d; int h, m;
    split_minute_of_week(win->interval.end, d, h, m);
    out<<"[ACTIVE] schedule '"<<win->interval.source_id<<"' until "<<weekday_name(d)<<" "
       <<format_hhmm(h, m)<<", "<<win->remaining_minutes<<" minute(s) left"
       <<" hosts="<<join(win->interval.hosts)<<"\n";
    return 0;
}

int App::run_command(Config cfg, const std::vector<std::string>& args, std::ostream& out) {
    cfg_ = std::move(cfg);
    if (args.empty()) { usage(std::cerr); return 1; }

    const std::string& cmd = args[0];
    if (cmd=="compile") return cmd_compile(out);
    if (cmd=="plist")   return cmd_plist(args, out);
    if (cmd=="status")  return cmd_status(out);
    usage(std::cerr);
    return 1;
}

int App::run(int argc, char** argv) {
    try {
        if (argc > 0) self_path_ = argv[0];
        std::vector<std::string> args;
        for (int i=1; i<argc; ++i) {
            std::string a = argv[i];
            if (a=="--config") {
                if (i+1 >= argc) { usage(std::cerr); return 1; }
                cfg_path_ = argv[++i];
            } else if (a=="-h" || a=="--help") {
                usage(std::cout);
                return 0;
            } else {
                args.push_back(a);
            }
        }
        if (args.empty()) { usage(std::cerr); return 1; }

        Config loaded = load_config_ini(cfg_path_);
        return run_command(std::move(loaded), args, std::cout);
    } catch (const std::exception& e) {
        std::cerr<<"Fatal: "<<e.what()<<"\n";
        return 1;
    }
}
