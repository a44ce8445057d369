#include "launchd.hpp"
#include "time_util.hpp"
#include <sstream>

std::string xml_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
        case '&':  out += "&amp;";  break;
        case '<':  out += "&lt;";   break;
        case '>':  out += "&gt;";   break;
        case '"':  out += "&quot;"; break;
        case '\'': out += "&apos;"; break;
        default:   out += c;
        }
    }
    return out;
}

std::string render_launchd_plist(const CompiledSchedule& cs, TriggerAction action,
                                 const LaunchdOptions& opt)
{
    std::ostringstream os;
    os<<"<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<!DOCTYPE plist PUBLIC \"-//Apple//DTD PLIST 1.0//EN\" \"http://www.apple.com/DTDs/PropertyList-1.0.dtd\">\n"
        "<plist version=\"1.0\">\n"
        "<dict>\n"
        "    <key>Label</key>\n"
        "    <string>"<<xml_escape(opt.label)<<"</string>\n"
        "    <key>ProgramArguments</key>\n"
        "    <array>\n";
    for (auto& a : opt.program_arguments)
        os<<"        <string>"<<xml_escape(a)<<"</string>\n";
    os<<"    </array>\n"
        "    <key>StartCalendarInterval</key>\n"
        "    <array>\n";

    for (const auto& t : cs.triggers) {
        if (t.action != action) continue;
        os<<"        <dict>\n"
            "            <key>Weekday</key>\n"
            "            <integer>"<<weekday_iso(t.weekday)<<"</integer>\n"
            "            <key>Hour</key>\n"
            "            <integer>"<<t.hour<<"</integer>\n"
            "            <key>Minute</key>\n"
            "            <integer>"<<t.minute<<"</integer>\n"
            "        </dict>\n";
    }
    os<<"    </array>\n"
        "    <key>RunAtLoad</key>\n"
        "    "<<(opt.run_at_load ? "<true/>" : "<false/>")<<"\n"
        "</dict>\n"
        "</plist>\n";
    return os.str();
}
