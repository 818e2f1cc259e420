#include "ArgumentParser.h"
#include "Utils.h"
#include "BuildInfo.h"
#include <iostream>
#include <limits>
#include <stdexcept>

namespace sockreap {

int ArgumentParser::need_int(const std::string& v, const char* flag){
    auto n = utils::parse_int(v);
    if(!n || *n < std::numeric_limits<int>::min() || *n > std::numeric_limits<int>::max())
        throw std::invalid_argument(std::string("Invalid integer for ") + flag + ": " + v);
    return static_cast<int>(*n);
}

static std::vector<int> need_int_list(const std::string& v, const char* flag){
    std::vector<int> out;
    for(const auto& item : utils::split_csv(v)){
        auto n = utils::parse_int(item);
        if(!n || *n <= 0 || *n > std::numeric_limits<int>::max())
            throw std::invalid_argument(std::string("Invalid PID for ") + flag + ": " + item);
        out.push_back(static_cast<int>(*n));
    }
    return out;
}

ArgumentParser::ArgumentParser(){
    specs_ = {
        {"--view", ArgKind::String, "Group listing by port or process", [](Config& c, const std::string& v){
            if(v=="port") c.view = ViewMode::Port;
            else if(v=="process") c.view = ViewMode::Process;
            else throw std::invalid_argument("Invalid value for --view: " + v);
        }},
        {"--proto", ArgKind::String, "Filter to tcp or udp", [](Config& c, const std::string& v){ c.protocol = v; }},
        {"--state", ArgKind::CSV, "Comma-separated TCP states", [](Config& c, const std::string& v){ c.states = utils::split_csv(v); }},
        {"--listen-only", ArgKind::None, "Only listening sockets", [](Config& c, const std::string&){ c.listen_only = true; }},
        {"--port", ArgKind::Int, "Target port", [](Config& c, const std::string& v){ c.target_port = need_int(v, "--port"); }},
        {"--pid", ArgKind::Int, "Target PID", [](Config& c, const std::string& v){ c.target_pid = need_int(v, "--pid"); }},
        {"--force", ArgKind::None, "SIGKILL only, skip SIGTERM", [](Config& c, const std::string&){ c.force = true; }},
        {"--yes", ArgKind::None, "Do not ask for confirmation", [](Config& c, const std::string&){ c.assume_yes = true; }},
        {"--grace-ms", ArgKind::Int, "Wait after SIGTERM before SIGKILL", [](Config& c, const std::string& v){ c.grace_ms = need_int(v, "--grace-ms"); }},
        {"--kill-wait-ms", ArgKind::Int, "Wait after SIGKILL before giving up", [](Config& c, const std::string& v){ c.kill_wait_ms = need_int(v, "--kill-wait-ms"); }},
        {"--protect", ArgKind::CSV, "PIDs that are never signalled", [](Config& c, const std::string& v){
            auto pids = need_int_list(v, "--protect");
            c.protected_pids.insert(c.protected_pids.end(), pids.begin(), pids.end());
        }},
        {"--protect-name", ArgKind::CSV, "Process names that are never signalled", [](Config& c, const std::string& v){
            auto names = utils::split_csv(v);
            c.protected_names.insert(c.protected_names.end(), names.begin(), names.end());
        }},
        {"--protect-file", ArgKind::String, "File listing protected PIDs and names", [](Config& c, const std::string& v){ c.protect_file = v; }},
        {"--hash-exe", ArgKind::None, "SHA256 of the executable in details", [](Config& c, const std::string&){ c.hash_exe = true; }},
        {"--json", ArgKind::None, "JSON output", [](Config& c, const std::string&){ c.json = true; }},
        {"--pretty", ArgKind::None, "Pretty-print JSON", [](Config& c, const std::string&){ c.pretty = true; }},
        {"--output", ArgKind::String, "Write output to FILE (default stdout)", [](Config& c, const std::string& v){ c.output_file = v; }},
        {"--proc-root", ArgKind::String, "procfs mount point (default /proc)", [](Config& c, const std::string& v){ c.proc_root = v; }},
        {"--log-level", ArgKind::String, "error|warn|info|debug|trace", [](Config& c, const std::string& v){ c.log_level = v; }},
        {"--drop-priv", ArgKind::None, "Drop Linux capabilities early", [](Config& c, const std::string&){ c.drop_priv = true; }},
        {"--seccomp", ArgKind::None, "Apply seccomp profile", [](Config& c, const std::string&){ c.seccomp = true; }},
        {"--seccomp-strict", ArgKind::None, "Fail if seccomp apply fails", [](Config& c, const std::string&){ c.seccomp = true; c.seccomp_strict = true; }}
    };
}

const ArgumentParser::FlagSpec* ArgumentParser::find_spec(const std::string& flag) const {
    for(const auto& s : specs_) if(flag == s.name) return &s;
    return nullptr;
}

bool ArgumentParser::parse(int argc, char** argv, Config& cfg){
    bool have_command = false;
    for(int i=1;i<argc;++i){
        std::string a = argv[i] ? argv[i] : "";
        if(a=="--help"){ print_help(); return false; }
        if(a=="--version"){ print_version(); return false; }
        if(a.size() > 1 && a[0]=='-'){
            const FlagSpec* spec = find_spec(a);
            if(!spec) throw std::invalid_argument("Unknown arg: " + a);
            std::string val;
            if(spec->kind != ArgKind::None){
                if(i+1>=argc || !argv[i+1]) throw std::invalid_argument("Missing value for " + a);
                val = argv[++i];
            }
            spec->apply(cfg, val);
            continue;
        }
        if(!have_command){
            if(!parse_command(a, cfg.command)) throw std::invalid_argument("Unknown command: " + a);
            have_command = true;
            continue;
        }
        // "port N" / "pid N" / "details N"
        switch(cfg.command){
            case Command::Port: cfg.target_port = need_int(a, "port"); break;
            case Command::Pid:
            case Command::Details: cfg.target_pid = need_int(a, command_name(cfg.command)); break;
            default: throw std::invalid_argument("Unexpected argument: " + a);
        }
    }
    return true;
}

void ArgumentParser::print_help() const {
    std::cout << "usage: sockreap [list|port N|pid N|details N|kill] [options]\n";
    std::cout << "  list      show sockets grouped by --view (default)\n"
                 "  port N    sockets bound to port N\n"
                 "  pid N     sockets owned by process N\n"
                 "  details N process information for PID N\n"
                 "  kill      terminate the owner of --port N or the process --pid N\n";
    std::cout << "options:\n";
    for(const auto& s : specs_){
        std::string name = s.name;
        if(s.kind == ArgKind::Int) name += " N";
        else if(s.kind == ArgKind::CSV) name += " a,b";
        else if(s.kind == ArgKind::String) name += " V";
        std::cout << "  " << name;
        if(name.size() < 24) for(size_t i=name.size(); i<24; ++i) std::cout << ' '; else std::cout << ' ';
        std::cout << s.help << "\n";
    }
    std::cout << "  --version               Print version & exit\n";
    std::cout << "  --help                  Show this help\n";
}

void ArgumentParser::print_version() const {
    std::cout << "sockreap " << buildinfo::APP_VERSION << " (git=" << buildinfo::GIT_COMMIT
              << ", compiler=" << buildinfo::COMPILER_ID << " " << buildinfo::COMPILER_VERSION
              << ", cxx_std=" << buildinfo::CXX_STANDARD << ")\n";
}

}
