#include "ConfigValidator.h"
#include "Logging.h"
#include "SocketRecord.h"
#include "Utils.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>

namespace sockreap {

bool ConfigValidator::validate(Config& cfg) {
    std::transform(cfg.protocol.begin(), cfg.protocol.end(), cfg.protocol.begin(), ::tolower);
    if(!cfg.protocol.empty() && cfg.protocol != "tcp" && cfg.protocol != "udp") {
        std::cerr << "Invalid --proto value: " << cfg.protocol << "\n";
        return false;
    }

    for(const auto& s : cfg.states) {
        if(!parse_tcp_state(s)) {
            std::cerr << "Unknown TCP state: " << s << "\n";
            return false;
        }
    }
    if(!cfg.states.empty() && cfg.protocol == "udp") {
        std::cerr << "--state only applies to TCP sockets\n";
        return false;
    }

    LogLevel lvl;
    if(!parse_log_level(cfg.log_level, lvl)) {
        std::cerr << "Invalid --log-level value: " << cfg.log_level << "\n";
        return false;
    }

    // Port 0 is a valid query: sockets not yet bound to a port report it
    if(cfg.target_port != -1 && (cfg.target_port < 0 || cfg.target_port > 65535)) {
        std::cerr << "Port out of range (0-65535): " << cfg.target_port << "\n";
        return false;
    }
    if(cfg.target_pid != -1 && cfg.target_pid < 1) {
        std::cerr << "PID must be positive: " << cfg.target_pid << "\n";
        return false;
    }

    switch(cfg.command) {
        case Command::Port:
            if(cfg.target_port == -1) { std::cerr << "port requires a port number\n"; return false; }
            break;
        case Command::Pid:
        case Command::Details:
            if(cfg.target_pid == -1) { std::cerr << command_name(cfg.command) << " requires a PID\n"; return false; }
            break;
        case Command::Kill:
            if(cfg.target_port == -1 && cfg.target_pid == -1) {
                std::cerr << "kill requires --port N or --pid N\n";
                return false;
            }
            if(cfg.target_port != -1 && cfg.target_pid != -1) {
                std::cerr << "--port and --pid are mutually exclusive\n";
                return false;
            }
            if(cfg.target_port == 0) {
                std::cerr << "kill --port requires a bound port (1-65535)\n";
                return false;
            }
            break;
        case Command::List:
            break;
    }

    if(!validate_timing(cfg.grace_ms, "--grace-ms")) return false;
    if(!validate_timing(cfg.kill_wait_ms, "--kill-wait-ms")) return false;
    if(cfg.poll_interval_ms < 1 || cfg.poll_interval_ms > kMaxWaitMs) {
        std::cerr << "Poll interval out of range: " << cfg.poll_interval_ms << "\n";
        return false;
    }

    if(cfg.pretty && !cfg.json) {
        Logger::instance().debug("--pretty without --json has no effect");
    }
    if(cfg.proc_root.empty()) cfg.proc_root = "/proc";
    while(cfg.proc_root.size() > 1 && cfg.proc_root.back() == '/') cfg.proc_root.pop_back();

    return true;
}

bool ConfigValidator::validate_timing(int value, const char* flag) {
    if(value < 0 || value > kMaxWaitMs) {
        std::cerr << flag << " must be between 0 and " << kMaxWaitMs << ": " << value << "\n";
        return false;
    }
    return true;
}

bool ConfigValidator::load_external_files(Config& cfg) {
    if(cfg.protect_file.empty()) return true;
    return load_protect_file(cfg);
}

bool ConfigValidator::load_protect_file(Config& cfg) {
    std::ifstream pf(cfg.protect_file);
    if(!pf) {
        std::cerr << "Failed to open protect file: " << cfg.protect_file << "\n";
        return false;
    }

    std::string line;
    while(std::getline(pf, line)) {
        auto hash = line.find('#');
        if(hash != std::string::npos) line.erase(hash);
        line = utils::trim(line);
        if(line.empty()) continue;
        int pid = 0;
        if(utils::is_valid_pid(line.c_str(), &pid)) cfg.protected_pids.push_back(pid);
        else cfg.protected_names.push_back(line);
    }
    return true;
}

}
