#pragma once
#include <string>
#include <vector>

namespace sockreap {

enum class Command { List, Port, Pid, Details, Kill };
enum class ViewMode { Port, Process };

struct Config {
    Command command = Command::List;
    ViewMode view = ViewMode::Port;
    // Listing filters
    std::string protocol; // "tcp" | "udp" | empty=both
    std::vector<std::string> states; // TCP states if non-empty (case-insensitive)
    bool listen_only = false; // TCP LISTEN and unconnected UDP only
    // Targets
    int target_port = -1; // -1 = not given
    int target_pid = -1;
    // Termination
    bool force = false; // SIGKILL only, no graceful stage
    bool assume_yes = false; // confirmation given on the command line
    int grace_ms = 500; // wait after SIGTERM before escalating
    int kill_wait_ms = 500; // wait after SIGKILL before the final check
    int poll_interval_ms = 25;
    std::vector<int> protected_pids; // never signalled (PID 1 and self are always protected)
    std::vector<std::string> protected_names; // process names (comm) never signalled
    std::string protect_file; // newline-delimited PIDs / names, '#' comments
    // Output
    bool json = false;
    bool pretty = false;
    std::string output_file;
    bool hash_exe = false; // SHA256 of the executable in details (OpenSSL)
    // Environment
    std::string proc_root = "/proc";
    std::string log_level = "info";
    bool drop_priv = false;
    bool seccomp = false;
    bool seccomp_strict = false;
};

// Upper bound for every wait of the termination engine.
constexpr int kMaxWaitMs = 30000;

const char* command_name(Command c);
bool parse_command(const std::string& s, Command& out);

}
