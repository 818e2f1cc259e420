#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace sockreap {

struct ProcessDetails {
    int pid = 0;
    int ppid = 0;
    std::string name;
    char state = '?';
    std::optional<std::uint32_t> uid;
    std::string user; // empty when the uid has no passwd entry
    std::string cmdline; // NUL separators replaced by spaces
    std::string exe; // empty when the link is unreadable
    std::uint64_t rss_bytes = 0;
    long threads = 0;
    std::optional<std::chrono::system_clock::time_point> start_time;
    std::uint64_t run_time_seconds = 0;
    double cpu_percent = 0.0; // average over the process lifetime
    std::string exe_sha256; // hex, only with hash_exe and OpenSSL
};

// Reads everything from <proc_root>/<pid>. Throws Error(NotFound) when the process does not exist.
ProcessDetails describe_process(int pid, const std::string& proc_root = "/proc", bool hash_exe = false);

// 5 -> "5s", 125 -> "2m 5s", 10925 -> "3h 2m 5s", 97325 -> "1d 3h 2m 5s"
std::string format_duration(std::uint64_t secs);

// Lowercase hex SHA256 of a file, empty on failure or without OpenSSL.
std::string sha256_file(const std::string& path);

}
