#include "Utils.h"
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <algorithm>
#include <fcntl.h>
#include <unistd.h>

namespace sockreap {
namespace utils {

bool is_valid_pid(const char* str, int* pid_out) {
    if (!str || !*str) return false;
    char* endptr;
    errno = 0;
    long val = strtol(str, &endptr, 10);
    if (errno != 0 || *endptr != '\0' || val <= 0 || val > INT_MAX) return false;
    if (pid_out) *pid_out = static_cast<int>(val);
    return true;
}

// EINTR-safe; /proc files report st_size 0 so read until EOF
bool read_file(const std::string& path, std::string& out, std::size_t max_bytes) {
    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1) return false;
    out.clear();
    char buf[4096];
    while (out.size() < max_bytes) {
        ssize_t n;
        do {
            n = read(fd, buf, sizeof(buf));
        } while (n == -1 && errno == EINTR);
        if (n <= 0) break;
        out.append(buf, static_cast<std::size_t>(n));
    }
    close(fd);
    if (out.size() > max_bytes) out.resize(max_bytes);
    return true;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split_csv(const std::string& s){
    std::vector<std::string> out; std::string cur;
    for(char c: s){ if(c==','){ if(!cur.empty()) out.push_back(trim(cur)); cur.clear(); } else cur.push_back(c); }
    if(!cur.empty()) out.push_back(trim(cur));
    out.erase(std::remove_if(out.begin(), out.end(), [](const std::string& v){ return v.empty(); }), out.end());
    return out;
}

std::optional<long long> parse_int(const std::string& s){
    std::string t = trim(s);
    if(t.empty()) return std::nullopt;
    char* endptr;
    errno = 0;
    long long v = strtoll(t.c_str(), &endptr, 10);
    if(errno != 0 || *endptr != '\0') return std::nullopt;
    return v;
}

}
}
