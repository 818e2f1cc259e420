#pragma once
#include <string>
#include <vector>
#include <optional>

namespace sockreap {
namespace utils {

// Decimal, > 0, fits in int. Used for /proc directory names and CLI values.
bool is_valid_pid(const char* str, int* pid_out = nullptr);
// Reads at most max_bytes; false when the file cannot be opened.
bool read_file(const std::string& path, std::string& out, std::size_t max_bytes = 64 * 1024);
std::string trim(const std::string& s);
std::vector<std::string> split_csv(const std::string& s);
// Strict integer parse of the whole string.
std::optional<long long> parse_int(const std::string& s);

}
}
