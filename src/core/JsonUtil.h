#pragma once
#include <chrono>
#include <string>

namespace sockreap {
namespace jsonutil {

std::string escape(const std::string& s);
// UTC, second precision: 2024-01-02T03:04:05Z
std::string time_to_iso(std::chrono::system_clock::time_point tp);

}
}
