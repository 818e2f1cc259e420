#pragma once
#include "Config.h"
#include <functional>
#include <string>
#include <vector>

namespace sockreap {

class ArgumentParser {
public:
    ArgumentParser();

    // Fills cfg from argv. Returns false when --help or --version was handled
    // (the caller exits 0). Throws std::invalid_argument on unknown flags,
    // missing values and malformed numbers.
    bool parse(int argc, char** argv, Config& cfg);

    void print_help() const;
    void print_version() const;

private:
    enum class ArgKind { None, String, Int, CSV };
    struct FlagSpec {
        const char* name;
        ArgKind kind;
        const char* help;
        std::function<void(Config&, const std::string&)> apply;
    };

    const FlagSpec* find_spec(const std::string& flag) const;
    static int need_int(const std::string& v, const char* flag);

    std::vector<FlagSpec> specs_;
};

}
