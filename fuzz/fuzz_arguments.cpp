#include "core/Config.h"
#include "core/ArgumentParser.h"
#include "core/ConfigValidator.h"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    std::string input(reinterpret_cast<const char*>(data), size);

    // Split into args on spaces; argv[0] is the program name
    std::vector<std::string> args{"sockreap"};
    size_t pos = 0;
    while (pos < input.size()) {
        size_t next = input.find(' ', pos);
        if (next == std::string::npos) {
            args.push_back(input.substr(pos));
            break;
        }
        args.push_back(input.substr(pos, next - pos));
        pos = next + 1;
    }

    std::vector<char*> argv;
    for (auto& arg : args) argv.push_back(const_cast<char*>(arg.c_str()));

    sockreap::ArgumentParser parser;
    sockreap::Config cfg;
    try {
        if (parser.parse(static_cast<int>(argv.size()), argv.data(), cfg)) {
            // Validation must accept or reject, never crash
            cfg.protect_file.clear();
            sockreap::ConfigValidator().validate(cfg);
        }
    } catch (const std::invalid_argument&) {
        // rejected input
    }
    return 0;
}
