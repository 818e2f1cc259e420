#pragma once
#include "Config.h"
#include <string>

namespace sockreap {

class ConfigValidator {
public:
    // Normalizes cfg in place. Returns false (reason on stderr) for invalid combinations.
    bool validate(Config& cfg);
    // Merges protect_file into protected_pids / protected_names.
    bool load_external_files(Config& cfg);

private:
    bool validate_timing(int value, const char* flag);
    bool load_protect_file(Config& cfg);
};

}
