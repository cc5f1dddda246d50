#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace constlint {

struct ExecutionMetadata {
    std::string toolVersion;
    std::string configPath;
    uint64_t timestampEpochSec = 0;
    std::vector<std::string> sourceFiles;
    std::vector<std::string> enabledRules;
};

} // namespace constlint
