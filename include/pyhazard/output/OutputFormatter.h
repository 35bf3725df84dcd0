#pragma once

#include "pyhazard/core/Finding.h"

#include <string>
#include <vector>

namespace pyhazard {

// Result of scanning one file from the command line.
struct FileReport {
    std::string path;
    std::vector<Finding> findings; // aggregated
    std::string skipReason;        // non-empty when the file was skipped
};

class OutputFormatter {
public:
    virtual ~OutputFormatter() = default;
    virtual std::string format(const std::vector<FileReport> &reports) = 0;
};

class CLIOutputFormatter : public OutputFormatter {
public:
    std::string format(const std::vector<FileReport> &reports) override;
};

class JSONOutputFormatter : public OutputFormatter {
public:
    std::string format(const std::vector<FileReport> &reports) override;
};

} // namespace pyhazard
