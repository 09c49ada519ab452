#pragma once

#include "liftfix/core/ExecutionMetadata.h"
#include "liftfix/core/Finding.h"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace liftfix {

class OutputFormatter {
public:
    virtual ~OutputFormatter() = default;
    virtual std::string format(const std::vector<Finding> &findings) = 0;
    virtual std::string format(const std::vector<Finding> &findings,
                               const ExecutionMetadata &meta) {
        return format(findings);
    }
};

class CLIOutputFormatter : public OutputFormatter {
public:
    std::string format(const std::vector<Finding> &findings) override;
    std::string format(const std::vector<Finding> &findings,
                       const ExecutionMetadata &meta) override;
};

class JSONOutputFormatter : public OutputFormatter {
public:
    std::string format(const std::vector<Finding> &findings) override;
    std::string format(const std::vector<Finding> &findings,
                       const ExecutionMetadata &meta) override;
};

class SARIFOutputFormatter : public OutputFormatter {
public:
    std::string format(const std::vector<Finding> &findings) override;
    std::string format(const std::vector<Finding> &findings,
                       const ExecutionMetadata &meta) override;
};

// text|json|sarif; nullptr for anything else.
std::unique_ptr<OutputFormatter> makeFormatter(std::string_view name);

// JSON string body: quotes, backslashes and control characters escaped.
std::string jsonEscape(std::string_view s);

} // namespace liftfix
