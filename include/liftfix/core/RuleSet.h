#pragma once

#include "liftfix/core/Rule.h"

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace liftfix {

// The compiled rules of one run. Read-only once built; shared by all workers.
class RuleSet {
public:
    // Reads a rules file. An unreadable or malformed file is an error; a
    // single rule that fails to compile is dropped with a warning.
    static llvm::Expected<RuleSet> loadFromFile(const std::string &path,
                                                OffsetUnit unit);

    static llvm::Expected<std::vector<RuleSpec>> parseSpecs(llvm::StringRef yaml);

    static RuleSet fromSpecs(const std::vector<RuleSpec> &specs, OffsetUnit unit);

    const std::vector<std::unique_ptr<Rule>> &rules() const { return rules_; }
    size_t size() const { return rules_.size(); }
    bool empty() const { return rules_.empty(); }

    const Rule *findByID(std::string_view id) const;

    // Removes every rule whose id is listed. Returns how many were removed.
    size_t disable(const std::vector<std::string> &ids);

private:
    std::vector<std::unique_ptr<Rule>> rules_;
};

} // namespace liftfix
