#pragma once

#include "liftfix/core/Finding.h"
#include "liftfix/core/MatchEnvironment.h"
#include "liftfix/core/Severity.h"
#include "liftfix/core/SourceBuffer.h"
#include "liftfix/fixing/Autofix.h"
#include "liftfix/lang/Language.h"
#include "liftfix/matching/Matcher.h"

#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace liftfix {

// One entry of a rules file, as written.
struct RuleSpec {
    std::string id;
    std::string pattern;
    std::string fix; // empty: the rule reports only
    std::string message;
    Severity severity = Severity::Warning;
    std::vector<std::string> languages;
};

// Id given to the rule built from --pattern on the command line.
inline constexpr const char *kCommandLineRuleID = "-";

class Rule {
public:
    // Parses the pattern and the fix for every listed language. An unknown
    // language or a pattern that does not parse is an error. A fix that does
    // not parse only disables the fix; see fixDisabledReason().
    static llvm::Expected<std::unique_ptr<Rule>> compile(const RuleSpec &spec,
                                                         OffsetUnit unit);

    std::string_view getID() const { return id_; }
    std::string_view getMessage() const { return message_; }
    Severity getSeverity() const { return severity_; }

    bool hasFix() const { return !fixText_.empty(); }
    bool fixEnabled() const { return hasFix() && fixDisabledReason_.empty(); }
    const std::string &fixDisabledReason() const { return fixDisabledReason_; }

    bool appliesTo(const Language &lang) const;

    // Matches the rule against one parsed target and appends one finding per
    // match. Fixes are rendered for every match; a fix failure is recorded on
    // the finding. With `trace`, per-match detail is written there.
    void analyze(const SourceBuffer &target, const NodePtr &tree,
                 const Language &lang, std::vector<Finding> &out,
                 llvm::raw_ostream *trace = nullptr) const;

private:
    struct CompiledPattern {
        const Language *lang;
        std::shared_ptr<const SourceBuffer> patternBuffer;
        Matcher matcher;
        std::optional<FixTemplate> fix;
    };

    Rule() = default;

    const CompiledPattern *patternFor(const Language &lang) const;
    Finding makeFinding(const Match &match, const SourceBuffer &target) const;

    std::string id_;
    std::string message_;
    std::string fixText_;
    std::string fixDisabledReason_;
    Severity severity_ = Severity::Warning;
    std::vector<CompiledPattern> patterns_;
};

// `$NAME` in a message is replaced by the target text bound to NAME.
// Unbound names are left as written.
std::string interpolateMessage(std::string_view message,
                               const MatchEnvironment &env,
                               const SourceBuffer &target);

} // namespace liftfix
