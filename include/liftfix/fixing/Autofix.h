#pragma once

#include "liftfix/core/MatchEnvironment.h"
#include "liftfix/core/Node.h"
#include "liftfix/core/SourceBuffer.h"
#include "liftfix/fixing/Printer.h"
#include "liftfix/lang/Language.h"

#include <llvm/Support/Error.h>

#include <memory>
#include <string>

namespace liftfix {

// A fix template parsed once per rule and shared read-only by every match.
class FixTemplate {
public:
    // Fails with TemplateParseError when the text does not parse under the
    // language's grammar.
    static llvm::Expected<FixTemplate> compile(std::string text,
                                               const Language &lang,
                                               OffsetUnit unit,
                                               const std::string &ruleID = {});

    const SourceBuffer &buffer() const { return *buffer_; }
    const NodePtr &tree() const { return tree_; }

private:
    FixTemplate(std::shared_ptr<const SourceBuffer> buffer, NodePtr tree)
        : buffer_(std::move(buffer)), tree_(std::move(tree)) {}

    std::shared_ptr<const SourceBuffer> buffer_;
    NodePtr tree_;
};

struct RenderedFix {
    std::string text;       // replacement for the match range
    std::string fixedText;  // whole target with the replacement spliced in
    PrintStats stats;
};

// Substitution, printing and splicing for one match.
llvm::Expected<RenderedFix> renderFix(const Match &match,
                                      const FixTemplate &fix,
                                      const SourceBuffer &target);

} // namespace liftfix
