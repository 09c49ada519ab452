#include "liftfix/fixing/Autofix.h"
#include "liftfix/core/FixError.h"
#include "liftfix/fixing/Splice.h"
#include "liftfix/fixing/Substitution.h"

#include <llvm/Support/raw_ostream.h>

namespace liftfix {

llvm::Expected<FixTemplate> FixTemplate::compile(std::string text,
                                                 const Language &lang,
                                                 OffsetUnit unit,
                                                 const std::string &ruleID) {
    auto buffer = std::make_shared<const SourceBuffer>(
        BufferRole::Template, std::move(text), unit, "fix");

    auto treeOrErr = lang.parsePattern(*buffer);
    if (!treeOrErr) {
        std::string detail = llvm::toString(treeOrErr.takeError());
        return makeFixError(FixErrorKind::TemplateParseError, ruleID,
                            std::string(lang.name) + " " + detail);
    }
    return FixTemplate(std::move(buffer), std::move(*treeOrErr));
}

llvm::Expected<RenderedFix> renderFix(const Match &match,
                                      const FixTemplate &fix,
                                      const SourceBuffer &target) {
    auto substitutedOrErr = replaceMetavars(match.env, fix.tree());
    if (!substitutedOrErr)
        return substitutedOrErr.takeError();

    RenderedFix out;
    auto textOrErr = printFix(*substitutedOrErr, target, fix.buffer(),
                              &out.stats);
    if (!textOrErr)
        return textOrErr.takeError();

    out.text = std::move(*textOrErr);
    out.fixedText = spliceFix(target, match.range, out.text);
    return out;
}

} // namespace liftfix
