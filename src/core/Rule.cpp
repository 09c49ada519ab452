#include "liftfix/core/Rule.h"
#include "liftfix/fixing/Printer.h"
#include "liftfix/fixing/Splice.h"

#include <cctype>

namespace liftfix {

namespace {

llvm::Error ruleError(const std::string &id, const std::string &msg) {
    return llvm::make_error<llvm::StringError>(
        "rule '" + id + "': " + msg, llvm::inconvertibleErrorCode());
}

bool isNameStart(char c) {
    return std::isupper(static_cast<unsigned char>(c)) || c == '_';
}

bool isNameChar(char c) {
    return isNameStart(c) || std::isdigit(static_cast<unsigned char>(c));
}

} // anonymous namespace

llvm::Expected<std::unique_ptr<Rule>> Rule::compile(const RuleSpec &spec,
                                                    OffsetUnit unit) {
    if (spec.id.empty())
        return ruleError("", "missing id");
    if (spec.pattern.empty())
        return ruleError(spec.id, "missing pattern");
    if (spec.languages.empty())
        return ruleError(spec.id, "no languages listed");

    // The constructor is private, so std::make_unique cannot reach it.
    std::unique_ptr<Rule> rule(new Rule());
    rule->id_ = spec.id;
    rule->message_ = spec.message.empty() ? spec.id : spec.message;
    rule->fixText_ = spec.fix;
    rule->severity_ = spec.severity;

    for (const auto &name : spec.languages) {
        const Language *lang = findLanguage(name);
        if (!lang)
            return ruleError(spec.id, "unknown language '" + name + "'");
        if (rule->patternFor(*lang))
            continue;

        auto patternBuffer = std::make_shared<const SourceBuffer>(
            BufferRole::Template, spec.pattern, unit, "pattern");
        auto treeOrErr = lang->parsePattern(*patternBuffer);
        if (!treeOrErr)
            return ruleError(spec.id, "invalid pattern: " +
                                          llvm::toString(treeOrErr.takeError()));

        std::optional<FixTemplate> fix;
        if (rule->hasFix() && rule->fixDisabledReason_.empty()) {
            auto fixOrErr = FixTemplate::compile(spec.fix, *lang, unit, spec.id);
            if (fixOrErr)
                fix = std::move(*fixOrErr);
            else
                rule->fixDisabledReason_ = llvm::toString(fixOrErr.takeError());
        }

        rule->patterns_.push_back(CompiledPattern{
            lang, std::move(patternBuffer), Matcher(std::move(*treeOrErr)),
            std::move(fix)});
    }

    return rule;
}

bool Rule::appliesTo(const Language &lang) const {
    return patternFor(lang) != nullptr;
}

const Rule::CompiledPattern *Rule::patternFor(const Language &lang) const {
    for (const auto &cp : patterns_) {
        if (cp.lang->id == lang.id)
            return &cp;
    }
    return nullptr;
}

Finding Rule::makeFinding(const Match &match, const SourceBuffer &target) const {
    Finding f;
    f.ruleID = id_;
    f.message = interpolateMessage(message_, match.env, target);
    f.severity = severity_;

    LineColumn begin = target.locate(match.range.start);
    LineColumn end = target.locate(match.range.end);
    f.location = {target.name(), begin.line, begin.column};
    f.endLine = end.line;
    f.endColumn = end.column;

    f.range = match.range;
    f.startByte = target.toByteOffset(match.range.start);
    f.endByte = target.toByteOffset(match.range.end);
    f.matchedText = std::string(target.slice(match.range));
    return f;
}

void Rule::analyze(const SourceBuffer &target, const NodePtr &tree,
                   const Language &lang, std::vector<Finding> &out,
                   llvm::raw_ostream *trace) const {
    const CompiledPattern *cp = patternFor(lang);
    if (!cp)
        return;

    for (const Match &match : cp->matcher.findAll(tree)) {
        Finding f = makeFinding(match, target);

        if (trace) {
            *trace << "liftfix: " << f.location.file << ":" << f.location.line
                   << ":" << f.location.column << ": " << id_ << " matched ["
                   << match.range.start << ", " << match.range.end << ")";
            for (const auto &entry : match.env) {
                if (auto R = bindingRange(entry.second))
                    *trace << " $" << entry.first << "='" << target.slice(*R)
                           << "'";
                else
                    *trace << " $" << entry.first << "=[]";
            }
            *trace << "\n";
        }

        if (!hasFix()) {
            out.push_back(std::move(f));
            continue;
        }

        if (!cp->fix) {
            f.fixStatus = FixStatus::Failed;
            f.fixFailure = fixDisabledReason_;
            out.push_back(std::move(f));
            continue;
        }

        auto renderedOrErr = renderFix(match, *cp->fix, target);
        if (!renderedOrErr) {
            f.fixStatus = FixStatus::Failed;
            f.fixFailure = llvm::toString(renderedOrErr.takeError());
            if (trace)
                *trace << "liftfix:   no fix: " << f.fixFailure << "\n";
        } else {
            const PrintStats &st = renderedOrErr->stats;
            f.fixStatus = FixStatus::Rendered;
            f.fix = std::move(renderedOrErr->text);
            f.fixedLines = fixedLinesPreview(renderedOrErr->fixedText,
                                             f.startByte, f.fix.size());
            if (trace) {
                *trace << "liftfix:   fix lifted " << st.liftedTargetChars
                       << " target + " << st.liftedTemplateChars
                       << " template chars, synthesized "
                       << st.synthesizedChars << " ("
                       << st.synthesizedSeparators << " separators)\n";
            }
        }
        out.push_back(std::move(f));
    }
}

std::string interpolateMessage(std::string_view message,
                               const MatchEnvironment &env,
                               const SourceBuffer &target) {
    std::string out;
    out.reserve(message.size());

    size_t i = 0;
    while (i < message.size()) {
        if (message[i] != '$' || i + 1 >= message.size() ||
            !isNameStart(message[i + 1])) {
            out += message[i++];
            continue;
        }

        size_t j = i + 1;
        while (j < message.size() && isNameChar(message[j]))
            ++j;

        std::string name(message.substr(i + 1, j - i - 1));
        const Binding *B = env.lookup(name);
        if (!B) {
            out.append(message.substr(i, j - i));
        } else if (auto R = bindingRange(*B)) {
            out.append(target.slice(*R));
        }
        i = j;
    }
    return out;
}

} // namespace liftfix
