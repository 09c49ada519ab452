#include "liftfix/core/RuleSet.h"
#include "liftfix/core/YAMLMapping.h"

#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/YAMLTraits.h>
#include <llvm/Support/raw_ostream.h>

#include <algorithm>

namespace liftfix {

namespace {

struct RulesFile {
    std::vector<RuleSpec> rules;
};

} // anonymous namespace

} // namespace liftfix

LLVM_YAML_IS_SEQUENCE_VECTOR(liftfix::RuleSpec)

namespace llvm {
namespace yaml {

template <>
struct MappingTraits<liftfix::RuleSpec> {
    static void mapping(IO &io, liftfix::RuleSpec &rule) {
        io.mapRequired("id",        rule.id);
        io.mapRequired("pattern",   rule.pattern);
        io.mapOptional("fix",       rule.fix);
        io.mapOptional("message",   rule.message);
        io.mapOptional("severity",  rule.severity, liftfix::Severity::Warning);
        io.mapRequired("languages", rule.languages);
    }
};

template <>
struct MappingTraits<liftfix::RulesFile> {
    static void mapping(IO &io, liftfix::RulesFile &file) {
        io.mapRequired("rules", file.rules);
    }
};

} // namespace yaml
} // namespace llvm

namespace liftfix {

llvm::Expected<std::vector<RuleSpec>> RuleSet::parseSpecs(llvm::StringRef yaml) {
    RulesFile file;
    llvm::yaml::Input yin(yaml);
    yin >> file;
    if (yin.error()) {
        return llvm::make_error<llvm::StringError>(
            "malformed rules document: " + yin.error().message(),
            yin.error());
    }
    return std::move(file.rules);
}

llvm::Expected<RuleSet> RuleSet::loadFromFile(const std::string &path,
                                              OffsetUnit unit) {
    auto bufOrErr = llvm::MemoryBuffer::getFile(path);
    if (!bufOrErr) {
        return llvm::make_error<llvm::StringError>(
            "cannot open rules file '" + path + "': " +
                bufOrErr.getError().message(),
            bufOrErr.getError());
    }

    auto specsOrErr = parseSpecs(bufOrErr.get()->getBuffer());
    if (!specsOrErr) {
        return llvm::make_error<llvm::StringError>(
            path + ": " + llvm::toString(specsOrErr.takeError()),
            llvm::inconvertibleErrorCode());
    }
    return fromSpecs(*specsOrErr, unit);
}

RuleSet RuleSet::fromSpecs(const std::vector<RuleSpec> &specs, OffsetUnit unit) {
    RuleSet set;
    for (const auto &spec : specs) {
        if (set.findByID(spec.id)) {
            llvm::errs() << "liftfix: warning: duplicate rule id '" << spec.id
                         << "', keeping the first\n";
            continue;
        }

        auto ruleOrErr = Rule::compile(spec, unit);
        if (!ruleOrErr) {
            llvm::errs() << "liftfix: warning: dropping "
                         << llvm::toString(ruleOrErr.takeError()) << "\n";
            continue;
        }

        // Reported once here; the rule keeps matching without its fix.
        if (!(*ruleOrErr)->fixDisabledReason().empty()) {
            llvm::errs() << "liftfix: warning: autofix disabled: "
                         << (*ruleOrErr)->fixDisabledReason() << "\n";
        }
        set.rules_.push_back(std::move(*ruleOrErr));
    }
    return set;
}

const Rule *RuleSet::findByID(std::string_view id) const {
    auto it = std::find_if(rules_.begin(), rules_.end(),
                           [id](const auto &r) { return r->getID() == id; });
    return (it != rules_.end()) ? it->get() : nullptr;
}

size_t RuleSet::disable(const std::vector<std::string> &ids) {
    size_t before = rules_.size();
    rules_.erase(std::remove_if(rules_.begin(), rules_.end(),
                                [&](const auto &r) {
                                    return std::find(ids.begin(), ids.end(),
                                                     r->getID()) != ids.end();
                                }),
                 rules_.end());
    return before - rules_.size();
}

} // namespace liftfix
