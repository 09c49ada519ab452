#pragma once

#include <llvm/Support/Error.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace liftfix {

enum class FixErrorKind : uint8_t {
    TemplateParseError,  // fix template does not parse; disables the rule's fix
    UnboundMetavariable, // placeholder missing from the match environment
    TypeMismatch,        // ellipsis placeholder bound to a scalar, or vice versa
    UnprintableNode,     // no origin and no synthesized form
    OffsetUnitMismatch,  // internal; reported through report_fatal_error only
};

constexpr std::string_view fixErrorKindName(FixErrorKind k) {
    switch (k) {
        case FixErrorKind::TemplateParseError:  return "TemplateParseError";
        case FixErrorKind::UnboundMetavariable: return "UnboundMetavariable";
        case FixErrorKind::TypeMismatch:        return "TypeMismatch";
        case FixErrorKind::UnprintableNode:     return "UnprintableNode";
        case FixErrorKind::OffsetUnitMismatch:  return "OffsetUnitMismatch";
    }
    return "UnprintableNode";
}

// Failure to produce a fix for one match (or, for TemplateParseError, for a
// whole rule). The finding itself is still reported.
class FixError : public llvm::ErrorInfo<FixError> {
public:
    static char ID;

    FixError(FixErrorKind kind, std::string subject, std::string detail = {});

    FixErrorKind kind() const { return kind_; }
    const std::string &subject() const { return subject_; }
    const std::string &detail() const { return detail_; }

    void log(llvm::raw_ostream &OS) const override;
    std::error_code convertToErrorCode() const override;

private:
    FixErrorKind kind_;
    std::string subject_; // placeholder name, node kind, or rule id
    std::string detail_;
};

llvm::Error makeFixError(FixErrorKind kind, std::string subject,
                         std::string detail = {});

} // namespace liftfix
