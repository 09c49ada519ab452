#include "liftfix/core/FixError.h"

#include <llvm/Support/raw_ostream.h>

namespace liftfix {

char FixError::ID = 0;

FixError::FixError(FixErrorKind kind, std::string subject, std::string detail)
    : kind_(kind), subject_(std::move(subject)), detail_(std::move(detail)) {}

void FixError::log(llvm::raw_ostream &OS) const {
    OS << fixErrorKindName(kind_);
    if (!subject_.empty())
        OS << "(" << subject_ << ")";
    if (!detail_.empty())
        OS << ": " << detail_;
}

std::error_code FixError::convertToErrorCode() const {
    return llvm::inconvertibleErrorCode();
}

llvm::Error makeFixError(FixErrorKind kind, std::string subject,
                         std::string detail) {
    return llvm::make_error<FixError>(kind, std::move(subject),
                                      std::move(detail));
}

} // namespace liftfix
