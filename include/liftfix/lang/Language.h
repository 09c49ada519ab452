#pragma once

#include "liftfix/core/Node.h"
#include "liftfix/core/SourceBuffer.h"

#include <llvm/Support/Error.h>

#include <cstdint>
#include <string_view>
#include <vector>

namespace liftfix {

enum class LanguageId : uint8_t {
    C,
};

// A language frontend: its own grammar, mapped onto the shared node envelope.
struct Language {
    LanguageId id;
    std::string_view name;
    std::vector<std::string_view> extensions;

    llvm::Expected<NodePtr> (*parseTarget)(const SourceBuffer &buf);
    llvm::Expected<NodePtr> (*parsePattern)(const SourceBuffer &buf);
};

const std::vector<Language> &allLanguages();

// nullptr when unknown.
const Language *findLanguage(std::string_view name);
const Language *languageForPath(std::string_view path);

} // namespace liftfix
