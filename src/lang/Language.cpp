#include "liftfix/lang/Language.h"
#include "liftfix/lang/Parser.h"

#include <llvm/Support/Path.h>

namespace liftfix {

const std::vector<Language> &allLanguages() {
    static const std::vector<Language> languages = {
        {LanguageId::C, "c", {".c", ".h"}, &parseTarget, &parsePattern},
    };
    return languages;
}

const Language *findLanguage(std::string_view name) {
    for (const auto &L : allLanguages()) {
        if (L.name == name)
            return &L;
    }
    return nullptr;
}

const Language *languageForPath(std::string_view path) {
    llvm::StringRef ext = llvm::sys::path::extension(llvm::StringRef(path));
    for (const auto &L : allLanguages()) {
        for (std::string_view e : L.extensions) {
            if (ext == llvm::StringRef(e))
                return &L;
        }
    }
    return nullptr;
}

} // namespace liftfix
