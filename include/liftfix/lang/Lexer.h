#pragma once

#include <llvm/Support/Error.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace liftfix {

enum class LexKind : uint8_t {
    Identifier,
    Keyword,
    Number,
    String,
    Char,
    Punct,
    Metavar,         // $NAME, pattern mode only
    EllipsisMetavar, // $...NAME, pattern mode only
    End,
};

struct Lexeme {
    LexKind kind = LexKind::End;
    std::string_view text; // points into the lexed source
    size_t begin = 0;      // byte offsets
    size_t end   = 0;
};

// Syntax error at a byte offset of the parsed text.
class ParseError : public llvm::ErrorInfo<ParseError> {
public:
    static char ID;

    ParseError(size_t byteOffset, std::string detail)
        : offset_(byteOffset), detail_(std::move(detail)) {}

    size_t offset() const { return offset_; }
    const std::string &detail() const { return detail_; }

    void log(llvm::raw_ostream &OS) const override;
    std::error_code convertToErrorCode() const override;

private:
    size_t offset_;
    std::string detail_;
};

// Tokenizer for the C expression and statement subset. Comments and
// whitespace are skipped; the parser recovers them, when needed, from the
// gaps between lexeme offsets.
class Lexer {
public:
    Lexer(std::string_view source, bool patternMode)
        : src_(source), patternMode_(patternMode) {}

    // Always ends with one LexKind::End lexeme.
    llvm::Expected<std::vector<Lexeme>> tokenize();

private:
    llvm::Error skipTrivia();
    llvm::Expected<Lexeme> next();
    Lexeme make(LexKind kind, size_t begin) const;
    llvm::Expected<Lexeme> lexQuoted(char quote);
    Lexeme lexNumber();
    llvm::Expected<Lexeme> lexMetavar();

    std::string_view src_;
    bool patternMode_;
    size_t pos_ = 0;
};

bool isKeyword(std::string_view word);

} // namespace liftfix
