#include "liftfix/lang/Lexer.h"

#include <llvm/Support/raw_ostream.h>

#include <array>
#include <cctype>

namespace liftfix {

char ParseError::ID = 0;

void ParseError::log(llvm::raw_ostream &OS) const {
    OS << "syntax error at offset " << offset_ << ": " << detail_;
}

std::error_code ParseError::convertToErrorCode() const {
    return llvm::inconvertibleErrorCode();
}

namespace {

// Longest first within each leading character.
constexpr std::array<std::string_view, 24> kMultiCharPuncts = {
    "<<=", ">>=", "...", "->", "++", "--", "<<", ">>", "<=", ">=", "==", "!=",
    "&&",  "||",  "+=",  "-=", "*=", "/=", "%=", "&=", "^=", "|=", "::", "##",
};

constexpr std::string_view kSingleCharPuncts = "+-*/%<>=!~&|^?:;,.()[]{}#";

bool isIdentStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool isMetavarStart(char c) {
    return (c >= 'A' && c <= 'Z') || c == '_';
}

bool isMetavarChar(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

} // anonymous namespace

bool isKeyword(std::string_view word) {
    return word == "return" || word == "if" || word == "else" ||
           word == "while";
}

llvm::Expected<std::vector<Lexeme>> Lexer::tokenize() {
    std::vector<Lexeme> out;
    while (true) {
        if (auto Err = skipTrivia())
            return std::move(Err);
        if (pos_ >= src_.size()) {
            out.push_back(make(LexKind::End, pos_));
            return out;
        }
        auto lexOrErr = next();
        if (!lexOrErr)
            return lexOrErr.takeError();
        out.push_back(*lexOrErr);
    }
}

llvm::Error Lexer::skipTrivia() {
    while (pos_ < src_.size()) {
        char c = src_[pos_];
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++pos_;
        } else if (src_.substr(pos_, 2) == "//") {
            size_t nl = src_.find('\n', pos_);
            pos_ = (nl == std::string_view::npos) ? src_.size() : nl + 1;
        } else if (src_.substr(pos_, 2) == "/*") {
            size_t close = src_.find("*/", pos_ + 2);
            if (close == std::string_view::npos)
                return llvm::make_error<ParseError>(pos_, "unterminated comment");
            pos_ = close + 2;
        } else {
            break;
        }
    }
    return llvm::Error::success();
}

Lexeme Lexer::make(LexKind kind, size_t begin) const {
    Lexeme L;
    L.kind = kind;
    L.begin = begin;
    L.end = pos_;
    L.text = src_.substr(begin, pos_ - begin);
    return L;
}

llvm::Expected<Lexeme> Lexer::next() {
    size_t begin = pos_;
    char c = src_[pos_];

    if (isIdentStart(c)) {
        while (pos_ < src_.size() && isIdentChar(src_[pos_]))
            ++pos_;
        Lexeme L = make(LexKind::Identifier, begin);
        if (isKeyword(L.text))
            L.kind = LexKind::Keyword;
        return L;
    }

    if (std::isdigit(static_cast<unsigned char>(c)) ||
        (c == '.' && pos_ + 1 < src_.size() &&
         std::isdigit(static_cast<unsigned char>(src_[pos_ + 1]))))
        return lexNumber();

    if (c == '"' || c == '\'')
        return lexQuoted(c);

    if (c == '$') {
        if (!patternMode_)
            return llvm::make_error<ParseError>(pos_, "unexpected '$'");
        return lexMetavar();
    }

    for (std::string_view p : kMultiCharPuncts) {
        if (src_.substr(pos_, p.size()) == p) {
            pos_ += p.size();
            return make(LexKind::Punct, begin);
        }
    }
    if (kSingleCharPuncts.find(c) != std::string_view::npos) {
        ++pos_;
        return make(LexKind::Punct, begin);
    }

    return llvm::make_error<ParseError>(
        pos_, std::string("unexpected character '") + c + "'");
}

llvm::Expected<Lexeme> Lexer::lexQuoted(char quote) {
    size_t begin = pos_++;
    while (pos_ < src_.size()) {
        char c = src_[pos_];
        if (c == '\\') {
            pos_ += 2;
            continue;
        }
        if (c == '\n')
            break;
        ++pos_;
        if (c == quote)
            return make(quote == '"' ? LexKind::String : LexKind::Char, begin);
    }
    return llvm::make_error<ParseError>(
        begin, quote == '"' ? "unterminated string literal"
                            : "unterminated character literal");
}

Lexeme Lexer::lexNumber() {
    size_t begin = pos_;
    while (pos_ < src_.size()) {
        char c = src_[pos_];
        if (isIdentChar(c) || c == '.') {
            ++pos_;
            continue;
        }
        // Exponent sign: 1e-5, 0x1p+3.
        char prev = src_[pos_ - 1];
        if ((c == '+' || c == '-') &&
            (prev == 'e' || prev == 'E' || prev == 'p' || prev == 'P')) {
            ++pos_;
            continue;
        }
        break;
    }
    return make(LexKind::Number, begin);
}

llvm::Expected<Lexeme> Lexer::lexMetavar() {
    size_t begin = pos_++;
    LexKind kind = LexKind::Metavar;
    if (src_.substr(pos_, 3) == "...") {
        pos_ += 3;
        kind = LexKind::EllipsisMetavar;
    }
    if (pos_ >= src_.size() || !isMetavarStart(src_[pos_]))
        return llvm::make_error<ParseError>(
            begin, "metavariable names are uppercase letters, digits and '_'");
    while (pos_ < src_.size() && isMetavarChar(src_[pos_]))
        ++pos_;
    return make(kind, begin);
}

} // namespace liftfix
