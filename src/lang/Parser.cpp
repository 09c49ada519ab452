#include "liftfix/lang/Parser.h"

#include <algorithm>
#include <array>
#include <utility>

namespace liftfix {

namespace {

struct BinaryOp {
    std::string_view spelling;
    int precedence;
};

constexpr std::array<BinaryOp, 18> kBinaryOps = {{
    {"||", 1}, {"&&", 2}, {"|", 3}, {"^", 4}, {"&", 5},
    {"==", 6}, {"!=", 6},
    {"<", 7},  {">", 7},  {"<=", 7}, {">=", 7},
    {"<<", 8}, {">>", 8},
    {"+", 9},  {"-", 9},
    {"*", 10}, {"/", 10}, {"%", 10},
}};

constexpr std::array<std::string_view, 11> kAssignOps = {
    "=", "+=", "-=", "*=", "/=", "%=", "<<=", ">>=", "&=", "^=", "|=",
};

constexpr std::array<std::string_view, 8> kPrefixOps = {
    "-", "+", "!", "~", "*", "&", "++", "--",
};

TokenKind tokenKindFor(LexKind k) {
    switch (k) {
        case LexKind::Identifier: return TokenKind::Identifier;
        case LexKind::Keyword:    return TokenKind::Keyword;
        case LexKind::Number:     return TokenKind::Number;
        case LexKind::String:     return TokenKind::String;
        case LexKind::Char:       return TokenKind::Char;
        default:                  return TokenKind::Punct;
    }
}

class CParser {
public:
    CParser(const SourceBuffer &buf, std::vector<Lexeme> lexemes)
        : buf_(buf), lex_(std::move(lexemes)) {}

    bool atEnd() const { return peek().kind == LexKind::End; }

    llvm::Error expectEnd() const {
        if (atEnd())
            return llvm::Error::success();
        return error("unexpected '" + std::string(peek().text) + "'");
    }

    // Statements until '}' (when nested) or end of input.
    llvm::Expected<NodePtr> parseStatementList(bool nested) {
        std::vector<NodePtr> items;
        size_t startByte = peek().begin;

        while (!atEnd() && !(nested && isPunct("}"))) {
            if (peek().kind == LexKind::EllipsisMetavar) {
                items.push_back(takeEllipsis());
                continue;
            }
            auto stmtOrErr = parseStatement();
            if (!stmtOrErr)
                return stmtOrErr.takeError();
            items.push_back(std::move(*stmtOrErr));
        }

        Range R = listRange(items, startByte);
        return makeList(ListKind::Statements, std::move(items), R);
    }

    llvm::Expected<NodePtr> parseStatement() {
        const Lexeme &L = peek();

        if (isPunct("{"))
            return parseBlock();

        if (L.kind == LexKind::Keyword) {
            if (L.text == "return")
                return parseReturn();
            if (L.text == "if")
                return parseIf();
            if (L.text == "while")
                return parseWhile();
            return error("unexpected '" + std::string(L.text) + "'");
        }

        if (L.kind == LexKind::EllipsisMetavar)
            return error("ellipsis metavariable outside a statement list");

        if (L.kind == LexKind::Identifier &&
            (peek(1).kind == LexKind::Identifier ||
             peek(1).kind == LexKind::Metavar))
            return parseDeclaration();

        auto exprOrErr = parseExpr();
        if (!exprOrErr)
            return exprOrErr.takeError();
        auto semiOrErr = expectPunct(";");
        if (!semiOrErr)
            return semiOrErr.takeError();
        return stmt(StmtKind::Expr, {std::move(*exprOrErr), std::move(*semiOrErr)});
    }

    // Assignment expression.
    llvm::Expected<NodePtr> parseExpr() {
        auto lhsOrErr = parseConditional();
        if (!lhsOrErr)
            return lhsOrErr.takeError();

        for (std::string_view op : kAssignOps) {
            if (!isPunct(op))
                continue;
            NodePtr opTok = takeToken();
            auto rhsOrErr = parseExpr();
            if (!rhsOrErr)
                return rhsOrErr.takeError();
            return expr(ExprKind::Assign,
                        {std::move(*lhsOrErr), opTok, std::move(*rhsOrErr)});
        }
        return lhsOrErr;
    }

private:
    const Lexeme &peek(size_t ahead = 0) const {
        size_t i = std::min(pos_ + ahead, lex_.size() - 1);
        return lex_[i];
    }

    bool isPunct(std::string_view p, size_t ahead = 0) const {
        const Lexeme &L = peek(ahead);
        return L.kind == LexKind::Punct && L.text == p;
    }

    llvm::Error error(const std::string &msg) const {
        return llvm::make_error<ParseError>(peek().begin, msg);
    }

    Range rangeOf(size_t beginByte, size_t endByte) const {
        return buf_.range(buf_.fromByteOffset(beginByte),
                          buf_.fromByteOffset(endByte));
    }

    static Range span(const std::vector<NodePtr> &nodes) {
        Range R = *nodes.front()->origin;
        R.end = nodes.back()->origin->end;
        return R;
    }

    Range listRange(const std::vector<NodePtr> &items, size_t emptyAtByte) const {
        if (items.empty())
            return rangeOf(emptyAtByte, emptyAtByte);
        return span(items);
    }

    NodePtr expr(ExprKind kind, std::vector<NodePtr> children) const {
        Range R = span(children);
        return makeExpr(kind, std::move(children), R);
    }

    NodePtr stmt(StmtKind kind, std::vector<NodePtr> children) const {
        Range R = span(children);
        return makeStmt(kind, std::move(children), R);
    }

    NodePtr takeToken() {
        const Lexeme &L = lex_[pos_++];
        return makeToken(tokenKindFor(L.kind), std::string(L.text),
                         rangeOf(L.begin, L.end));
    }

    NodePtr takeMetavar() {
        const Lexeme &L = lex_[pos_++];
        return makeMetavar(std::string(L.text.substr(1)), rangeOf(L.begin, L.end));
    }

    NodePtr takeEllipsis() {
        const Lexeme &L = lex_[pos_++];
        return makeEllipsis(std::string(L.text.substr(4)), rangeOf(L.begin, L.end));
    }

    llvm::Expected<NodePtr> expectPunct(std::string_view p) {
        if (!isPunct(p)) {
            if (atEnd())
                return error("expected '" + std::string(p) + "' at end of input");
            return error("expected '" + std::string(p) + "' before '" +
                         std::string(peek().text) + "'");
        }
        return takeToken();
    }

    llvm::Expected<NodePtr> expectIdentifier() {
        if (peek().kind != LexKind::Identifier)
            return error("expected identifier");
        return takeToken();
    }

    // Declared name: identifier, or a metavariable in patterns.
    llvm::Expected<NodePtr> parseName() {
        if (peek().kind == LexKind::Metavar)
            return takeMetavar();
        return expectIdentifier();
    }

    // ---- statements ----

    llvm::Expected<NodePtr> parseBlock() {
        auto openOrErr = expectPunct("{");
        if (!openOrErr)
            return openOrErr.takeError();
        auto bodyOrErr = parseStatementList(/*nested=*/true);
        if (!bodyOrErr)
            return bodyOrErr.takeError();
        auto closeOrErr = expectPunct("}");
        if (!closeOrErr)
            return closeOrErr.takeError();
        return stmt(StmtKind::Block, {std::move(*openOrErr), std::move(*bodyOrErr),
                                      std::move(*closeOrErr)});
    }

    llvm::Expected<NodePtr> parseReturn() {
        std::vector<NodePtr> children{takeToken()};
        if (!isPunct(";")) {
            auto valueOrErr = parseExpr();
            if (!valueOrErr)
                return valueOrErr.takeError();
            children.push_back(std::move(*valueOrErr));
        }
        auto semiOrErr = expectPunct(";");
        if (!semiOrErr)
            return semiOrErr.takeError();
        children.push_back(std::move(*semiOrErr));
        return stmt(StmtKind::Return, std::move(children));
    }

    // '(' expr ')' after a keyword.
    llvm::Error parseCondition(std::vector<NodePtr> &children) {
        auto openOrErr = expectPunct("(");
        if (!openOrErr)
            return openOrErr.takeError();
        children.push_back(std::move(*openOrErr));
        auto condOrErr = parseExpr();
        if (!condOrErr)
            return condOrErr.takeError();
        children.push_back(std::move(*condOrErr));
        auto closeOrErr = expectPunct(")");
        if (!closeOrErr)
            return closeOrErr.takeError();
        children.push_back(std::move(*closeOrErr));
        return llvm::Error::success();
    }

    llvm::Expected<NodePtr> parseIf() {
        std::vector<NodePtr> children{takeToken()};
        if (auto Err = parseCondition(children))
            return std::move(Err);
        auto thenOrErr = parseStatement();
        if (!thenOrErr)
            return thenOrErr.takeError();
        children.push_back(std::move(*thenOrErr));

        if (peek().kind == LexKind::Keyword && peek().text == "else") {
            children.push_back(takeToken());
            auto elseOrErr = parseStatement();
            if (!elseOrErr)
                return elseOrErr.takeError();
            children.push_back(std::move(*elseOrErr));
        }
        return stmt(StmtKind::If, std::move(children));
    }

    llvm::Expected<NodePtr> parseWhile() {
        std::vector<NodePtr> children{takeToken()};
        if (auto Err = parseCondition(children))
            return std::move(Err);
        auto bodyOrErr = parseStatement();
        if (!bodyOrErr)
            return bodyOrErr.takeError();
        children.push_back(std::move(*bodyOrErr));
        return stmt(StmtKind::While, std::move(children));
    }

    llvm::Expected<NodePtr> parseDeclaration() {
        std::vector<NodePtr> children{takeToken()};
        auto nameOrErr = parseName();
        if (!nameOrErr)
            return nameOrErr.takeError();
        children.push_back(std::move(*nameOrErr));

        if (isPunct("("))
            return parseFunction(std::move(children));

        if (isPunct("=")) {
            children.push_back(takeToken());
            auto initOrErr = parseExpr();
            if (!initOrErr)
                return initOrErr.takeError();
            children.push_back(std::move(*initOrErr));
        }
        auto semiOrErr = expectPunct(";");
        if (!semiOrErr)
            return semiOrErr.takeError();
        children.push_back(std::move(*semiOrErr));
        return stmt(StmtKind::Decl, std::move(children));
    }

    llvm::Expected<NodePtr> parseFunction(std::vector<NodePtr> children) {
        children.push_back(takeToken()); // (
        auto paramsOrErr = parseParameters();
        if (!paramsOrErr)
            return paramsOrErr.takeError();
        children.push_back(std::move(*paramsOrErr));
        auto closeOrErr = expectPunct(")");
        if (!closeOrErr)
            return closeOrErr.takeError();
        children.push_back(std::move(*closeOrErr));
        auto bodyOrErr = parseBlock();
        if (!bodyOrErr)
            return bodyOrErr.takeError();
        children.push_back(std::move(*bodyOrErr));
        return stmt(StmtKind::Function, std::move(children));
    }

    llvm::Expected<NodePtr> parseParameters() {
        std::vector<NodePtr> items;
        size_t startByte = peek().begin;

        while (!isPunct(")")) {
            if (peek().kind == LexKind::EllipsisMetavar) {
                items.push_back(takeEllipsis());
            } else if (peek().kind == LexKind::Metavar) {
                items.push_back(takeMetavar());
            } else {
                std::vector<NodePtr> param;
                auto typeOrErr = expectIdentifier();
                if (!typeOrErr)
                    return typeOrErr.takeError();
                param.push_back(std::move(*typeOrErr));
                if (!isPunct(",") && !isPunct(")")) {
                    auto nameOrErr = parseName();
                    if (!nameOrErr)
                        return nameOrErr.takeError();
                    param.push_back(std::move(*nameOrErr));
                }
                items.push_back(stmt(StmtKind::Param, std::move(param)));
            }
            if (!isPunct(","))
                break;
            ++pos_;
        }
        Range R = listRange(items, startByte);
        return makeList(ListKind::Parameters, std::move(items), R);
    }

    // ---- expressions ----

    llvm::Expected<NodePtr> parseConditional() {
        auto condOrErr = parseBinary(1);
        if (!condOrErr)
            return condOrErr.takeError();
        if (!isPunct("?"))
            return condOrErr;

        NodePtr question = takeToken();
        auto thenOrErr = parseExpr();
        if (!thenOrErr)
            return thenOrErr.takeError();
        auto colonOrErr = expectPunct(":");
        if (!colonOrErr)
            return colonOrErr.takeError();
        auto elseOrErr = parseConditional();
        if (!elseOrErr)
            return elseOrErr.takeError();
        return expr(ExprKind::Conditional,
                    {std::move(*condOrErr), question, std::move(*thenOrErr),
                     std::move(*colonOrErr), std::move(*elseOrErr)});
    }

    int binaryPrecedence() const {
        if (peek().kind != LexKind::Punct)
            return 0;
        for (const auto &op : kBinaryOps) {
            if (peek().text == op.spelling)
                return op.precedence;
        }
        return 0;
    }

    // Precedence climbing, left associative.
    llvm::Expected<NodePtr> parseBinary(int minPrec) {
        auto lhsOrErr = parseUnary();
        if (!lhsOrErr)
            return lhsOrErr.takeError();
        NodePtr lhs = std::move(*lhsOrErr);

        while (true) {
            int prec = binaryPrecedence();
            if (prec == 0 || prec < minPrec)
                break;
            NodePtr op = takeToken();
            auto rhsOrErr = parseBinary(prec + 1);
            if (!rhsOrErr)
                return rhsOrErr.takeError();
            lhs = expr(ExprKind::Binary, {lhs, op, std::move(*rhsOrErr)});
        }
        return lhs;
    }

    llvm::Expected<NodePtr> parseUnary() {
        for (std::string_view op : kPrefixOps) {
            if (!isPunct(op))
                continue;
            NodePtr opTok = takeToken();
            auto operandOrErr = parseUnary();
            if (!operandOrErr)
                return operandOrErr.takeError();
            return expr(ExprKind::Unary, {opTok, std::move(*operandOrErr)});
        }
        return parsePostfix();
    }

    llvm::Expected<NodePtr> parsePostfix() {
        auto baseOrErr = parsePrimary();
        if (!baseOrErr)
            return baseOrErr.takeError();
        NodePtr base = std::move(*baseOrErr);

        while (true) {
            if (isPunct("(")) {
                NodePtr open = takeToken();
                auto argsOrErr = parseArguments();
                if (!argsOrErr)
                    return argsOrErr.takeError();
                auto closeOrErr = expectPunct(")");
                if (!closeOrErr)
                    return closeOrErr.takeError();
                base = expr(ExprKind::Call, {base, open, std::move(*argsOrErr),
                                             std::move(*closeOrErr)});
            } else if (isPunct("[")) {
                NodePtr open = takeToken();
                auto indexOrErr = parseExpr();
                if (!indexOrErr)
                    return indexOrErr.takeError();
                auto closeOrErr = expectPunct("]");
                if (!closeOrErr)
                    return closeOrErr.takeError();
                base = expr(ExprKind::Index, {base, open, std::move(*indexOrErr),
                                              std::move(*closeOrErr)});
            } else if (isPunct(".") || isPunct("->")) {
                NodePtr op = takeToken();
                auto memberOrErr = parseName();
                if (!memberOrErr)
                    return memberOrErr.takeError();
                base = expr(ExprKind::Member, {base, op, std::move(*memberOrErr)});
            } else if (isPunct("++") || isPunct("--")) {
                base = expr(ExprKind::Postfix, {base, takeToken()});
            } else {
                return base;
            }
        }
    }

    llvm::Expected<NodePtr> parseArguments() {
        std::vector<NodePtr> items;
        size_t startByte = peek().begin;

        while (!isPunct(")")) {
            if (peek().kind == LexKind::EllipsisMetavar) {
                items.push_back(takeEllipsis());
            } else {
                auto argOrErr = parseExpr();
                if (!argOrErr)
                    return argOrErr.takeError();
                items.push_back(std::move(*argOrErr));
            }
            if (!isPunct(","))
                break;
            ++pos_;
        }
        Range R = listRange(items, startByte);
        return makeList(ListKind::Arguments, std::move(items), R);
    }

    llvm::Expected<NodePtr> parsePrimary() {
        const Lexeme &L = peek();
        switch (L.kind) {
            case LexKind::Identifier:
            case LexKind::Number:
            case LexKind::String:
            case LexKind::Char:
                return takeToken();
            case LexKind::Metavar:
                return takeMetavar();
            case LexKind::EllipsisMetavar:
                return error("ellipsis metavariable outside an argument, "
                             "parameter or statement list");
            case LexKind::End:
                return error("expected expression at end of input");
            default:
                break;
        }

        if (isPunct("(")) {
            NodePtr open = takeToken();
            auto innerOrErr = parseExpr();
            if (!innerOrErr)
                return innerOrErr.takeError();
            auto closeOrErr = expectPunct(")");
            if (!closeOrErr)
                return closeOrErr.takeError();
            return expr(ExprKind::Paren,
                        {open, std::move(*innerOrErr), std::move(*closeOrErr)});
        }
        return error("expected expression before '" + std::string(L.text) + "'");
    }

    const SourceBuffer &buf_;
    std::vector<Lexeme> lex_;
    size_t pos_ = 0;
};

llvm::Expected<std::vector<Lexeme>> lexBuffer(const SourceBuffer &buf,
                                              bool patternMode) {
    Lexer lexer(buf.text(), patternMode);
    return lexer.tokenize();
}

} // anonymous namespace

llvm::Expected<NodePtr> parseTarget(const SourceBuffer &buf) {
    auto lexOrErr = lexBuffer(buf, /*patternMode=*/false);
    if (!lexOrErr)
        return lexOrErr.takeError();

    CParser parser(buf, std::move(*lexOrErr));
    auto listOrErr = parser.parseStatementList(/*nested=*/false);
    if (!listOrErr)
        return listOrErr.takeError();
    if (auto Err = parser.expectEnd())
        return std::move(Err);
    return listOrErr;
}

llvm::Expected<NodePtr> parsePattern(const SourceBuffer &buf) {
    auto lexOrErr = lexBuffer(buf, /*patternMode=*/true);
    if (!lexOrErr)
        return lexOrErr.takeError();
    if (lexOrErr->size() == 1)
        return llvm::make_error<ParseError>(0, "empty pattern");

    {
        CParser exprParser(buf, *lexOrErr);
        auto exprOrErr = exprParser.parseExpr();
        if (exprOrErr && exprParser.atEnd())
            return exprOrErr;
        if (!exprOrErr)
            llvm::consumeError(exprOrErr.takeError());
    }

    CParser stmtParser(buf, std::move(*lexOrErr));
    auto listOrErr = stmtParser.parseStatementList(/*nested=*/false);
    if (!listOrErr)
        return listOrErr.takeError();
    if (auto Err = stmtParser.expectEnd())
        return std::move(Err);

    const auto &items = (*listOrErr)->children();
    if (items.size() == 1 && !items.front()->getIf<EllipsisRef>())
        return items.front();
    return listOrErr;
}

} // namespace liftfix
