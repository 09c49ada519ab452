#include "liftfix/core/Node.h"

#include <llvm/Support/raw_ostream.h>

namespace liftfix {

namespace {

const std::vector<NodePtr> &noChildren() {
    static const std::vector<NodePtr> empty;
    return empty;
}

NodePtr makeNode(Node::Payload data, std::optional<Range> origin, bool altered) {
    auto N = std::make_shared<Node>();
    N->data = std::move(data);
    N->origin = origin;
    N->altered = altered;
    return N;
}

std::string_view tokenKindName(TokenKind k) {
    switch (k) {
        case TokenKind::Identifier: return "ident";
        case TokenKind::Keyword:    return "kw";
        case TokenKind::Number:     return "num";
        case TokenKind::String:     return "str";
        case TokenKind::Char:       return "chr";
        case TokenKind::Punct:      return "punct";
        case TokenKind::Connective: return "conn";
    }
    return "punct";
}

void dump(const Node &N, llvm::raw_ostream &os) {
    if (const auto *T = N.getIf<Token>()) {
        if (T->kind == TokenKind::Connective)
            os << "<" << (T->connective == Connective::Newline ? "\\n" : ", ")
               << ">";
        else
            os << T->text;
        return;
    }
    if (const auto *M = N.getIf<MetavarRef>()) {
        os << "$" << M->name;
        if (M->binding) {
            os << "=";
            dump(*M->binding, os);
        }
        return;
    }
    if (const auto *E = N.getIf<EllipsisRef>()) {
        os << "$..." << E->name;
        return;
    }

    os << "(" << describeNode(N);
    for (const auto &C : N.children()) {
        os << " ";
        dump(*C, os);
    }
    os << ")";
}

} // anonymous namespace

const std::vector<NodePtr> &Node::children() const {
    if (const auto *E = getIf<Expr>())      return E->children;
    if (const auto *S = getIf<Stmt>())      return S->children;
    if (const auto *L = getIf<List>())      return L->items;
    if (const auto *X = getIf<Expansion>()) return X->items;
    return noChildren();
}

std::string_view nodeKindName(NodeKind k) {
    switch (k) {
        case NodeKind::Token:       return "Token";
        case NodeKind::Expr:        return "Expr";
        case NodeKind::Stmt:        return "Stmt";
        case NodeKind::List:        return "List";
        case NodeKind::MetavarRef:  return "Metavar";
        case NodeKind::EllipsisRef: return "Ellipsis";
        case NodeKind::Expansion:   return "Expansion";
    }
    return "Token";
}

std::string_view exprKindName(ExprKind k) {
    switch (k) {
        case ExprKind::Paren:       return "Paren";
        case ExprKind::Call:        return "Call";
        case ExprKind::Index:       return "Index";
        case ExprKind::Member:      return "Member";
        case ExprKind::Unary:       return "Unary";
        case ExprKind::Postfix:     return "Postfix";
        case ExprKind::Binary:      return "Binary";
        case ExprKind::Conditional: return "Conditional";
        case ExprKind::Assign:      return "Assign";
    }
    return "Expr";
}

std::string_view stmtKindName(StmtKind k) {
    switch (k) {
        case StmtKind::Expr:     return "ExprStmt";
        case StmtKind::Return:   return "Return";
        case StmtKind::Block:    return "Block";
        case StmtKind::If:       return "If";
        case StmtKind::While:    return "While";
        case StmtKind::Decl:     return "Decl";
        case StmtKind::Param:    return "Param";
        case StmtKind::Function: return "Function";
    }
    return "Stmt";
}

std::string_view listKindName(ListKind k) {
    switch (k) {
        case ListKind::Arguments:  return "Args";
        case ListKind::Parameters: return "Params";
        case ListKind::Statements: return "Stmts";
    }
    return "List";
}

std::string describeNode(const Node &N) {
    std::string out(nodeKindName(N.kind()));
    if (const auto *T = N.getIf<Token>()) {
        out += ":";
        out += tokenKindName(T->kind);
    } else if (const auto *E = N.getIf<Expr>()) {
        out += ":";
        out += exprKindName(E->kind);
    } else if (const auto *S = N.getIf<Stmt>()) {
        out += ":";
        out += stmtKindName(S->kind);
    } else if (const auto *L = N.getIf<List>()) {
        out += ":";
        out += listKindName(L->kind);
    } else if (const auto *X = N.getIf<Expansion>()) {
        out += ":";
        out += listKindName(X->kind);
    } else if (const auto *M = N.getIf<MetavarRef>()) {
        out = "$" + M->name;
    } else if (const auto *R = N.getIf<EllipsisRef>()) {
        out = "$..." + R->name;
    }
    return out;
}

NodePtr makeToken(TokenKind kind, std::string text, std::optional<Range> origin) {
    return makeNode(Token{kind, std::move(text), Connective::None}, origin,
                    false);
}

NodePtr makeConnective(Connective c) {
    return makeNode(Token{TokenKind::Connective, std::string(connectiveText(c)), c},
                    std::nullopt, false);
}

NodePtr makeExpr(ExprKind kind, std::vector<NodePtr> children,
                 std::optional<Range> origin, bool altered) {
    return makeNode(Expr{kind, std::move(children)}, origin, altered);
}

NodePtr makeStmt(StmtKind kind, std::vector<NodePtr> children,
                 std::optional<Range> origin, bool altered) {
    return makeNode(Stmt{kind, std::move(children)}, origin, altered);
}

NodePtr makeList(ListKind kind, std::vector<NodePtr> items,
                 std::optional<Range> origin, bool altered) {
    return makeNode(List{kind, std::move(items)}, origin, altered);
}

NodePtr makeMetavar(std::string name, std::optional<Range> origin) {
    return makeNode(MetavarRef{std::move(name), nullptr}, origin, false);
}

NodePtr makeEllipsis(std::string name, std::optional<Range> origin) {
    return makeNode(EllipsisRef{std::move(name)}, origin, false);
}

bool structurallyEqual(const Node &a, const Node &b) {
    if (a.kind() != b.kind())
        return false;

    if (const auto *TA = a.getIf<Token>()) {
        const auto *TB = b.getIf<Token>();
        return TA->kind == TB->kind && TA->text == TB->text &&
               TA->connective == TB->connective;
    }
    if (const auto *MA = a.getIf<MetavarRef>())
        return MA->name == b.getIf<MetavarRef>()->name;
    if (const auto *EA = a.getIf<EllipsisRef>())
        return EA->name == b.getIf<EllipsisRef>()->name;
    if (const auto *XA = a.getIf<Expr>()) {
        if (XA->kind != b.getIf<Expr>()->kind)
            return false;
    } else if (const auto *SA = a.getIf<Stmt>()) {
        if (SA->kind != b.getIf<Stmt>()->kind)
            return false;
    } else if (const auto *LA = a.getIf<List>()) {
        if (LA->kind != b.getIf<List>()->kind)
            return false;
    } else if (const auto *PA = a.getIf<Expansion>()) {
        if (PA->kind != b.getIf<Expansion>()->kind)
            return false;
    }

    const auto &CA = a.children();
    const auto &CB = b.children();
    if (CA.size() != CB.size())
        return false;
    for (size_t i = 0; i < CA.size(); ++i) {
        if (!structurallyEqual(*CA[i], *CB[i]))
            return false;
    }
    return true;
}

std::string dumpTree(const Node &N) {
    std::string out;
    llvm::raw_string_ostream os(out);
    dump(N, os);
    return os.str();
}

} // namespace liftfix
