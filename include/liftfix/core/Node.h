#pragma once

#include "liftfix/core/SourceBuffer.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace liftfix {

// Generic node envelope shared by every language frontend, the matcher, the
// substitution pass and the printer. Each frontend keeps its own grammar and
// only maps it onto these kinds.

struct Node;
using NodePtr = std::shared_ptr<const Node>;

enum class TokenKind : uint8_t {
    Identifier,
    Keyword,
    Number,
    String,
    Char,
    Punct,
    Connective, // synthesized separator; never has an origin
};

// Closed set of text the printer is allowed to synthesize.
enum class Connective : uint8_t {
    None,
    CommaSpace,
    Newline,
};

constexpr std::string_view connectiveText(Connective c) {
    switch (c) {
        case Connective::None:       return "";
        case Connective::CommaSpace: return ", ";
        case Connective::Newline:    return "\n";
    }
    return "";
}

enum class ExprKind : uint8_t {
    Paren,
    Call,
    Index,
    Member,
    Unary,
    Postfix,
    Binary,
    Conditional,
    Assign,
};

enum class StmtKind : uint8_t {
    Expr,
    Return,
    Block,
    If,
    While,
    Decl,
    Param,
    Function,
};

enum class ListKind : uint8_t {
    Arguments,
    Parameters,
    Statements,
};

// Separator implied by the grammar between two elements of a list.
constexpr Connective listSeparator(ListKind k) {
    switch (k) {
        case ListKind::Arguments:  return Connective::CommaSpace;
        case ListKind::Parameters: return Connective::CommaSpace;
        case ListKind::Statements: return Connective::Newline;
    }
    return Connective::None;
}

struct Token {
    TokenKind kind = TokenKind::Punct;
    std::string text;                          // spelling; never printed
    Connective connective = Connective::None;  // TokenKind::Connective only
};

struct Expr {
    ExprKind kind;
    std::vector<NodePtr> children;
};

struct Stmt {
    StmtKind kind;
    std::vector<NodePtr> children;
};

// Elements only; separators are implied by the list kind.
struct List {
    ListKind kind;
    std::vector<NodePtr> items;
};

// `$X`. After substitution `binding` points at the shared bound subtree while
// the node keeps its template origin.
struct MetavarRef {
    std::string name;
    NodePtr binding;
};

// `$...X`, only meaningful as a list element.
struct EllipsisRef {
    std::string name;
};

// An ellipsis binding spliced into a list: bound elements interleaved with
// synthesized connective tokens. Produced by substitution only.
struct Expansion {
    ListKind kind;
    std::vector<NodePtr> items;
};

enum class NodeKind : uint8_t {
    Token,
    Expr,
    Stmt,
    List,
    MetavarRef,
    EllipsisRef,
    Expansion,
};

struct Node {
    using Payload = std::variant<Token, Expr, Stmt, List, MetavarRef,
                                 EllipsisRef, Expansion>;

    Payload data;
    std::optional<Range> origin; // absent: synthesized
    bool altered = false;        // set by substitution on rebuilt nodes

    NodeKind kind() const { return static_cast<NodeKind>(data.index()); }
    bool isSynthesized() const { return !origin.has_value(); }

    template <typename T>
    const T *getIf() const { return std::get_if<T>(&data); }

    // Children in structural order (empty for leaves and references).
    const std::vector<NodePtr> &children() const;
};

std::string_view nodeKindName(NodeKind k);
std::string_view exprKindName(ExprKind k);
std::string_view stmtKindName(StmtKind k);
std::string_view listKindName(ListKind k);

// Description of a node for diagnostics, e.g. "Expr:Call" or "$X".
std::string describeNode(const Node &N);

NodePtr makeToken(TokenKind kind, std::string text, std::optional<Range> origin);
NodePtr makeConnective(Connective c);
NodePtr makeExpr(ExprKind kind, std::vector<NodePtr> children,
                 std::optional<Range> origin, bool altered = false);
NodePtr makeStmt(StmtKind kind, std::vector<NodePtr> children,
                 std::optional<Range> origin, bool altered = false);
NodePtr makeList(ListKind kind, std::vector<NodePtr> items,
                 std::optional<Range> origin, bool altered = false);
NodePtr makeMetavar(std::string name, std::optional<Range> origin);
NodePtr makeEllipsis(std::string name, std::optional<Range> origin);

// Same kind, same token spellings, same shape. Origins are ignored.
bool structurallyEqual(const Node &a, const Node &b);

// S-expression dump used by --verbose and by tests.
std::string dumpTree(const Node &N);

} // namespace liftfix
