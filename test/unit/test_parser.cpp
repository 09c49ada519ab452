#include <gtest/gtest.h>

#include "liftfix/lang/Language.h"
#include "liftfix/lang/Lexer.h"
#include "liftfix/lang/Parser.h"

namespace liftfix {
namespace {

class ParserTest : public ::testing::Test {
protected:
    NodePtr parseTargetOk(const std::string &code) {
        buffer_ = std::make_unique<SourceBuffer>(BufferRole::Target, code);
        return unwrap(parseTarget(*buffer_));
    }

    NodePtr parsePatternOk(const std::string &code) {
        buffer_ = std::make_unique<SourceBuffer>(BufferRole::Template, code);
        return unwrap(parsePattern(*buffer_));
    }

    std::string targetError(const std::string &code) {
        buffer_ = std::make_unique<SourceBuffer>(BufferRole::Target, code);
        return errorOf(parseTarget(*buffer_));
    }

    std::string patternError(const std::string &code) {
        buffer_ = std::make_unique<SourceBuffer>(BufferRole::Template, code);
        return errorOf(parsePattern(*buffer_));
    }

    static NodePtr unwrap(llvm::Expected<NodePtr> res) {
        if (!res) {
            ADD_FAILURE() << llvm::toString(res.takeError());
            return nullptr;
        }
        return *res;
    }

    static std::string errorOf(llvm::Expected<NodePtr> res) {
        if (res)
            return {};
        return llvm::toString(res.takeError());
    }

    std::unique_ptr<SourceBuffer> buffer_;
};

TEST_F(ParserTest, TargetIsStatementList) {
    auto tree = parseTargetOk("int x = foo(1, 2);\nreturn x;");
    ASSERT_NE(tree, nullptr);
    EXPECT_EQ(dumpTree(*tree),
              "(List:Stmts (Stmt:Decl int x = (Expr:Call foo ( (List:Args 1 2) )) ;) "
              "(Stmt:Return return x ;))");
}

TEST_F(ParserTest, OriginsCoverSourceText) {
    auto tree = parseTargetOk("int x = foo(1,  2);");
    ASSERT_NE(tree, nullptr);
    const NodePtr &decl = tree->children().at(0);
    const NodePtr &call = decl->children().at(3);
    ASSERT_TRUE(call->origin.has_value());
    EXPECT_EQ(buffer_->slice(*call->origin), "foo(1,  2)");

    const NodePtr &args = call->children().at(2);
    ASSERT_TRUE(args->origin.has_value());
    EXPECT_EQ(buffer_->slice(*args->origin), "1,  2");
    EXPECT_EQ(buffer_->slice(*decl->origin), "int x = foo(1,  2);");
}

TEST_F(ParserTest, EmptyArgumentListSitsBeforeClosingParen) {
    auto tree = parsePatternOk("f()");
    ASSERT_NE(tree, nullptr);
    const NodePtr &args = tree->children().at(2);
    ASSERT_NE(args->getIf<List>(), nullptr);
    EXPECT_TRUE(args->children().empty());
    EXPECT_EQ(args->origin->start, 2u);
    EXPECT_EQ(args->origin->end, 2u);
}

TEST_F(ParserTest, BinaryPrecedenceAndAssociativity) {
    auto tree = parsePatternOk("a + b * c - d");
    ASSERT_NE(tree, nullptr);
    EXPECT_EQ(dumpTree(*tree),
              "(Expr:Binary (Expr:Binary a + (Expr:Binary b * c)) - d)");
}

TEST_F(ParserTest, AssignmentIsRightAssociative) {
    auto tree = parsePatternOk("a = b += c");
    ASSERT_NE(tree, nullptr);
    EXPECT_EQ(dumpTree(*tree), "(Expr:Assign a = (Expr:Assign b += c))");
}

TEST_F(ParserTest, PostfixAndMemberChains) {
    auto tree = parsePatternOk("p->items[i].next++");
    ASSERT_NE(tree, nullptr);
    EXPECT_EQ(dumpTree(*tree),
              "(Expr:Postfix (Expr:Member (Expr:Index (Expr:Member p -> items) "
              "[ i ]) . next) ++)");
}

TEST_F(ParserTest, ConditionalAndUnary) {
    auto tree = parsePatternOk("!ok ? -1 : (x)");
    ASSERT_NE(tree, nullptr);
    EXPECT_EQ(dumpTree(*tree),
              "(Expr:Conditional (Expr:Unary ! ok) ? (Expr:Unary - 1) : "
              "(Expr:Paren ( x )))");
}

TEST_F(ParserTest, ControlFlowStatements) {
    auto tree = parseTargetOk("if (a) { b(); } else c();\nwhile (x) x--;");
    ASSERT_NE(tree, nullptr);
    EXPECT_EQ(dumpTree(*tree),
              "(List:Stmts (Stmt:If if ( a ) (Stmt:Block { (List:Stmts "
              "(Stmt:ExprStmt (Expr:Call b ( (List:Args) )) ;)) }) else "
              "(Stmt:ExprStmt (Expr:Call c ( (List:Args) )) ;)) "
              "(Stmt:While while ( x ) (Stmt:ExprStmt (Expr:Postfix x --) ;)))");
}

TEST_F(ParserTest, FunctionDefinition) {
    auto tree = parseTargetOk("int add(int a, int b) { return a + b; }");
    ASSERT_NE(tree, nullptr);
    EXPECT_EQ(dumpTree(*tree),
              "(List:Stmts (Stmt:Function int add ( (List:Params "
              "(Stmt:Param int a) (Stmt:Param int b)) ) (Stmt:Block { "
              "(List:Stmts (Stmt:Return return (Expr:Binary a + b) ;)) })))");
}

TEST_F(ParserTest, CommentsAreSkipped) {
    auto tree = parseTargetOk("// lead\nf(/* inline */ 1); /* tail */");
    ASSERT_NE(tree, nullptr);
    EXPECT_EQ(dumpTree(*tree),
              "(List:Stmts (Stmt:ExprStmt (Expr:Call f ( (List:Args 1) )) ;))");
}

TEST_F(ParserTest, PatternPrefersSingleExpression) {
    auto tree = parsePatternOk("$X + 1");
    ASSERT_NE(tree, nullptr);
    EXPECT_EQ(dumpTree(*tree), "(Expr:Binary $X + 1)");
}

TEST_F(ParserTest, PatternEllipsisInArguments) {
    auto tree = parsePatternOk("foo($A, $...REST)");
    ASSERT_NE(tree, nullptr);
    EXPECT_EQ(dumpTree(*tree), "(Expr:Call foo ( (List:Args $A $...REST) ))");

    const NodePtr &args = tree->children().at(2);
    const NodePtr &rest = args->children().at(1);
    ASSERT_NE(rest->getIf<EllipsisRef>(), nullptr);
    EXPECT_EQ(rest->getIf<EllipsisRef>()->name, "REST");
    EXPECT_EQ(buffer_->slice(*rest->origin), "$...REST");
}

TEST_F(ParserTest, PatternSingleStatement) {
    auto tree = parsePatternOk("return $X;");
    ASSERT_NE(tree, nullptr);
    EXPECT_EQ(dumpTree(*tree), "(Stmt:Return return $X ;)");
}

TEST_F(ParserTest, PatternStatementSequence) {
    auto tree = parsePatternOk("lock(); $...BODY unlock();");
    ASSERT_NE(tree, nullptr);
    ASSERT_NE(tree->getIf<List>(), nullptr);
    EXPECT_EQ(tree->getIf<List>()->kind, ListKind::Statements);
    EXPECT_EQ(tree->children().size(), 3u);
}

TEST_F(ParserTest, PatternMetavariableAsDeclaredName) {
    auto tree = parsePatternOk("int $NAME = $INIT;");
    ASSERT_NE(tree, nullptr);
    EXPECT_EQ(dumpTree(*tree), "(Stmt:Decl int $NAME = $INIT ;)");
}

TEST_F(ParserTest, UnclosedCallIsSyntaxError) {
    std::string err = targetError("foo(1, 2");
    EXPECT_NE(err.find("syntax error"), std::string::npos) << err;
    EXPECT_NE(err.find("expected ')'"), std::string::npos) << err;
}

TEST_F(ParserTest, SyntaxErrorCarriesOffsetAndDetail) {
    buffer_ = std::make_unique<SourceBuffer>(BufferRole::Target, "x = (1;");
    auto treeOrErr = parseTarget(*buffer_);
    ASSERT_FALSE(static_cast<bool>(treeOrErr));

    bool seen = false;
    llvm::Error rest = llvm::handleErrors(treeOrErr.takeError(),
                                          [&](const ParseError &E) {
        seen = true;
        EXPECT_EQ(E.offset(), 6u);
        EXPECT_EQ(E.detail(), "expected ')' before ';'");
    });
    llvm::consumeError(std::move(rest));
    EXPECT_TRUE(seen);
}

TEST_F(ParserTest, DollarOutsidePatternsIsRejected) {
    std::string err = targetError("f($X);");
    EXPECT_NE(err.find("unexpected '$'"), std::string::npos) << err;
}

TEST_F(ParserTest, LowercaseMetavariableIsRejected) {
    std::string err = patternError("f($x)");
    EXPECT_NE(err.find("metavariable names"), std::string::npos) << err;
}

TEST_F(ParserTest, EllipsisOutsideListIsRejected) {
    std::string err = patternError("$...X + 1");
    EXPECT_FALSE(err.empty());
}

TEST_F(ParserTest, EmptyPatternIsRejected) {
    std::string err = patternError("   // nothing\n");
    EXPECT_NE(err.find("empty pattern"), std::string::npos) << err;
}

TEST_F(ParserTest, UnterminatedStringIsRejected) {
    std::string err = targetError("puts(\"abc);");
    EXPECT_NE(err.find("unterminated string"), std::string::npos) << err;
}

TEST(LanguageTest, LookupByNameAndExtension) {
    const Language *c = findLanguage("c");
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->id, LanguageId::C);
    EXPECT_EQ(languageForPath("src/util.c"), c);
    EXPECT_EQ(languageForPath("include/util.h"), c);
    EXPECT_EQ(languageForPath("script.py"), nullptr);
    EXPECT_EQ(findLanguage("cobol"), nullptr);
}

TEST(LexerTest, LongestPunctuatorWins) {
    Lexer lexer("a <<= b->c", /*patternMode=*/false);
    auto lexOrErr = lexer.tokenize();
    ASSERT_TRUE(static_cast<bool>(lexOrErr)) << llvm::toString(lexOrErr.takeError());
    ASSERT_EQ(lexOrErr->size(), 6u);
    EXPECT_EQ((*lexOrErr)[1].text, "<<=");
    EXPECT_EQ((*lexOrErr)[3].text, "->");
    EXPECT_EQ(lexOrErr->back().kind, LexKind::End);
}

} // namespace
} // namespace liftfix
