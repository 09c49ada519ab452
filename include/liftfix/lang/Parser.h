#pragma once

#include "liftfix/core/Node.h"
#include "liftfix/core/SourceBuffer.h"
#include "liftfix/lang/Lexer.h"

#include <llvm/Support/Error.h>

namespace liftfix {

// Recursive-descent parser for the C expression and statement subset.
// Every produced node carries an origin range in the buffer's own unit.
//
// Grammar (informal):
//   stmt   := '{' stmt* '}' | 'return' expr? ';'
//           | 'if' '(' expr ')' stmt ('else' stmt)?
//           | 'while' '(' expr ')' stmt
//           | ident ident ('=' expr)? ';'
//           | ident ident '(' params ')' block
//           | expr ';' | $...NAME
//   expr   := C assignment-expression (no comma operator)
//
// Lists hold elements only. The commas between arguments and parameters stay
// in the source text between elements and are never turned into nodes.

// A whole file: a Statements list.
llvm::Expected<NodePtr> parseTarget(const SourceBuffer &buf);

// A pattern or fix template: a single expression when the whole text is
// one, else a statement or a Statements list. Metavariables are allowed.
llvm::Expected<NodePtr> parsePattern(const SourceBuffer &buf);

} // namespace liftfix
