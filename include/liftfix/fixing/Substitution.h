#pragma once

#include "liftfix/core/MatchEnvironment.h"
#include "liftfix/core/Node.h"

#include <llvm/Support/Error.h>

namespace liftfix {

// Rewrites a parsed fix template against one match environment.
//
//   $X      -> resolved MetavarRef keeping its template origin and sharing
//              the bound subtree (every occurrence of X shares one pointer)
//   $...X   -> Expansion inside the enclosing list: the bound elements with a
//              synthesized separator between each consecutive pair. The
//              separator follows the template's list, not the binding's, so
//              a template that is only `$...X` joins with newlines
//
// Composites whose children changed are rebuilt with their template origin
// and marked altered; untouched subtrees are returned as-is so the printer
// can lift them wholesale.
//
// Errors: UnboundMetavariable(X), TypeMismatch(X). No partial tree is ever
// returned with an error.
llvm::Expected<NodePtr> replaceMetavars(const MatchEnvironment &env,
                                        const NodePtr &fixTemplate);

} // namespace liftfix
