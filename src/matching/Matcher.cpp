#include "liftfix/matching/Matcher.h"

namespace liftfix {

namespace {

// What a single `$X` may stand for: an expression, a statement, or an
// operand token. Punctuation, keywords and lists are never captured alone.
bool isCapturable(const Node &N) {
    if (N.getIf<Expr>() || N.getIf<Stmt>())
        return true;
    if (const auto *T = N.getIf<Token>()) {
        switch (T->kind) {
            case TokenKind::Identifier:
            case TokenKind::Number:
            case TokenKind::String:
            case TokenKind::Char:
                return true;
            default:
                return false;
        }
    }
    return false;
}

bool isStatementList(const Node &N) {
    const auto *L = N.getIf<List>();
    return L && L->kind == ListKind::Statements;
}

} // anonymous namespace

Matcher::Matcher(NodePtr pattern)
    : pattern_(std::move(pattern)), windowPattern_(isStatementList(*pattern_)) {}

std::vector<Match> Matcher::findAll(const NodePtr &target) const {
    std::vector<Match> out;
    collect(target, out);
    return out;
}

bool Matcher::matchAt(const NodePtr &target, MatchEnvironment &env) const {
    return matchNode(*pattern_, target, env);
}

void Matcher::collect(const NodePtr &target, std::vector<Match> &out) const {
    if (windowPattern_ && isStatementList(*target)) {
        const auto &pItems = pattern_->children();
        const auto &tItems = target->children();
        for (size_t start = 0; start < tItems.size(); ++start) {
            MatchEnvironment env;
            size_t end = start;
            if (!matchSequence(pItems, 0, tItems, start, env,
                               /*anchored=*/false, &end))
                continue;
            if (end == start)
                continue;
            Range R = *tItems[start]->origin;
            R.end = tItems[end - 1]->origin->end;
            out.push_back(Match{std::move(env), R});
        }
    } else if (!windowPattern_ && target->origin) {
        MatchEnvironment env;
        if (matchNode(*pattern_, target, env))
            out.push_back(Match{std::move(env), *target->origin});
    }

    for (const auto &child : target->children())
        collect(child, out);
}

bool Matcher::matchNode(const Node &pattern, const NodePtr &target,
                        MatchEnvironment &env) const {
    if (const auto *M = pattern.getIf<MetavarRef>()) {
        if (!isCapturable(*target))
            return false;
        if (const Binding *B = env.lookup(M->name)) {
            const auto *bound = std::get_if<NodePtr>(B);
            return bound && structurallyEqual(**bound, *target);
        }
        env.bind(M->name, target);
        return true;
    }

    if (pattern.getIf<EllipsisRef>())
        return false;
    if (pattern.kind() != target->kind())
        return false;

    if (const auto *PT = pattern.getIf<Token>()) {
        const auto *TT = target->getIf<Token>();
        return PT->kind == TT->kind && PT->text == TT->text;
    }

    if (const auto *PL = pattern.getIf<List>()) {
        const auto *TL = target->getIf<List>();
        if (PL->kind != TL->kind)
            return false;
        return matchSequence(PL->items, 0, TL->items, 0, env,
                             /*anchored=*/true, nullptr);
    }

    if (const auto *PE = pattern.getIf<Expr>()) {
        if (PE->kind != target->getIf<Expr>()->kind)
            return false;
    } else if (const auto *PS = pattern.getIf<Stmt>()) {
        if (PS->kind != target->getIf<Stmt>()->kind)
            return false;
    } else {
        return false;
    }

    const auto &pc = pattern.children();
    const auto &tc = target->children();
    if (pc.size() != tc.size())
        return false;
    for (size_t i = 0; i < pc.size(); ++i) {
        if (!matchNode(*pc[i], tc[i], env))
            return false;
    }
    return true;
}

bool Matcher::matchSequence(const std::vector<NodePtr> &pattern, size_t pi,
                            const std::vector<NodePtr> &target, size_t ti,
                            MatchEnvironment &env, bool anchored,
                            size_t *consumedEnd) const {
    if (pi == pattern.size()) {
        if (anchored && ti != target.size())
            return false;
        if (consumedEnd)
            *consumedEnd = ti;
        return true;
    }

    const Node &P = *pattern[pi];
    if (const auto *E = P.getIf<EllipsisRef>()) {
        if (const Binding *B = env.lookup(E->name)) {
            const auto *seq = std::get_if<std::vector<NodePtr>>(B);
            if (!seq || ti + seq->size() > target.size())
                return false;
            for (size_t k = 0; k < seq->size(); ++k) {
                if (!structurallyEqual(*(*seq)[k], *target[ti + k]))
                    return false;
            }
            return matchSequence(pattern, pi + 1, target, ti + seq->size(),
                                 env, anchored, consumedEnd);
        }

        // Shortest run first.
        for (size_t n = 0; ti + n <= target.size(); ++n) {
            MatchEnvironment trial = env;
            trial.bindSequence(E->name,
                               std::vector<NodePtr>(target.begin() + ti,
                                                    target.begin() + ti + n));
            if (matchSequence(pattern, pi + 1, target, ti + n, trial, anchored,
                              consumedEnd)) {
                env = std::move(trial);
                return true;
            }
        }
        return false;
    }

    if (ti >= target.size())
        return false;
    if (!matchNode(P, target[ti], env))
        return false;
    return matchSequence(pattern, pi + 1, target, ti + 1, env, anchored,
                         consumedEnd);
}

} // namespace liftfix
