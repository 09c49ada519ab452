#include "liftfix/fixing/Substitution.h"
#include "liftfix/core/FixError.h"

namespace liftfix {

namespace {

class MetavarReplacer {
public:
    explicit MetavarReplacer(const MatchEnvironment &env) : env_(env) {}

    llvm::Expected<NodePtr> replace(const NodePtr &N) {
        if (const auto *M = N->getIf<MetavarRef>())
            return resolveScalar(N, *M);

        if (const auto *E = N->getIf<EllipsisRef>())
            return makeFixError(FixErrorKind::TypeMismatch, E->name,
                                "ellipsis placeholder outside a list");

        if (const auto *L = N->getIf<List>())
            return replaceList(N, *L);

        if (const auto *E = N->getIf<Expr>()) {
            std::vector<NodePtr> children;
            auto changedOrErr = replaceChildren(E->children, children);
            if (!changedOrErr)
                return changedOrErr.takeError();
            if (!*changedOrErr)
                return N;
            return makeExpr(E->kind, std::move(children), N->origin,
                            /*altered=*/true);
        }

        if (const auto *S = N->getIf<Stmt>()) {
            std::vector<NodePtr> children;
            auto changedOrErr = replaceChildren(S->children, children);
            if (!changedOrErr)
                return changedOrErr.takeError();
            if (!*changedOrErr)
                return N;
            return makeStmt(S->kind, std::move(children), N->origin,
                            /*altered=*/true);
        }

        // Tokens keep their template origin.
        return N;
    }

private:
    llvm::Expected<NodePtr> resolveScalar(const NodePtr &N, const MetavarRef &M) {
        const Binding *B = env_.lookup(M.name);
        if (!B)
            return makeFixError(FixErrorKind::UnboundMetavariable, M.name);

        const auto *bound = std::get_if<NodePtr>(B);
        if (!bound)
            return makeFixError(FixErrorKind::TypeMismatch, M.name,
                                "bound to a sequence, used as a single node");

        auto R = std::make_shared<Node>();
        R->data = MetavarRef{M.name, *bound};
        R->origin = N->origin;
        R->altered = true;
        return NodePtr(std::move(R));
    }

    llvm::Expected<NodePtr> expand(const NodePtr &N, const EllipsisRef &E,
                                   ListKind kind) {
        const Binding *B = env_.lookup(E.name);
        if (!B)
            return makeFixError(FixErrorKind::UnboundMetavariable, E.name);

        const auto *seq = std::get_if<std::vector<NodePtr>>(B);
        if (!seq)
            return makeFixError(FixErrorKind::TypeMismatch, E.name,
                                "bound to a single node, used as a sequence");

        Expansion X{kind, {}};
        X.items.reserve(seq->empty() ? 0 : seq->size() * 2 - 1);
        for (size_t i = 0; i < seq->size(); ++i) {
            if (i > 0)
                X.items.push_back(makeConnective(listSeparator(kind)));
            X.items.push_back((*seq)[i]);
        }

        auto R = std::make_shared<Node>();
        R->data = std::move(X);
        R->origin = N->origin;
        R->altered = true;
        return NodePtr(std::move(R));
    }

    llvm::Expected<NodePtr> replaceList(const NodePtr &N, const List &L) {
        std::vector<NodePtr> items;
        items.reserve(L.items.size());
        bool changed = false;

        for (const auto &item : L.items) {
            NodePtr out;
            if (const auto *E = item->getIf<EllipsisRef>()) {
                auto expandedOrErr = expand(item, *E, L.kind);
                if (!expandedOrErr)
                    return expandedOrErr.takeError();
                out = std::move(*expandedOrErr);
            } else {
                auto replacedOrErr = replace(item);
                if (!replacedOrErr)
                    return replacedOrErr.takeError();
                out = std::move(*replacedOrErr);
            }
            changed |= (out != item);
            items.push_back(std::move(out));
        }

        if (!changed)
            return N;
        return makeList(L.kind, std::move(items), N->origin, /*altered=*/true);
    }

    // Returns whether any child was replaced.
    llvm::Expected<bool> replaceChildren(const std::vector<NodePtr> &in,
                                         std::vector<NodePtr> &out) {
        out.reserve(in.size());
        bool changed = false;
        for (const auto &child : in) {
            auto replacedOrErr = replace(child);
            if (!replacedOrErr)
                return replacedOrErr.takeError();
            changed |= (*replacedOrErr != child);
            out.push_back(std::move(*replacedOrErr));
        }
        return changed;
    }

    const MatchEnvironment &env_;
};

} // anonymous namespace

llvm::Expected<NodePtr> replaceMetavars(const MatchEnvironment &env,
                                        const NodePtr &fixTemplate) {
    MetavarReplacer replacer(env);
    return replacer.replace(fixTemplate);
}

} // namespace liftfix
