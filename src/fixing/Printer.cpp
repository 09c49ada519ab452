#include "liftfix/fixing/Printer.h"
#include "liftfix/core/FixError.h"

#include <optional>

namespace liftfix {

namespace {

bool isEmptyExpansion(const Node &N) {
    const auto *X = N.getIf<Expansion>();
    return X && X->items.empty();
}

class StructuralPrinter {
public:
    StructuralPrinter(const SourceBuffer &target, const SourceBuffer &fixTemplate,
                      PrintStats &stats)
        : target_(target), template_(fixTemplate), stats_(stats) {}

    llvm::Error print(const Node &N) {
        // References are never lifted: their origin spells the placeholder.
        if (const auto *M = N.getIf<MetavarRef>()) {
            if (!M->binding)
                return makeFixError(FixErrorKind::UnprintableNode,
                                    describeNode(N), "unresolved placeholder");
            return print(*M->binding);
        }
        if (N.getIf<EllipsisRef>())
            return makeFixError(FixErrorKind::UnprintableNode, describeNode(N),
                                "unresolved placeholder");

        if (const auto *X = N.getIf<Expansion>()) {
            for (const auto &item : X->items) {
                if (auto Err = print(*item))
                    return Err;
            }
            return llvm::Error::success();
        }

        if (N.origin && !N.altered) {
            lift(*N.origin);
            return llvm::Error::success();
        }

        if (const auto *T = N.getIf<Token>()) {
            if (T->kind == TokenKind::Connective &&
                T->connective != Connective::None) {
                std::string_view text = connectiveText(T->connective);
                out_ += text;
                stats_.synthesizedChars += text.size();
                ++stats_.synthesizedSeparators;
                return llvm::Error::success();
            }
            return makeFixError(FixErrorKind::UnprintableNode, describeNode(N),
                                "token without origin");
        }

        return printChildren(N.children());
    }

    std::string take() { return std::move(out_); }

private:
    const SourceBuffer &bufferFor(const Range &R) const {
        return R.buffer == BufferRole::Target ? target_ : template_;
    }

    void lift(const Range &R) {
        std::string_view text = bufferFor(R).slice(R);
        out_ += text;
        if (R.buffer == BufferRole::Target)
            stats_.liftedTargetChars += text.size();
        else
            stats_.liftedTemplateChars += text.size();
    }

    static std::optional<Range> templateSpan(const Node &N) {
        if (N.origin && N.origin->buffer == BufferRole::Template)
            return N.origin;
        return std::nullopt;
    }

    // Template text between two sibling template nodes: whitespace and any
    // punctuation the frontend folded into its parent.
    void liftGap(const Node &a, const Node &b) {
        auto sa = templateSpan(a);
        auto sb = templateSpan(b);
        if (!sa || !sb || sa->end > sb->start)
            return;
        Range gap = *sa;
        gap.start = sa->end;
        gap.end = sb->start;
        if (!gap.empty())
            lift(gap);
    }

    // An empty expansion disappears together with the template text that
    // separated it from the element before it, so `f(a, $...X)` with an
    // empty X prints `f(a)`.
    llvm::Error printChildren(const std::vector<NodePtr> &children) {
        std::optional<size_t> prev;
        for (size_t i = 0; i < children.size(); ++i) {
            if (isEmptyExpansion(*children[i]))
                continue;
            if (prev)
                liftGap(*children[*prev], *children[*prev + 1]);
            if (auto Err = print(*children[i]))
                return Err;
            prev = i;
        }
        return llvm::Error::success();
    }

    const SourceBuffer &target_;
    const SourceBuffer &template_;
    PrintStats &stats_;
    std::string out_;
};

} // anonymous namespace

llvm::Expected<std::string> printFix(const NodePtr &tree,
                                     const SourceBuffer &target,
                                     const SourceBuffer &fixTemplate,
                                     PrintStats *stats) {
    PrintStats local;
    StructuralPrinter printer(target, fixTemplate, local);
    if (auto Err = printer.print(*tree))
        return std::move(Err);
    if (stats)
        *stats = local;
    return printer.take();
}

} // namespace liftfix
