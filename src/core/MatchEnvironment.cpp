#include "liftfix/core/MatchEnvironment.h"

namespace liftfix {

void MatchEnvironment::bind(const std::string &name, NodePtr node) {
    bindings_[name] = Binding(std::move(node));
}

void MatchEnvironment::bindSequence(const std::string &name,
                                    std::vector<NodePtr> nodes) {
    bindings_[name] = Binding(std::move(nodes));
}

const Binding *MatchEnvironment::lookup(const std::string &name) const {
    auto it = bindings_.find(name);
    return (it != bindings_.end()) ? &it->second : nullptr;
}

std::optional<Range> bindingRange(const Binding &B) {
    if (const auto *N = std::get_if<NodePtr>(&B)) {
        if (*N && (*N)->origin)
            return (*N)->origin;
        return std::nullopt;
    }

    const auto &seq = std::get<std::vector<NodePtr>>(B);
    if (seq.empty() || !seq.front()->origin || !seq.back()->origin)
        return std::nullopt;
    Range R = *seq.front()->origin;
    R.end = seq.back()->origin->end;
    return R;
}

} // namespace liftfix
