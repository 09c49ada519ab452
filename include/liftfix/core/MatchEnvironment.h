#pragma once

#include "liftfix/core/Node.h"
#include "liftfix/core/SourceBuffer.h"

#include <llvm/ADT/MapVector.h>

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace liftfix {

// A placeholder is bound either to one subtree or, for `$...X`, to an ordered
// run of subtrees. Bound nodes always originate in the target buffer.
using Binding = std::variant<NodePtr, std::vector<NodePtr>>;

class MatchEnvironment {
public:
    using Storage = llvm::MapVector<std::string, Binding, std::map<std::string, unsigned>>;

    void bind(const std::string &name, NodePtr node);
    void bindSequence(const std::string &name, std::vector<NodePtr> nodes);

    const Binding *lookup(const std::string &name) const;
    bool contains(const std::string &name) const { return lookup(name) != nullptr; }

    size_t size() const { return bindings_.size(); }
    bool empty() const { return bindings_.empty(); }

    // Insertion order.
    Storage::const_iterator begin() const { return bindings_.begin(); }
    Storage::const_iterator end() const { return bindings_.end(); }

private:
    Storage bindings_;
};

// Target text covered by a binding; a sequence spans its first to last element.
std::optional<Range> bindingRange(const Binding &B);

// One match record handed from the matcher to fix rendering.
struct Match {
    MatchEnvironment env;
    Range range; // in the target buffer
};

} // namespace liftfix
