#pragma once

#include <cstddef>
#include <functional>
#include <limits>
#include <optional>
#include <unordered_set>
#include <utility>
#include <vector>

namespace zen::di {

// Depth-first search over a directed graph given by a neighbour function.
// Nodes reached and fully explored go to the visited set; nodes on the current
// path are kept on the recursion stack. Meeting a stack node again is a cycle.
// The visited set is kept between calls so a detector can sweep a whole graph.
template <typename Node, typename Hash = std::hash<Node>>
class CycleDetector {
public:
    using Neighbors = std::function<std::vector<Node>(const Node&)>;

    explicit CycleDetector(Neighbors neighbors,
                           std::size_t depthLimit = std::numeric_limits<std::size_t>::max())
        : neighbors_(std::move(neighbors)), depthLimit_(depthLimit) {}

    // Returns the node that closed the cycle (or the node at which the depth
    // limit was hit), nullopt when nothing reachable from start loops back.
    std::optional<Node> findCycleFrom(const Node& start) {
        offender_.reset();
        depthLimitHit_ = false;
        onStack_.clear();
        if (visit(start, 0)) {
            return offender_;
        }
        return std::nullopt;
    }

    bool depthLimitHit() const noexcept { return depthLimitHit_; }

private:
    bool visit(const Node& node, std::size_t depth) {
        if (depth > depthLimit_) {
            depthLimitHit_ = true;
            offender_ = node;
            return true;
        }
        if (onStack_.count(node) != 0) {
            offender_ = node;
            return true;
        }
        if (visited_.count(node) != 0) {
            return false;
        }

        visited_.insert(node);
        onStack_.insert(node);

        for (const auto& next : neighbors_(node)) {
            if (visit(next, depth + 1)) {
                return true;
            }
        }

        onStack_.erase(node);
        return false;
    }

    Neighbors neighbors_;
    std::size_t depthLimit_;
    std::unordered_set<Node, Hash> visited_;
    std::unordered_set<Node, Hash> onStack_;
    std::optional<Node> offender_;
    bool depthLimitHit_{false};
};

}  // namespace zen::di
