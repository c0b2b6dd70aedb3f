// teardown_stats.hpp
// Teardown strategy selector and the instrumentation record every teardown fills in.
//
// - Teardown names the strategy a container runs from clear() and from its destructor.
// - TeardownStats counts released nodes, rotations, recursion nesting and the peak size of the
//   pending frontier; to_json() renders it for diagnostics in the same flat JSON style as the
//   containers' validate_invariants output.
// - take_link(slot) is the single ownership-transfer primitive: it returns the owned pointer and
//   clears the slot in one step, so a node is never reachable from two slots at once.

#ifndef DEEPDROP_TEARDOWN_STATS_HPP
#define DEEPDROP_TEARDOWN_STATS_HPP

#include <cstddef>
#include <sstream>
#include <string>
#include <utility>

namespace deepdrop {

enum class Teardown {
    recursive,     // post-order recursion, one native frame per level (negative control)
    iterative,     // in-place head replacement for singly-linked chains
    worklist,      // explicit heap-resident stack
    depth_guided,  // recurse only into the shallower child
    rotation       // allocation-free rotations, no metadata
};

inline const char* to_string(Teardown t) noexcept {
    switch (t) {
        case Teardown::recursive:    return "recursive";
        case Teardown::iterative:    return "iterative";
        case Teardown::worklist:     return "worklist";
        case Teardown::depth_guided: return "depth_guided";
        case Teardown::rotation:     return "rotation";
    }
    return "unknown";
}

struct TeardownStats {
    Teardown strategy = Teardown::recursive;
    std::size_t nodes_released = 0;
    std::size_t rotations = 0;
    // nesting of recursive calls beyond the entry call
    std::size_t max_recursion_depth = 0;
    std::size_t peak_worklist = 0;

    void reset(Teardown s) noexcept {
        strategy = s;
        nodes_released = 0;
        rotations = 0;
        max_recursion_depth = 0;
        peak_worklist = 0;
    }

    void note_recursion(std::size_t level) noexcept {
        if (level > max_recursion_depth) max_recursion_depth = level;
    }

    void note_worklist(std::size_t pending) noexcept {
        if (pending > peak_worklist) peak_worklist = pending;
    }

    std::string to_json() const {
        std::ostringstream out;
        out << "{";
        out << "\"strategy\":\"" << to_string(strategy) << "\",";
        out << "\"nodes_released\":" << nodes_released << ",";
        out << "\"rotations\":" << rotations << ",";
        out << "\"max_recursion_depth\":" << max_recursion_depth << ",";
        out << "\"peak_worklist\":" << peak_worklist;
        out << "}";
        return out.str();
    }
};

template <typename Node>
inline Node* take_link(Node*& slot) noexcept {
    return std::exchange(slot, nullptr);
}

} // namespace deepdrop

#endif // DEEPDROP_TEARDOWN_STATS_HPP
