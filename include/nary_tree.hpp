// nary_tree.hpp
// Ordered n-ary tree (each node owns a sequence of children) with stack-safe teardown.
//
// - C++17 header-only, allocator-aware: nodes come from Alloc rebound to Node, child sequences from
//   Alloc rebound to Node*.
// - Child order is meaningful; emplace_child/attach_child append at the end.
// - Teardown::rotation (default): the last child is popped and either collapsed into the current node,
//   spliced onto it (fewer than two grandchildren) or rotated above it. O(1) stack, and no child
//   sequence ever grows past its size before the pop, so teardown allocates nothing.
//   Teardown::worklist: explicit heap-resident stack. Teardown::recursive: comparison only.
//
// Use as:
//   deepdrop::NaryTree<int> t;
//   auto* root = t.emplace_root(0).first;
//   t.emplace_child(root, 1);
//   auto* n = t.emplace_child(root, 2);
//   for (int i = 3; i < 1000000; ++i) n = t.emplace_child(n, i);
//   t.clear();

#ifndef DEEPDROP_NARY_TREE_HPP
#define DEEPDROP_NARY_TREE_HPP

#include <cstddef>
#include <iostream>
#include <iterator>
#include <limits>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "diagnostics.hpp"
#include "teardown.hpp"

namespace deepdrop {

template <typename T, typename Alloc = std::allocator<T>>
class NaryTree {
public:
    using value_type      = T;
    using allocator_type  = Alloc;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;

    struct Node {
        using child_allocator = typename std::allocator_traits<Alloc>::template rebind_alloc<Node*>;
        using child_list = std::vector<Node*, child_allocator>;

        value_type value;
        child_list children;
        template <typename... Args>
        Node(std::in_place_t, const child_allocator& a, Args&&... args)
            : value(std::forward<Args>(args)...), children(a) {}
    };

private:
    using AllocTraits = std::allocator_traits<allocator_type>;
    using NodeAlloc = typename AllocTraits::template rebind_alloc<Node>;
    using NodeAllocTraits = std::allocator_traits<NodeAlloc>;
    using ChildAlloc = typename Node::child_allocator;

public:
    explicit NaryTree(const allocator_type& alloc = allocator_type())
        : node_alloc_(alloc), root_(nullptr), size_(0), teardown_(Teardown::rotation) {}

    NaryTree(NaryTree&& other) noexcept
        : node_alloc_(std::move(other.node_alloc_)), root_(take_link(other.root_)),
          size_(std::exchange(other.size_, 0)), teardown_(other.teardown_), stats_(other.stats_) {}

    NaryTree& operator=(NaryTree&& other) noexcept {
        if (this == &other) return *this;
        clear();
        node_alloc_ = std::move(other.node_alloc_);
        root_ = take_link(other.root_);
        size_ = std::exchange(other.size_, 0);
        teardown_ = other.teardown_;
        stats_ = other.stats_;
        return *this;
    }

    NaryTree(const NaryTree&) = delete;
    NaryTree& operator=(const NaryTree&) = delete;

    ~NaryTree() { clear(); }

    allocator_type get_allocator() const { return allocator_type(node_alloc_); }

    // capacity
    bool empty() const noexcept { return root_ == nullptr; }
    size_type size() const noexcept { return size_; }
    size_type max_size() const noexcept { return std::numeric_limits<size_type>::max() / sizeof(Node); }

    Node* root() noexcept { return root_; }
    const Node* root() const noexcept { return root_; }

    // Number of levels (0 for an empty tree), computed breadth-first.
    size_type height() const {
        size_type levels = 0;
        std::vector<const Node*> level;
        std::vector<const Node*> next;
        if (root_) level.push_back(root_);
        while (!level.empty()) {
            ++levels;
            next.clear();
            for (const Node* n : level) next.insert(next.end(), n->children.begin(), n->children.end());
            level.swap(next);
        }
        return levels;
    }

    // ---------------------------
    // building
    // ---------------------------

    template <typename... Args>
    std::pair<Node*, bool> emplace_root(Args&&... args) {
        if (root_) return { root_, false };
        root_ = allocate_node(std::forward<Args>(args)...);
        ++size_;
        return { root_, true };
    }

    // Appends a new last child; returns nullptr when `at` is null.
    template <typename... Args>
    Node* emplace_child(Node* at, Args&&... args) {
        if (!at) return nullptr;
        Node* n = allocate_node(std::forward<Args>(args)...);
        try {
            at->children.push_back(n);
        } catch (...) {
            deallocate_node(n);
            throw;
        }
        ++size_;
        return n;
    }

    // Appends `subtree` as the last child of `at`, which must be a node of this tree (checked by a walk of
    // this tree; a node of `subtree` or of another tree is refused).
    bool attach_child(Node* at, NaryTree&& subtree) {
        if (!at || subtree.empty() || &subtree == this || !allocator_compatible(subtree)) return false;
        if (!owns(at)) return false;
        at->children.push_back(subtree.root_);
        subtree.root_ = nullptr;
        size_ += std::exchange(subtree.size_, 0);
        return true;
    }

    // Removes the child at `index` (later children shift down) and returns it as its own tree.
    NaryTree detach_child(Node* at, size_type index) {
        NaryTree out(get_allocator());
        out.teardown_ = teardown_;
        if (!at || index >= at->children.size()) return out;
        size_type moved = count_nodes(at->children[index]);
        out.root_ = take_link(at->children[index]);
        at->children.erase(at->children.begin() + static_cast<difference_type>(index));
        out.size_ = moved;
        size_ -= moved;
        return out;
    }

    // ---------------------------
    // teardown
    // ---------------------------

    void clear() noexcept {
        stats_.reset(teardown_);
        Node* root = take_link(root_);
        size_ = 0;
        auto release = [this](Node* n) noexcept { deallocate_node(n); };
        switch (teardown_) {
            case Teardown::recursive: destroy_nary_recursive(root, release, stats_); break;
            case Teardown::worklist:  destroy_nary_worklist(root, release, stats_, node_alloc_); break;
            case Teardown::rotation:
            case Teardown::iterative:     // not selectable here
            case Teardown::depth_guided:  // not selectable here
                destroy_nary_rotating(root, release, stats_);
                break;
        }
    }

    static constexpr bool supports_teardown(Teardown t) noexcept {
        return t == Teardown::rotation || t == Teardown::worklist || t == Teardown::recursive;
    }
    bool set_teardown(Teardown t) noexcept {
        if (!supports_teardown(t)) return false;
        teardown_ = t;
        return true;
    }
    Teardown teardown_strategy() const noexcept { return teardown_; }

    // Instrumentation accessors
    const TeardownStats& last_teardown() const noexcept { return stats_; }
    void reset_teardown_stats() noexcept { stats_.reset(teardown_); }

    // ---------------------------
    // diagnostics
    // ---------------------------

    // JSON structure:
    // { "valid": true|false, "size_reported": n, "size_actual": n2, "max_fanout": k,
    //   "teardown": "...", "issues": [ "..." ] }
    bool validate_invariants_json(std::string& out_json) const {
        std::vector<std::string> issues;
        size_type counted = 0;
        size_type max_fanout = 0;
        std::vector<const Node*> pending;
        if (root_) pending.push_back(root_);
        while (!pending.empty() && counted <= size_) {
            const Node* n = pending.back();
            pending.pop_back();
            ++counted;
            if (n->children.size() > max_fanout) max_fanout = n->children.size();
            for (const Node* c : n->children) {
                if (!c) {
                    issues.push_back("null child at " + detail::pointer_to_hex(n));
                    continue;
                }
                pending.push_back(c);
            }
        }
        if (counted > size_) {
            issues.push_back("walk exceeded size: shared or cyclic links");
        } else if (counted != size_) {
            std::ostringstream oss;
            oss << "Size mismatch: size_=" << size_ << " actual=" << counted;
            issues.push_back(oss.str());
        }
        bool valid = issues.empty();

        std::ostringstream out;
        out << "{";
        out << "\"valid\":" << (valid ? "true" : "false") << ",";
        out << "\"size_reported\":" << size_ << ",";
        out << "\"size_actual\":" << counted << ",";
        out << "\"max_fanout\":" << max_fanout << ",";
        out << "\"teardown\":\"" << to_string(teardown_) << "\",";
        out << "\"issues\":" << detail::json_array(issues);
        out << "}";
        out_json = out.str();
        return valid;
    }

    bool validate_invariants(std::string* out = nullptr) const {
        std::string json;
        bool ok = validate_invariants_json(json);
        if (out) *out = detail::readable_report(ok, json, "");
        return ok;
    }

    // Pretty-print tree with indentation, children in order (requires operator<< for T).
    void tree_dump(std::ostream& os, bool show_addresses = false) const {
        os << tree_dump_to_string(show_addresses);
    }

    std::string tree_dump_to_string(bool show_addresses = false) const {
        std::ostringstream oss;
        if (!root_) {
            oss << "<empty tree>\n";
            return oss.str();
        }
        std::vector<std::pair<const Node*, size_type>> pending{ { root_, 0 } };
        while (!pending.empty()) {
            auto e = pending.back();
            pending.pop_back();
            oss << std::string(e.second * 2, ' ') << detail::value_to_string(e.first->value);
            if (show_addresses) oss << " @" << detail::pointer_to_hex(e.first);
            oss << "\n";
            for (auto it = e.first->children.rbegin(); it != e.first->children.rend(); ++it) {
                pending.emplace_back(*it, e.second + 1);
            }
        }
        return oss.str();
    }

private:
    NodeAlloc node_alloc_;
    Node* root_;
    size_type size_;
    Teardown teardown_;
    TeardownStats stats_;

    bool allocator_compatible(const NaryTree& other) const noexcept {
        return NodeAllocTraits::is_always_equal::value || node_alloc_ == other.node_alloc_;
    }

    bool owns(const Node* target) const {
        std::vector<const Node*> pending;
        if (root_) pending.push_back(root_);
        while (!pending.empty()) {
            const Node* n = pending.back();
            pending.pop_back();
            if (n == target) return true;
            pending.insert(pending.end(), n->children.begin(), n->children.end());
        }
        return false;
    }

    static size_type count_nodes(const Node* root) {
        size_type counted = 0;
        std::vector<const Node*> pending;
        if (root) pending.push_back(root);
        while (!pending.empty()) {
            const Node* n = pending.back();
            pending.pop_back();
            ++counted;
            pending.insert(pending.end(), n->children.begin(), n->children.end());
        }
        return counted;
    }

    // node allocation helpers
    template <typename... Args>
    Node* allocate_node(Args&&... args) {
        Node* n = NodeAllocTraits::allocate(node_alloc_, 1);
        try {
            NodeAllocTraits::construct(node_alloc_, n, std::in_place, ChildAlloc(node_alloc_),
                                       std::forward<Args>(args)...);
        } catch (...) {
            NodeAllocTraits::deallocate(node_alloc_, n, 1);
            throw;
        }
        return n;
    }

    void deallocate_node(Node* n) noexcept {
        NodeAllocTraits::destroy(node_alloc_, n);
        NodeAllocTraits::deallocate(node_alloc_, n, 1);
    }
};

} // namespace deepdrop

#endif // DEEPDROP_NARY_TREE_HPP
