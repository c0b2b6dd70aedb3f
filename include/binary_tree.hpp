// binary_tree.hpp
// Owner-linked binary tree with stack-safe teardown.
//
// - C++17 header-only, allocator-aware (Alloc rebound to Node for nodes and to Node* for the worklist).
// - Each node owns its left and right child. The shape is whatever the caller builds; a caterpillar of
//   any length is fine because clear() and the destructor never recurse per level:
//     * Teardown::rotation (default): right rotations turn every two-child node into a one-child node,
//       O(1) stack, no allocation, no per-node metadata.
//     * Teardown::worklist: explicit heap-resident stack of pending subtrees.
//     * Teardown::recursive: post-order recursion, kept for comparison (overflows on deep trees).
// - Subtrees move between trees with attach_*/detach_*; a refused attach leaves the argument intact.
// - Move-only; the allocator moves with the nodes.
//
// Use as:
//   deepdrop::BinaryTree<int> t;
//   auto* n = t.emplace_root(0).first;
//   for (int i = 1; i < 100000; ++i) n = t.emplace_right(n, i).first;
//   t.clear();                                  // no recursion, no allocation
//   t.last_teardown().to_json();
//
// Node pointers handed out stay valid until the node is detached into another tree or released.
// They are positions for the building API; relinking nodes by hand voids the size bookkeeping.

#ifndef DEEPDROP_BINARY_TREE_HPP
#define DEEPDROP_BINARY_TREE_HPP

#include <cstddef>
#include <iostream>
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
class BinaryTree {
public:
    using value_type      = T;
    using allocator_type  = Alloc;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;

    struct Node {
        value_type value;
        Node* left;
        Node* right;
        template <typename... Args>
        explicit Node(std::in_place_t, Args&&... args)
            : value(std::forward<Args>(args)...), left(nullptr), right(nullptr) {}
    };

private:
    using AllocTraits = std::allocator_traits<allocator_type>;
    using NodeAlloc = typename AllocTraits::template rebind_alloc<Node>;
    using NodeAllocTraits = std::allocator_traits<NodeAlloc>;

public:
    explicit BinaryTree(const allocator_type& alloc = allocator_type())
        : node_alloc_(alloc), root_(nullptr), size_(0), teardown_(Teardown::rotation) {}

    BinaryTree(BinaryTree&& other) noexcept
        : node_alloc_(std::move(other.node_alloc_)), root_(take_link(other.root_)),
          size_(std::exchange(other.size_, 0)), teardown_(other.teardown_), stats_(other.stats_) {}

    BinaryTree& operator=(BinaryTree&& other) noexcept {
        if (this == &other) return *this;
        clear();
        node_alloc_ = std::move(other.node_alloc_);
        root_ = take_link(other.root_);
        size_ = std::exchange(other.size_, 0);
        teardown_ = other.teardown_;
        stats_ = other.stats_;
        return *this;
    }

    BinaryTree(const BinaryTree&) = delete;
    BinaryTree& operator=(const BinaryTree&) = delete;

    ~BinaryTree() { clear(); }

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
            for (const Node* n : level) {
                if (n->left) next.push_back(n->left);
                if (n->right) next.push_back(n->right);
            }
            level.swap(next);
        }
        return levels;
    }

    // ---------------------------
    // building
    // ---------------------------

    template <typename... Args>
    std::pair<Node*, bool> emplace_root(Args&&... args) {
        return emplace_at(root_, std::forward<Args>(args)...);
    }

    template <typename... Args>
    std::pair<Node*, bool> emplace_left(Node* at, Args&&... args) {
        if (!at) return { nullptr, false };
        return emplace_at(at->left, std::forward<Args>(args)...);
    }

    template <typename... Args>
    std::pair<Node*, bool> emplace_right(Node* at, Args&&... args) {
        if (!at) return { nullptr, false };
        return emplace_at(at->right, std::forward<Args>(args)...);
    }

    // `at` must be a node of this tree; a node of `subtree` or of any other tree is refused, since linking
    // it would create a cycle or an unreachable subtree. Checking costs a walk of this tree.
    bool attach_left(Node* at, BinaryTree&& subtree) { return at && attach_at(at, at->left, std::move(subtree)); }
    bool attach_right(Node* at, BinaryTree&& subtree) { return at && attach_at(at, at->right, std::move(subtree)); }

    BinaryTree detach_left(Node* at) { return at ? detach_at(at->left) : BinaryTree(get_allocator()); }
    BinaryTree detach_right(Node* at) { return at ? detach_at(at->right) : BinaryTree(get_allocator()); }

    // ---------------------------
    // teardown
    // ---------------------------

    void clear() noexcept {
        stats_.reset(teardown_);
        Node* root = take_link(root_);
        size_ = 0;
        auto release = [this](Node* n) noexcept { deallocate_node(n); };
        switch (teardown_) {
            case Teardown::recursive: destroy_binary_recursive(root, release, stats_); break;
            case Teardown::worklist:  destroy_binary_worklist(root, release, stats_, node_alloc_); break;
            case Teardown::rotation:
            case Teardown::iterative:     // not selectable here
            case Teardown::depth_guided:  // not selectable here
                destroy_binary_rotating(root, release, stats_);
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

    // validate_invariants_json:
    // Walks the tree iteratively and checks that it is a tree of exactly size() nodes. A node met twice
    // (shared or cyclic link) makes the walk exceed size(); the walk stops there.
    //
    // JSON structure:
    // { "valid": true|false, "size_reported": n, "size_actual": n2, "height": h,
    //   "teardown": "...", "issues": [ "..." ] }
    bool validate_invariants_json(std::string& out_json) const {
        std::vector<std::string> issues;
        size_type counted = 0;
        std::vector<const Node*> pending;
        if (root_) pending.push_back(root_);
        while (!pending.empty() && counted <= size_) {
            const Node* n = pending.back();
            pending.pop_back();
            ++counted;
            if (n->left == n || n->right == n) issues.push_back("self link at " + detail::pointer_to_hex(n));
            if (n->left) pending.push_back(n->left);
            if (n->right) pending.push_back(n->right);
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
        out << "\"height\":" << (valid ? height() : 0) << ",";
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

    // Pretty-print tree with indentation (requires operator<< for T). Iterative, so deep trees are fine.
    void tree_dump(std::ostream& os, bool show_addresses = false) const {
        os << tree_dump_to_string(show_addresses);
    }

    std::string tree_dump_to_string(bool show_addresses = false) const {
        std::ostringstream oss;
        if (!root_) {
            oss << "<empty tree>\n";
            return oss.str();
        }
        struct Entry { const Node* node; size_type level; const char* tag; };
        std::vector<Entry> pending{ { root_, 0, "" } };
        while (!pending.empty()) {
            Entry e = pending.back();
            pending.pop_back();
            oss << std::string(e.level * 2, ' ') << e.tag << detail::value_to_string(e.node->value);
            if (show_addresses) oss << " @" << detail::pointer_to_hex(e.node);
            oss << "\n";
            if (e.node->right) pending.push_back({ e.node->right, e.level + 1, "R-" });
            if (e.node->left) pending.push_back({ e.node->left, e.level + 1, "L-" });
        }
        return oss.str();
    }

private:
    NodeAlloc node_alloc_;
    Node* root_;
    size_type size_;
    Teardown teardown_;
    TeardownStats stats_;

    bool allocator_compatible(const BinaryTree& other) const noexcept {
        return NodeAllocTraits::is_always_equal::value || node_alloc_ == other.node_alloc_;
    }

    template <typename... Args>
    std::pair<Node*, bool> emplace_at(Node*& slot, Args&&... args) {
        if (slot) return { slot, false };
        slot = allocate_node(std::forward<Args>(args)...);
        ++size_;
        return { slot, true };
    }

    bool attach_at(const Node* at, Node*& slot, BinaryTree&& subtree) {
        if (slot || subtree.empty() || &subtree == this || !allocator_compatible(subtree)) return false;
        if (!owns(at)) return false;
        slot = take_link(subtree.root_);
        size_ += std::exchange(subtree.size_, 0);
        return true;
    }

    BinaryTree detach_at(Node*& slot) {
        BinaryTree out(get_allocator());
        out.teardown_ = teardown_;
        if (!slot) return out;
        size_type moved = count_nodes(slot);
        out.root_ = take_link(slot);
        out.size_ = moved;
        size_ -= moved;
        return out;
    }

    bool owns(const Node* target) const {
        std::vector<const Node*> pending;
        if (root_) pending.push_back(root_);
        while (!pending.empty()) {
            const Node* n = pending.back();
            pending.pop_back();
            if (n == target) return true;
            if (n->left) pending.push_back(n->left);
            if (n->right) pending.push_back(n->right);
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
            if (n->left) pending.push_back(n->left);
            if (n->right) pending.push_back(n->right);
        }
        return counted;
    }

    // node allocation helpers
    template <typename... Args>
    Node* allocate_node(Args&&... args) {
        Node* n = NodeAllocTraits::allocate(node_alloc_, 1);
        try {
            NodeAllocTraits::construct(node_alloc_, n, std::in_place, std::forward<Args>(args)...);
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

#endif // DEEPDROP_BINARY_TREE_HPP
