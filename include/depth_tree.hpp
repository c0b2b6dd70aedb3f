// depth_tree.hpp
// Binary tree whose nodes carry their subtree depth so teardown can recurse into the shallower side only.
//
// - C++17 header-only, allocator-aware.
// - Every node stores `depth` (0 for a leaf, otherwise 1 + the largest child depth) and a parent link.
//   emplace_*, attach_* and detach_* re-establish the depth on the touched node and walk up the parent
//   links, stopping at the first ancestor whose depth does not change. Building bottom-up (attaching
//   finished subtrees under a fresh root) therefore costs O(1) per step.
// - Teardown::depth_guided (default): the loop follows the deeper child and spends a native frame only
//   on the shallower one. Nesting never exceeds the height of the shallower subtrees along the path
//   and is zero on a caterpillar; no allocation.
//   Teardown::rotation, Teardown::worklist and Teardown::recursive behave as in BinaryTree.
// - validate_invariants() recomputes every depth from scratch and compares it with the stored one.
//
// Use as:
//   deepdrop::DepthTree<int> chain;
//   chain.emplace_root(0);
//   for (int i = 1; i < 100000; ++i) {
//       deepdrop::DepthTree<int> top;
//       top.attach_right(top.emplace_root(i).first, std::move(chain));
//       chain = std::move(top);
//   }
//   chain.root()->depth;   // 99999

#ifndef DEEPDROP_DEPTH_TREE_HPP
#define DEEPDROP_DEPTH_TREE_HPP

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <limits>
#include <memory>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "diagnostics.hpp"
#include "teardown.hpp"

namespace deepdrop {

template <typename T, typename Alloc = std::allocator<T>>
class DepthTree {
public:
    using value_type      = T;
    using allocator_type  = Alloc;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;

    struct Node {
        value_type value;
        Node* left;
        Node* right;
        Node* parent;
        size_type depth;
        template <typename... Args>
        explicit Node(std::in_place_t, Args&&... args)
            : value(std::forward<Args>(args)...), left(nullptr), right(nullptr), parent(nullptr), depth(0) {}
    };

private:
    using AllocTraits = std::allocator_traits<allocator_type>;
    using NodeAlloc = typename AllocTraits::template rebind_alloc<Node>;
    using NodeAllocTraits = std::allocator_traits<NodeAlloc>;

public:
    explicit DepthTree(const allocator_type& alloc = allocator_type())
        : node_alloc_(alloc), root_(nullptr), size_(0), teardown_(Teardown::depth_guided) {}

    DepthTree(DepthTree&& other) noexcept
        : node_alloc_(std::move(other.node_alloc_)), root_(take_link(other.root_)),
          size_(std::exchange(other.size_, 0)), teardown_(other.teardown_), stats_(other.stats_) {}

    DepthTree& operator=(DepthTree&& other) noexcept {
        if (this == &other) return *this;
        clear();
        node_alloc_ = std::move(other.node_alloc_);
        root_ = take_link(other.root_);
        size_ = std::exchange(other.size_, 0);
        teardown_ = other.teardown_;
        stats_ = other.stats_;
        return *this;
    }

    DepthTree(const DepthTree&) = delete;
    DepthTree& operator=(const DepthTree&) = delete;

    ~DepthTree() { clear(); }

    allocator_type get_allocator() const { return allocator_type(node_alloc_); }

    // capacity
    bool empty() const noexcept { return root_ == nullptr; }
    size_type size() const noexcept { return size_; }
    size_type max_size() const noexcept { return std::numeric_limits<size_type>::max() / sizeof(Node); }

    Node* root() noexcept { return root_; }
    const Node* root() const noexcept { return root_; }

    // Number of levels, read from the maintained depth of the root.
    size_type height() const noexcept { return root_ ? root_->depth + 1 : 0; }

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

    template <typename... Args>
    std::pair<Node*, bool> emplace_left(Node* at, Args&&... args) {
        if (!at) return { nullptr, false };
        return emplace_at(at, at->left, std::forward<Args>(args)...);
    }

    template <typename... Args>
    std::pair<Node*, bool> emplace_right(Node* at, Args&&... args) {
        if (!at) return { nullptr, false };
        return emplace_at(at, at->right, std::forward<Args>(args)...);
    }

    // `at` must be a node of this tree: its parent links must lead to root(). Anything else is refused.
    bool attach_left(Node* at, DepthTree&& subtree) { return at && attach_at(at, at->left, std::move(subtree)); }
    bool attach_right(Node* at, DepthTree&& subtree) { return at && attach_at(at, at->right, std::move(subtree)); }

    DepthTree detach_left(Node* at) { return at ? detach_at(at, at->left) : DepthTree(get_allocator()); }
    DepthTree detach_right(Node* at) { return at ? detach_at(at, at->right) : DepthTree(get_allocator()); }

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
            case Teardown::rotation:  destroy_binary_rotating(root, release, stats_); break;
            case Teardown::depth_guided:
            case Teardown::iterative:     // not selectable here
                destroy_binary_depth_guided(root, release, stats_);
                break;
        }
    }

    static constexpr bool supports_teardown(Teardown t) noexcept {
        return t != Teardown::iterative;
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
    // Recomputes every depth bottom-up (no recursion) and checks it against the stored value, together
    // with parent links, the size and the absence of shared or cyclic links.
    //
    // JSON structure:
    // { "valid": true|false, "size_reported": n, "size_actual": n2, "root_depth": d,
    //   "depth_mismatches": k, "teardown": "...", "issues": [ "..." ] }
    bool validate_invariants_json(std::string& out_json) const {
        std::vector<std::string> issues;
        std::vector<const Node*> order;
        std::vector<const Node*> pending;
        size_type depth_mismatches = 0;

        if (root_) {
            if (root_->parent) issues.push_back("root has a parent link");
            pending.push_back(root_);
        }
        while (!pending.empty() && order.size() <= size_) {
            const Node* n = pending.back();
            pending.pop_back();
            order.push_back(n);
            for (const Node* c : { n->left, n->right }) {
                if (!c) continue;
                if (c->parent != n) issues.push_back("parent link mismatch at " + detail::pointer_to_hex(c));
                pending.push_back(c);
            }
        }

        bool walk_ok = order.size() <= size_;
        if (!walk_ok) {
            issues.push_back("walk exceeded size: shared or cyclic links");
        } else if (order.size() != size_) {
            std::ostringstream oss;
            oss << "Size mismatch: size_=" << size_ << " actual=" << order.size();
            issues.push_back(oss.str());
        }

        if (walk_ok) {
            // preorder reversed visits children before their parent
            std::unordered_map<const Node*, size_type> recomputed;
            recomputed.reserve(order.size());
            for (auto it = order.rbegin(); it != order.rend(); ++it) {
                const Node* n = *it;
                size_type d = 0;
                if (n->left || n->right) {
                    size_type l = n->left ? recomputed[n->left] : 0;
                    size_type r = n->right ? recomputed[n->right] : 0;
                    d = 1 + std::max(l, r);
                }
                recomputed[n] = d;
                if (d != n->depth) {
                    if (depth_mismatches < 16) {
                        std::ostringstream oss;
                        oss << "Depth mismatch at " << detail::pointer_to_hex(n)
                            << " stored=" << n->depth << " recomputed=" << d;
                        issues.push_back(oss.str());
                    }
                    ++depth_mismatches;
                }
            }
        }

        bool valid = issues.empty();
        std::ostringstream out;
        out << "{";
        out << "\"valid\":" << (valid ? "true" : "false") << ",";
        out << "\"size_reported\":" << size_ << ",";
        out << "\"size_actual\":" << order.size() << ",";
        out << "\"root_depth\":" << (root_ ? root_->depth : 0) << ",";
        out << "\"depth_mismatches\":" << depth_mismatches << ",";
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

    // Pretty-print tree with indentation and stored depths (requires operator<< for T).
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
            oss << std::string(e.level * 2, ' ') << e.tag << detail::value_to_string(e.node->value)
                << " d=" << e.node->depth;
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

    static size_type local_depth(const Node* n) noexcept {
        if (!n->left && !n->right) return 0;
        size_type l = n->left ? n->left->depth : 0;
        size_type r = n->right ? n->right->depth : 0;
        return 1 + std::max(l, r);
    }

    // Walks towards the root until an ancestor's depth is already right.
    static void refresh_depths(Node* from) noexcept {
        for (Node* n = from; n; n = n->parent) {
            size_type d = local_depth(n);
            if (d == n->depth) break;
            n->depth = d;
        }
    }

    bool allocator_compatible(const DepthTree& other) const noexcept {
        return NodeAllocTraits::is_always_equal::value || node_alloc_ == other.node_alloc_;
    }

    template <typename... Args>
    std::pair<Node*, bool> emplace_at(Node* at, Node*& slot, Args&&... args) {
        if (slot) return { slot, false };
        slot = allocate_node(std::forward<Args>(args)...);
        slot->parent = at;
        ++size_;
        refresh_depths(at);
        return { slot, true };
    }

    bool attach_at(Node* at, Node*& slot, DepthTree&& subtree) {
        if (slot || subtree.empty() || &subtree == this || !allocator_compatible(subtree)) return false;
        if (!owns(at)) return false;
        slot = take_link(subtree.root_);
        slot->parent = at;
        size_ += std::exchange(subtree.size_, 0);
        refresh_depths(at);
        return true;
    }

    DepthTree detach_at(Node* at, Node*& slot) {
        DepthTree out(get_allocator());
        out.teardown_ = teardown_;
        if (!slot) return out;
        size_type moved = count_nodes(slot);
        out.root_ = take_link(slot);
        out.root_->parent = nullptr;
        out.size_ = moved;
        size_ -= moved;
        refresh_depths(at);
        return out;
    }

    // O(depth of n): follows parent links up to the top.
    bool owns(const Node* n) const noexcept {
        while (n && n->parent) n = n->parent;
        return n && n == root_;
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

#endif // DEEPDROP_DEPTH_TREE_HPP
