// teardown.hpp
// Teardown algorithms for owner-linked chains, binary trees and ordered n-ary trees.
//
// Every function consumes exclusive ownership of a root pointer and hands each node, exactly once and
// already unlinked from its children, to `release` (destroy + deallocate a single node, no cascade).
// Node requirements:
//   - chains:       Node* next
//   - binary trees: Node* left, Node* right (and an integral `depth` for the depth-guided variant)
//   - n-ary trees:  a `children` sequence of Node* supporting back/pop_back/push_back/front/clear
//
// Native stack use:
//   destroy_*_recursive         one frame per level (kept as the negative control)
//   destroy_chain_iterative     O(1)
//   destroy_*_worklist          O(1), frontier on the heap
//   destroy_binary_depth_guided recursion only into the shallower child, nesting <= shallower heights
//   destroy_*_rotating          O(1), no allocation, no metadata; at most one rotation per node
//
// A null root is a no-op everywhere. `release` must not throw.

#ifndef DEEPDROP_TEARDOWN_HPP
#define DEEPDROP_TEARDOWN_HPP

#include <cstddef>
#include <memory>
#include <new>
#include <utility>
#include <vector>

#include "teardown_stats.hpp"

namespace deepdrop {

namespace detail {

template <typename Node, typename Release>
inline void release_one(Node* n, Release& release, TeardownStats& stats) noexcept {
    release(n);
    ++stats.nodes_released;
}

template <typename Node, typename Alloc>
using pending_list = std::vector<Node*, typename std::allocator_traits<Alloc>::template rebind_alloc<Node*>>;

} // namespace detail

// ---------------------------
// singly-linked chains
// ---------------------------

template <typename Node, typename Release>
void destroy_chain_recursive(Node* head, Release& release, TeardownStats& stats, std::size_t level = 0) noexcept {
    if (!head) return;
    stats.note_recursion(level);
    destroy_chain_recursive(take_link(head->next), release, stats, level + 1);
    detail::release_one(head, release, stats);
}

// The head is replaced by its successor until none is left; each step frees one childless node.
template <typename Node, typename Release>
void destroy_chain_iterative(Node* head, Release& release, TeardownStats& stats) noexcept {
    while (head) {
        Node* next = take_link(head->next);
        detail::release_one(head, release, stats);
        head = next;
    }
}

// ---------------------------
// binary trees
// ---------------------------

// clear helper (postorder)
template <typename Node, typename Release>
void destroy_binary_recursive(Node* node, Release& release, TeardownStats& stats, std::size_t level = 0) noexcept {
    if (!node) return;
    stats.note_recursion(level);
    destroy_binary_recursive(take_link(node->left), release, stats, level + 1);
    destroy_binary_recursive(take_link(node->right), release, stats, level + 1);
    detail::release_one(node, release, stats);
}

template <typename Node, typename Release>
void destroy_binary_rotating(Node* root, Release& release, TeardownStats& stats) noexcept {
    Node* cur = root;
    while (cur) {
        Node* left = take_link(cur->left);
        Node* right = take_link(cur->right);
        if (left && right) {
            // right rotation: left comes up, cur keeps the original right and adopts left's right subtree
            cur->left = take_link(left->right);
            cur->right = right;
            left->right = cur;
            cur = left;
            ++stats.rotations;
            continue;
        }
        detail::release_one(cur, release, stats);
        cur = left ? left : right;
    }
}

template <typename Node, typename Release, typename Alloc>
void destroy_binary_worklist(Node* root, Release& release, TeardownStats& stats, const Alloc& alloc) noexcept {
    if (!root) return;
    using PendingAlloc = typename std::allocator_traits<Alloc>::template rebind_alloc<Node*>;
    detail::pending_list<Node, Alloc> pending{PendingAlloc(alloc)};
    Node* n = root;
    try {
        pending.push_back(root);
        stats.note_worklist(pending.size());
        while (!pending.empty()) {
            n = pending.back();
            pending.pop_back();
            // links are cleared only after the push succeeded, so n keeps whatever could not be queued
            if (n->left) { pending.push_back(n->left); n->left = nullptr; }
            if (n->right) { pending.push_back(n->right); n->right = nullptr; }
            stats.note_worklist(pending.size());
            detail::release_one(n, release, stats);
            n = nullptr;
        }
    } catch (const std::bad_alloc&) {
        // out of memory for the frontier: finish without allocating
        destroy_binary_rotating(n, release, stats);
        for (Node* p : pending) destroy_binary_rotating(p, release, stats);
    }
}

// Requires node->depth == 1 + max(child depths) (0 for a leaf) on every node of the tree.
// The loop follows the deeper child; only the shallower child of a two-child node costs a frame.
template <typename Node, typename Release>
void destroy_binary_depth_guided(Node* root, Release& release, TeardownStats& stats, std::size_t level = 0) noexcept {
    if (!root) return;
    stats.note_recursion(level);
    Node* cur = root;
    while (cur) {
        Node* left = take_link(cur->left);
        Node* right = take_link(cur->right);
        detail::release_one(cur, release, stats);
        if (left && right) {
            Node* shallow = left;
            Node* deep = right;
            if (left->depth > right->depth) std::swap(shallow, deep);
            destroy_binary_depth_guided(shallow, release, stats, level + 1);
            cur = deep;
        } else {
            cur = left ? left : right;
        }
    }
}

// ---------------------------
// ordered n-ary trees
// ---------------------------

template <typename Node, typename Release>
void destroy_nary_recursive(Node* node, Release& release, TeardownStats& stats, std::size_t level = 0) noexcept {
    if (!node) return;
    stats.note_recursion(level);
    for (Node*& child : node->children) destroy_nary_recursive(take_link(child), release, stats, level + 1);
    node->children.clear();
    detail::release_one(node, release, stats);
}

// First/last children play the left/right roles of destroy_binary_rotating; the last child is popped
// because that end of the sequence is the cheap one. No child sequence grows past the size it had
// before the pop, so nothing is allocated.
template <typename Node, typename Release>
void destroy_nary_rotating(Node* root, Release& release, TeardownStats& stats) noexcept {
    Node* cur = root;
    while (cur) {
        if (cur->children.empty()) {
            detail::release_one(cur, release, stats);
            break;
        }
        Node* last = take_link(cur->children.back());
        cur->children.pop_back();

        if (cur->children.empty()) {
            detail::release_one(cur, release, stats);
            cur = last;
            continue;
        }

        if (last->children.size() < 2) {
            if (!last->children.empty()) {
                cur->children.push_back(take_link(last->children.front()));
                last->children.clear();
            }
            detail::release_one(last, release, stats);
            continue;
        }

        // rotation: last comes up; cur becomes its first child and adopts last's former first child
        // as its own last child, so the left-to-right order of the leaves is unchanged
        cur->children.push_back(take_link(last->children.front()));
        last->children.front() = cur;
        cur = last;
        ++stats.rotations;
    }
}

template <typename Node, typename Release, typename Alloc>
void destroy_nary_worklist(Node* root, Release& release, TeardownStats& stats, const Alloc& alloc) noexcept {
    if (!root) return;
    using PendingAlloc = typename std::allocator_traits<Alloc>::template rebind_alloc<Node*>;
    detail::pending_list<Node, Alloc> pending{PendingAlloc(alloc)};
    Node* n = root;
    try {
        pending.push_back(root);
        stats.note_worklist(pending.size());
        while (!pending.empty()) {
            n = pending.back();
            pending.pop_back();
            while (!n->children.empty()) {
                pending.push_back(n->children.back());
                n->children.pop_back();
            }
            stats.note_worklist(pending.size());
            detail::release_one(n, release, stats);
            n = nullptr;
        }
    } catch (const std::bad_alloc&) {
        destroy_nary_rotating(n, release, stats);
        for (Node* p : pending) destroy_nary_rotating(p, release, stats);
    }
}

} // namespace deepdrop

#endif // DEEPDROP_TEARDOWN_HPP
