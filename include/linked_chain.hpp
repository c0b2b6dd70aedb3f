// linked_chain.hpp
// Singly-linked owner chain whose teardown never recurses.
//
// - C++17 header-only, allocator-aware (nodes come from Alloc rebound to Node).
// - Every node owns its successor. clear() and the destructor run the selected teardown:
//     * Teardown::iterative (default): the head is repeatedly replaced by its successor, O(1) stack.
//     * Teardown::recursive: one native frame per node, kept for comparison only.
// - Move-only; the allocator moves with the nodes.
//
// Use as:
//   deepdrop::LinkedChain<int> c;
//   for (int i = 0; i < 100000; ++i) c.push_front(i);
//   c.clear();                           // releases 100000 nodes without recursion
//   c.last_teardown().nodes_released;    // 100000

#ifndef DEEPDROP_LINKED_CHAIN_HPP
#define DEEPDROP_LINKED_CHAIN_HPP

#include <cassert>
#include <cstddef>
#include <iterator>
#include <limits>
#include <memory>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

#include "diagnostics.hpp"
#include "teardown.hpp"

namespace deepdrop {

template <typename T, typename Alloc = std::allocator<T>>
class LinkedChain {
public:
    using value_type      = T;
    using allocator_type  = Alloc;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;
    using reference       = value_type&;
    using const_reference = const value_type&;

    struct Node {
        value_type value;
        Node* next;
        template <typename... Args>
        explicit Node(std::in_place_t, Args&&... args)
            : value(std::forward<Args>(args)...), next(nullptr) {}
    };

private:
    using AllocTraits = std::allocator_traits<allocator_type>;
    using NodeAlloc = typename AllocTraits::template rebind_alloc<Node>;
    using NodeAllocTraits = std::allocator_traits<NodeAlloc>;

public:
    template <bool Const>
    class basic_iterator {
        friend class LinkedChain;
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type        = LinkedChain::value_type;
        using reference         = std::conditional_t<Const, const value_type&, value_type&>;
        using pointer           = std::conditional_t<Const, const value_type*, value_type*>;
        using difference_type   = LinkedChain::difference_type;
        using node_pointer      = std::conditional_t<Const, const Node*, Node*>;

        basic_iterator() noexcept : node_(nullptr) {}
        template <bool C = Const, typename = std::enable_if_t<C>>
        basic_iterator(const basic_iterator<false>& it) noexcept : node_(it.node_) {}

        reference operator*() const { return node_->value; }
        pointer operator->() const { return &node_->value; }

        basic_iterator& operator++() { node_ = node_->next; return *this; }
        basic_iterator operator++(int) { basic_iterator tmp = *this; ++(*this); return tmp; }

        bool operator==(const basic_iterator& o) const { return node_ == o.node_; }
        bool operator!=(const basic_iterator& o) const { return node_ != o.node_; }

    private:
        template <bool> friend class basic_iterator;
        node_pointer node_;
        explicit basic_iterator(node_pointer n) noexcept : node_(n) {}
    };

    using iterator = basic_iterator<false>;
    using const_iterator = basic_iterator<true>;

    explicit LinkedChain(const allocator_type& alloc = allocator_type())
        : node_alloc_(alloc), head_(nullptr), size_(0), teardown_(Teardown::iterative) {}

    LinkedChain(LinkedChain&& other) noexcept
        : node_alloc_(std::move(other.node_alloc_)), head_(take_link(other.head_)),
          size_(std::exchange(other.size_, 0)), teardown_(other.teardown_), stats_(other.stats_) {}

    LinkedChain& operator=(LinkedChain&& other) noexcept {
        if (this == &other) return *this;
        clear();
        node_alloc_ = std::move(other.node_alloc_);
        head_ = take_link(other.head_);
        size_ = std::exchange(other.size_, 0);
        teardown_ = other.teardown_;
        stats_ = other.stats_;
        return *this;
    }

    LinkedChain(const LinkedChain&) = delete;
    LinkedChain& operator=(const LinkedChain&) = delete;

    ~LinkedChain() { clear(); }

    allocator_type get_allocator() const { return allocator_type(node_alloc_); }

    // capacity
    bool empty() const noexcept { return head_ == nullptr; }
    size_type size() const noexcept { return size_; }
    size_type max_size() const noexcept { return std::numeric_limits<size_type>::max() / sizeof(Node); }

    // iterators
    iterator begin() noexcept { return iterator(head_); }
    const_iterator begin() const noexcept { return const_iterator(head_); }
    const_iterator cbegin() const noexcept { return begin(); }
    iterator end() noexcept { return iterator(nullptr); }
    const_iterator end() const noexcept { return const_iterator(nullptr); }
    const_iterator cend() const noexcept { return end(); }

    // element access
    reference front() { assert(head_); return head_->value; }
    const_reference front() const { assert(head_); return head_->value; }

    // modifiers
    template <typename... Args>
    reference emplace_front(Args&&... args) {
        Node* n = allocate_node(std::forward<Args>(args)...);
        n->next = take_link(head_);
        head_ = n;
        ++size_;
        return n->value;
    }

    void push_front(const value_type& v) { emplace_front(v); }
    void push_front(value_type&& v) { emplace_front(std::move(v)); }

    bool pop_front() noexcept {
        if (!head_) return false;
        Node* old = take_link(head_);
        head_ = take_link(old->next);
        deallocate_node(old);
        --size_;
        return true;
    }

    void clear() noexcept {
        stats_.reset(teardown_);
        Node* head = take_link(head_);
        size_ = 0;
        auto release = [this](Node* n) noexcept { deallocate_node(n); };
        if (teardown_ == Teardown::recursive) destroy_chain_recursive(head, release, stats_);
        else destroy_chain_iterative(head, release, stats_);
    }

    // teardown selection and instrumentation
    static constexpr bool supports_teardown(Teardown t) noexcept {
        return t == Teardown::iterative || t == Teardown::recursive;
    }
    bool set_teardown(Teardown t) noexcept {
        if (!supports_teardown(t)) return false;
        teardown_ = t;
        return true;
    }
    Teardown teardown_strategy() const noexcept { return teardown_; }
    const TeardownStats& last_teardown() const noexcept { return stats_; }
    void reset_teardown_stats() noexcept { stats_.reset(teardown_); }

    // Walks the chain and checks it holds exactly size() nodes. A walk that runs past size() means a
    // shared or cyclic link; it stops there instead of looping forever.
    bool validate_invariants(std::string* out = nullptr) const {
        size_type counted = 0;
        for (const Node* n = head_; n && counted <= size_; n = n->next) ++counted;
        bool ok = counted == size_;
        if (out) {
            std::ostringstream json;
            json << "{\"valid\":" << (ok ? "true" : "false") << ",\"size_reported\":" << size_
                 << ",\"size_actual\":" << counted << ",\"teardown\":\"" << to_string(teardown_) << "\"}";
            *out = detail::readable_report(ok, json.str(), "");
        }
        return ok;
    }

private:
    NodeAlloc node_alloc_;
    Node* head_;
    size_type size_;
    Teardown teardown_;
    TeardownStats stats_;

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

#endif // DEEPDROP_LINKED_CHAIN_HPP
