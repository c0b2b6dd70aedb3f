// tests/teardown_stress.cpp
//
// Randomized / adversarial stress tests for the teardown strategies. Uses GoogleTest.
//
// - Builds many tree shapes (random, skewed, zig-zag, alternating-heavy spine, complete, random n-ary,
//   combs) and tears each down with every applicable strategy on a small thread stack, checking:
//     * every node released exactly once and nothing left allocated
//     * rotation teardowns allocate nothing and rotate each node at most once
// - Fuzzes DepthTree attach/detach sequences and checks the maintained depths against a from-scratch
//   recomputation after every batch.
//
// Intensity comes from the environment:
//   DEEPDROP_STRESS_ROUNDS  rounds per test (default 8)
//   DEEPDROP_STRESS_NODES   nodes per generated tree (default 20000)

#include <gtest/gtest.h>
#include <chrono>
#include <algorithm>
#include <functional>
#include <sstream>
#include <random>
#include <string>
#include <vector>

#include "test_support.hpp"

using deepdrop::BinaryTree;
using deepdrop::DepthTree;
using deepdrop::NaryTree;
using deepdrop::Teardown;

namespace {

int stress_rounds() { return static_cast<int>(env_or("DEEPDROP_STRESS_ROUNDS", 8)); }
int stress_nodes() { return static_cast<int>(env_or("DEEPDROP_STRESS_NODES", 20000)); }

// Tears `t` down on a small stack and returns a diagnostic string (empty if ok). `blocks_baseline` is
// AllocCounters::live_blocks as it was before the tree was built.
template <typename Tree>
std::string teardown_and_check(Tree& t, Teardown strategy, long blocks_baseline) {
    const std::size_t n = t.size();
    std::ostringstream oss;
    if (!t.set_teardown(strategy)) {
        oss << "strategy " << deepdrop::to_string(strategy) << " rejected\n";
        return oss.str();
    }
    Tracked::reset(n);
    long allocations_before = AllocCounters::allocations;
    if (!run_with_stack(kSmallStack, [&] { t.clear(); })) return "could not start teardown thread\n";

    const auto& stats = t.last_teardown();
    if (stats.nodes_released != n) oss << "released " << stats.nodes_released << " of " << n << "\n";
    if (Tracked::released != static_cast<long>(n)) oss << "payload teardowns " << Tracked::released << " of " << n << "\n";
    if (Tracked::duplicates != 0) oss << "payload torn down twice: " << Tracked::duplicates << "\n";
    if (Tracked::live != 0) oss << "live payloads left: " << Tracked::live << "\n";
    if (AllocCounters::live_blocks != blocks_baseline) {
        oss << "blocks still allocated: " << (AllocCounters::live_blocks - blocks_baseline) << "\n";
    }
    if (strategy == Teardown::rotation) {
        if (AllocCounters::allocations != allocations_before) {
            oss << "rotation teardown allocated " << (AllocCounters::allocations - allocations_before) << " blocks\n";
        }
        if (stats.rotations > n) oss << "rotations " << stats.rotations << " exceed node count " << n << "\n";
    }
    if (!oss.str().empty()) oss << "stats: " << stats.to_json() << "\n";
    return oss.str();
}

using StressTree = BinaryTree<Tracked, CountingAllocator<Tracked>>;
using StressNary = NaryTree<Tracked, CountingAllocator<Tracked>>;

struct Shape {
    const char* name;
    std::function<void(StressTree&, int, std::mt19937_64&)> build;
};

std::vector<Shape> binary_shapes() {
    return {
        { "random", [](StressTree& t, int n, std::mt19937_64& rng) { build_random(t, n, rng); } },
        { "skewed_right", [](StressTree& t, int n, std::mt19937_64& rng) { build_skewed(t, n, rng, 0.9); } },
        { "skewed_left", [](StressTree& t, int n, std::mt19937_64& rng) { build_skewed(t, n, rng, 0.1); } },
        { "zigzag", [](StressTree& t, int n, std::mt19937_64&) { build_zigzag(t, n); } },
        { "alternating_heavy", [](StressTree& t, int n, std::mt19937_64&) { build_alternating_heavy(t, n); } },
        { "caterpillar", [](StressTree& t, int n, std::mt19937_64&) { build_caterpillar(t, n); } },
        { "complete", [](StressTree& t, int n, std::mt19937_64&) {
              int levels = 1;
              while ((2 << levels) - 1 <= n) ++levels;
              build_complete(t, levels);
          } },
    };
}

// Random n-ary tree: each new node hangs under a uniformly chosen existing node.
void build_random_nary(StressNary& t, int n, std::mt19937_64& rng) {
    std::vector<StressNary::Node*> nodes;
    nodes.reserve(static_cast<std::size_t>(n));
    nodes.push_back(t.emplace_root(0).first);
    for (int i = 1; i < n; ++i) {
        std::uniform_int_distribution<std::size_t> pick(0, nodes.size() - 1);
        nodes.push_back(t.emplace_child(nodes[pick(rng)], i));
    }
}

// Deep n-ary tree: new nodes hang under one of the most recent few nodes, so the height grows linearly.
void build_deep_nary(StressNary& t, int n, std::mt19937_64& rng) {
    std::vector<StressNary::Node*> nodes;
    nodes.reserve(static_cast<std::size_t>(n));
    nodes.push_back(t.emplace_root(0).first);
    std::uniform_int_distribution<std::size_t> back(1, 4);
    for (int i = 1; i < n; ++i) {
        std::size_t k = std::min(back(rng), nodes.size());
        nodes.push_back(t.emplace_child(nodes[nodes.size() - k], i));
    }
}

// Comb: every spine node has the spine continuation at a random position among a few leaves.
void build_comb_nary(StressNary& t, int n, std::mt19937_64& rng) {
    std::uniform_int_distribution<int> leaves(0, 3);
    int id = 0;
    auto* cur = t.emplace_root(id++).first;
    while (id < n) {
        int before = leaves(rng);
        int after = leaves(rng);
        for (int i = 0; i < before && id < n; ++i) t.emplace_child(cur, id++);
        if (id >= n) break;
        auto* next = t.emplace_child(cur, id++);
        for (int i = 0; i < after && id < n; ++i) t.emplace_child(cur, id++);
        cur = next;
    }
}

} // namespace

TEST(StressTeardown, BinaryShapesEveryStrategy) {
    const int rounds = stress_rounds();
    const int n = stress_nodes();
    std::mt19937_64 rng(12345);

    for (int round = 0; round < rounds; ++round) {
        for (const Shape& shape : binary_shapes()) {
            for (Teardown strategy : { Teardown::rotation, Teardown::worklist }) {
                long baseline = AllocCounters::live_blocks;
                StressTree t;
                shape.build(t, n, rng);
                std::string diag = teardown_and_check(t, strategy, baseline);
                if (!diag.empty()) {
                    FAIL() << "round " << round << " shape " << shape.name << " strategy "
                           << deepdrop::to_string(strategy) << ":\n" << diag;
                }
            }
        }
    }
}

TEST(StressTeardown, NaryShapesEveryStrategy) {
    const int rounds = stress_rounds();
    const int n = stress_nodes();
    std::mt19937_64 rng(777);
    using Builder = void (*)(StressNary&, int, std::mt19937_64&);
    const std::pair<const char*, Builder> shapes[] = {
        { "random", &build_random_nary },
        { "deep", &build_deep_nary },
        { "comb", &build_comb_nary },
    };

    for (int round = 0; round < rounds; ++round) {
        for (const auto& shape : shapes) {
            for (Teardown strategy : { Teardown::rotation, Teardown::worklist }) {
                long baseline = AllocCounters::live_blocks;
                StressNary t;
                shape.second(t, n, rng);
                ASSERT_EQ(t.size(), static_cast<std::size_t>(n));
                std::string diag = teardown_and_check(t, strategy, baseline);
                if (!diag.empty()) {
                    FAIL() << "round " << round << " shape " << shape.first << " strategy "
                           << deepdrop::to_string(strategy) << ":\n" << diag;
                }
            }
        }
    }
}

TEST(StressTeardown, DepthGuidedNestingStaysBelowHeight) {
    using Tree = DepthTree<Tracked, CountingAllocator<Tracked>>;
    const int rounds = stress_rounds();
    const int n = stress_nodes();
    std::mt19937_64 rng(99);

    for (int round = 0; round < rounds; ++round) {
        for (double bias : { 0.5, 0.8, 0.95 }) {
            long baseline = AllocCounters::live_blocks;
            Tree t;
            build_skewed(t, n, rng, bias);
            std::string diag;
            ASSERT_TRUE(t.validate_invariants(&diag)) << diag;
            const std::size_t height = t.height();

            diag = teardown_and_check(t, Teardown::depth_guided, baseline);
            ASSERT_TRUE(diag.empty()) << "round " << round << " bias " << bias << ":\n" << diag;
            EXPECT_LT(t.last_teardown().max_recursion_depth, height);
        }
    }
}

// Random attach/detach sequences must keep every maintained depth equal to its recomputed value.
TEST(StressDepthTree, RandomAttachDetachKeepsDepthsConsistent) {
    using Tree = DepthTree<int>;
    using Node = Tree::Node;
    const int rounds = stress_rounds();
    const int OPS_PER_ROUND = 2000;
    std::mt19937_64 rng(2024);
    std::uniform_int_distribution<int> opdist(0, 99);

    auto collect = [](Tree& t) {
        std::vector<Node*> nodes;
        std::vector<Node*> pending;
        if (t.root()) pending.push_back(t.root());
        while (!pending.empty()) {
            Node* n = pending.back();
            pending.pop_back();
            nodes.push_back(n);
            if (n->left) pending.push_back(n->left);
            if (n->right) pending.push_back(n->right);
        }
        return nodes;
    };

    for (int round = 0; round < rounds; ++round) {
        Tree t;
        t.emplace_root(0);
        std::vector<Tree> detached;
        int next_value = 1;

        for (int op = 0; op < OPS_PER_ROUND; ++op) {
            std::vector<Node*> nodes = collect(t);
            std::uniform_int_distribution<std::size_t> pick(0, nodes.size() - 1);
            Node* at = nodes[pick(rng)];
            bool left = (opdist(rng) & 1) != 0;
            int action = opdist(rng);

            if (action < 55) {
                // 55%: grow a leaf
                if (left) t.emplace_left(at, next_value++);
                else t.emplace_right(at, next_value++);
            } else if (action < 75) {
                // 20%: detach a subtree and keep it for later
                Tree sub = left ? t.detach_left(at) : t.detach_right(at);
                if (!sub.empty()) {
                    std::string diag;
                    ASSERT_TRUE(sub.validate_invariants(&diag)) << diag;
                    detached.push_back(std::move(sub));
                }
            } else if (action < 95) {
                // 20%: re-attach a previously detached subtree
                if (!detached.empty()) {
                    std::size_t before = detached.back().size();
                    bool ok = left ? t.attach_left(at, std::move(detached.back()))
                                   : t.attach_right(at, std::move(detached.back()));
                    if (ok) {
                        detached.pop_back();
                    } else {
                        ASSERT_EQ(detached.back().size(), before);
                    }
                }
            } else {
                // 5%: drop a subtree outright
                if (left) t.detach_left(at);
                else t.detach_right(at);
            }

            if (op % 50 == 0) {
                std::string diag;
                if (!t.validate_invariants(&diag)) {
                    FAIL() << "Round " << round << " op " << op << " failed:\n" << diag;
                }
            }
        }

        std::string final_diag;
        if (!t.validate_invariants(&final_diag)) {
            FAIL() << "Round " << round << " final validation failed:\n" << final_diag;
        }
        EXPECT_EQ(collect(t).size(), t.size());
    }
}

// Large run disabled by default - enable with --gtest_also_run_disabled_tests for very long runs.
TEST(StressTeardown, DISABLED_MillionNodeShapes) {
    std::mt19937_64 rng((unsigned)std::chrono::high_resolution_clock::now().time_since_epoch().count());
    const int n = 1000000;
    for (const Shape& shape : binary_shapes()) {
        long baseline = AllocCounters::live_blocks;
        StressTree t;
        shape.build(t, n, rng);
        std::string diag = teardown_and_check(t, Teardown::rotation, baseline);
        ASSERT_TRUE(diag.empty()) << shape.name << ":\n" << diag;
    }
    long baseline = AllocCounters::live_blocks;
    StressNary nt;
    build_deep_nary(nt, n, rng);
    std::string diag = teardown_and_check(nt, Teardown::rotation, baseline);
    ASSERT_TRUE(diag.empty()) << diag;
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
