// -----------------------------
// Examples
// -----------------------------
// Builds degenerate structures of the requested depth (default 100000) and tears them down with each
// strategy, printing the teardown diagnostics as JSON.
//
// Example 1: singly-linked chain built by prepending, iterative teardown.
// Example 2: caterpillar binary tree (right children only), worklist and rotation teardown.
// Example 3: the same caterpillar with maintained depths, depth-guided teardown.
// Example 4: n-ary tree whose second root child heads a long chain, n-ary rotation teardown.
//
// Usage: deepdrop_examples [depth]

#include <cstdlib>
#include <iostream>
#include <limits>
#include <string>

#include "deepdrop.hpp"

namespace {

void report(const char* label, const deepdrop::TeardownStats& stats) {
    std::cout << label << ": " << stats.to_json() << "\n";
}

} // namespace

int main(int argc, char** argv) {
    long depth = 100000;
    if (argc > 1) {
        char* end = nullptr;
        depth = std::strtol(argv[1], &end, 10);
        if (!end || *end != '\0' || depth < 1 || depth > std::numeric_limits<int>::max()) {
            std::cerr << "usage: " << argv[0] << " [depth]   (depth must be a positive int, got '"
                      << argv[1] << "')\n";
            return 1;
        }
    }
    const int n = static_cast<int>(depth);

    {
        std::cout << "Example 1: chain of " << n << " nodes\n";
        deepdrop::LinkedChain<int> chain;
        for (int i = 0; i < n; ++i) chain.push_front(i);
        chain.clear();
        report("  iterative", chain.last_teardown());
    }

    {
        std::cout << "\nExample 2: caterpillar binary tree of depth " << n << "\n";
        for (deepdrop::Teardown strategy : { deepdrop::Teardown::worklist, deepdrop::Teardown::rotation }) {
            deepdrop::BinaryTree<int> tree;
            tree.set_teardown(strategy);
            auto* cur = tree.emplace_root(0).first;
            for (int i = 1; i < n; ++i) cur = tree.emplace_right(cur, i).first;
            tree.clear();
            report(strategy == deepdrop::Teardown::worklist ? "  worklist" : "  rotation", tree.last_teardown());
        }
    }

    {
        std::cout << "\nExample 3: caterpillar with maintained depths\n";
        deepdrop::DepthTree<int> chain;
        chain.emplace_root(0);
        for (int i = 1; i < n; ++i) {
            deepdrop::DepthTree<int> top;
            top.attach_right(top.emplace_root(i).first, std::move(chain));
            chain = std::move(top);
        }
        std::string diag;
        if (!chain.validate_invariants(&diag)) {
            std::cerr << diag;
            return 1;
        }
        std::cout << "  root depth " << chain.root()->depth << "\n";
        chain.clear();
        report("  depth_guided", chain.last_teardown());
    }

    {
        std::cout << "\nExample 4: n-ary tree, root with a leaf and a chain\n";
        deepdrop::NaryTree<int> tree;
        auto* root = tree.emplace_root(0).first;
        tree.emplace_child(root, 1);
        auto* cur = tree.emplace_child(root, 2);
        for (int i = 3; i < n; ++i) cur = tree.emplace_child(cur, i);
        tree.clear();
        report("  rotation", tree.last_teardown());

        deepdrop::NaryTree<int> small;
        auto* r = small.emplace_root(0).first;
        auto* a = small.emplace_child(r, 1);
        small.emplace_child(a, 2);
        small.emplace_child(a, 3);
        small.emplace_child(r, 4);
        std::cout << "  small tree:\n";
        small.tree_dump(std::cout);
    }

    return 0;
}
