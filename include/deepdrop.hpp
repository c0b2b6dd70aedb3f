// deepdrop.hpp
// Umbrella header: owner-linked containers whose teardown does not grow the native stack with depth.
//
//   LinkedChain<T>  singly-linked chain, iterative teardown
//   BinaryTree<T>   binary tree, rotation (default) or worklist teardown
//   DepthTree<T>    binary tree with maintained subtree depths, depth-guided teardown
//   NaryTree<T>     ordered n-ary tree, n-ary rotation (default) or worklist teardown
//
// The algorithms themselves live in teardown.hpp and work on any node type with the documented links.

#ifndef DEEPDROP_HPP
#define DEEPDROP_HPP

#include "teardown_stats.hpp"
#include "teardown.hpp"
#include "linked_chain.hpp"
#include "binary_tree.hpp"
#include "depth_tree.hpp"
#include "nary_tree.hpp"

#endif // DEEPDROP_HPP
