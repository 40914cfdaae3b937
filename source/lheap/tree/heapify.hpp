#pragma once

#include "lheap/tree/forest.hpp"
#include "lheap/tree/node_id.hpp"

#include <functional>
#include <optional>
#include <vector>

namespace lheap::tree {
  // Moves the value stored at `node` toward the root by value exchange and
  // returns the node it ends up in.
  template <class Key, class Compare = std::less<>>
  node_id sift_up(forest<Key>& trees, node_id node, Compare compare = {}) {
    std::optional<node_id> parent = trees.parent(node);
    while (parent && compare(trees.value(node), trees.value(*parent))) {
      trees.swap(*parent, node);
      node = *parent;
      parent = trees.parent(node);
    }
    return node;
  }

  // Moves the value stored at `node` toward the leaves, always through the
  // child ordered first (the earliest one on ties), and returns the node it
  // ends up in.
  template <class Key, class Compare = std::less<>>
  node_id sift_down(forest<Key>& trees, node_id node, Compare compare = {}) {
    while (true) {
      auto children = trees.children(node);
      if (children.empty()) {
        return node;
      }
      node_id child = children.front();
      for (node_id candidate: children.subspan(1)) {
        if (compare(trees.value(candidate), trees.value(child))) {
          child = candidate;
        }
      }
      if (!compare(trees.value(child), trees.value(node))) {
        return node;
      }
      trees.swap(node, child);
      node = child;
    }
  }

  template <class Key, class Compare = std::less<>>
  [[nodiscard]] bool is_heap_ordered(const forest<Key>& trees, node_id root, Compare compare = {}) {
    std::vector<node_id> pending{root};
    while (!pending.empty()) {
      node_id node = pending.back();
      pending.pop_back();
      for (node_id child: trees.children(node)) {
        if (compare(trees.value(child), trees.value(node))) {
          return false;
        }
        pending.push_back(child);
      }
    }
    return true;
  }
} // namespace lheap::tree
