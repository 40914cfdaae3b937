#include "lheap/tree/heapify.hpp"

#include <catch2/catch_all.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <random>
#include <set>
#include <unordered_set>
#include <vector>

namespace {
  using lheap::tree::int_forest;
  using lheap::tree::is_heap_ordered;
  using lheap::tree::node_id;
  using lheap::tree::sift_down;
  using lheap::tree::sift_up;
  using values = std::vector<std::int32_t>;

  // Complete binary tree in level order; returns the nodes by level-order
  // position.
  std::vector<node_id> build_complete(int_forest& trees, const values& keys) {
    std::vector<node_id> nodes;
    nodes.reserve(keys.size());
    for (std::size_t i = 0; i < keys.size(); ++i) {
      if (i == 0) {
        nodes.push_back(trees.create_root(keys[i]));
      } else {
        nodes.push_back(trees.attach_new_child(nodes[(i - 1) / 2], keys[i]));
      }
    }
    return nodes;
  }

  values level_values(const int_forest& trees, const std::vector<node_id>& nodes) {
    values result;
    for (node_id node: nodes) {
      result.push_back(trees.value(node));
    }
    return result;
  }
} // namespace

TEST_CASE("sift_up walks a value toward the root", "[tree][heapify]") {
  int_forest trees;

  SECTION("stops at the root") {
    auto nodes = build_complete(trees, {2, 4, 6, 8, 9, 10, 12, 1});
    node_id rest = sift_up(trees, nodes.back());
    CHECK(rest == nodes[0]);
    CHECK(level_values(trees, nodes) == values{1, 2, 6, 4, 9, 10, 12, 8});
    CHECK(is_heap_ordered(trees, nodes[0]));
    CHECK_FALSE(trees.verify());
  }

  SECTION("stops once order is restored") {
    auto nodes = build_complete(trees, {1, 4, 6, 8, 9, 10, 12, 3});
    node_id rest = sift_up(trees, nodes.back());
    CHECK(rest == nodes[1]);
    CHECK(level_values(trees, nodes) == values{1, 3, 6, 4, 9, 10, 12, 8});
  }

  SECTION("equal values do not move") {
    auto nodes = build_complete(trees, {5, 5});
    CHECK(sift_up(trees, nodes[1]) == nodes[1]);
  }

  SECTION("a root stays where it is") {
    node_id root = trees.create_root(3);
    CHECK(sift_up(trees, root) == root);
  }
}

TEST_CASE("sift_down walks a value toward the leaves", "[tree][heapify]") {
  int_forest trees;

  SECTION("follows the smaller child") {
    auto nodes = build_complete(trees, {9, 2, 3, 4, 5, 6, 7});
    const auto before = trees.children(nodes[0]).size();
    node_id rest = sift_down(trees, nodes[0]);
    CHECK(rest == nodes[3]);
    CHECK(level_values(trees, nodes) == values{2, 4, 3, 9, 5, 6, 7});
    CHECK(trees.children(nodes[0]).size() == before);
    CHECK(is_heap_ordered(trees, nodes[0]));
  }

  SECTION("takes the first child on ties") {
    auto nodes = build_complete(trees, {8, 1, 1});
    CHECK(sift_down(trees, nodes[0]) == nodes[1]);
    CHECK(level_values(trees, nodes) == values{1, 8, 1});
  }

  SECTION("a leaf stays where it is") {
    node_id root = trees.create_root(3);
    CHECK(sift_down(trees, root) == root);
  }

  SECTION("max order through the comparator") {
    auto nodes = build_complete(trees, {1, 7, 9, 3});
    node_id rest = sift_down(trees, nodes[0], std::greater<>{});
    CHECK(rest == nodes[2]);
    CHECK(level_values(trees, nodes) == values{9, 7, 1, 3});
    CHECK(is_heap_ordered(trees, nodes[0], std::greater<>{}));
    CHECK_FALSE(is_heap_ordered(trees, nodes[0]));
  }
}

TEST_CASE("is_heap_ordered detects violations below the root", "[tree][heapify]") {
  int_forest trees;
  auto nodes = build_complete(trees, {1, 2, 3, 4, 0});
  CHECK_FALSE(is_heap_ordered(trees, nodes[0]));
  CHECK(is_heap_ordered(trees, nodes[2]));
  sift_up(trees, nodes[4]);
  CHECK(is_heap_ordered(trees, nodes[0]));
}

TEST_CASE("heap maintenance under random pushes and pops", "[tree][heapify][stress]") {
  constexpr int operations = 1500;
  std::mt19937 rng{1337};
  std::uniform_int_distribution<std::int32_t> key_dist{-1000, 1000};
  std::uniform_int_distribution<int> op_dist{0, 2};

  int_forest trees;
  std::vector<node_id> nodes;
  std::multiset<std::int32_t> reference;

  auto push = [&](std::int32_t key) {
    if (nodes.empty()) {
      nodes.push_back(trees.create_root(key));
    } else {
      nodes.push_back(trees.attach_new_child(nodes[(nodes.size() - 1) / 2], key));
    }
    sift_up(trees, nodes.back());
    reference.insert(key);
  };

  // Rotates the path from the root to the last leaf so the minimum lands in
  // that leaf, releases it and sifts the rest of the path back into order.
  auto pop = [&] {
    std::vector<node_id> path{nodes.back()};
    while (auto up = trees.parent(path.back())) {
      path.push_back(*up);
    }
    std::reverse(path.begin(), path.end());
    const std::int32_t smallest = trees.value(path.front());
    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
      trees.swap(path[i], path[i + 1]);
    }
    REQUIRE(trees.value(nodes.back()) == smallest);
    trees.release(nodes.back());
    nodes.pop_back();
    path.pop_back();
    for (std::size_t i = path.size(); i-- > 0;) {
      sift_down(trees, path[i]);
    }
    reference.erase(reference.find(smallest));
    return smallest;
  };

  std::unordered_set<node_id> released;
  for (int step = 0; step < operations; ++step) {
    int op = op_dist(rng);
    if (nodes.empty()) {
      op = 0;
    }
    switch (op) {
      case 0:
      case 1: push(key_dist(rng)); break;
      case 2: {
        const node_id leaf = nodes.back();
        const std::int32_t expected = *reference.begin();
        CHECK(pop() == expected);
        released.insert(leaf);
        break;
      }
    }

    CHECK(trees.size() == reference.size());
    CHECK_FALSE(trees.verify());
    if (!nodes.empty()) {
      CHECK(trees.value(nodes[0]) == *reference.begin());
      CHECK(is_heap_ordered(trees, nodes[0]));
    }
  }

  for (node_id id: released) {
    if (std::find(nodes.begin(), nodes.end(), id) == nodes.end()) {
      CHECK_FALSE(trees.contains(id));
    }
  }
}
