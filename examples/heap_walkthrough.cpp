#include <lheap/tree/heapify.hpp>
#include <lheap/tree/owned_root.hpp>

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <system_error>
#include <vector>

namespace {
  void print_values(const char* label, const std::vector<std::int32_t>& values) {
    std::cout << label << ": [";
    for (std::size_t i = 0; i < values.size(); ++i) {
      std::cout << (i ? ", " : "") << values[i];
    }
    std::cout << "]\n";
  }
} // namespace

int main() {
  using lheap::tree::node_id;
  lheap::tree::int_forest trees;

  try {
    lheap::tree::owned_root<std::int32_t> root{trees, 5};
    trees.attach_new_child(root.get(), 24);
    node_id three = trees.attach_new_child(root.get(), 3);
    print_values("children of 5", trees.child_values(root.get()));

    trees.swap(root.get(), three);
    std::cout << "root after swap: " << trees.value(root.get()) << '\n';
    print_values("children after swap", trees.child_values(root.get()));

    node_id stranger = trees.create_root(1);
    try {
      trees.swap(root.get(), stranger);
    } catch (const std::system_error& err) {
      std::cerr << "swap with a non-child: " << err.code().message() << '\n';
    }
    trees.release(stranger);

    // Level order 9, 2, 3, 4, 5: sift the 9 down to a leaf.
    lheap::tree::owned_root<std::int32_t> heap{trees, 9};
    std::vector<node_id> levels{heap.get()};
    for (std::int32_t value: {2, 3, 4, 5}) {
      levels.push_back(trees.attach_new_child(levels[(levels.size() - 1) / 2], value));
    }
    lheap::tree::sift_down(trees, heap.get());
    std::vector<std::int32_t> ordered;
    for (node_id node: levels) {
      ordered.push_back(trees.value(node));
    }
    print_values("after sift_down", ordered);
    std::cout << "heap ordered: " << std::boolalpha << lheap::tree::is_heap_ordered(trees, heap.get())
              << '\n';
  } catch (const std::system_error& err) {
    std::cerr << "lheap: " << err.what() << '\n';
    return 1;
  }

  if (auto ec = trees.verify()) {
    std::cerr << "lheap: " << ec.message() << '\n';
    return 1;
  }
  std::cout << "nodes left: " << trees.size() << '\n';
  return 0;
}
