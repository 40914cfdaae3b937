#pragma once

#include "lheap/tree/errc.hpp"
#include "lheap/tree/forest.hpp"
#include "lheap/tree/node_id.hpp"

#include <system_error>
#include <utility>

namespace lheap::tree {
  // Holds the owning reference to one root. The subtree lives exactly as long
  // as the holder, unless ownership is handed back with release(). The forest
  // must outlive every holder created on it.
  template <class Key>
  class owned_root {
   public:
    owned_root() = default;

    owned_root(forest<Key>& trees, Key value)
      : forest_(&trees)
      , root_(trees.create_root(std::move(value))) {
    }

    owned_root(const owned_root&) = delete;
    owned_root& operator=(const owned_root&) = delete;

    owned_root(owned_root&& other) noexcept
      : forest_(std::exchange(other.forest_, nullptr))
      , root_(std::exchange(other.root_, node_id{})) {
    }

    owned_root& operator=(owned_root&& other) noexcept {
      if (this != &other) {
        reset();
        forest_ = std::exchange(other.forest_, nullptr);
        root_ = std::exchange(other.root_, node_id{});
      }
      return *this;
    }

    ~owned_root() {
      reset();
    }

    static owned_root adopt(forest<Key>& trees, node_id root) {
      if (trees.parent(root).has_value()) {
        throw std::system_error(make_error_code(errc::already_attached));
      }
      owned_root holder{};
      holder.forest_ = &trees;
      holder.root_ = root;
      return holder;
    }

    [[nodiscard]] node_id get() const noexcept {
      return root_;
    }

    [[nodiscard]] explicit operator bool() const noexcept {
      return forest_ != nullptr && forest_->contains(root_);
    }

    [[nodiscard]] node_id release() noexcept {
      forest_ = nullptr;
      return std::exchange(root_, node_id{});
    }

    // A root that was linked under another node since it was adopted belongs
    // to that parent now and is left alone.
    void reset() noexcept {
      if (forest_ != nullptr && forest_->contains(root_) && !forest_->parent(root_).has_value()) {
        forest_->release(root_);
      }
      forest_ = nullptr;
      root_ = node_id{};
    }

   private:
    forest<Key>* forest_ = nullptr;
    node_id root_{};
  };
} // namespace lheap::tree
