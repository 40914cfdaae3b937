#pragma once

#include "lheap/tree/errc.hpp"
#include "lheap/tree/node_id.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <system_error>
#include <utility>
#include <vector>

namespace lheap::tree {
  // Arena of heap nodes. Each node owns the children listed in its children
  // sequence and refers back to its parent without owning it. Releasing a
  // node releases the subtree below it.
  template <class Key>
  class forest {
   public:
    using key_type = Key;
    using size_type = std::size_t;

    forest() = default;

    // owned_root holders keep the forest's address, so a forest stays put.
    forest(const forest&) = delete;
    forest& operator=(const forest&) = delete;
    forest(forest&&) = delete;
    forest& operator=(forest&&) = delete;

    [[nodiscard]] bool empty() const noexcept {
      return size_ == 0;
    }

    [[nodiscard]] size_type size() const noexcept {
      return size_;
    }

    void reserve(size_type capacity) {
      slots_.reserve(capacity);
      free_.reserve(capacity);
    }

    [[nodiscard]] bool contains(node_id id) const noexcept {
      return id.valid() && id.index < slots_.size() && slots_[id.index].live
          && slots_[id.index].generation == id.generation;
    }

    node_id create_root(Key value) {
      return allocate(std::move(value), node_id{});
    }

    node_id attach_new_child(node_id parent, Key value) {
      slot& owner = at(parent);
      owner.children.reserve(owner.children.size() + 1);
      node_id child = allocate(std::move(value), parent);
      // allocate may have grown slots_, so look the parent up again.
      slots_[parent.index].children.push_back(child);
      return child;
    }

    // Makes the root `child` the last child of `parent`. A node that already
    // has a parent must be detached first.
    void link(node_id parent, node_id child) {
      at(parent);
      slot& attached = at(child);
      if (attached.parent.valid()) {
        throw std::system_error(make_error_code(errc::already_attached));
      }
      if (is_ancestor_or_self(child, parent)) {
        throw std::system_error(make_error_code(errc::invalid_relation));
      }
      slots_[parent.index].children.push_back(child);
      attached.parent = parent;
    }

    // Exchanges the values of `parent` and its direct child `child`. Edges
    // and child order are left untouched.
    void swap(node_id parent, node_id child) {
      slot& upper = at(parent);
      slot& lower = at(child);
      if (lower.parent != parent) {
        throw std::system_error(make_error_code(errc::invalid_relation));
      }
      using std::swap;
      swap(upper.value, lower.value);
    }

    void detach(node_id child) {
      slot& node = at(child);
      if (node.parent.valid()) {
        unlink_from_parent(child, node);
      }
    }

    void release(node_id node) {
      slot& released = at(node);
      if (released.parent.valid()) {
        unlink_from_parent(node, released);
      }
      destroy_subtree(node.index);
    }

    void clear() noexcept {
      for (std::uint32_t index = 0; index < slots_.size(); ++index) {
        if (slots_[index].live) {
          vacate(index);
        }
      }
    }

    [[nodiscard]] Key value(node_id node) const {
      return at(node).value;
    }

    [[nodiscard]] std::vector<Key> child_values(node_id node) const {
      const slot& owner = at(node);
      std::vector<Key> values;
      values.reserve(owner.children.size());
      for (node_id child: owner.children) {
        values.push_back(slots_[child.index].value);
      }
      return values;
    }

    [[nodiscard]] std::optional<node_id> parent(node_id node) const {
      const slot& child = at(node);
      if (!child.parent.valid()) {
        return std::nullopt;
      }
      return child.parent;
    }

    [[nodiscard]] std::span<const node_id> children(node_id node) const {
      return at(node).children;
    }

    [[nodiscard]] std::vector<node_id> roots() const {
      std::vector<node_id> result;
      for (std::uint32_t index = 0; index < slots_.size(); ++index) {
        const slot& s = slots_[index];
        if (s.live && !s.parent.valid()) {
          result.push_back(node_id{index, s.generation});
        }
      }
      return result;
    }

    // Walks every live node and reports the first broken parent/child
    // relation or cycle.
    [[nodiscard]] std::error_code verify() const noexcept {
      const auto broken = make_error_code(errc::invalid_relation);
      size_type live = 0;
      for (std::uint32_t index = 0; index < slots_.size(); ++index) {
        const slot& s = slots_[index];
        if (!s.live) {
          continue;
        }
        ++live;
        const node_id self{index, s.generation};
        if (s.parent.valid()) {
          if (!contains(s.parent)) {
            return broken;
          }
          const auto& siblings = slots_[s.parent.index].children;
          if (std::count(siblings.begin(), siblings.end(), self) != 1) {
            return broken;
          }
        }
        for (node_id child: s.children) {
          if (!contains(child) || slots_[child.index].parent != self) {
            return broken;
          }
        }
        size_type depth = 0;
        for (node_id up = s.parent; up.valid(); up = slots_[up.index].parent) {
          if (up == self || !contains(up) || ++depth > size_) {
            return broken;
          }
        }
      }
      if (live != size_) {
        return broken;
      }
      return {};
    }

   private:
    struct slot {
      Key value{};
      node_id parent{};
      std::vector<node_id> children{};
      std::uint32_t generation = 0;
      bool live = false;
    };

    static constexpr std::uint32_t retired_generation = std::numeric_limits<std::uint32_t>::max();

    std::vector<slot> slots_{};
    std::vector<std::uint32_t> free_{};
    size_type size_ = 0;

    slot& at(node_id id) {
      if (!contains(id)) {
        throw std::system_error(make_error_code(errc::dead_reference));
      }
      return slots_[id.index];
    }

    const slot& at(node_id id) const {
      if (!contains(id)) {
        throw std::system_error(make_error_code(errc::dead_reference));
      }
      return slots_[id.index];
    }

    node_id allocate(Key value, node_id parent) {
      std::uint32_t index;
      if (free_.empty()) {
        // free_ never needs to grow while releasing nodes.
        free_.reserve(slots_.size() + 1);
        slots_.emplace_back();
        index = static_cast<std::uint32_t>(slots_.size() - 1);
      } else {
        index = free_.back();
        free_.pop_back();
      }
      slot& s = slots_[index];
      s.value = std::move(value);
      s.parent = parent;
      s.live = true;
      size_ += 1;
      return node_id{index, s.generation};
    }

    // A slot whose generation reaches retired_generation is never handed out
    // again, so no stale handle can match a later occupant.
    void vacate(std::uint32_t index) noexcept {
      slot& s = slots_[index];
      s.live = false;
      s.generation += 1;
      s.parent = node_id{};
      s.children.clear();
      if (s.generation != retired_generation) {
        free_.push_back(index);
      }
      size_ -= 1;
    }

    void unlink_from_parent(node_id node, slot& s) noexcept {
      std::erase(slots_[s.parent.index].children, node);
      s.parent = node_id{};
    }

    bool is_ancestor_or_self(node_id ancestor, node_id node) const noexcept {
      for (node_id up = node; up.valid(); up = slots_[up.index].parent) {
        if (up == ancestor) {
          return true;
        }
      }
      return false;
    }

    // Post-order teardown over the parent links: no recursion, no allocation.
    void destroy_subtree(std::uint32_t top) noexcept {
      std::uint32_t current = top;
      while (true) {
        slot& s = slots_[current];
        if (!s.children.empty()) {
          current = s.children.back().index;
          s.children.pop_back();
          continue;
        }
        const std::uint32_t up = s.parent.index;
        vacate(current);
        if (current == top) {
          return;
        }
        current = up;
      }
    }
  };

  using int_forest = forest<std::int32_t>;
} // namespace lheap::tree
