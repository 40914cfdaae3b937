#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>

namespace lheap::tree {
  // Handle to a forest slot. The generation tells a live node apart from a
  // later occupant of the same slot.
  struct node_id {
    static constexpr std::uint32_t invalid_index = std::numeric_limits<std::uint32_t>::max();

    std::uint32_t index = invalid_index;
    std::uint32_t generation = 0;

    [[nodiscard]] constexpr bool valid() const noexcept {
      return index != invalid_index;
    }

    friend constexpr bool operator==(const node_id&, const node_id&) noexcept = default;
  };
} // namespace lheap::tree

namespace std {
  template <>
  struct hash<lheap::tree::node_id> {
    size_t operator()(const lheap::tree::node_id& id) const noexcept {
      return hash<uint64_t>{}((uint64_t{id.generation} << 32) | id.index);
    }
  };
} // namespace std
