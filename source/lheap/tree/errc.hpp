#pragma once

#include <string>
#include <system_error>
#include <type_traits>

namespace lheap::tree {
  enum class errc {
    invalid_relation = 1,
    already_attached,
    dead_reference,
  };

  namespace detail {
    class tree_category final : public std::error_category {
     public:
      const char* name() const noexcept override {
        return "lheap.tree";
      }

      std::string message(int value) const override {
        switch (static_cast<errc>(value)) {
          case errc::invalid_relation:
            return "node is not in the required parent/child relation";
          case errc::already_attached:
            return "node is already attached to a parent";
          case errc::dead_reference:
            return "node handle refers to a released node";
        }
        return "unknown lheap.tree error";
      }
    };
  } // namespace detail

  inline const std::error_category& tree_category() noexcept {
    static const detail::tree_category category{};
    return category;
  }

  inline std::error_code make_error_code(errc value) noexcept {
    return std::error_code(static_cast<int>(value), tree_category());
  }
} // namespace lheap::tree

namespace std {
  template <>
  struct is_error_code_enum<lheap::tree::errc> : true_type { };
} // namespace std
