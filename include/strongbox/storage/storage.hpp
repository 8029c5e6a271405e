#pragma once
#include <strongbox/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace strongbox::storage {

using key_value_entry_t =
    std::pair<strongbox::schema::bytes_t, strongbox::schema::bytes_t>;

/// One staged mutation: a value to store, or std::nullopt to delete the key.
using write_entry_t = std::pair<strongbox::schema::bytes_t,
                                std::optional<strongbox::schema::bytes_t>>;

template <typename Library>
struct storage {
  /// Return the raw bytes at key, or std::nullopt when missing.
  std::optional<strongbox::schema::bytes_t> get_raw(
      const strongbox::schema::bytes_view_t& key) const;

  /// Apply every write in a single atomic batch.
  void commit(const std::vector<write_entry_t>& writes) const;

  /// Return the key-value pairs with `first <= key <= last` in key order.
  std::vector<key_value_entry_t> list_range(
      const strongbox::schema::bytes_view_t& first,
      const strongbox::schema::bytes_view_t& last) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace strongbox::storage
