#pragma once
#include <covenant/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace covenant::storage {

using key_value_entry_t =
    std::pair<covenant::schema::bytes_t, covenant::schema::bytes_t>;

/// Encoded writes staged by a component and applied together by
/// `storage::commit`. Later entries for the same key win.
struct write_set final {
  std::vector<key_value_entry_t> entries;

  template <typename Encoder, typename T>
  void put(Encoder& encoder, covenant::schema::bytes_t key, const T& value) {
    entries.push_back(
        key_value_entry_t{std::move(key), encoder.encode(value)});
  }

  bool empty() const { return entries.empty(); }
  std::size_t size() const { return entries.size(); }
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const covenant::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const covenant::schema::bytes_view_t& key,
           const T& value) const;

  /// True when a value is stored at key.
  bool contains(const covenant::schema::bytes_view_t& key) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const covenant::schema::bytes_view_t& prefix) const;

  /// Atomically apply every staged write, or none of them.
  void commit(const write_set& writes) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace covenant::storage
