#pragma once

#include <strongbox/schema/encoding/scale/encoder.hpp>
#include <strongbox/schema/primitives.hpp>
#include <strongbox/storage/rocksdb/storage.hpp>
#include <cstddef>
#include <map>
#include <optional>
#include <vector>

namespace strongbox::execution {

using encoder_t = strongbox::schema::encoding::encoder<
    strongbox::schema::encoding::scale_encoder_tag>;
using storage_t =
    strongbox::storage::storage<strongbox::storage::rocksdb_storage_tag>;

/// Transactional view over durable storage.
///
/// Writes are staged in a stack of frames. Reads see the innermost staged
/// value first, then storage. `commit` folds the innermost frame into its
/// parent, or into one atomic RocksDB batch when it is the outermost frame;
/// `rollback` drops it.
class state final {
 public:
  explicit state(storage_t& storage);

  state(const state&) = delete;
  state& operator=(const state&) = delete;

  /// Open a new innermost frame.
  void begin();

  /// Merge the innermost frame into its parent or persist it.
  void commit();

  /// Discard the innermost frame.
  void rollback();

  /// Number of open frames.
  std::size_t depth() const;

  template <typename T>
  std::optional<T> get(const strongbox::schema::bytes_t& key) const {
    auto raw = get_raw(key);
    if (!raw) {
      return std::nullopt;
    }
    auto encoder = encoder_t{};
    return encoder.decode<T>(
        strongbox::schema::bytes_view_t{raw->data(), raw->size()});
  }

  template <typename T>
  void put(const strongbox::schema::bytes_t& key, const T& value) {
    auto encoder = encoder_t{};
    put_raw(key, encoder.encode(value));
  }

  void erase(const strongbox::schema::bytes_t& key);

  std::optional<strongbox::schema::bytes_t> get_raw(
      const strongbox::schema::bytes_t& key) const;
  void put_raw(const strongbox::schema::bytes_t& key,
               strongbox::schema::bytes_t value);

  storage_t& storage() { return storage_; }
  const storage_t& storage() const { return storage_; }

 private:
  using frame_t = std::map<strongbox::schema::bytes_t,
                           std::optional<strongbox::schema::bytes_t>>;

  frame_t& innermost();

  storage_t& storage_;
  std::vector<frame_t> frames_;
};

/// Frame opened on construction and rolled back on destruction unless it was
/// committed or rolled back explicitly first.
class frame_scope final {
 public:
  explicit frame_scope(state& target) : state_{target} { state_.begin(); }
  ~frame_scope() {
    if (open_) {
      state_.rollback();
    }
  }

  frame_scope(const frame_scope&) = delete;
  frame_scope& operator=(const frame_scope&) = delete;

  void commit() {
    open_ = false;
    state_.commit();
  }

  void rollback() {
    open_ = false;
    state_.rollback();
  }

 private:
  state& state_;
  bool open_{true};
};

}  // namespace strongbox::execution
