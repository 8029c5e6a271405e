#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <strongbox/common/critical.hpp>
#include <strongbox/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>

namespace strongbox::storage {

namespace detail {

inline strongbox::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const strongbox::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  std::optional<strongbox::schema::bytes_t> get_raw(
      const strongbox::schema::bytes_view_t& key) const;
  void commit(const std::vector<write_entry_t>& writes) const;
  std::vector<key_value_entry_t> list_range(
      const strongbox::schema::bytes_view_t& first,
      const strongbox::schema::bytes_view_t& last) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline std::optional<strongbox::schema::bytes_t>
storage<rocksdb_storage_tag>::get_raw(
    const strongbox::schema::bytes_view_t& key) const {
  if (!database) {
    strongbox::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    strongbox::common::critical("Failed to get value from RocksDB");
  }
  return strongbox::schema::bytes_t(std::begin(value), std::end(value));
}

inline void storage<rocksdb_storage_tag>::commit(
    const std::vector<write_entry_t>& writes) const {
  if (!database) {
    strongbox::common::critical("RocksDB database is not initialized");
  }
  if (writes.empty()) {
    return;
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : writes) {
    auto key_slice = detail::to_slice(
        strongbox::schema::bytes_view_t{key.data(), key.size()});
    auto status = value.has_value()
                      ? batch.Put(key_slice,
                                  detail::to_slice(strongbox::schema::bytes_view_t{
                                      value->data(), value->size()}))
                      : batch.Delete(key_slice);
    if (!status.ok()) {
      spdlog::error("Failed staging write batch entry: {}", status.ToString());
      strongbox::common::critical("failed staging write batch entry");
    }
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto status = database->Write(write_options, &batch);
  if (!status.ok()) {
    spdlog::error("Failed to commit write batch: {}", status.ToString());
    strongbox::common::critical("failed to commit write batch");
  }
}

inline std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_range(
    const strongbox::schema::bytes_view_t& first,
    const strongbox::schema::bytes_view_t& last) const {
  if (!database) {
    strongbox::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto upper = detail::to_slice(last);

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  for (iterator->Seek(detail::to_slice(first));
       iterator->Valid() && iterator->key().compare(upper) <= 0;
       iterator->Next()) {
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    strongbox::common::critical("RocksDB iteration failed");
  }
  return entries;
}

}  // namespace strongbox::storage
