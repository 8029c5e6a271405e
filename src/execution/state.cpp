#include <strongbox/common/critical.hpp>
#include <strongbox/execution/state.hpp>

#include <iterator>
#include <utility>

namespace strongbox::execution {

state::state(storage_t& storage) : storage_{storage} {}

void state::begin() {
  frames_.emplace_back();
}

void state::commit() {
  if (frames_.empty()) {
    strongbox::common::critical("state commit without an open frame");
  }
  auto frame = std::move(frames_.back());
  frames_.pop_back();

  if (!frames_.empty()) {
    auto& parent = frames_.back();
    for (auto& [key, value] : frame) {
      parent.insert_or_assign(key, std::move(value));
    }
    return;
  }

  auto writes = std::vector<strongbox::storage::write_entry_t>{};
  writes.reserve(frame.size());
  for (auto& [key, value] : frame) {
    writes.emplace_back(key, std::move(value));
  }
  storage_.commit(writes);
}

void state::rollback() {
  if (frames_.empty()) {
    strongbox::common::critical("state rollback without an open frame");
  }
  frames_.pop_back();
}

std::size_t state::depth() const {
  return frames_.size();
}

std::optional<strongbox::schema::bytes_t> state::get_raw(
    const strongbox::schema::bytes_t& key) const {
  for (auto frame = std::rbegin(frames_); frame != std::rend(frames_);
       ++frame) {
    auto staged = frame->find(key);
    if (staged != std::end(*frame)) {
      return staged->second;
    }
  }
  return storage_.get_raw(
      strongbox::schema::bytes_view_t{key.data(), key.size()});
}

void state::put_raw(const strongbox::schema::bytes_t& key,
                    strongbox::schema::bytes_t value) {
  innermost().insert_or_assign(key, std::move(value));
}

void state::erase(const strongbox::schema::bytes_t& key) {
  innermost().insert_or_assign(key, std::nullopt);
}

state::frame_t& state::innermost() {
  if (frames_.empty()) {
    strongbox::common::critical("state write without an open frame");
  }
  return frames_.back();
}

}  // namespace strongbox::execution
