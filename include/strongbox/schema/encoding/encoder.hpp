#pragma once
#include <strongbox/schema/primitives.hpp>
#include <optional>
#include <span>

namespace strongbox::schema::encoding {

// The wire/storage format is a build-time choice: callers name the library
// through a tag type (see scale_encoder_tag) and every component that encodes
// is templated on, or aliased to, that single encoder.
template <typename Library>
struct encoder {
  template <typename T>
  strongbox::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, strongbox::schema::bytes_t& out);

  template <typename T>
  T decode(const strongbox::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const strongbox::schema::bytes_view_t& bytes);
};

}  // namespace strongbox::schema::encoding
