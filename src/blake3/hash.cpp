#include <blake3.h>
#include <strongbox/blake3/hash.hpp>

namespace strongbox::blake3 {

strongbox::schema::hash32_t hash(const strongbox::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  // BLAKE3_OUT_LEN
  auto output = strongbox::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace strongbox::blake3
