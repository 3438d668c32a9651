#ifndef PASTEBIN_KEYGEN_RANDOM_SOURCE_HPP
#define PASTEBIN_KEYGEN_RANDOM_SOURCE_HPP

#include <cstddef>
#include <cstdint>
#include <vector>
#include "keygen_error.hpp"

namespace pastebin::keygen {

// Source of uniformly distributed random bytes
class RandomSource {
public:
  virtual ~RandomSource() = default;

  // Fills [data, data + size) or throws RandomSourceError
  virtual void fill(std::uint8_t* data, std::size_t size) = 0;
};

// Cryptographically secure bytes from OpenSSL's RAND_bytes. Stateless and
// safe to share between threads.
class OpenSslRandomSource : public RandomSource {
public:
  void fill(std::uint8_t* data, std::size_t size) override;
};

// Process-wide OpenSslRandomSource
RandomSource& default_random_source();


// Buffers bytes from a RandomSource so that many small draws cost one
// source read. Not thread safe.
class BytePool {
public:
  static constexpr std::size_t DEFAULT_POOL_SIZE = 256;

  explicit BytePool(RandomSource& source, std::size_t pool_size = DEFAULT_POOL_SIZE);

  std::uint8_t next_byte();
  // Uniform value in [0, bound) using rejection sampling. bound must be in [1, 256].
  std::size_t uniform(std::size_t bound);

private:
  RandomSource& source_;
  std::vector<std::uint8_t> pool_;
  std::size_t position_;

  void refill();
};

} // namespace pastebin::keygen

#endif // PASTEBIN_KEYGEN_RANDOM_SOURCE_HPP
