#include "keygen/random_source.hpp"
#include <limits>
#include <stdexcept>
#include <string>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <boost/log/trivial.hpp>

namespace pastebin::keygen {

//==============================================
// OPENSSL RANDOM SOURCE
//==============================================

void OpenSslRandomSource::fill(std::uint8_t* data, std::size_t size) {
  if (size > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    throw RandomSourceError("Request too large: " + std::to_string(size) + " bytes");
  }

  if (RAND_bytes(data, static_cast<int>(size)) != 1) {
    unsigned long code = ERR_get_error();
    char reason[256];
    ERR_error_string_n(code, reason, sizeof(reason));
    BOOST_LOG_TRIVIAL(error) << "Random source: RAND_bytes failed: " << reason;
    throw RandomSourceError(std::string("RAND_bytes failed: ") + reason);
  }
}

RandomSource& default_random_source() {
  static OpenSslRandomSource source;
  return source;
}


//==============================================
// BYTE POOL
//==============================================

BytePool::BytePool(RandomSource& source, std::size_t pool_size)
  : source_(source)
  , pool_(pool_size == 0 ? 1 : pool_size)
  , position_(pool_.size()) {
}

std::uint8_t BytePool::next_byte() {
  if (position_ >= pool_.size()) {
    refill();
  }
  return pool_[position_++];
}

std::size_t BytePool::uniform(std::size_t bound) {
  if (bound == 0 || bound > 256) {
    throw std::invalid_argument("Byte pool: bound must be in [1, 256]");
  }

  // Largest multiple of bound that fits in a byte; anything above is rejected
  const std::size_t limit = 256 - (256 % bound);
  for (;;) {
    std::size_t value = next_byte();
    if (value < limit) {
      return value % bound;
    }
  }
}

void BytePool::refill() {
  source_.fill(pool_.data(), pool_.size());
  position_ = 0;
}

} // namespace pastebin::keygen
