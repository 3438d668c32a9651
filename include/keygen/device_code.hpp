#ifndef PASTEBIN_KEYGEN_DEVICE_CODE_HPP
#define PASTEBIN_KEYGEN_DEVICE_CODE_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include "random_source.hpp"
#include "store/paste_store.hpp"

namespace pastebin::keygen {

constexpr std::size_t DEVICE_CODE_LENGTH = 8;

// True for exactly eight characters from [A-Z0-9]
bool is_valid_device_code(std::string_view code);

class DeviceCodeGenerator {
public:
  static constexpr std::size_t DEFAULT_MAX_ATTEMPTS = 10000;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit DeviceCodeGenerator(RandomSource& source = default_random_source(),
                               std::size_t max_attempts = DEFAULT_MAX_ATTEMPTS);


  // ---- GENERATION ----
  // Returns a code that no live paste in the store is owned by.
  // Throws NamespaceExhaustedError after max_attempts collisions and
  // RandomSourceError if the random source fails.
  std::string generate_unique(const store::PasteStore& store);

private:
  RandomSource& source_;
  const std::size_t max_attempts_;

  std::string sample(BytePool& pool) const;
};

// Convenience wrapper over a DeviceCodeGenerator on the default random source
std::string generate_unique_device_code(const store::PasteStore& store);

} // namespace pastebin::keygen

#endif // PASTEBIN_KEYGEN_DEVICE_CODE_HPP
