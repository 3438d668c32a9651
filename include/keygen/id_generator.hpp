#ifndef PASTEBIN_KEYGEN_ID_GENERATOR_HPP
#define PASTEBIN_KEYGEN_ID_GENERATOR_HPP

#include <cstddef>
#include <optional>
#include <string>
#include "random_source.hpp"

namespace pastebin::keygen {

// Produces pronounceable lower-case identifiers by alternating consonant and
// vowel units, e.g. "tobashel". One instance per thread.
class IdGenerator {
public:
  static constexpr std::size_t MIN_LENGTH = 7;
  static constexpr std::size_t MAX_LENGTH = 10;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit IdGenerator(RandomSource& source = default_random_source());

  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;


  // ---- GENERATION ----
  // Returns std::nullopt if the random source fails
  std::optional<std::string> next();

private:
  BytePool pool_;

  std::string build();
};

// Length of ids produced by generate_fallback_id
constexpr std::size_t FALLBACK_ID_LENGTH = 6;

// Six characters from [A-Za-z0-9] drawn with a seeded std::mt19937
std::string generate_fallback_id();

// Identifier from this thread's IdGenerator, or a fallback id if that fails.
// Never fails; collisions are the caller's concern.
std::string generate_id();

} // namespace pastebin::keygen

#endif // PASTEBIN_KEYGEN_ID_GENERATOR_HPP
