#include "keygen/id_generator.hpp"
#include <array>
#include <random>
#include <boost/log/trivial.hpp>

namespace pastebin::keygen {

namespace {

const std::array<const char*, 26> CONSONANTS = {
  "b", "c", "d", "f", "g", "h", "j", "k", "l", "m", "n", "p", "r",
  "s", "t", "v", "w", "z", "ch", "sh", "th", "st", "tr", "br", "pl", "gr"
};

const std::array<const char*, 10> VOWELS = {
  "a", "e", "i", "o", "u", "ai", "ea", "ou", "oo", "ie"
};

const char ALPHANUMERIC[] =
  "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

IdGenerator::IdGenerator(RandomSource& source)
  : pool_(source) {
}


//==============================================
// GENERATION
//==============================================

std::optional<std::string> IdGenerator::next() {
  try {
    return build();
  } catch (const RandomSourceError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Id generator: Pronounceable id unavailable: " << e.what();
    return std::nullopt;
  }
}

std::string IdGenerator::build() {
  const std::size_t length = MIN_LENGTH + pool_.uniform(MAX_LENGTH - MIN_LENGTH + 1);
  bool consonant = pool_.uniform(2) == 0;

  std::string id;
  id.reserve(length + 1);
  while (id.size() < length) {
    if (consonant) {
      id += CONSONANTS[pool_.uniform(CONSONANTS.size())];
    } else {
      id += VOWELS[pool_.uniform(VOWELS.size())];
    }
    consonant = !consonant;
  }

  // A two-letter unit may overshoot by one
  id.resize(length);
  return id;
}

std::string generate_fallback_id() {
  thread_local std::mt19937 gen{std::random_device{}()};
  std::uniform_int_distribution<std::size_t> dis(0, sizeof(ALPHANUMERIC) - 2);

  std::string id;
  id.reserve(FALLBACK_ID_LENGTH);
  for (std::size_t i = 0; i < FALLBACK_ID_LENGTH; ++i) {
    id += ALPHANUMERIC[dis(gen)];
  }
  return id;
}

std::string generate_id() {
  thread_local IdGenerator generator;

  if (auto id = generator.next()) {
    return *id;
  }

  std::string id = generate_fallback_id();
  BOOST_LOG_TRIVIAL(debug) << "Id generator: Using fallback id: " << id;
  return id;
}

} // namespace pastebin::keygen
