#include "keygen/device_code.hpp"
#include <algorithm>
#include <unordered_set>
#include <boost/log/trivial.hpp>

namespace pastebin::keygen {

namespace {

constexpr char DEVICE_CODE_ALPHABET[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
constexpr std::size_t DEVICE_CODE_ALPHABET_SIZE = sizeof(DEVICE_CODE_ALPHABET) - 1;

bool is_device_code_char(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

} // namespace

bool is_valid_device_code(std::string_view code) {
  return code.size() == DEVICE_CODE_LENGTH &&
         std::all_of(code.begin(), code.end(), is_device_code_char);
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

DeviceCodeGenerator::DeviceCodeGenerator(RandomSource& source, std::size_t max_attempts)
  : source_(source)
  , max_attempts_(max_attempts == 0 ? 1 : max_attempts) {
}


//==============================================
// GENERATION
//==============================================

std::string DeviceCodeGenerator::generate_unique(const store::PasteStore& store) {
  const std::unordered_set<std::string> existing_devices = store.known_owners();
  BytePool pool(source_, 4 * DEVICE_CODE_LENGTH);

  for (std::size_t attempt = 1; attempt <= max_attempts_; ++attempt) {
    std::string code = sample(pool);
    if (existing_devices.count(code) == 0) {
      BOOST_LOG_TRIVIAL(debug) << "Device code generator: Issued device code after " << attempt << " attempt(s)";
      return code;
    }
    BOOST_LOG_TRIVIAL(debug) << "Device code generator: Collision with live device code: " << code;
  }

  BOOST_LOG_TRIVIAL(fatal) << "Device code generator: No free device code after " << max_attempts_
                           << " attempts with " << existing_devices.size() << " live devices";
  throw NamespaceExhaustedError("No free device code after " + std::to_string(max_attempts_) + " attempts");
}

std::string DeviceCodeGenerator::sample(BytePool& pool) const {
  std::string code;
  code.reserve(DEVICE_CODE_LENGTH);
  for (std::size_t i = 0; i < DEVICE_CODE_LENGTH; ++i) {
    code += DEVICE_CODE_ALPHABET[pool.uniform(DEVICE_CODE_ALPHABET_SIZE)];
  }
  return code;
}

std::string generate_unique_device_code(const store::PasteStore& store) {
  DeviceCodeGenerator generator;
  return generator.generate_unique(store);
}

} // namespace pastebin::keygen
