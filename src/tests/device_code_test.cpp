#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <string>
#include "keygen/device_code.hpp"
#include "keygen/keygen_error.hpp"
#include "store/paste_store.hpp"
#include "test_utils.hpp"

using namespace pastebin::keygen;
using pastebin::store::Bytes;
using pastebin::store::PasteStore;
using ::testing::_;
using ::testing::Throw;

class DeviceCodeTest : public ::testing::Test {
protected:
  PasteStore store;

  void SetUp() override {
    quiet_logging();
  }

  void own(const std::string& device_code) {
    store.insert("paste_" + device_code, Bytes{'x'}, device_code);
  }
};

TEST_F(DeviceCodeTest, ValidatesShape) {
  EXPECT_TRUE(is_valid_device_code("ABCD1234"));
  EXPECT_TRUE(is_valid_device_code("00000000"));
  EXPECT_TRUE(is_valid_device_code("ZZZZZZZZ"));

  EXPECT_FALSE(is_valid_device_code(""));
  EXPECT_FALSE(is_valid_device_code("ABCD123"));
  EXPECT_FALSE(is_valid_device_code("ABCD12345"));
  EXPECT_FALSE(is_valid_device_code("abcd1234"));
  EXPECT_FALSE(is_valid_device_code("ABCD-234"));
  EXPECT_FALSE(is_valid_device_code("ABCD 234"));
}

TEST_F(DeviceCodeTest, GeneratedCodesAreValid) {
  DeviceCodeGenerator generator;
  for (int i = 0; i < 100; ++i) {
    std::string code = generator.generate_unique(store);
    EXPECT_EQ(code.size(), DEVICE_CODE_LENGTH);
    EXPECT_TRUE(is_valid_device_code(code)) << code;
  }
}

TEST_F(DeviceCodeTest, SuccessiveCodesDiffer) {
  std::string first = generate_unique_device_code(store);
  std::string second = generate_unique_device_code(store);
  EXPECT_NE(first, second);
}

TEST_F(DeviceCodeTest, SkipsLiveDeviceCode) {
  own("AAAAAAAA");

  // First sample is AAAAAAAA, second is BBBBBBBB
  ScriptedRandomSource source(device_code_script({0, 1}));
  DeviceCodeGenerator generator(source);

  EXPECT_EQ(generator.generate_unique(store), "BBBBBBBB");
}

TEST_F(DeviceCodeTest, DigitsComeAfterLetters) {
  ScriptedRandomSource source(device_code_script({26}));
  DeviceCodeGenerator generator(source);

  EXPECT_EQ(generator.generate_unique(store), "00000000");
}

TEST_F(DeviceCodeTest, NeverReturnsKnownOwner) {
  own("AAAAAAAA");
  own("BBBBBBBB");
  own("CCCCCCCC");

  ScriptedRandomSource source(device_code_script({0, 1, 2, 3}));
  DeviceCodeGenerator generator(source);

  std::string code = generator.generate_unique(store);
  EXPECT_EQ(code, "DDDDDDDD");
  EXPECT_EQ(store.known_owners().count(code), 0u);
}

TEST_F(DeviceCodeTest, ExhaustionIsReported) {
  own("AAAAAAAA");

  ScriptedRandomSource source({0});
  DeviceCodeGenerator generator(source, 5);

  EXPECT_THROW(generator.generate_unique(store), NamespaceExhaustedError);
  EXPECT_EQ(source.bytes_served() % (4 * DEVICE_CODE_LENGTH), 0u);
  EXPECT_GE(source.bytes_served(), 5 * DEVICE_CODE_LENGTH);
}

TEST_F(DeviceCodeTest, RandomSourceFailurePropagates) {
  MockRandomSource source;
  EXPECT_CALL(source, fill(_, _)).WillOnce(Throw(RandomSourceError("entropy unavailable")));

  DeviceCodeGenerator generator(source);
  EXPECT_THROW(generator.generate_unique(store), RandomSourceError);
}
