#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <algorithm>
#include <cctype>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include "keygen/id_generator.hpp"
#include "test_utils.hpp"

using namespace pastebin::keygen;
using ::testing::_;
using ::testing::Throw;

class IdGeneratorTest : public ::testing::Test {
protected:
  void SetUp() override {
    quiet_logging();
  }

  static bool is_lower_alpha(const std::string& id) {
    return std::all_of(id.begin(), id.end(), [](unsigned char c) { return std::islower(c) != 0; });
  }

  static bool is_alphanumeric(const std::string& id) {
    return std::all_of(id.begin(), id.end(), [](unsigned char c) { return std::isalnum(c) != 0; });
  }
};

TEST_F(IdGeneratorTest, DeterministicForFixedBytes) {
  // All-zero bytes: shortest length, consonant first, first unit of each table
  ScriptedRandomSource source({0});
  IdGenerator generator(source);

  auto id = generator.next();
  ASSERT_TRUE(id.has_value());
  EXPECT_EQ(*id, "bababab");
}

TEST_F(IdGeneratorTest, LengthWithinBounds) {
  IdGenerator generator;
  for (int i = 0; i < 500; ++i) {
    auto id = generator.next();
    ASSERT_TRUE(id.has_value());
    EXPECT_GE(id->size(), IdGenerator::MIN_LENGTH) << *id;
    EXPECT_LE(id->size(), IdGenerator::MAX_LENGTH) << *id;
    EXPECT_TRUE(is_lower_alpha(*id)) << *id;
  }
}

TEST_F(IdGeneratorTest, IdsAreVaried) {
  IdGenerator generator;
  std::set<std::string> ids;
  for (int i = 0; i < 200; ++i) {
    ids.insert(*generator.next());
  }
  EXPECT_GT(ids.size(), 190u);
}

TEST_F(IdGeneratorTest, SourceFailureYieldsNoId) {
  MockRandomSource source;
  EXPECT_CALL(source, fill(_, _)).WillOnce(Throw(RandomSourceError("entropy unavailable")));

  IdGenerator generator(source);
  EXPECT_FALSE(generator.next().has_value());
}

TEST_F(IdGeneratorTest, FallbackIdShape) {
  for (int i = 0; i < 100; ++i) {
    std::string id = generate_fallback_id();
    EXPECT_EQ(id.size(), FALLBACK_ID_LENGTH);
    EXPECT_TRUE(is_alphanumeric(id)) << id;
  }
}

TEST_F(IdGeneratorTest, GenerateIdNeverEmpty) {
  for (int i = 0; i < 100; ++i) {
    std::string id = generate_id();
    EXPECT_GE(id.size(), FALLBACK_ID_LENGTH);
    EXPECT_LE(id.size(), IdGenerator::MAX_LENGTH);
    EXPECT_TRUE(is_alphanumeric(id)) << id;
  }
}

TEST_F(IdGeneratorTest, GenerateIdFromManyThreads) {
  const size_t num_threads = 8;
  std::vector<std::vector<std::string>> results(num_threads);
  std::vector<std::thread> threads;

  for (size_t i = 0; i < num_threads; ++i) {
    threads.emplace_back([&results, i]() {
      for (int j = 0; j < 100; ++j) {
        results[i].push_back(generate_id());
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  std::set<std::string> unique;
  for (const auto& ids : results) {
    EXPECT_EQ(ids.size(), 100u);
    unique.insert(ids.begin(), ids.end());
  }
  EXPECT_GT(unique.size(), 780u);
}
