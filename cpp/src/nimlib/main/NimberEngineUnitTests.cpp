#include "nimlib/MoveGenerator.hpp"
#include "nimlib/NimberCache.hpp"
#include "nimlib/NimberEngine.hpp"
#include "nimlib/Rules.hpp"
#include "util/Asserts.hpp"
#include "util/Exceptions.hpp"
#include "util/GTestUtil.hpp"

#include <gtest/gtest.h>

#include <set>
#include <thread>
#include <vector>

using nimlib::height_t;
using nimlib::NimAction;
using nimlib::Nimber;
using nimlib::NimberCache;
using nimlib::nimber_value_t;
using nimlib::Position;
using nimlib::Rule;
using nimlib::RuleSet;
using nimlib::SplitInto;
using nimlib::SplitPolicy;
using nimlib::Stack;
using nimlib::TakeAction;

namespace {

std::vector<nimber_value_t> nimbers(const RuleSet& rules, height_t max_height) {
  std::vector<nimber_value_t> out;
  for (height_t h = 0; h <= max_height; ++h) {
    out.push_back(rules.nimber_for_height(h).value);
  }
  return out;
}

// The values reachable in one move from a stack of height h.
std::set<nimber_value_t> successor_values(const RuleSet& rules, height_t h) {
  std::set<nimber_value_t> values;
  for (const NimAction& action : nimlib::calculate_legal_moves(rules, Stack(h))) {
    const TakeAction& take = std::get<TakeAction>(action);
    if (const SplitInto* split = std::get_if<SplitInto>(&take.split)) {
      Nimber a = rules.nimber_for_height(split->first.height);
      Nimber b = rules.nimber_for_height(split->second.height);
      values.insert((a ^ b).value);
    } else {
      values.insert(rules.nimber_for_height(h - take.amount).value);
    }
  }
  return values;
}

}  // namespace

// Classic Nim: the nimber of a stack is its height.
TEST(NimberEngine, classic_nim) {
  RuleSet rules{Rule::take_any()};
  EXPECT_EQ(nimbers(rules, 5), (std::vector<nimber_value_t>{0, 1, 2, 3, 4, 5}));
  for (height_t h = 0; h < 40; ++h) {
    EXPECT_EQ(rules.nimber_for_height(h), Nimber(h));
  }
}

TEST(NimberEngine, take_one) {
  RuleSet rules{Rule::take_exact(1)};
  EXPECT_EQ(nimbers(rules, 5), (std::vector<nimber_value_t>{0, 1, 0, 1, 0, 1}));
}

TEST(NimberEngine, take_one_optional_split) {
  RuleSet rules{Rule::take_exact(1, SplitPolicy::kOptional)};

  Nimber n1 = rules.nimber_for_height(1);
  Nimber n2 = rules.nimber_for_height(2);
  Nimber n3 = rules.nimber_for_height(3);
  EXPECT_EQ(n1, Nimber(1));  // {0} -> 1
  EXPECT_EQ(n2, Nimber(0));  // {n1} = {1} -> 0
  EXPECT_EQ(n3, Nimber(1));  // {n2, n1 ^ n1} = {0} -> 1

  // {n3, n1 ^ n2} = {1} -> 0
  EXPECT_EQ(rules.nimber_for_height(4), Nimber(0));
  EXPECT_EQ(nimbers(rules, 6), (std::vector<nimber_value_t>{0, 1, 0, 1, 0, 1, 0}));
}

TEST(NimberEngine, take_one_always_split) {
  RuleSet rules{Rule::take_exact(1, SplitPolicy::kAlways)};
  EXPECT_EQ(nimbers(rules, 7), (std::vector<nimber_value_t>{0, 0, 0, 1, 1, 2, 0, 3}));
}

TEST(NimberEngine, take_lists) {
  RuleSet one_two_three{Rule::take_exact(1), Rule::take_exact(2), Rule::take_exact(3)};
  EXPECT_EQ(nimbers(one_two_three, 7), (std::vector<nimber_value_t>{0, 1, 2, 3, 0, 1, 2, 3}));

  RuleSet two_three{Rule::take_exact(2), Rule::take_exact(3)};
  EXPECT_EQ(nimbers(two_three, 7), (std::vector<nimber_value_t>{0, 0, 1, 1, 2, 0, 0, 1}));
}

TEST(NimberEngine, no_rules) {
  RuleSet rules;
  EXPECT_EQ(nimbers(rules, 4), (std::vector<nimber_value_t>{0, 0, 0, 0, 0}));

  RuleSet place_only{Rule::place()};
  EXPECT_EQ(place_only.nimber_for_height(6), Nimber(0));
}

// Every nimber is the smallest value not reachable in one move.
TEST(NimberEngine, mex_law) {
  RuleSet rules{Rule::take_exact(2, SplitPolicy::kOptional),
                Rule::take_exact(3, SplitPolicy::kAlways), Rule::take_exact(5)};
  for (height_t h = 0; h <= 30; ++h) {
    std::set<nimber_value_t> values = successor_values(rules, h);
    nimber_value_t mex = 0;
    while (values.count(mex)) ++mex;
    EXPECT_EQ(rules.nimber_for_height(h).value, mex) << "height " << h;
  }
}

TEST(NimberEngine, position_is_nim_sum) {
  RuleSet rules{Rule::take_any()};
  EXPECT_EQ(rules.nimber_for_position(Position{Stack(3), Stack(4), Stack(5)}), Nimber(2));
  EXPECT_EQ(rules.nimber_for_position(Position{Stack(1), Stack(2), Stack(3)}), Nimber(0));
  EXPECT_EQ(rules.nimber_for_position(Position{}), Nimber(0));

  RuleSet splitting{Rule::take_exact(1, SplitPolicy::kAlways)};
  Position position{Stack(5), Stack(7), Stack(3)};
  Nimber expected = splitting.nimber_for_height(5) ^ splitting.nimber_for_height(7) ^
                    splitting.nimber_for_height(3);
  EXPECT_EQ(splitting.nimber_for_position(position), expected);
}

TEST(NimberEngine, tall_stack) {
  RuleSet rules{Rule::take_exact(1)};
  EXPECT_EQ(rules.nimber_for_height(200000), Nimber(0));
  EXPECT_EQ(rules.nimber_for_height(200001), Nimber(1));
}

TEST(NimberEngine, explicit_cache) {
  RuleSet rules{Rule::take_exact(2), Rule::take_exact(3)};
  NimberCache cache;
  EXPECT_EQ(nimlib::calculate_nimber_for_height(rules, 4, cache), Nimber(2));
  EXPECT_EQ(cache.num_entries(), 5);
  EXPECT_EQ(cache.lookup(2), Nimber(1));
  EXPECT_EQ(cache.lookup(9), std::nullopt);

  // The rule set's own cache was not touched.
  EXPECT_EQ(rules.cache().num_entries(), 0);
}

TEST(NimberCache, insert_and_lookup) {
  NimberCache cache;
  EXPECT_EQ(cache.lookup(0), std::nullopt);

  cache.insert(3, Nimber(2));
  EXPECT_EQ(cache.lookup(3), Nimber(2));
  EXPECT_EQ(cache.lookup(2), std::nullopt);
  EXPECT_EQ(cache.num_entries(), 1);

  cache.insert(3, Nimber(2));  // same value again is fine
  EXPECT_EQ(cache.num_entries(), 1);
  EXPECT_THROW(cache.insert(3, Nimber(1)), util::Exception);
}

TEST(NimberCache, huge_height) {
  NimberCache cache;
  EXPECT_THROW(cache.insert(UINT64_MAX, Nimber(0)), util::ReleaseAssertionError);
  EXPECT_EQ(cache.num_entries(), 0);
  EXPECT_EQ(cache.lookup(UINT64_MAX), std::nullopt);
}

TEST(NimberCache, per_rule_set) {
  RuleSet classic{Rule::take_any()};
  RuleSet parity{Rule::take_exact(1)};

  EXPECT_EQ(classic.nimber_for_height(6), Nimber(6));
  EXPECT_EQ(classic.cache().num_entries(), 7);
  EXPECT_EQ(parity.cache().num_entries(), 0);

  EXPECT_EQ(parity.nimber_for_height(6), Nimber(0));
  EXPECT_EQ(classic.nimber_for_height(6), Nimber(6));
}

TEST(NimberCache, copy_keeps_entries) {
  RuleSet rules{Rule::take_exact(1, SplitPolicy::kAlways)};
  rules.nimber_for_height(7);

  RuleSet copy = rules;
  EXPECT_EQ(copy, rules);
  EXPECT_EQ(copy.cache().num_entries(), 8);
  EXPECT_EQ(copy.cache().lookup(7), Nimber(3));

  // The copy fills its own cache from here on.
  copy.nimber_for_height(9);
  EXPECT_EQ(copy.cache().num_entries(), 10);
  EXPECT_EQ(rules.cache().num_entries(), 8);
}

TEST(NimberCache, concurrent_queries) {
  constexpr height_t kMaxHeight = 120;
  constexpr int kNumThreads = 8;

  RuleSet reference{Rule::take_any(SplitPolicy::kOptional)};
  std::vector<nimber_value_t> expected = nimbers(reference, kMaxHeight);

  RuleSet shared{Rule::take_any(SplitPolicy::kOptional)};
  std::vector<std::vector<nimber_value_t>> results(kNumThreads);
  std::vector<std::thread> threads;
  for (int t = 0; t < kNumThreads; ++t) {
    threads.emplace_back([&, t]() {
      std::vector<nimber_value_t>& result = results[t];
      result.resize(kMaxHeight + 1);
      // Half the threads walk up, half walk down.
      for (height_t i = 0; i <= kMaxHeight; ++i) {
        height_t h = (t % 2 == 0) ? i : kMaxHeight - i;
        result[h] = shared.nimber_for_height(h).value;
      }
    });
  }
  for (auto& thread : threads) thread.join();

  for (int t = 0; t < kNumThreads; ++t) {
    EXPECT_EQ(results[t], expected) << "thread " << t;
  }
  EXPECT_EQ(shared.cache().num_entries(), kMaxHeight + 1);
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
