#pragma once

#include "nimlib/BasicTypes.hpp"
#include "nimlib/NimberCache.hpp"

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace nimlib {

// Whether a player may/must split the remainder of a stack into two non-empty stacks after taking.
enum class SplitPolicy : uint8_t {
  kNever,
  kOptional,
  kAlways
};

// Exactly this many coins may be taken (if the stack is tall enough). Always >= 1.
struct TakeExact {
  bool operator==(const TakeExact&) const = default;
  height_t amount;
};

// Any number of coins from 1 up to the stack height may be taken.
struct TakeAny {
  bool operator==(const TakeAny&) const = default;
};

// Reserved for Poker-Nim, where coins are placed from a player's pool onto a stack. Has no move
// semantics yet: such rules never produce legal moves.
struct PlaceCoins {
  bool operator==(const PlaceCoins&) const = default;
};

using TakeSize = std::variant<TakeExact, TakeAny, PlaceCoins>;

/*
 * A Rule describes a family of legal moves: a take size crossed with a split policy.
 *
 * A move is legal under a RuleSet iff at least one of its rules admits it.
 */
struct Rule {
  static Rule take_exact(height_t amount, SplitPolicy split = SplitPolicy::kNever);
  static Rule take_any(SplitPolicy split = SplitPolicy::kNever);
  static Rule place();

  bool operator==(const Rule&) const = default;

  bool is_place() const { return std::holds_alternative<PlaceCoins>(take); }

  // Whether taking amount coins from stack is one of the take sizes of this rule.
  bool admits_amount(height_t amount, Stack stack) const;

  // Whether a move that does (split=true) or does not (split=false) split is allowed.
  bool admits_split(bool split) const;

  TakeSize take;
  SplitPolicy split = SplitPolicy::kNever;
};

std::string_view split_policy_name(SplitPolicy policy);  // "Never", "Optional", "Always"
std::optional<SplitPolicy> parse_split_policy(std::string_view name);  // case-insensitive

/*
 * An immutable, ordered collection of Rules, together with the NimberCache for those rules.
 *
 * The cache is created empty with the RuleSet, filled lazily by the nimber calculations, and
 * destroyed with it. Since the rules can't change after construction, cached values never go
 * stale, and two RuleSets never share cached values.
 *
 * Rule order has no effect on legality, but determines the order in which legal moves are listed.
 */
class RuleSet {
 public:
  using rule_vec_t = std::vector<Rule>;
  using const_iterator = rule_vec_t::const_iterator;

  RuleSet() = default;

  // Throws util::CleanException if some rule takes an exact amount of 0.
  explicit RuleSet(rule_vec_t rules);
  RuleSet(std::initializer_list<Rule> rules) : RuleSet(rule_vec_t(rules)) {}

  /*
   * Builds a rule set the way the make-rule-set command does: one TakeExact rule per entry of
   * never, then of optional, then of always (with the matching split policy), then a TakeAny rule
   * if any_policy is set, then a PlaceCoins rule if allow_place is set.
   */
  static RuleSet from_take_lists(const std::vector<height_t>& never,
                                 const std::vector<height_t>& optional,
                                 const std::vector<height_t>& always,
                                 std::optional<SplitPolicy> any_policy = std::nullopt,
                                 bool allow_place = false);

  const rule_vec_t& rules() const { return rules_; }
  const_iterator begin() const { return rules_.begin(); }
  const_iterator end() const { return rules_.end(); }
  size_t size() const { return rules_.size(); }
  bool empty() const { return rules_.empty(); }

  // Compares rules only.
  bool operator==(const RuleSet& other) const { return rules_ == other.rules_; }

  // Filling the cache does not change the rules, hence const.
  NimberCache& cache() const { return cache_; }

  Nimber nimber_for_height(height_t height) const;
  Nimber nimber_for_position(const Position& position) const;

 private:
  rule_vec_t rules_;
  mutable NimberCache cache_;
};

}  // namespace nimlib

#include "inline/nimlib/Rules.inl"
