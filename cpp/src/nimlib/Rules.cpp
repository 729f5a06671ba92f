#include "nimlib/Rules.hpp"

#include "nimlib/NimberEngine.hpp"
#include "util/Exceptions.hpp"

#include <magic_enum/magic_enum.hpp>

#include <algorithm>
#include <cctype>
#include <string>

namespace nimlib {

std::string_view split_policy_name(SplitPolicy policy) {
  std::string_view name = magic_enum::enum_name(policy);
  name.remove_prefix(1);  // drop the 'k'
  return name;
}

std::optional<SplitPolicy> parse_split_policy(std::string_view name) {
  for (SplitPolicy policy : magic_enum::enum_values<SplitPolicy>()) {
    std::string_view candidate = split_policy_name(policy);
    bool match = std::equal(name.begin(), name.end(), candidate.begin(), candidate.end(),
                            [](unsigned char a, unsigned char b) {
                              return std::tolower(a) == std::tolower(b);
                            });
    if (match) return policy;
  }
  return std::nullopt;
}

RuleSet::RuleSet(rule_vec_t rules) : rules_(std::move(rules)) {
  for (size_t i = 0; i < rules_.size(); ++i) {
    const TakeExact* exact = std::get_if<TakeExact>(&rules_[i].take);
    if (exact && exact->amount == 0) {
      throw util::CleanException("Rule {} takes exactly 0 coins; amounts must be at least 1", i);
    }
  }
}

RuleSet RuleSet::from_take_lists(const std::vector<height_t>& never,
                                 const std::vector<height_t>& optional,
                                 const std::vector<height_t>& always,
                                 std::optional<SplitPolicy> any_policy, bool allow_place) {
  rule_vec_t rules;
  for (height_t amount : never) rules.push_back(Rule::take_exact(amount, SplitPolicy::kNever));
  for (height_t amount : optional) {
    rules.push_back(Rule::take_exact(amount, SplitPolicy::kOptional));
  }
  for (height_t amount : always) rules.push_back(Rule::take_exact(amount, SplitPolicy::kAlways));
  if (any_policy) rules.push_back(Rule::take_any(*any_policy));
  if (allow_place) rules.push_back(Rule::place());
  return RuleSet(std::move(rules));
}

Nimber RuleSet::nimber_for_height(height_t height) const {
  return calculate_nimber_for_height(*this, height, cache_);
}

Nimber RuleSet::nimber_for_position(const Position& position) const {
  return calculate_nimber_for_position(*this, position, cache_);
}

}  // namespace nimlib
