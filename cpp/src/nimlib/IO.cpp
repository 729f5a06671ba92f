#include "nimlib/IO.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <sstream>

namespace nimlib {

namespace {

size_t num_digits(uint64_t x) { return std::to_string(x).size(); }

}  // namespace

std::string IO::action_to_str(const NimAction& action) {
  std::ostringstream ss;
  ss << action;
  return ss.str();
}

std::string IO::move_to_str(const PositionedAction& move) {
  return std::format("stack {}: {}", move.stack_index, action_to_str(move.action));
}

std::string IO::rule_to_str(const Rule& rule) {
  std::string split = std::string(split_policy_name(rule.split));
  std::transform(split.begin(), split.end(), split.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (const TakeExact* exact = std::get_if<TakeExact>(&rule.take)) {
    return std::format("take {} (split: {})", exact->amount, split);
  }
  if (std::holds_alternative<TakeAny>(rule.take)) {
    return std::format("take any (split: {})", split);
  }
  return std::format("place (split: {})", split);
}

std::string IO::splits_to_str(height_t height, const std::vector<SplitInto>& splits) {
  if (splits.empty()) {
    return std::format("No splits for height {}\n", height);
  }

  // The left column grows and the right column shrinks, so the widest entries are at the ends.
  size_t left_width = num_digits(splits.back().first.height);
  size_t right_width = num_digits(splits.front().second.height);

  std::ostringstream ss;
  ss << std::format("Splits for height {}:\n", height);
  for (const SplitInto& split : splits) {
    ss << std::format("{:>{}} + {:>{}}\n", split.first.height, left_width, split.second.height,
                      right_width);
  }
  return ss.str();
}

std::string IO::splits_to_csv(const std::vector<SplitInto>& splits) {
  std::ostringstream ss;
  ss << "left,right\n";
  for (const SplitInto& split : splits) {
    ss << split.first.height << "," << split.second.height << "\n";
  }
  return ss.str();
}

std::string IO::nimbers_to_str(const std::vector<height_nimber_t>& nimbers) {
  size_t width = 0;
  for (const auto& [height, nimber] : nimbers) {
    width = std::max(width, num_digits(height));
  }

  std::ostringstream ss;
  for (const auto& [height, nimber] : nimbers) {
    ss << std::format("nimber({:>{}}) = {}\n", height, width, nimber.value);
  }
  return ss.str();
}

std::string IO::nimbers_to_csv(const std::vector<height_nimber_t>& nimbers) {
  std::ostringstream ss;
  ss << "height,nimber\n";
  for (const auto& [height, nimber] : nimbers) {
    ss << height << "," << nimber.value << "\n";
  }
  return ss.str();
}

std::string IO::position_to_str(const Position& position,
                                const std::vector<Nimber>& stack_nimbers, Nimber total) {
  std::ostringstream ss;
  for (size_t i = 0; i < position.size(); ++i) {
    ss << std::format("stack {} (height {}): nimber {}\n", i, position[i].height,
                      stack_nimbers[i].value);
  }
  ss << std::format("nim-sum: {} ({} player wins)\n", total.value,
                    total.is_zero() ? "second" : "first");
  return ss.str();
}

}  // namespace nimlib
