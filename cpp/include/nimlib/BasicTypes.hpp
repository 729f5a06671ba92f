#pragma once

#include <compare>
#include <cstdint>
#include <ostream>
#include <vector>

namespace nimlib {

using height_t = uint64_t;
using nimber_value_t = uint64_t;
using stack_index_t = uint32_t;

// A stack of coins, represented by its height. A stack of height 0 is terminal.
struct Stack {
  constexpr Stack() = default;
  constexpr explicit Stack(height_t h) : height(h) {}

  auto operator<=>(const Stack&) const = default;
  bool empty() const { return height == 0; }

  height_t height = 0;
};

/*
 * A Sprague-Grundy value. Kept distinct from Stack so that heights and values can't be mixed up.
 *
 * The value of a disjunctive sum of games is the XOR (nim-sum) of the values of its components.
 */
struct Nimber {
  constexpr Nimber() = default;
  constexpr explicit Nimber(nimber_value_t v) : value(v) {}

  auto operator<=>(const Nimber&) const = default;

  constexpr Nimber operator^(Nimber other) const { return Nimber(value ^ other.value); }
  Nimber& operator^=(Nimber other) {
    value ^= other.value;
    return *this;
  }

  // A position whose nimber is zero is lost for the player to move.
  bool is_zero() const { return value == 0; }

  nimber_value_t value = 0;
};

// One full game state. Order of the stacks does not affect the value.
using Position = std::vector<Stack>;

inline std::ostream& operator<<(std::ostream& os, const Stack& stack) {
  return os << "Stack(" << stack.height << ")";
}

inline std::ostream& operator<<(std::ostream& os, const Nimber& nimber) {
  return os << "*" << nimber.value;
}

}  // namespace nimlib
