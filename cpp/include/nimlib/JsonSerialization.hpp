#pragma once

#include "nimlib/Actions.hpp"
#include "nimlib/BasicTypes.hpp"
#include "nimlib/NimGame.hpp"
#include "nimlib/Rules.hpp"

#include <boost/json.hpp>

#include <string>

namespace nimlib {

/*
 * JSON encoding of rule sets, positions and moves.
 *
 * A rule set is an array of rules:
 *
 * [
 *   {"take": {"Exact": 2}, "split": "Never"},
 *   {"take": "Any", "split": "Optional"},
 *   {"take": "Place", "split": "Never"}
 * ]
 *
 * When reading, {"take": {"List": [1, 2, 3]}, ...} is also accepted, and expands to one Exact rule
 * per listed amount. Split policy names are matched case-insensitively.
 *
 * A move is {"stack": 0, "take": 2, "split": [1, 3]}, with "split": null for an unsplit take, or
 * {"stack": 0, "place": 2}.
 *
 * All parse functions throw util::CleanException on malformed input.
 */
struct Json {
  static boost::json::value to_json(const Rule& rule);
  static boost::json::value to_json(const RuleSet& rules);
  static boost::json::value to_json(const Position& position);
  static boost::json::value to_json(const NimAction& action);
  static boost::json::value to_json(const PositionedAction& move);

  static RuleSet parse_rule_set(const boost::json::value& jv);
  static RuleSet parse_rule_set(const std::string& json_text);
  static Position parse_position(const boost::json::value& jv);
  static PositionedAction parse_move(const boost::json::value& jv);
};

}  // namespace nimlib
