#include "nimlib/JsonSerialization.hpp"

#include "util/Exceptions.hpp"

#include <limits>
#include <string_view>

namespace nimlib {

namespace {

height_t to_height(const boost::json::value& jv, std::string_view what) {
  if (jv.is_uint64()) return jv.get_uint64();
  if (jv.is_int64() && jv.get_int64() >= 0) return jv.get_int64();
  throw util::CleanException("Expected a non-negative integer for {}, got {}", what,
                             boost::json::serialize(jv));
}

const boost::json::object& to_object(const boost::json::value& jv, std::string_view what) {
  const boost::json::object* obj = jv.if_object();
  if (!obj) {
    throw util::CleanException("Expected an object for {}, got {}", what,
                               boost::json::serialize(jv));
  }
  return *obj;
}

const boost::json::value& member(const boost::json::object& obj, std::string_view key,
                                 std::string_view what) {
  const boost::json::value* jv = obj.if_contains(key);
  if (!jv) {
    throw util::CleanException("Missing \"{}\" in {}: {}", key, what, boost::json::serialize(obj));
  }
  return *jv;
}

SplitPolicy to_split_policy(const boost::json::value& jv) {
  const boost::json::string* str = jv.if_string();
  std::optional<SplitPolicy> policy;
  if (str) policy = parse_split_policy(std::string_view(str->data(), str->size()));
  if (!policy) {
    throw util::CleanException("Invalid split policy {} (expected Never, Optional or Always)",
                               boost::json::serialize(jv));
  }
  return *policy;
}

// Appends the rule(s) described by jv. A List take expands to several rules.
void append_rules(RuleSet::rule_vec_t& rules, const boost::json::value& jv) {
  const boost::json::object& obj = to_object(jv, "rule");
  const boost::json::value& take = member(obj, "take", "rule");
  SplitPolicy split = to_split_policy(member(obj, "split", "rule"));

  if (const boost::json::string* str = take.if_string()) {
    if (*str == "Any") {
      rules.push_back(Rule::take_any(split));
      return;
    }
    if (*str == "Place") {
      rules.push_back(Rule{PlaceCoins{}, split});
      return;
    }
  } else if (const boost::json::object* take_obj = take.if_object()) {
    if (const boost::json::value* exact = take_obj->if_contains("Exact")) {
      rules.push_back(Rule::take_exact(to_height(*exact, "Exact"), split));
      return;
    }
    if (const boost::json::value* list = take_obj->if_contains("List")) {
      const boost::json::array* arr = list->if_array();
      if (!arr) {
        throw util::CleanException("Expected an array for List, got {}",
                                   boost::json::serialize(*list));
      }
      for (const boost::json::value& amount : *arr) {
        rules.push_back(Rule::take_exact(to_height(amount, "List entry"), split));
      }
      return;
    }
  }
  throw util::CleanException("Invalid take size {} (expected \"Any\", \"Place\", {{\"Exact\": n}} "
                             "or {{\"List\": [...]}})",
                             boost::json::serialize(take));
}

}  // namespace

boost::json::value Json::to_json(const Rule& rule) {
  boost::json::object obj;
  if (const TakeExact* exact = std::get_if<TakeExact>(&rule.take)) {
    boost::json::object take;
    take["Exact"] = exact->amount;
    obj["take"] = std::move(take);
  } else if (std::holds_alternative<TakeAny>(rule.take)) {
    obj["take"] = "Any";
  } else {
    obj["take"] = "Place";
  }
  obj["split"] = split_policy_name(rule.split);
  return obj;
}

boost::json::value Json::to_json(const RuleSet& rules) {
  boost::json::array arr;
  for (const Rule& rule : rules) {
    arr.push_back(to_json(rule));
  }
  return arr;
}

boost::json::value Json::to_json(const Position& position) {
  boost::json::array arr;
  for (const Stack& stack : position) {
    arr.push_back(stack.height);
  }
  return arr;
}

boost::json::value Json::to_json(const NimAction& action) {
  boost::json::object obj;
  if (const TakeAction* take = std::get_if<TakeAction>(&action)) {
    obj["take"] = take->amount;
    if (const SplitInto* split = std::get_if<SplitInto>(&take->split)) {
      obj["split"] = boost::json::array{split->first.height, split->second.height};
    } else {
      obj["split"] = nullptr;
    }
  } else {
    obj["place"] = std::get<PlaceAction>(action).amount;
  }
  return obj;
}

boost::json::value Json::to_json(const PositionedAction& move) {
  boost::json::value jv = to_json(move.action);
  jv.as_object()["stack"] = move.stack_index;
  return jv;
}

RuleSet Json::parse_rule_set(const boost::json::value& jv) {
  const boost::json::array* arr = jv.if_array();
  if (!arr) {
    throw util::CleanException("Expected an array of rules, got {}", boost::json::serialize(jv));
  }

  RuleSet::rule_vec_t rules;
  for (const boost::json::value& rule : *arr) {
    append_rules(rules, rule);
  }
  return RuleSet(std::move(rules));
}

RuleSet Json::parse_rule_set(const std::string& json_text) {
  boost::json::error_code ec;
  boost::json::value jv = boost::json::parse(json_text, ec);
  if (ec) {
    throw util::CleanException("Failed to parse rule set json: {}", ec.message());
  }
  return parse_rule_set(jv);
}

Position Json::parse_position(const boost::json::value& jv) {
  const boost::json::array* arr = jv.if_array();
  if (!arr) {
    throw util::CleanException("Expected an array of heights, got {}",
                               boost::json::serialize(jv));
  }

  Position position;
  for (const boost::json::value& height : *arr) {
    position.push_back(Stack(to_height(height, "stack height")));
  }
  return position;
}

PositionedAction Json::parse_move(const boost::json::value& jv) {
  const boost::json::object& obj = to_object(jv, "move");
  height_t raw_index = to_height(member(obj, "stack", "move"), "stack");
  if (raw_index > std::numeric_limits<stack_index_t>::max()) {
    throw util::CleanException("Stack index {} out of range", raw_index);
  }
  stack_index_t stack_index = static_cast<stack_index_t>(raw_index);

  if (const boost::json::value* place = obj.if_contains("place")) {
    return PositionedAction{stack_index, PlaceAction{to_height(*place, "place")}};
  }

  TakeAction take{to_height(member(obj, "take", "move"), "take"), NoSplit{}};
  const boost::json::value* split = obj.if_contains("split");
  if (split && !split->is_null()) {
    const boost::json::array* halves = split->if_array();
    if (!halves || halves->size() != 2) {
      throw util::CleanException("Expected a split of the form [a, b], got {}",
                                 boost::json::serialize(*split));
    }
    take.split = SplitInto{Stack(to_height((*halves)[0], "split")),
                           Stack(to_height((*halves)[1], "split"))};
  }
  return PositionedAction{stack_index, take};
}

}  // namespace nimlib
