#include "nimlib/IO.hpp"
#include "nimlib/JsonSerialization.hpp"
#include "nimlib/NimGame.hpp"
#include "nimlib/Rules.hpp"
#include "nimlib/Splits.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exceptions.hpp"
#include "util/LoggingUtil.hpp"
#include "util/StringUtil.hpp"

#include <boost/json.hpp>
#include <boost/program_options.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace po = boost::program_options;
namespace po2 = boost_util::program_options;

using nimlib::height_t;
using nimlib::IO;
using nimlib::Json;
using nimlib::Nimber;
using nimlib::Position;
using nimlib::RuleSet;

// Where the rules come from: a json file, an inline json string, or take lists.
struct RuleSetParams {
  std::string rules_file;
  std::string rules_json;
  std::string take_split_never;
  std::string take_split_optional;
  std::string take_split_always;
  std::string any_take;
  bool allow_place = false;

  auto make_options_description() {
    po2::options_description desc("Rule options");

    return desc
      .template add_option<"rules-file">(po::value<std::string>(&rules_file),
                                         "json file holding the rule set")
      .template add_option<"rules">(po::value<std::string>(&rules_json),
                                    "rule set as a json string")
      .template add_option<"take-split-never", 'n'>(
        po::value<std::string>(&take_split_never),
        "comma-separated amounts that may be taken without splitting")
      .template add_option<"take-split-optional", 'o'>(
        po::value<std::string>(&take_split_optional),
        "comma-separated amounts that may be taken, optionally splitting the rest")
      .template add_option<"take-split-always", 'a'>(
        po::value<std::string>(&take_split_always),
        "comma-separated amounts that may be taken, always splitting the rest")
      .template add_option<"allow-any-take", 's'>(
        po::value<std::string>(&any_take),
        "allow taking any amount, with this split policy (never|optional|always)")
      .template add_option<"allow-place", 'p'>(po::bool_switch(&allow_place),
                                               "add a place rule (no moves are generated for it)");
  }

  bool uses_take_lists() const {
    return !take_split_never.empty() || !take_split_optional.empty() ||
           !take_split_always.empty() || !any_take.empty() || allow_place;
  }

  // With allow_empty, giving no rules at all yields the empty rule set.
  RuleSet build(bool allow_empty = false) const {
    int num_sources = !rules_file.empty() + !rules_json.empty() + uses_take_lists();
    if (num_sources == 0) {
      if (allow_empty) return RuleSet();
      throw util::CleanException(
        "No rules given (use --rules-file, --rules, or the take-list options)");
    }
    if (num_sources > 1) {
      throw util::CleanException(
        "Rules given more than once (use only one of --rules-file, --rules, or the take-list "
        "options)");
    }

    if (!rules_file.empty()) {
      return Json::parse_rule_set(boost_util::read_json_file(rules_file));
    }
    if (!rules_json.empty()) {
      return Json::parse_rule_set(rules_json);
    }

    std::optional<nimlib::SplitPolicy> any_policy;
    if (!any_take.empty()) {
      any_policy = nimlib::parse_split_policy(any_take);
      if (!any_policy) {
        throw util::CleanException("Invalid --allow-any-take value \"{}\"", any_take);
      }
    }
    return RuleSet::from_take_lists(util::parse_uint64_list(take_split_never),
                                    util::parse_uint64_list(take_split_optional),
                                    util::parse_uint64_list(take_split_always), any_policy,
                                    allow_place);
  }
};

// What to compute, and how to print it.
struct QueryParams {
  std::string height;
  std::string max_height;
  std::string position;
  bool csv = false;
  bool json = false;
  bool pretty_print = false;

  auto make_options_description() {
    po2::options_description desc("Query options");

    return desc
      .template add_option<"height">(po::value<std::string>(&height), "single stack height")
      .template add_option<"max-height", 'm'>(po::value<std::string>(&max_height),
                                              "all stack heights from 0 up to this one")
      .template add_option<"position", 'x'>(po::value<std::string>(&position),
                                            "stack heights of a position, e.g. \"3 4 5\"")
      .template add_option<"csv", 'c'>(po::bool_switch(&csv), "print csv")
      .template add_option<"json", 'j'>(po::bool_switch(&json), "print json")
      .template add_option<"pretty-print", 'P'>(po::bool_switch(&pretty_print),
                                                "pretty-print json output");
  }

  Position parse_position() const {
    Position out;
    for (uint64_t h : util::parse_uint64_list(position)) {
      out.push_back(nimlib::Stack(h));
    }
    return out;
  }
};

struct Args {
  std::string command;
  std::vector<std::string> command_args;

  auto make_options_description() {
    po2::options_description desc("Command");

    return desc
      .template add_hidden_option<"command">(po::value<std::string>(&command),
                                             "splits | make-rule-set | nimber | moves")
      .template add_hidden_option<"command-args">(
        po::value<std::vector<std::string>>(&command_args), "command arguments");
  }
};

void print_json(const boost::json::value& jv, bool pretty) {
  if (pretty) {
    boost_util::pretty_print(std::cout, jv);
    std::cout << std::endl;
  } else {
    std::cout << boost::json::serialize(jv) << std::endl;
  }
}

void print_usage(std::ostream& os) {
  os << "Usage: nimlib <command> [options]\n\n"
     << "Commands:\n"
     << "  splits <height>   list the ways to split a stack into two\n"
     << "  make-rule-set     print the rule set built from the rule options as json\n"
     << "  nimber            compute nimbers (--height, --max-height or --position)\n"
     << "  moves             list the legal moves of --position\n";
}

int run_splits(const Args& args, const QueryParams& query) {
  std::string height_str = query.height;
  if (height_str.empty() && !args.command_args.empty()) height_str = args.command_args[0];
  if (height_str.empty()) {
    throw util::CleanException("splits requires a height");
  }

  height_t height = util::atou64_safe(height_str);
  auto splits = nimlib::calculate_splits(height);
  LOG_INFO("{} splits for height {}", splits.size(), height);

  if (query.json) {
    boost::json::array arr;
    for (const auto& split : splits) {
      arr.push_back(boost::json::array{split.first.height, split.second.height});
    }
    print_json(arr, query.pretty_print);
  } else if (query.csv) {
    std::cout << IO::splits_to_csv(splits);
  } else {
    std::cout << IO::splits_to_str(height, splits);
  }
  return 0;
}

int run_make_rule_set(const RuleSetParams& rule_params, const QueryParams& query) {
  RuleSet rules = rule_params.build(true);
  std::cout << "Made rule set:" << std::endl;
  print_json(Json::to_json(rules), query.pretty_print);
  return 0;
}

int run_nimber(const RuleSetParams& rule_params, const QueryParams& query) {
  int num_queries = !query.height.empty() + !query.max_height.empty() + !query.position.empty();
  if (num_queries != 1) {
    throw util::CleanException("nimber requires exactly one of --height, --max-height, --position");
  }

  RuleSet rules = rule_params.build();
  LOG_INFO("Computing nimbers for a rule set of {} rules", rules.size());

  if (!query.position.empty()) {
    Position position = query.parse_position();
    std::vector<Nimber> stack_nimbers;
    for (const auto& stack : position) {
      stack_nimbers.push_back(rules.nimber_for_height(stack.height));
    }
    Nimber total = rules.nimber_for_position(position);

    if (query.json) {
      boost::json::array nimbers;
      for (Nimber n : stack_nimbers) nimbers.push_back(n.value);
      boost::json::object obj;
      obj["position"] = Json::to_json(position);
      obj["nimbers"] = std::move(nimbers);
      obj["nim_sum"] = total.value;
      obj["first_player_wins"] = !total.is_zero();
      print_json(obj, query.pretty_print);
    } else {
      std::cout << IO::position_to_str(position, stack_nimbers, total);
    }
    return 0;
  }

  std::vector<IO::height_nimber_t> nimbers;
  if (!query.height.empty()) {
    height_t height = util::atou64_safe(query.height);
    nimbers.emplace_back(height, rules.nimber_for_height(height));
  } else {
    height_t max_height = util::atou64_safe(query.max_height);
    // Filling the top height first fills every lower one too.
    rules.nimber_for_height(max_height);
    for (height_t h = 0; h <= max_height; ++h) {
      nimbers.emplace_back(h, rules.nimber_for_height(h));
    }
  }

  if (query.json) {
    boost::json::array arr;
    for (const auto& [height, nimber] : nimbers) {
      boost::json::object obj;
      obj["height"] = height;
      obj["nimber"] = nimber.value;
      arr.push_back(std::move(obj));
    }
    print_json(arr, query.pretty_print);
  } else if (query.csv) {
    std::cout << IO::nimbers_to_csv(nimbers);
  } else {
    std::cout << IO::nimbers_to_str(nimbers);
  }
  return 0;
}

int run_moves(const RuleSetParams& rule_params, const QueryParams& query) {
  if (query.position.empty()) {
    throw util::CleanException("moves requires --position");
  }

  nimlib::NimGame game(rule_params.build(), query.parse_position());
  auto moves = game.enumerate_moves();
  LOG_INFO("{} legal moves", moves.size());

  if (query.json) {
    boost::json::array arr;
    for (const auto& move : moves) {
      arr.push_back(Json::to_json(move));
    }
    print_json(arr, query.pretty_print);
  } else if (moves.empty()) {
    std::cout << "No legal moves" << std::endl;
  } else {
    for (const auto& move : moves) {
      std::cout << IO::move_to_str(move) << std::endl;
    }
  }
  return 0;
}

int main(int ac, char* av[]) {
  try {
    Args args;
    RuleSetParams rule_params;
    QueryParams query_params;
    util::Logging::Params log_params;

    po2::options_description raw_desc("General options");
    auto desc = raw_desc.template add_option<"help", 'h'>("help (most used options)")
                  .template add_option<"help-full">("help (all options)")
                  .add(args.make_options_description())
                  .add(rule_params.make_options_description())
                  .add(query_params.make_options_description())
                  .add(log_params.make_options_description());

    po::positional_options_description positionals;
    positionals.add("command", 1).add("command-args", -1);

    po::variables_map vm = po2::parse_args_with_positionals(desc, positionals, ac, av);

    if (vm.count("help") || vm.count("help-full")) {
      po2::Settings::help_full = vm.count("help-full");
      print_usage(std::cout);
      std::cout << std::endl << desc << std::endl;
      return 0;
    }

    util::Logging::init(log_params);

    if (args.command == "splits") return run_splits(args, query_params);
    if (args.command == "make-rule-set") return run_make_rule_set(rule_params, query_params);
    if (args.command == "nimber") return run_nimber(rule_params, query_params);
    if (args.command == "moves") return run_moves(rule_params, query_params);

    print_usage(std::cerr);
    if (args.command.empty()) {
      throw util::CleanException("No command given");
    }
    throw util::CleanException("Unknown command \"{}\"", args.command);
  } catch (const util::CleanException& e) {
    std::cerr << "Caught a CleanException: ";
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}
