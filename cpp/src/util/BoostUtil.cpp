#include "util/BoostUtil.hpp"

#include "util/Exceptions.hpp"

// Boost.JSON is built header-only; this must be included in exactly one translation unit.
#include <boost/json/src.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace boost_util {

// The code below was adapted from:
// https://www.boost.org/doc/libs/1_76_0/libs/json/doc/html/json/examples.html
void pretty_print(std::ostream& os, boost::json::value const& jv, std::string* indent) {
  std::string indent_;
  if (!indent) indent = &indent_;
  switch (jv.kind()) {
    case boost::json::kind::object: {
      auto const& obj = jv.get_object();
      if (obj.empty()) {
        os << "{}";
        break;
      }

      // Collect iterators, sort by key
      std::vector<boost::json::object::const_iterator> its;
      its.reserve(obj.size());
      for (auto it = obj.begin(); it != obj.end(); ++it) its.push_back(it);

      std::sort(its.begin(), its.end(), [](auto a, auto b) { return a->key() < b->key(); });

      os << "{\n";
      indent->append(2, ' ');
      for (std::size_t i = 0; i < its.size(); ++i) {
        auto it = its[i];
        os << *indent << boost::json::serialize(it->key()) << ": ";
        pretty_print(os, it->value(), indent);
        if (i + 1 != its.size()) os << ",\n";
      }
      os << "\n";
      indent->resize(indent->size() - 2);
      os << *indent << "}";
      break;
    }

    case boost::json::kind::array: {
      auto const& arr = jv.get_array();
      if (arr.empty()) {
        os << "[]";
        break;
      }

      auto it = arr.begin();
      bool is_simple_array = std::all_of(arr.begin(), arr.end(), [](const auto& elem) {
        return elem.kind() != boost::json::kind::object && elem.kind() != boost::json::kind::array;
      });

      // print without newlines if the array contains only simple elements
      if (is_simple_array) {
        os << "[";

        while (true) {
          pretty_print(os, *it, indent);
          if (++it == arr.end()) break;
          os << ", ";
        }
        os << "]";
      } else {
        os << "[\n";
        indent->append(2, ' ');

        while (true) {
          os << *indent;
          pretty_print(os, *it, indent);
          if (++it == arr.end()) break;
          os << ",\n";
        }
        os << "\n";
        indent->resize(indent->size() - 2);
        os << *indent << "]";
      }
      break;
    }

    case boost::json::kind::string: {
      os << boost::json::serialize(jv.get_string());
      break;
    }

    case boost::json::kind::uint64:
      os << jv.get_uint64();
      break;

    case boost::json::kind::int64:
      os << jv.get_int64();
      break;

    case boost::json::kind::double_: {
      auto x = jv.get_double();
      if (x == 0) {  // IEEE 754 standard is weird, 0 can be printed as -0
        os << "0";
      } else {
        os << x;
      }
      break;
    }

    case boost::json::kind::bool_:
      if (jv.get_bool())
        os << "true";
      else
        os << "false";
      break;

    case boost::json::kind::null:
      os << "null";
      break;
  }
}

boost::json::value read_json_file(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw util::CleanException("Unable to open file: {}", path);
  }

  std::ostringstream ss;
  ss << file.rdbuf();

  boost::json::error_code ec;
  boost::json::value jv = boost::json::parse(ss.str(), ec);
  if (ec) {
    throw util::CleanException("Failed to parse json file {}: {}", path, ec.message());
  }
  return jv;
}

}  // namespace boost_util
