// Copyright (c) 2024 liudegui. MIT License.
//
// dalpp name helpers -- case folding and column name mapping.
//
// Parameter, column and key names are case-insensitive and stored
// lower-cased. Reported column names pass through a ColumnNameMapper so a
// snake_case column can be read by its camelCase spelling.

#pragma once

#include <functional>
#include <string>

namespace dalpp {

using ColumnNameMapper = std::function<std::string(const std::string&)>;

inline std::string ToLower(const std::string& s) {
  std::string out(s);
  for (char& c : out) {
    if (c >= 'A' && c <= 'Z') { c = static_cast<char>(c - 'A' + 'a'); }
  }
  return out;
}

/// first_name -> firstName. Leading and repeated underscores are dropped.
inline std::string SnakeToCamel(const std::string& name) {
  std::string out;
  out.reserve(name.size());
  bool upper_next = false;
  for (char c : name) {
    if (c == '_') {
      upper_next = !out.empty();
      continue;
    }
    if (upper_next && c >= 'a' && c <= 'z') {
      out.push_back(static_cast<char>(c - 'a' + 'A'));
    } else {
      out.push_back(c);
    }
    upper_next = false;
  }
  return out;
}

/// "my ""col""" -> my "col". Unquoted names are returned unchanged.
inline std::string UnquoteColumnName(const std::string& name) {
  if (name.size() < 2 || name.front() != '"' || name.back() != '"') {
    return name;
  }
  std::string out;
  out.reserve(name.size() - 2);
  for (size_t i = 1; i + 1 < name.size(); ++i) {
    out.push_back(name[i]);
    if (name[i] == '"' && i + 2 < name.size() && name[i + 1] == '"') {
      ++i;
    }
  }
  return out;
}

inline ColumnNameMapper DefaultColumnNameMapper() {
  return [](const std::string& name) { return SnakeToCamel(name); };
}

}  // namespace dalpp
