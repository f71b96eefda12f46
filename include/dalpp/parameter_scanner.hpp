// Copyright (c) 2024 liudegui. MIT License.
//
// dalpp::ScanParameters -- named parameter scanner.
//
// Design:
//   - Single left-to-right pass, lexical only (never validates SQL)
//   - `:name` tokens become `?` placeholders, indexed from 0 in text order
//   - Line comments, quoted strings and quoted identifiers are copied
//     verbatim; no parameters are recognized inside them
//   - A literal `?` outside those ranges is rejected
//
// Example:
//   SELECT * FROM t WHERE name = :name AND (a = :x OR b = :x)
//   => SELECT * FROM t WHERE name = ? AND (a = ? OR b = ?)
//      {name: [0], x: [1, 2]}

#pragma once

#include <cstdint>
#include <cstring>
#include <map>
#include <string>
#include <vector>

#include "dalpp/error.hpp"
#include "dalpp/names.hpp"

namespace dalpp {

using ParameterIndices = std::map<std::string, std::vector<int32_t>>;
using ListSizes = std::map<std::string, int32_t>;

/// Name of the i-th element of list parameter `name`.
inline std::string ListElementName(const std::string& name, int32_t i) {
  return name + "[" + std::to_string(i) + "]";
}

struct ScanResult {
  std::string sql;
  ParameterIndices indices;
  int32_t placeholder_count = 0;
};

namespace detail {

// ---------------------------------------------------------------------------
// EscapedRange
// ---------------------------------------------------------------------------

// Region in which parameters are not parsed. Escapes inside the region need
// no handling because SQL escapes by doubling the end token: 'it''s' scans
// as two adjacent ranges and is copied unchanged.
struct EscapedRange {
  const char* start;
  const char* end;
};

// Tried in this order at every position outside a range.
static constexpr EscapedRange kEscapedRanges[] = {
    {"--", "\n"},
    {"'", "'"},
    {"\"", "\""},
    {"[", "]"},
    {"`", "`"},
};

static constexpr int32_t kNoRange = -1;

inline bool MatchesAt(const std::string& text, size_t pos, const char* token) {
  size_t len = std::strlen(token);
  return pos + len <= text.size() && text.compare(pos, len, token) == 0;
}

inline bool IsIdentifierStart(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

inline bool IsIdentifierPart(char c) {
  return IsIdentifierStart(c) || (c >= '0' && c <= '9');
}

}  // namespace detail

// ---------------------------------------------------------------------------
// ScanParameters
// ---------------------------------------------------------------------------

/// Rewrite named parameters in `text` into positional placeholders.
/// A name listed in `list_sizes` (lower-cased keys) expands to that many
/// comma-separated placeholders, recorded under ListElementName(name, i).
/// Scan errors are reported as ErrorCode::kParse.
inline Error ScanParameters(const std::string& text,
                            const ListSizes& list_sizes, ScanResult* out) {
  if (out == nullptr) {
    return Error::Make(ErrorCode::kNullParam, "scan result is null");
  }
  out->sql.clear();
  out->indices.clear();
  out->placeholder_count = 0;
  out->sql.reserve(text.size());

  int32_t open_range = detail::kNoRange;
  size_t i = 0;
  const size_t len = text.size();

  while (i < len) {
    if (open_range != detail::kNoRange) {
      const char* end = detail::kEscapedRanges[open_range].end;
      if (detail::MatchesAt(text, i, end)) {
        out->sql.append(end);
        i += std::strlen(end);
        open_range = detail::kNoRange;
      } else {
        out->sql.push_back(text[i]);
        ++i;
      }
      continue;
    }

    bool entered = false;
    for (int32_t r = 0; r < static_cast<int32_t>(
                                sizeof(detail::kEscapedRanges) /
                                sizeof(detail::kEscapedRanges[0]));
         ++r) {
      const char* start = detail::kEscapedRanges[r].start;
      if (detail::MatchesAt(text, i, start)) {
        out->sql.append(start);
        i += std::strlen(start);
        open_range = r;
        entered = true;
        break;
      }
    }
    if (entered) { continue; }

    char c = text[i];

    if (c == '?') {
      return Error::Format(ErrorCode::kParse,
                           "Illegal character '?' at position %zu. "
                           "Only named parameters are allowed.", i);
    }

    if (c != ':') {
      out->sql.push_back(c);
      ++i;
      continue;
    }

    ++i;
    if (i == len) {
      return Error::Make(ErrorCode::kParse, "Empty parameter at query end.");
    }
    if (!detail::IsIdentifierStart(text[i])) {
      return Error::Format(ErrorCode::kParse,
                           "Character '%c' is not a valid parameter start "
                           "(character position %zu).", text[i], i);
    }

    size_t name_start = i;
    ++i;
    while (i < len && detail::IsIdentifierPart(text[i])) { ++i; }
    std::string name = text.substr(name_start, i - name_start);

    auto list = list_sizes.find(ToLower(name));
    if (list == list_sizes.end()) {
      out->indices[name].push_back(out->placeholder_count++);
      out->sql.push_back('?');
      continue;
    }

    for (int32_t k = 0; k < list->second; ++k) {
      if (k > 0) { out->sql.append(", "); }
      out->indices[ListElementName(list->first, k)].push_back(
          out->placeholder_count++);
      out->sql.push_back('?');
    }
  }

  return Error::Ok();
}

inline Error ScanParameters(const std::string& text, ScanResult* out) {
  return ScanParameters(text, ListSizes(), out);
}

}  // namespace dalpp
