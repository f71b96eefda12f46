// Copyright (c) 2024 liudegui. MIT License.
//
// dalpp::Query -- engine independent query definition.
// dalpp::QueryDescriptor -- the query resolved for one live database.
//
// Design:
//   - Query is immutable and cheap to copy (shared definition node)
//   - Text may vary by database type and version; the first matching
//     variant wins, in registration order, else the default
//   - Parameter, column and key types are declared, never inferred
//   - Fragments compose with Concat()/Format(); the combined text is scanned
//     once so placeholder indices are global
//   - Scan errors surface when the Query is built, not at execution
//
// Usage:
//   dalpp::Error err;
//   auto q = dalpp::QueryBuilder()
//       .ForVersion("sqlite", dalpp::VersionPredicate::AtLeast({3, 35}),
//                   "DELETE FROM emp WHERE empno = :no RETURNING empname")
//       .ForDefault("DELETE FROM emp WHERE empno = :no")
//       .Parameter("no", dalpp::ValueType::kInt64)
//       .Build(&err);

#pragma once

#include <algorithm>
#include <cstdint>
#include <map>
#include <memory>
#include <regex>
#include <string>
#include <utility>
#include <vector>

#include "dalpp/error.hpp"
#include "dalpp/names.hpp"
#include "dalpp/parameter_scanner.hpp"
#include "dalpp/value.hpp"

namespace dalpp {

using TypeMap = std::map<std::string, ValueType>;

/// Engine type identifier and version string reported by a connection.
struct DatabaseInfo {
  std::string type;
  std::string version;
};

// ---------------------------------------------------------------------------
// VersionPredicate
// ---------------------------------------------------------------------------

class VersionPredicate {
 public:
  /// Matches every version.
  static VersionPredicate Any() { return VersionPredicate(); }

  /// Regular expression searched for in the raw version string.
  static VersionPredicate Matching(const char* pattern) {
    VersionPredicate p;
    p.kind_ = Kind::kPattern;
    p.pattern_ = (pattern != nullptr) ? pattern : "";
    try {
      p.regex_ = std::make_shared<std::regex>(p.pattern_);
    } catch (const std::regex_error& e) {
      p.regex_.reset();
      p.invalid_reason_ = e.what();
    }
    return p;
  }

  /// Version split on '.'; each component, in order, must be >= the
  /// corresponding required component. A non-numeric component fails. A
  /// shorter version is compared on the components it has ("2" >= 2.0).
  static VersionPredicate AtLeast(std::vector<int32_t> minimum) {
    VersionPredicate p;
    p.kind_ = Kind::kMinimum;
    p.minimum_ = std::move(minimum);
    return p;
  }

  bool Valid() const { return kind_ != Kind::kPattern || regex_ != nullptr; }
  const std::string& InvalidReason() const { return invalid_reason_; }
  const std::string& Pattern() const { return pattern_; }

  bool Matches(const std::string& version) const {
    switch (kind_) {
      case Kind::kAny:
        return true;
      case Kind::kPattern:
        return regex_ != nullptr && std::regex_search(version, *regex_);
      case Kind::kMinimum:
        return MatchesMinimum(version);
    }
    return false;
  }

 private:
  enum class Kind : uint8_t { kAny, kPattern, kMinimum };

  VersionPredicate() = default;

  bool MatchesMinimum(const std::string& version) const {
    size_t pos = 0;
    for (int32_t required : minimum_) {
      if (pos > version.size()) { break; }
      size_t dot = version.find('.', pos);
      std::string part = version.substr(
          pos, (dot == std::string::npos) ? std::string::npos : dot - pos);
      int64_t number = 0;
      if (!ParseComponent(part, &number)) { return false; }
      if (number < required) { return false; }
      pos = (dot == std::string::npos) ? version.size() + 1 : dot + 1;
    }
    return true;
  }

  static bool ParseComponent(const std::string& part, int64_t* out) {
    if (part.empty() || part.size() > 18) { return false; }
    int64_t value = 0;
    for (char c : part) {
      if (c < '0' || c > '9') { return false; }
      value = value * 10 + (c - '0');
    }
    *out = value;
    return true;
  }

  Kind kind_ = Kind::kAny;
  std::string pattern_;
  std::shared_ptr<std::regex> regex_;
  std::string invalid_reason_;
  std::vector<int32_t> minimum_;
};

// ---------------------------------------------------------------------------
// QueryDeclarations
// ---------------------------------------------------------------------------

/// Declared names and types of a query. All names are lower-cased.
/// A list parameter `ids` of size N declares ListElementName("ids", i) for
/// each i in `parameters` and records N in `list_sizes`.
struct QueryDeclarations {
  TypeMap parameters;
  ListSizes list_sizes;
  TypeMap columns;
  TypeMap keys;

  /// Fold `other` into this. The same name with two different types (or
  /// list sizes) is a kTypeConflict.
  Error Merge(const QueryDeclarations& other) {
    Error err = MergeTypes(other.parameters, "parameter", &parameters);
    if (!err.ok()) { return err; }
    for (const auto& kv : other.list_sizes) {
      auto it = list_sizes.find(kv.first);
      if (it != list_sizes.end() && it->second != kv.second) {
        return Error::Format(ErrorCode::kTypeConflict,
                             "Multiple different sizes are defined for list "
                             "parameter %s: %d, %d",
                             kv.first.c_str(), it->second, kv.second);
      }
      list_sizes[kv.first] = kv.second;
    }
    err = MergeTypes(other.columns, "column", &columns);
    if (!err.ok()) { return err; }
    return MergeTypes(other.keys, "key", &keys);
  }

 private:
  static Error MergeTypes(const TypeMap& from, const char* what, TypeMap* into) {
    for (const auto& kv : from) {
      auto it = into->find(kv.first);
      if (it != into->end() && it->second != kv.second) {
        return Error::Format(ErrorCode::kTypeConflict,
                             "Multiple different types are defined for %s "
                             "with name %s: %s, %s",
                             what, kv.first.c_str(),
                             ValueTypeName(it->second),
                             ValueTypeName(kv.second));
      }
      (*into)[kv.first] = kv.second;
    }
    return Error::Ok();
  }
};

// ---------------------------------------------------------------------------
// QueryDescriptor
// ---------------------------------------------------------------------------

class QueryDescriptor {
 public:
  QueryDescriptor() = default;

  /// Scan `sql` and combine it with the declarations.
  static Error Create(const std::string& sql, const QueryDeclarations& decls,
                      QueryDescriptor* out) {
    if (out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "descriptor is null");
    }
    ScanResult scan;
    Error err = ScanParameters(sql, decls.list_sizes, &scan);
    if (!err.ok()) { return err; }

    QueryDescriptor d;
    d.sql_ = std::move(scan.sql);
    d.placeholder_count_ = scan.placeholder_count;
    for (auto& kv : scan.indices) {
      std::vector<int32_t>& slots = d.parameter_indices_[ToLower(kv.first)];
      slots.insert(slots.end(), kv.second.begin(), kv.second.end());
    }
    for (auto& kv : d.parameter_indices_) {
      std::sort(kv.second.begin(), kv.second.end());
    }
    d.decls_ = decls;
    *out = std::move(d);
    return Error::Ok();
  }

  const std::string& Sql() const { return sql_; }
  int32_t PlaceholderCount() const { return placeholder_count_; }
  const TypeMap& Parameters() const { return decls_.parameters; }
  const ListSizes& ListParameterSizes() const { return decls_.list_sizes; }
  const TypeMap& Columns() const { return decls_.columns; }
  const TypeMap& Keys() const { return decls_.keys; }

  /// Positional slots of a (lower-cased) parameter name, or nullptr when the
  /// name does not occur in the text.
  const std::vector<int32_t>* IndicesOf(const std::string& name) const {
    auto it = parameter_indices_.find(name);
    return (it != parameter_indices_.end()) ? &it->second : nullptr;
  }

 private:
  std::string sql_;
  int32_t placeholder_count_ = 0;
  ParameterIndices parameter_indices_;
  QueryDeclarations decls_;
};

// ---------------------------------------------------------------------------
// Query
// ---------------------------------------------------------------------------

class Query;

namespace detail {

struct QueryVariant {
  std::string type;
  VersionPredicate version;
  std::string sql;
};

struct QueryNode {
  enum class Kind : uint8_t { kText, kConcat, kFormat };

  Kind kind = Kind::kText;
  std::vector<QueryVariant> variants;
  std::string default_sql;
  bool has_default = false;
  // kConcat: all parts in order. kFormat: parts[0] is the format.
  std::vector<std::shared_ptr<const QueryNode>> parts;
  QueryDeclarations decls;

  Error Text(const DatabaseInfo& info, std::string* out) const {
    switch (kind) {
      case Kind::kText:
        return SelectText(info, out);
      case Kind::kConcat: {
        out->clear();
        for (const auto& part : parts) {
          std::string piece;
          Error err = part->Text(info, &piece);
          if (!err.ok()) { return err; }
          out->append(piece);
        }
        return Error::Ok();
      }
      case Kind::kFormat:
        return FormatText(info, out);
    }
    return Error::Make(ErrorCode::kMisuse, "unknown query node");
  }

 private:
  Error SelectText(const DatabaseInfo& info, std::string* out) const {
    for (const auto& v : variants) {
      if (v.type == info.type && v.version.Matches(info.version)) {
        *out = v.sql;
        return Error::Ok();
      }
    }
    if (has_default) {
      *out = default_sql;
      return Error::Ok();
    }
    return Error::Format(ErrorCode::kNoVariant,
                         "No applicable query variant found for database "
                         "%s %s", info.type.c_str(), info.version.c_str());
  }

  Error FormatText(const DatabaseInfo& info, std::string* out) const {
    std::string format;
    Error err = parts[0]->Text(info, &format);
    if (!err.ok()) { return err; }

    out->clear();
    size_t next_arg = 1;
    for (size_t i = 0; i < format.size(); ++i) {
      if (format[i] != '%' || i + 1 >= format.size()) {
        out->push_back(format[i]);
        continue;
      }
      char conv = format[i + 1];
      if (conv == '%') {
        out->push_back('%');
        ++i;
      } else if (conv == 's') {
        if (next_arg >= parts.size()) {
          return Error::Make(ErrorCode::kMisuse,
                             "Format query has more %s than arguments");
        }
        std::string arg;
        err = parts[next_arg++]->Text(info, &arg);
        if (!err.ok()) { return err; }
        out->append(arg);
        ++i;
      } else {
        out->push_back('%');
      }
    }
    return Error::Ok();
  }
};

}  // namespace detail

class Query {
 public:
  Query() = default;

  /// Same SQL for every database, no declared parameters or columns.
  static Query Of(const char* sql, Error* out_error = nullptr) {
    return Of(sql, TypeMap(), TypeMap(), out_error);
  }

  static Query Of(const char* sql, const TypeMap& parameters,
                  const TypeMap& columns, Error* out_error = nullptr);

  /// Concatenate fragments, merging their declarations.
  static Query Concat(const std::vector<Query>& parts,
                      Error* out_error = nullptr) {
    return Compose(detail::QueryNode::Kind::kConcat, parts, out_error);
  }

  /// Substitute each "%s" in `format` with the next argument's text.
  static Query Format(const Query& format, const std::vector<Query>& args,
                      Error* out_error = nullptr) {
    std::vector<Query> parts;
    parts.reserve(args.size() + 1);
    parts.push_back(format);
    parts.insert(parts.end(), args.begin(), args.end());
    return Compose(detail::QueryNode::Kind::kFormat, parts, out_error);
  }

  bool Valid() const { return node_ != nullptr; }

  const QueryDeclarations& Declarations() const {
    static const QueryDeclarations kEmpty;
    return node_ ? node_->decls : kEmpty;
  }

  /// Select the text for `info` and scan it into a descriptor.
  Error Resolve(const DatabaseInfo& info, QueryDescriptor* out) const {
    if (node_ == nullptr) {
      return Error::Make(ErrorCode::kMisuse, "Query not initialized");
    }
    std::string sql;
    Error err = node_->Text(info, &sql);
    if (!err.ok()) { return err; }
    return QueryDescriptor::Create(sql, node_->decls, out);
  }

 private:
  friend class QueryBuilder;

  explicit Query(std::shared_ptr<const detail::QueryNode> node)
      : node_(std::move(node)) {}

  static Query Compose(detail::QueryNode::Kind kind,
                       const std::vector<Query>& parts, Error* out_error) {
    auto node = std::make_shared<detail::QueryNode>();
    node->kind = kind;
    for (const Query& part : parts) {
      if (!part.Valid()) {
        Report(Error::Make(ErrorCode::kMisuse, "Query fragment not initialized"),
               out_error);
        return Query();
      }
      Error err = node->decls.Merge(part.node_->decls);
      if (!err.ok()) {
        Report(err, out_error);
        return Query();
      }
      node->parts.push_back(part.node_);
    }
    if (kind == detail::QueryNode::Kind::kFormat && node->parts.empty()) {
      Report(Error::Make(ErrorCode::kMisuse, "Format query missing"), out_error);
      return Query();
    }
    Report(Error::Ok(), out_error);
    return Query(std::move(node));
  }

  std::shared_ptr<const detail::QueryNode> node_;
};

// ---------------------------------------------------------------------------
// QueryBuilder
// ---------------------------------------------------------------------------

class QueryBuilder {
 public:
  QueryBuilder() = default;

  /// Text used when the database reports `type`.
  QueryBuilder& ForType(const char* type, const char* sql) {
    return ForVersion(type, VersionPredicate::Any(), sql);
  }

  /// Text used when the database reports `type` and its version matches.
  QueryBuilder& ForVersion(const char* type, VersionPredicate version,
                           const char* sql) {
    if (type == nullptr || sql == nullptr) {
      Fail(Error::Make(ErrorCode::kNullParam, "type or sql is null"));
      return *this;
    }
    if (!version.Valid()) {
      Fail(Error::Format(ErrorCode::kParse, "Invalid version pattern '%s': %s",
                         version.Pattern().c_str(),
                         version.InvalidReason().c_str()));
      return *this;
    }
    node_.variants.push_back(detail::QueryVariant{type, std::move(version), sql});
    return *this;
  }

  /// Fallback text when no variant matches.
  QueryBuilder& ForDefault(const char* sql) {
    if (sql == nullptr) {
      Fail(Error::Make(ErrorCode::kNullParam, "sql is null"));
      return *this;
    }
    node_.default_sql = sql;
    node_.has_default = true;
    return *this;
  }

  QueryBuilder& Parameter(const char* name, ValueType type) {
    return Declare(&decls_.parameters, "parameter", name, type);
  }

  /// `:name` in the text expands to `size` placeholders bound from a list.
  QueryBuilder& ParameterList(const char* name, ValueType type, int32_t size) {
    if (name == nullptr || size <= 0) {
      Fail(Error::Make(ErrorCode::kRange, "list parameter needs a name and size > 0"));
      return *this;
    }
    QueryDeclarations list;
    std::string base = ToLower(name);
    list.list_sizes[base] = size;
    for (int32_t i = 0; i < size; ++i) {
      list.parameters[ListElementName(base, i)] = type;
    }
    if (decls_.parameters.count(base) != 0) {
      Fail(Error::Format(ErrorCode::kTypeConflict,
                         "%s is declared both as parameter and list", name));
      return *this;
    }
    Error err = decls_.Merge(list);
    if (!err.ok()) { Fail(err); }
    return *this;
  }

  QueryBuilder& Column(const char* name, ValueType type) {
    return Declare(&decls_.columns, "column", name, type);
  }

  /// Generated key returned by Statement::Insert().
  QueryBuilder& Key(const char* name, ValueType type) {
    return Declare(&decls_.keys, "key", name, type);
  }

  /// Build the query. Every variant text is scanned here so malformed
  /// parameters are reported now rather than at execution.
  Query Build(Error* out_error = nullptr) const {
    if (!error_.ok()) {
      Report(error_, out_error);
      return Query();
    }
    if (node_.variants.empty() && !node_.has_default) {
      Report(Error::Make(ErrorCode::kNoVariant, "Query has no text"), out_error);
      return Query();
    }

    ScanResult scan;
    for (const auto& v : node_.variants) {
      Error err = ScanParameters(v.sql, decls_.list_sizes, &scan);
      if (!err.ok()) {
        Report(err, out_error);
        return Query();
      }
    }
    if (node_.has_default) {
      Error err = ScanParameters(node_.default_sql, decls_.list_sizes, &scan);
      if (!err.ok()) {
        Report(err, out_error);
        return Query();
      }
    }

    auto node = std::make_shared<detail::QueryNode>(node_);
    node->decls = decls_;
    Report(Error::Ok(), out_error);
    return Query(std::move(node));
  }

 private:
  QueryBuilder& Declare(TypeMap* map, const char* what, const char* name,
                        ValueType type) {
    if (name == nullptr) {
      Fail(Error::Make(ErrorCode::kNullParam, "name is null"));
      return *this;
    }
    std::string key = ToLower(name);
    auto it = map->find(key);
    if (it != map->end() && it->second != type) {
      Fail(Error::Format(ErrorCode::kTypeConflict,
                         "Multiple different types are defined for %s with "
                         "name %s: %s, %s",
                         what, name, ValueTypeName(it->second),
                         ValueTypeName(type)));
      return *this;
    }
    if (map == &decls_.parameters && decls_.list_sizes.count(key) != 0) {
      Fail(Error::Format(ErrorCode::kTypeConflict,
                         "%s is declared both as parameter and list", name));
      return *this;
    }
    (*map)[key] = type;
    return *this;
  }

  void Fail(const Error& err) {
    if (error_.ok()) { error_ = err; }
  }

  detail::QueryNode node_;
  QueryDeclarations decls_;
  Error error_;
};

inline Query Query::Of(const char* sql, const TypeMap& parameters,
                       const TypeMap& columns, Error* out_error) {
  if (sql == nullptr) {
    Report(Error::Make(ErrorCode::kNullParam, "sql is null"), out_error);
    return Query();
  }
  QueryBuilder builder;
  builder.ForDefault(sql);
  for (const auto& kv : parameters) {
    builder.Parameter(kv.first.c_str(), kv.second);
  }
  for (const auto& kv : columns) {
    builder.Column(kv.first.c_str(), kv.second);
  }
  return builder.Build(out_error);
}

}  // namespace dalpp
