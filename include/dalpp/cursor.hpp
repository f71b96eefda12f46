// Copyright (c) 2024 liudegui. MIT License.
//
// dalpp::Cursor<Backend> -- named, typed access to result rows.
//
// Design:
//   - Move-only RAII handle; closing is idempotent
//   - Starts before the first row: call Next() (or Seek()) before Get()
//   - Seek() moves relative to the current row; moving past either end
//     returns false and closes the cursor
//   - Columns are looked up case-insensitively by the reported name or by
//     its mapped spelling (first_name or firstName)
//   - Rows are fetched lazily and kept, so Previous() works on every backend
//
// Usage:
//   auto cursor = stmt.Query(&err);
//   while (cursor.Next()) {
//     std::string name = cursor.GetString("empname");
//   }

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "dalpp/error.hpp"
#include "dalpp/names.hpp"
#include "dalpp/session.hpp"
#include "dalpp/value.hpp"

namespace dalpp {

template <typename Backend> class Statement;
template <typename Backend> class Database;

namespace detail {

/// Map reported columns to accessors for the declared column types.
/// Both the raw (unquoted, lower-cased) and the mapped spelling resolve to
/// the same column. Undeclared columns are not exposed.
template <typename Backend>
Error BuildColumns(typename Backend::Handle handle, const TypeMap& declared,
                   const Options<Backend>& options, CursorState<Backend>* out) {
  int32_t n = Backend::ColumnCount(handle);
  for (int32_t i = 0; i < n; ++i) {
    std::string raw = UnquoteColumnName(Backend::ColumnName(handle, i));
    std::string mapped = options.column_name_mapper
                             ? ToLower(options.column_name_mapper(raw))
                             : ToLower(raw);
    const std::string candidates[2] = {ToLower(raw), mapped};

    for (const std::string& name : candidates) {
      auto type = declared.find(name);
      if (type == declared.end()) { continue; }

      const Accessor<Backend>* accessor = options.accessors.Find(type->second);
      if (accessor == nullptr) {
        return Error::Format(ErrorCode::kNoAccessor,
                             "No accessor is defined for type %s (column %s)",
                             ValueTypeName(type->second), raw.c_str());
      }
      typename CursorState<Backend>::Column column;
      column.accessor = *accessor;
      column.index = i;
      out->columns[candidates[0]] = column;
      out->columns[mapped] = column;
      break;
    }
  }
  return Error::Ok();
}

}  // namespace detail

// ---------------------------------------------------------------------------
// Cursor
// ---------------------------------------------------------------------------

template <typename Backend>
class Cursor {
 public:
  Cursor() = default;

  ~Cursor() { Release(); }

  // Move
  Cursor(Cursor&& other) noexcept : state_(std::move(other.state_)) {}

  Cursor& operator=(Cursor&& other) noexcept {
    if (this != &other) {
      Release();
      state_ = std::move(other.state_);
    }
    return *this;
  }

  // No copy
  Cursor(const Cursor&) = delete;
  Cursor& operator=(const Cursor&) = delete;

  // --- Navigation ---

  /// Move `rows` relative to the current row. Returns false, and closes the
  /// cursor, when the destination is outside the result.
  bool Seek(int64_t rows, Error* out_error = nullptr) {
    if (!Valid()) {
      Report(Error::Make(ErrorCode::kClosed, "Cursor is closed"), out_error);
      return false;
    }
    detail::CursorState<Backend>& s = *state_;
    if ((rows > 0 && s.position > INT64_MAX - rows) ||
        (rows < 0 && s.position < INT64_MIN - rows)) {
      Report(Error::Ok(), out_error);
      Close();
      return false;
    }
    int64_t target = s.position + rows;
    if (target < 0) {
      Report(Error::Ok(), out_error);
      Close();
      return false;
    }
    Error err = s.FetchUntil(target);
    if (!err.ok()) {
      Report(err, out_error);
      Close();
      return false;
    }
    if (target >= static_cast<int64_t>(s.rows.size())) {
      Report(Error::Ok(), out_error);
      Close();
      return false;
    }
    s.position = target;
    Report(Error::Ok(), out_error);
    return true;
  }

  bool Next(Error* out_error = nullptr) { return Seek(1, out_error); }
  bool Previous(Error* out_error = nullptr) { return Seek(-1, out_error); }

  /// 0-based index of the current row, -1 before the first.
  int64_t Row() const { return Valid() ? state_->position : -1; }

  bool Valid() const { return state_ != nullptr && !state_->closed; }

  // --- Column values ---

  Value Get(const char* column, Error* out_error = nullptr) const {
    Value value;
    Report(Read(column, &value), out_error);
    return value;
  }

  bool HasColumn(const char* column) const {
    return Valid() && column != nullptr &&
           state_->columns.count(ToLower(column)) != 0;
  }

  // Typed readers. `null_value` is returned for SQL NULL and on error.

  bool GetBool(const char* column, bool null_value = false,
               Error* out_error = nullptr) const {
    Value v = Get(column, out_error);
    return v.IsNull() ? null_value : v.AsBool();
  }

  int32_t GetInt32(const char* column, int32_t null_value = 0,
                   Error* out_error = nullptr) const {
    Value v = Get(column, out_error);
    return v.IsNull() ? null_value : v.AsInt32();
  }

  int64_t GetInt64(const char* column, int64_t null_value = 0,
                   Error* out_error = nullptr) const {
    Value v = Get(column, out_error);
    return v.IsNull() ? null_value : v.AsInt64();
  }

  double GetDouble(const char* column, double null_value = 0.0,
                   Error* out_error = nullptr) const {
    Value v = Get(column, out_error);
    return v.IsNull() ? null_value : v.AsDouble();
  }

  std::string GetString(const char* column, const char* null_value = "",
                        Error* out_error = nullptr) const {
    Value v = Get(column, out_error);
    return v.IsNull() ? std::string(null_value) : v.AsText();
  }

  std::vector<uint8_t> GetBlob(const char* column,
                               Error* out_error = nullptr) const {
    return Get(column, out_error).AsBlob();
  }

  // --- Close ---

  /// Release the rows. No-op on a closed or empty cursor.
  Error Close() {
    if (state_ == nullptr) { return Error::Ok(); }
    std::shared_ptr<detail::CursorState<Backend>> s = std::move(state_);
    state_.reset();
    return s->Close();
  }

 private:
  void Release() {
    if (state_ == nullptr) { return; }
    std::shared_ptr<detail::DatabaseState<Backend>> db = state_->db;
    Error err = Close();
    if (!err.ok() && db) {
      db->log().Write(LogLevel::kWarn, "Cursor close failed: %s",
                      err.message);
    }
  }

  friend class Statement<Backend>;
  friend class Database<Backend>;

  explicit Cursor(std::shared_ptr<detail::CursorState<Backend>> state)
      : state_(std::move(state)) {}

  Error Read(const char* column, Value* out) const {
    if (!Valid()) { return Error::Make(ErrorCode::kClosed, "Cursor is closed"); }
    if (column == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "column is null");
    }
    const detail::CursorState<Backend>& s = *state_;
    if (s.position < 0) {
      return Error::Make(ErrorCode::kMisuse,
                         "Cursor is before the first row; call Next()");
    }
    auto it = s.columns.find(ToLower(column));
    if (it == s.columns.end()) {
      return Error::Format(ErrorCode::kNotFound,
                           "No column %s is declared in the query", column);
    }
    const auto& row = s.rows[static_cast<size_t>(s.position)];
    if (it->second.index >= static_cast<int32_t>(row.size())) {
      return Error::Format(ErrorCode::kRange, "Column %s out of range", column);
    }
    return it->second.accessor.get(row[static_cast<size_t>(it->second.index)],
                                   out);
  }

  std::shared_ptr<detail::CursorState<Backend>> state_;
};

}  // namespace dalpp
