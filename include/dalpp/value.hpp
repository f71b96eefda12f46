// Copyright (c) 2024 liudegui. MIT License.
//
// dalpp::Value -- semantic value exchanged with accessors.
//
// Design:
//   - ValueType names the declared type of a parameter or column
//   - Value is a small tagged holder; text and blob bytes are owned
//   - A default-constructed Value is SQL NULL

#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace dalpp {

// ---------------------------------------------------------------------------
// ValueType
// ---------------------------------------------------------------------------

enum class ValueType : uint8_t {
  kNull = 0,
  kBool,
  kInt32,
  kInt64,
  kDouble,
  kText,
  kBlob,
};

inline const char* ValueTypeName(ValueType type) {
  switch (type) {
    case ValueType::kNull:   return "null";
    case ValueType::kBool:   return "bool";
    case ValueType::kInt32:  return "int32";
    case ValueType::kInt64:  return "int64";
    case ValueType::kDouble: return "double";
    case ValueType::kText:   return "text";
    case ValueType::kBlob:   return "blob";
  }
  return "unknown";
}

// ---------------------------------------------------------------------------
// Value
// ---------------------------------------------------------------------------

class Value {
 public:
  Value() = default;

  Value(bool v) : type_(ValueType::kBool), int_(v ? 1 : 0) {}  // NOLINT
  Value(int32_t v) : type_(ValueType::kInt32), int_(v) {}      // NOLINT
  Value(int64_t v) : type_(ValueType::kInt64), int_(v) {}      // NOLINT
  Value(double v) : type_(ValueType::kDouble), double_(v) {}   // NOLINT

  Value(const char* v)  // NOLINT
      : type_(v != nullptr ? ValueType::kText : ValueType::kNull) {
    if (v != nullptr) { bytes_ = v; }
  }

  Value(std::string v)  // NOLINT
      : type_(ValueType::kText), bytes_(std::move(v)) {}

  static Value Null() { return Value(); }

  static Value Blob(const uint8_t* data, size_t len) {
    Value v;
    v.type_ = ValueType::kBlob;
    if (data != nullptr && len > 0) {
      v.bytes_.assign(reinterpret_cast<const char*>(data), len);
    }
    return v;
  }

  static Value Blob(const std::vector<uint8_t>& data) {
    return Blob(data.data(), data.size());
  }

  ValueType type() const { return type_; }
  bool IsNull() const { return type_ == ValueType::kNull; }

  bool IsIntegral() const {
    return type_ == ValueType::kBool || type_ == ValueType::kInt32 ||
           type_ == ValueType::kInt64;
  }

  // Raw accessors. The caller checks type() first; numeric reads convert
  // between the integral and floating representations.
  bool AsBool() const { return AsInt64() != 0; }
  int32_t AsInt32() const { return static_cast<int32_t>(AsInt64()); }

  int64_t AsInt64() const {
    return (type_ == ValueType::kDouble) ? static_cast<int64_t>(double_)
                                         : int_;
  }

  double AsDouble() const {
    return (type_ == ValueType::kDouble) ? double_
                                         : static_cast<double>(int_);
  }

  const std::string& AsText() const { return bytes_; }

  const uint8_t* BlobData() const {
    return reinterpret_cast<const uint8_t*>(bytes_.data());
  }
  size_t BlobSize() const { return bytes_.size(); }

  std::vector<uint8_t> AsBlob() const {
    return std::vector<uint8_t>(BlobData(), BlobData() + bytes_.size());
  }

  bool operator==(const Value& other) const {
    if (type_ != other.type_) { return false; }
    switch (type_) {
      case ValueType::kNull:   return true;
      case ValueType::kDouble: return double_ == other.double_;
      case ValueType::kText:
      case ValueType::kBlob:   return bytes_ == other.bytes_;
      default:                 return int_ == other.int_;
    }
  }
  bool operator!=(const Value& other) const { return !(*this == other); }

 private:
  ValueType type_ = ValueType::kNull;
  int64_t int_ = 0;
  double double_ = 0.0;
  std::string bytes_;
};

}  // namespace dalpp
