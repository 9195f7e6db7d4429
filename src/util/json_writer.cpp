#include "util/json_writer.h"

#include <cmath>
#include <cstdio>
#include <iomanip>
#include <limits>

namespace notescribe {

JsonWriter& JsonWriter::begin_object() {
  append_separator();
  ss_ << "{";
  needs_comma_.push_back(false);
  return *this;
}

JsonWriter& JsonWriter::end_object() {
  ss_ << "}";
  needs_comma_.pop_back();
  mark_value();
  return *this;
}

JsonWriter& JsonWriter::begin_array() {
  append_separator();
  ss_ << "[";
  needs_comma_.push_back(false);
  return *this;
}

JsonWriter& JsonWriter::end_array() {
  ss_ << "]";
  needs_comma_.pop_back();
  mark_value();
  return *this;
}

JsonWriter& JsonWriter::key(const std::string& k) {
  append_separator();
  ss_ << "\"" << escape(k) << "\": ";
  if (!needs_comma_.empty()) needs_comma_.back() = false;
  return *this;
}

JsonWriter& JsonWriter::value(const std::string& v) {
  append_separator();
  ss_ << "\"" << escape(v) << "\"";
  mark_value();
  return *this;
}

JsonWriter& JsonWriter::value(int v) {
  append_separator();
  ss_ << v;
  mark_value();
  return *this;
}

JsonWriter& JsonWriter::value(size_t v) {
  append_separator();
  ss_ << v;
  mark_value();
  return *this;
}

JsonWriter& JsonWriter::value(double v) {
  append_separator();
  if (std::isfinite(v)) {
    ss_ << std::setprecision(std::numeric_limits<float>::max_digits10) << v;
  } else {
    ss_ << "null";
  }
  mark_value();
  return *this;
}

JsonWriter& JsonWriter::value(bool v) {
  append_separator();
  ss_ << (v ? "true" : "false");
  mark_value();
  return *this;
}

void JsonWriter::append_separator() {
  if (!needs_comma_.empty() && needs_comma_.back()) {
    ss_ << ", ";
  }
}

void JsonWriter::mark_value() {
  if (!needs_comma_.empty()) needs_comma_.back() = true;
}

std::string JsonWriter::escape(const std::string& s) {
  std::string result;
  result.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '"':
        result += "\\\"";
        break;
      case '\\':
        result += "\\\\";
        break;
      case '\n':
        result += "\\n";
        break;
      case '\r':
        result += "\\r";
        break;
      case '\t':
        result += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
          result += buf;
        } else {
          result += c;
        }
    }
  }
  return result;
}

}  // namespace notescribe
