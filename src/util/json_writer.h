#pragma once

/// @file json_writer.h
/// @brief Minimal streaming JSON writer.

#include <cstddef>
#include <sstream>
#include <string>
#include <vector>

namespace notescribe {

/// @brief Fluent JSON writer.
/// @details Tracks comma placement per nesting level. Keys and strings are escaped;
/// non-finite numbers are written as null.
class JsonWriter {
 public:
  JsonWriter& begin_object();
  JsonWriter& end_object();
  JsonWriter& begin_array();
  JsonWriter& end_array();

  JsonWriter& key(const std::string& k);

  JsonWriter& value(const std::string& v);
  JsonWriter& value(const char* v) { return value(std::string(v)); }
  JsonWriter& value(int v);
  JsonWriter& value(size_t v);
  JsonWriter& value(float v) { return value(static_cast<double>(v)); }
  JsonWriter& value(double v);
  JsonWriter& value(bool v);

  // Convenience: key-value pairs
  JsonWriter& kv(const std::string& k, const std::string& v) { return key(k).value(v); }
  JsonWriter& kv(const std::string& k, const char* v) { return key(k).value(v); }
  JsonWriter& kv(const std::string& k, int v) { return key(k).value(v); }
  JsonWriter& kv(const std::string& k, size_t v) { return key(k).value(v); }
  JsonWriter& kv(const std::string& k, float v) { return key(k).value(v); }
  JsonWriter& kv(const std::string& k, double v) { return key(k).value(v); }
  JsonWriter& kv(const std::string& k, bool v) { return key(k).value(v); }

  /// @brief Returns the document written so far.
  std::string str() const { return ss_.str(); }

  /// @brief Escapes a string for use inside JSON quotes.
  static std::string escape(const std::string& s);

 private:
  void append_separator();
  void mark_value();

  std::ostringstream ss_;
  std::vector<bool> needs_comma_;
};

}  // namespace notescribe
