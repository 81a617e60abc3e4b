#include "content.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>
#include <vector>

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace activity::util {

namespace {

void AppendEscaped(std::string& out, const std::string& s) {
  out.push_back('"');
  for (unsigned char c : s) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      case '\b':
        out += "\\b";
        break;
      case '\f':
        out += "\\f";
        break;
      default:
        if (c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", c);
          out += buf;
        } else {
          out.push_back(static_cast<char>(c));
        }
    }
  }
  out.push_back('"');
}

void AppendNumber(std::string& out, double v) {
  if (!std::isfinite(v)) {
    out += "null";
    return;
  }

  char buf[32];
  if (std::floor(v) == v && std::fabs(v) < 9007199254740992.0) {
    std::snprintf(buf, sizeof(buf), "%.0f", v);
  } else {
    std::snprintf(buf, sizeof(buf), "%.17g", v);
  }
  out += buf;
}

void AppendStruct(std::string& out, const google::protobuf::Struct& s);

void AppendValue(std::string& out, const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kNullValue:
    case google::protobuf::Value::KIND_NOT_SET:
      out += "null";
      break;
    case google::protobuf::Value::kNumberValue:
      AppendNumber(out, value.number_value());
      break;
    case google::protobuf::Value::kStringValue:
      AppendEscaped(out, value.string_value());
      break;
    case google::protobuf::Value::kBoolValue:
      out += value.bool_value() ? "true" : "false";
      break;
    case google::protobuf::Value::kStructValue:
      AppendStruct(out, value.struct_value());
      break;
    case google::protobuf::Value::kListValue: {
      out.push_back('[');
      bool first = true;
      for (const auto& item : value.list_value().values()) {
        if (!first) out.push_back(',');
        first = false;
        AppendValue(out, item);
      }
      out.push_back(']');
      break;
    }
  }
}

void AppendStruct(std::string& out, const google::protobuf::Struct& s) {
  // protobuf map iteration order is unspecified
  std::vector<const std::string*> keys;
  keys.reserve(s.fields().size());
  for (const auto& [key, _] : s.fields()) {
    keys.push_back(&key);
  }
  std::sort(keys.begin(), keys.end(), [](const std::string* a, const std::string* b) { return *a < *b; });

  out.push_back('{');
  bool first = true;
  for (const auto* key : keys) {
    if (!first) out.push_back(',');
    first = false;
    AppendEscaped(out, *key);
    out.push_back(':');
    AppendValue(out, s.fields().at(*key));
  }
  out.push_back('}');
}

} // namespace

Content ParseContent(std::string_view json) {
  Content content;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(std::string(json), &content, options);
  if (!status.ok()) {
    throw InvalidArgument("content must be a JSON object: " + std::string(status.message()));
  }
  return content;
}

std::string CanonicalJson(const Content& content) {
  std::string out;
  AppendStruct(out, content);
  return out;
}

Content ShallowMerge(const Content& base, const Content& patch) {
  Content merged = base;
  for (const auto& [key, value] : patch.fields()) {
    (*merged.mutable_fields())[key] = value;
  }
  return merged;
}

} // namespace activity::util
