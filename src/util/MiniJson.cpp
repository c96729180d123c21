// Repository: LumenSync
// Component: Minimal JSON Reader
// Purpose: Small recursive JSON parser for the config file and the TV's
//          ambilight / powerstate payloads.
// Copyright (c) 2026 LumenSync

#include "lumensync/util/MiniJson.hpp"

#include <cstdio>
#include <cstdlib>

namespace lumensync::util {

JsonValue JsonValue::Bool(bool b) {
  JsonValue v;
  v.type_ = Type::kBool;
  v.bool_ = b;
  return v;
}

JsonValue JsonValue::Number(double n) {
  JsonValue v;
  v.type_ = Type::kNumber;
  v.number_ = n;
  return v;
}

JsonValue JsonValue::String(std::string s) {
  JsonValue v;
  v.type_ = Type::kString;
  v.string_ = std::move(s);
  return v;
}

JsonValue JsonValue::MakeArray(Array items) {
  JsonValue v;
  v.type_ = Type::kArray;
  v.array_ = std::move(items);
  return v;
}

JsonValue JsonValue::MakeObject(Object members) {
  JsonValue v;
  v.type_ = Type::kObject;
  v.object_ = std::move(members);
  return v;
}

const char* JsonTypeToString(JsonValue::Type type) {
  switch (type) {
    case JsonValue::Type::kNull: return "null";
    case JsonValue::Type::kBool: return "bool";
    case JsonValue::Type::kNumber: return "number";
    case JsonValue::Type::kString: return "string";
    case JsonValue::Type::kArray: return "array";
    case JsonValue::Type::kObject: return "object";
  }
  return "unknown";
}

namespace {

[[noreturn]] void TypeMismatch(JsonValue::Type want, JsonValue::Type got) {
  throw std::logic_error(std::string("JsonValue: expected ") + JsonTypeToString(want) +
                         ", have " + JsonTypeToString(got));
}

}  // namespace

bool JsonValue::AsBool() const {
  if (type_ != Type::kBool) TypeMismatch(Type::kBool, type_);
  return bool_;
}

double JsonValue::AsNumber() const {
  if (type_ != Type::kNumber) TypeMismatch(Type::kNumber, type_);
  return number_;
}

const std::string& JsonValue::AsString() const {
  if (type_ != Type::kString) TypeMismatch(Type::kString, type_);
  return string_;
}

const JsonValue::Array& JsonValue::AsArray() const {
  if (type_ != Type::kArray) TypeMismatch(Type::kArray, type_);
  return array_;
}

const JsonValue::Object& JsonValue::AsObject() const {
  if (type_ != Type::kObject) TypeMismatch(Type::kObject, type_);
  return object_;
}

const JsonValue* JsonValue::Find(const std::string& key) const {
  if (type_ != Type::kObject) return nullptr;
  for (const auto& member : object_) {
    if (member.first == key) return &member.second;
  }
  return nullptr;
}

// ---------------------------------------------------------------------------
// Parser
// ---------------------------------------------------------------------------

namespace {

constexpr int kMaxDepth = 64;

class Parser {
 public:
  explicit Parser(const std::string& text) : text_(text) {}

  JsonValue ParseDocument() {
    SkipWhitespace();
    JsonValue value = ParseValue(0);
    SkipWhitespace();
    if (pos_ != text_.size()) {
      Fail("trailing characters after document");
    }
    return value;
  }

 private:
  [[noreturn]] void Fail(const std::string& what) const { throw JsonParseError(what, pos_); }

  bool AtEnd() const { return pos_ >= text_.size(); }
  char Peek() const { return AtEnd() ? '\0' : text_[pos_]; }

  void SkipWhitespace() {
    while (!AtEnd()) {
      char c = text_[pos_];
      if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
      ++pos_;
    }
  }

  void Expect(char c) {
    if (Peek() != c) {
      Fail(std::string("expected '") + c + "'");
    }
    ++pos_;
  }

  void ExpectLiteral(const char* literal) {
    for (const char* p = literal; *p != '\0'; ++p) {
      if (Peek() != *p) Fail(std::string("invalid literal, expected ") + literal);
      ++pos_;
    }
  }

  JsonValue ParseValue(int depth) {
    if (depth > kMaxDepth) Fail("nesting too deep");
    switch (Peek()) {
      case '{': return ParseObject(depth);
      case '[': return ParseArray(depth);
      case '"': return JsonValue::String(ParseString());
      case 't': ExpectLiteral("true"); return JsonValue::Bool(true);
      case 'f': ExpectLiteral("false"); return JsonValue::Bool(false);
      case 'n': ExpectLiteral("null"); return JsonValue::Null();
      case '\0':
        if (AtEnd()) Fail("unexpected end of input");
        Fail("unexpected character");
      default:
        return ParseNumber();
    }
  }

  JsonValue ParseObject(int depth) {
    Expect('{');
    JsonValue::Object members;
    SkipWhitespace();
    if (Peek() == '}') {
      ++pos_;
      return JsonValue::MakeObject(std::move(members));
    }
    while (true) {
      SkipWhitespace();
      if (Peek() != '"') Fail("expected object key");
      std::string key = ParseString();
      SkipWhitespace();
      Expect(':');
      SkipWhitespace();
      JsonValue value = ParseValue(depth + 1);
      members.emplace_back(std::move(key), std::move(value));
      SkipWhitespace();
      if (Peek() == ',') {
        ++pos_;
        continue;
      }
      Expect('}');
      return JsonValue::MakeObject(std::move(members));
    }
  }

  JsonValue ParseArray(int depth) {
    Expect('[');
    JsonValue::Array items;
    SkipWhitespace();
    if (Peek() == ']') {
      ++pos_;
      return JsonValue::MakeArray(std::move(items));
    }
    while (true) {
      SkipWhitespace();
      items.push_back(ParseValue(depth + 1));
      SkipWhitespace();
      if (Peek() == ',') {
        ++pos_;
        continue;
      }
      Expect(']');
      return JsonValue::MakeArray(std::move(items));
    }
  }

  unsigned ParseHex4() {
    if (pos_ + 4 > text_.size()) Fail("truncated \\u escape");
    unsigned code = 0;
    for (int i = 0; i < 4; ++i) {
      char c = text_[pos_++];
      code <<= 4;
      if (c >= '0' && c <= '9') code |= static_cast<unsigned>(c - '0');
      else if (c >= 'a' && c <= 'f') code |= static_cast<unsigned>(c - 'a' + 10);
      else if (c >= 'A' && c <= 'F') code |= static_cast<unsigned>(c - 'A' + 10);
      else Fail("invalid hex digit in \\u escape");
    }
    return code;
  }

  static void AppendUtf8(std::string& out, unsigned cp) {
    if (cp < 0x80) {
      out += static_cast<char>(cp);
    } else if (cp < 0x800) {
      out += static_cast<char>(0xC0 | (cp >> 6));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
      out += static_cast<char>(0xE0 | (cp >> 12));
      out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
      out += static_cast<char>(0xF0 | (cp >> 18));
      out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
      out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    }
  }

  std::string ParseString() {
    Expect('"');
    std::string out;
    while (true) {
      if (AtEnd()) Fail("unterminated string");
      char c = text_[pos_++];
      if (c == '"') return out;
      if (static_cast<unsigned char>(c) < 0x20) Fail("control character in string");
      if (c != '\\') {
        out += c;
        continue;
      }
      if (AtEnd()) Fail("unterminated escape");
      char e = text_[pos_++];
      switch (e) {
        case '"': out += '"'; break;
        case '\\': out += '\\'; break;
        case '/': out += '/'; break;
        case 'b': out += '\b'; break;
        case 'f': out += '\f'; break;
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        case 't': out += '\t'; break;
        case 'u': {
          unsigned cp = ParseHex4();
          if (cp >= 0xD800 && cp <= 0xDBFF) {
            if (pos_ + 2 <= text_.size() && text_[pos_] == '\\' && text_[pos_ + 1] == 'u') {
              pos_ += 2;
              unsigned low = ParseHex4();
              if (low < 0xDC00 || low > 0xDFFF) Fail("invalid surrogate pair");
              cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
            } else {
              Fail("unpaired surrogate");
            }
          }
          AppendUtf8(out, cp);
          break;
        }
        default:
          Fail(std::string("invalid escape '\\") + e + "'");
      }
    }
  }

  JsonValue ParseNumber() {
    const size_t start = pos_;
    if (Peek() == '-') ++pos_;
    if (Peek() < '0' || Peek() > '9') Fail("unexpected character");
    if (Peek() == '0') {
      ++pos_;
    } else {
      while (Peek() >= '0' && Peek() <= '9') ++pos_;
    }
    if (Peek() == '.') {
      ++pos_;
      if (Peek() < '0' || Peek() > '9') Fail("digit expected after decimal point");
      while (Peek() >= '0' && Peek() <= '9') ++pos_;
    }
    if (Peek() == 'e' || Peek() == 'E') {
      ++pos_;
      if (Peek() == '+' || Peek() == '-') ++pos_;
      if (Peek() < '0' || Peek() > '9') Fail("digit expected in exponent");
      while (Peek() >= '0' && Peek() <= '9') ++pos_;
    }
    const std::string literal = text_.substr(start, pos_ - start);
    return JsonValue::Number(std::strtod(literal.c_str(), nullptr));
  }

  const std::string& text_;
  size_t pos_ = 0;
};

}  // namespace

JsonValue ParseJson(const std::string& text) {
  Parser parser(text);
  return parser.ParseDocument();
}

std::string JsonQuote(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 2);
  out += '"';
  for (char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          out += buf;
        } else {
          out += c;
        }
    }
  }
  out += '"';
  return out;
}

}  // namespace lumensync::util
