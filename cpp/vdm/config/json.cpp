/*
================================================================================
Fragment 5.3 - Config: JSON Reader / Writer
FILE: cpp/vdm/config/json.cpp
================================================================================
*/

#include "vdm/config/json.hpp"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <istream>
#include <iterator>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace vdm::config {
namespace {

// Model configs nest a handful of levels; anything near this is malformed.
constexpr int kMaxNesting = 256;

bool is_digit(char ch) noexcept { return ch >= '0' && ch <= '9'; }

int hex_value(char ch) noexcept {
  if (ch >= '0' && ch <= '9') return ch - '0';
  if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
  if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
  return -1;
}

void put_utf8(std::string& s, unsigned cp) {
  if (cp < 0x80u) {
    s += static_cast<char>(cp);
    return;
  }
  int tail = cp < 0x800u ? 1 : (cp < 0x10000u ? 2 : 3);
  static constexpr unsigned kLead[] = {0x00u, 0xC0u, 0xE0u, 0xF0u};
  s += static_cast<char>(kLead[tail] | (cp >> (6 * tail)));
  while (tail-- > 0) s += static_cast<char>(0x80u | ((cp >> (6 * tail)) & 0x3Fu));
}

// Recursive-descent reader over one config document. The first failure
// is recorded with the position it was detected at; every later call
// returns false without overwriting it.
class ConfigTextReader final {
 public:
  ConfigTextReader(std::string_view text, JsonParseError* err) : text_(text), err_(err) {}

  bool read_document(JsonValue& root) {
    if (!read_value(root, 0)) return false;
    skip_blank();
    if (!at_end()) return fail("config: unexpected text after the top-level value");
    return true;
  }

 private:
  bool at_end() const noexcept { return pos_ >= text_.size(); }
  char peek() const noexcept { return at_end() ? '\0' : text_[pos_]; }

  void take() noexcept {
    if (text_[pos_] == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    ++pos_;
  }

  bool fail(std::string why) { return fail_at(std::move(why), pos_, line_, col_); }

  bool fail_at(std::string why, std::size_t pos, int line, int col) {
    if (err_ && !failed_) {
      err_->message = std::move(why);
      err_->offset = pos;
      err_->line = line;
      err_->col = col;
    }
    failed_ = true;
    return false;
  }

  void skip_blank() noexcept {
    for (char ch = peek(); ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r'; ch = peek()) take();
  }

  bool read_value(JsonValue& v, int depth) {
    skip_blank();
    if (at_end()) return fail("config: document ends where a value was expected");
    if (depth > kMaxNesting) return fail("config: arrays/objects nested too deeply");

    v.offset = pos_;
    v.line = line_;
    v.col = col_;

    switch (peek()) {
      case '{': return read_object(v, depth);
      case '[': return read_array(v, depth);
      case '"':
        v.t = JsonType::kStr;
        return read_string(v.str);
      case 't': return read_word("true", v, JsonType::kBool, true);
      case 'f': return read_word("false", v, JsonType::kBool, false);
      case 'n': return read_word("null", v, JsonType::kNull, false);
      default: break;
    }
    if (peek() == '-' || is_digit(peek())) {
      v.t = JsonType::kNum;
      return read_number(v.num);
    }
    return fail(std::string("config: '") + peek() + "' cannot start a value");
  }

  bool read_word(std::string_view word, JsonValue& v, JsonType t, bool flag) {
    if (text_.substr(pos_, word.size()) != word) {
      return fail("config: misspelled literal, expected '" + std::string(word) + "'");
    }
    for (std::size_t i = 0; i < word.size(); ++i) take();
    v.t = t;
    v.b = flag;
    return true;
  }

  bool read_number(double& out) {
    const std::size_t from = pos_;
    const int line = line_;
    const int col = col_;

    if (peek() == '-') take();
    if (peek() == '0') {
      take();
    } else if (is_digit(peek())) {
      while (is_digit(peek())) take();
    } else {
      return fail("config: number needs digits after the sign");
    }
    if (peek() == '.') {
      take();
      if (!is_digit(peek())) return fail("config: number needs digits after the decimal point");
      while (is_digit(peek())) take();
    }
    if (peek() == 'e' || peek() == 'E') {
      take();
      if (peek() == '+' || peek() == '-') take();
      if (!is_digit(peek())) return fail("config: number needs digits in its exponent");
      while (is_digit(peek())) take();
    }

    const std::string lexeme(text_.substr(from, pos_ - from));
    errno = 0;
    char* stop = nullptr;
    const double v = std::strtod(lexeme.c_str(), &stop);
    if (stop != lexeme.c_str() + lexeme.size()) {
      return fail_at("config: unreadable number '" + lexeme + "'", from, line, col);
    }
    if (errno == ERANGE || !std::isfinite(v)) {
      return fail_at("config: number '" + lexeme + "' exceeds double range", from, line, col);
    }
    out = v;
    return true;
  }

  bool read_hex4(unsigned& cp) {
    cp = 0;
    for (int i = 0; i < 4; ++i) {
      const int h = hex_value(peek());
      if (at_end() || h < 0) return fail("config: \\u escape needs four hex digits");
      cp = (cp << 4) | static_cast<unsigned>(h);
      take();
    }
    return true;
  }

  bool read_unicode_escape(std::string& out) {
    unsigned cp = 0;
    if (!read_hex4(cp)) return false;
    if (cp >= 0xDC00u && cp <= 0xDFFFu) return fail("config: lone low surrogate in \\u escape");
    if (cp >= 0xD800u && cp <= 0xDBFFu) {
      if (peek() != '\\') return fail("config: high surrogate must be followed by a \\u low surrogate");
      take();
      if (peek() != 'u') return fail("config: high surrogate must be followed by a \\u low surrogate");
      take();
      unsigned lo = 0;
      if (!read_hex4(lo)) return false;
      if (lo < 0xDC00u || lo > 0xDFFFu) return fail("config: bad low surrogate in \\u escape");
      cp = 0x10000u + ((cp - 0xD800u) << 10) + (lo - 0xDC00u);
    }
    put_utf8(out, cp);
    return true;
  }

  bool read_string(std::string& out) {
    skip_blank();
    if (peek() != '"') return fail("config: expected a quoted name or string");
    take();
    out.clear();

    while (!at_end()) {
      const char ch = peek();
      if (ch == '"') {
        take();
        return true;
      }
      if (static_cast<unsigned char>(ch) < 0x20) return fail("config: raw control character inside a string");
      take();
      if (ch != '\\') {
        out += ch;
        continue;
      }
      if (at_end()) break;
      const char esc = peek();
      take();
      switch (esc) {
        case 'n': out += '\n'; break;
        case 't': out += '\t'; break;
        case 'r': out += '\r'; break;
        case 'b': out += '\b'; break;
        case 'f': out += '\f'; break;
        case '"':
        case '\\':
        case '/': out += esc; break;
        case 'u':
          if (!read_unicode_escape(out)) return false;
          break;
        default:
          return fail(std::string("config: unknown escape '\\") + esc + "'");
      }
    }
    return fail("config: string runs to the end of the document");
  }

  // Consumes the separator after an element; sets done on the closer.
  bool read_separator(char closer, const char* what, bool& done) {
    skip_blank();
    if (peek() == ',') {
      take();
      done = false;
      return true;
    }
    if (peek() == closer) {
      take();
      done = true;
      return true;
    }
    if (at_end()) return fail(std::string("config: document ends inside an ") + what);
    return fail(std::string("config: expected ',' or '") + closer + "' in " + what);
  }

  bool read_array(JsonValue& v, int depth) {
    take();  // '['
    v.t = JsonType::kArr;
    v.arr.clear();
    skip_blank();
    if (peek() == ']') {
      take();
      return true;
    }
    for (bool done = false; !done;) {
      v.arr.emplace_back();
      if (!read_value(v.arr.back(), depth + 1)) return false;
      if (!read_separator(']', "array", done)) return false;
    }
    return true;
  }

  bool read_object(JsonValue& v, int depth) {
    take();  // '{'
    v.t = JsonType::kObj;
    v.obj.clear();
    skip_blank();
    if (peek() == '}') {
      take();
      return true;
    }
    for (bool done = false; !done;) {
      std::string name;
      if (!read_string(name)) return false;
      skip_blank();
      if (peek() != ':') return fail("config: expected ':' after key \"" + name + "\"");
      take();
      JsonValue member;
      if (!read_value(member, depth + 1)) return false;
      v.obj.emplace_back(std::move(name), std::move(member));
      if (!read_separator('}', "object", done)) return false;
    }
    return true;
  }

  std::string_view text_;
  JsonParseError* err_;
  std::size_t pos_ = 0;
  int line_ = 1;
  int col_ = 1;
  bool failed_ = false;
};

}  // namespace

std::string JsonParseError::describe() const {
  std::ostringstream o;
  o << "line " << line << ", col " << col << ": " << message;
  return o.str();
}

const char* to_string(JsonType t) noexcept {
  switch (t) {
    case JsonType::kNull: return "null";
    case JsonType::kBool: return "bool";
    case JsonType::kNum: return "number";
    case JsonType::kStr: return "string";
    case JsonType::kObj: return "object";
    case JsonType::kArr: return "array";
  }
  return "unknown";
}

const JsonValue* JsonValue::find(std::string_view key) const noexcept {
  if (t != JsonType::kObj) return nullptr;
  // Later members shadow earlier ones with the same key.
  for (auto it = obj.rbegin(); it != obj.rend(); ++it) {
    if (it->first == key) return &it->second;
  }
  return nullptr;
}

bool parse_json(std::string_view json, JsonValue* out, JsonParseError* err) {
  if (!out) return false;
  JsonValue root;
  ConfigTextReader reader(json, err);
  if (!reader.read_document(root)) return false;
  *out = std::move(root);
  return true;
}

bool parse_json(std::istream& is, JsonValue* out, JsonParseError* err) {
  const std::string text{std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>()};
  return parse_json(std::string_view(text), out, err);
}

std::string json_escape(std::string_view s) {
  std::string o;
  o.reserve(s.size() + 2);
  for (const char c : s) {
    const auto u = static_cast<unsigned char>(c);
    if (c == '"' || c == '\\') {
      o += '\\';
      o += c;
    } else if (c == '\n') {
      o += "\\n";
    } else if (c == '\t') {
      o += "\\t";
    } else if (c == '\r') {
      o += "\\r";
    } else if (u < 0x20) {
      char code[8];
      std::snprintf(code, sizeof(code), "\\u%04X", static_cast<unsigned>(u));
      o += code;
    } else {
      o += c;
    }
  }
  return o;
}

// ----------------------------- JsonWriter ------------------------------------

JsonWriter::JsonWriter(int indent) : indent_(indent < 0 ? 0 : indent) {}

void JsonWriter::nl() {
  if (indent_ == 0) return;
  out_ << '\n' << std::string(has_items_.size() * static_cast<std::size_t>(indent_), ' ');
}

void JsonWriter::before_value() {
  if (after_key_) {
    after_key_ = false;
    return;
  }
  if (has_items_.empty()) return;
  if (has_items_.back()) out_ << ',';
  has_items_.back() = true;
  nl();
}

void JsonWriter::obj_begin() {
  before_value();
  out_ << '{';
  has_items_.push_back(false);
}

void JsonWriter::obj_end() {
  const bool had = has_items_.back();
  has_items_.pop_back();
  if (had) nl();
  out_ << '}';
}

void JsonWriter::arr_begin() {
  before_value();
  out_ << '[';
  has_items_.push_back(false);
}

void JsonWriter::arr_end() {
  const bool had = has_items_.back();
  has_items_.pop_back();
  if (had) nl();
  out_ << ']';
}

void JsonWriter::key(std::string_view k) {
  before_value();
  out_ << '"' << json_escape(k) << "\": ";
  after_key_ = true;
}

void JsonWriter::str(std::string_view v) {
  before_value();
  out_ << '"' << json_escape(v) << '"';
}

void JsonWriter::b(bool v) {
  before_value();
  out_ << (v ? "true" : "false");
}

void JsonWriter::null() {
  before_value();
  out_ << "null";
}

void JsonWriter::num(double v) {
  before_value();
  if (!std::isfinite(v)) {
    out_ << "null";
    return;
  }
  // Shortest of %.15g..%.17g that reads back bit-identical.
  char text[32];
  for (int digits = 15; digits <= 17; ++digits) {
    std::snprintf(text, sizeof(text), "%.*g", digits, v);
    if (std::strtod(text, nullptr) == v) break;
  }
  out_ << text;
}

void JsonWriter::num_u(std::uint64_t v) {
  before_value();
  out_ << v;
}

void JsonWriter::num_i(long long v) {
  before_value();
  out_ << v;
}

void JsonWriter::num_list(const std::vector<double>& v) {
  arr_begin();
  for (const double x : v) num(x);
  arr_end();
}

void JsonWriter::str_list(const std::vector<std::string>& v) {
  arr_begin();
  for (const auto& x : v) str(x);
  arr_end();
}

}  // namespace vdm::config
