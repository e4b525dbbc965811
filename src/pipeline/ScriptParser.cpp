// Repository: Podwright
// Component: Script Parser Implementation
// Copyright (c) 2025 Podwright

#include "podwright/pipeline/ScriptParser.hpp"

#include <cctype>
#include <cstdint>
#include <sstream>

namespace podwright::pipeline {

namespace {

// Containers nested inside a skipped member value.
constexpr int kMaxSkipDepth = 64;

std::string Trim(const std::string& s) {
  size_t b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return "";
  size_t e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

void AppendUtf8(uint32_t cp, std::string* out) {
  if (cp < 0x80) {
    *out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    *out += static_cast<char>(0xC0 | (cp >> 6));
    *out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    *out += static_cast<char>(0xE0 | (cp >> 12));
    *out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    *out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    *out += static_cast<char>(0xF0 | (cp >> 18));
    *out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    *out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    *out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

// Minimal JSON reader for an array of flat objects. Non-string member values
// are skipped structurally.
class JsonCursor {
 public:
  explicit JsonCursor(const std::string& text) : s_(text) {}

  const std::string& error() const { return error_; }

  bool ParseScript(Script* script) {
    SkipWs();
    if (!Consume('[')) return Fail("expected '['");
    SkipWs();
    if (Peek() == ']') {
      ++pos_;
      return AtEnd();
    }
    while (true) {
      ScriptLine line;
      line.index = static_cast<int32_t>(script->lines.size());
      if (!ParseEntry(&line)) return false;
      script->lines.push_back(std::move(line));
      SkipWs();
      if (Consume(',')) continue;
      if (Consume(']')) break;
      return Fail("expected ',' or ']'");
    }
    return AtEnd();
  }

 private:
  bool ParseEntry(ScriptLine* line) {
    SkipWs();
    if (!Consume('{')) return Fail("expected '{'");
    bool have_speaker = false;
    bool have_text = false;
    SkipWs();
    if (!Consume('}')) {
      while (true) {
        SkipWs();
        std::string key;
        if (!ParseString(&key)) return false;
        SkipWs();
        if (!Consume(':')) return Fail("expected ':'");
        SkipWs();
        if (key == "speaker" || key == "text") {
          std::string value;
          if (!ParseString(&value)) return false;
          if (key == "speaker") {
            line->speaker = voice::ParseSpeaker(value);
            have_speaker = true;
          } else {
            line->text = Trim(value);
            have_text = true;
          }
        } else if (!SkipValue()) {
          return false;
        }
        SkipWs();
        if (Consume(',')) continue;
        if (Consume('}')) break;
        return Fail("expected ',' or '}'");
      }
    }
    if (!have_speaker || !have_text) {
      std::ostringstream oss;
      oss << "entry " << line->index << " missing "
          << (have_speaker ? "\"text\"" : "\"speaker\"");
      return Fail(oss.str());
    }
    return true;
  }

  bool ParseString(std::string* out) {
    if (!Consume('"')) return Fail("expected string");
    out->clear();
    while (pos_ < s_.size()) {
      char c = s_[pos_++];
      if (c == '"') return true;
      if (c != '\\') {
        *out += c;
        continue;
      }
      if (pos_ >= s_.size()) break;
      char esc = s_[pos_++];
      switch (esc) {
        case '"': *out += '"'; break;
        case '\\': *out += '\\'; break;
        case '/': *out += '/'; break;
        case 'b': *out += '\b'; break;
        case 'f': *out += '\f'; break;
        case 'n': *out += '\n'; break;
        case 'r': *out += '\r'; break;
        case 't': *out += '\t'; break;
        case 'u': {
          uint32_t cp;
          if (!ParseHex4(&cp)) return false;
          if (cp >= 0xD800 && cp <= 0xDBFF && pos_ + 1 < s_.size() &&
              s_[pos_] == '\\' && s_[pos_ + 1] == 'u') {
            pos_ += 2;
            uint32_t low;
            if (!ParseHex4(&low)) return false;
            if (low >= 0xDC00 && low <= 0xDFFF) {
              cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
            } else {
              AppendUtf8(cp, out);
              cp = low;
            }
          }
          AppendUtf8(cp, out);
          break;
        }
        default:
          return Fail(std::string("bad escape \\") + esc);
      }
    }
    return Fail("unterminated string");
  }

  bool ParseHex4(uint32_t* out) {
    if (pos_ + 4 > s_.size()) return Fail("short \\u escape");
    uint32_t v = 0;
    for (int i = 0; i < 4; ++i) {
      char h = s_[pos_++];
      v <<= 4;
      if (h >= '0' && h <= '9') v |= static_cast<uint32_t>(h - '0');
      else if (h >= 'a' && h <= 'f') v |= static_cast<uint32_t>(h - 'a' + 10);
      else if (h >= 'A' && h <= 'F') v |= static_cast<uint32_t>(h - 'A' + 10);
      else return Fail("bad hex digit in \\u escape");
    }
    *out = v;
    return true;
  }

  // Skips any JSON value (string, number, literal, array, object).
  bool SkipValue(int depth = 0) {
    SkipWs();
    char c = Peek();
    if (c == '"') {
      std::string ignored;
      return ParseString(&ignored);
    }
    if (c == '{' || c == '[') {
      if (depth >= kMaxSkipDepth) return Fail("nesting too deep");
      char close = (c == '{') ? '}' : ']';
      ++pos_;
      SkipWs();
      if (Consume(close)) return true;
      while (true) {
        if (c == '{') {
          std::string ignored;
          SkipWs();
          if (!ParseString(&ignored)) return false;
          SkipWs();
          if (!Consume(':')) return Fail("expected ':'");
        }
        if (!SkipValue(depth + 1)) return false;
        SkipWs();
        if (Consume(',')) continue;
        if (Consume(close)) return true;
        return Fail("unterminated container");
      }
    }
    size_t start = pos_;
    while (pos_ < s_.size() &&
           (std::isalnum(static_cast<unsigned char>(s_[pos_])) ||
            s_[pos_] == '-' || s_[pos_] == '+' || s_[pos_] == '.')) {
      ++pos_;
    }
    if (pos_ == start) return Fail("expected value");
    return true;
  }

  void SkipWs() {
    while (pos_ < s_.size() && std::isspace(static_cast<unsigned char>(s_[pos_]))) {
      ++pos_;
    }
  }

  char Peek() const { return pos_ < s_.size() ? s_[pos_] : '\0'; }

  bool Consume(char c) {
    if (Peek() != c) return false;
    ++pos_;
    return true;
  }

  bool AtEnd() {
    SkipWs();
    if (pos_ != s_.size()) return Fail("trailing content after array");
    return true;
  }

  bool Fail(const std::string& what) {
    if (error_.empty()) {
      std::ostringstream oss;
      oss << what << " at offset " << pos_;
      error_ = oss.str();
    }
    return false;
  }

  const std::string& s_;
  size_t pos_ = 0;
  std::string error_;
};

}  // namespace

std::string ScriptParser::StripCodeFences(const std::string& raw) {
  std::string text = Trim(raw);
  if (text.compare(0, 3, "```") != 0) {
    return text;
  }
  std::istringstream in(text);
  std::string out;
  std::string line;
  while (std::getline(in, line)) {
    if (Trim(line).compare(0, 3, "```") == 0) continue;
    out += line;
    out += '\n';
  }
  return Trim(out);
}

ScriptParseResult ScriptParser::Parse(const std::string& raw) {
  std::string text = StripCodeFences(raw);
  if (text.empty()) {
    return ScriptParseResult::Failure("script reply is empty");
  }
  Script script;
  JsonCursor cursor(text);
  if (!cursor.ParseScript(&script)) {
    return ScriptParseResult::Failure("malformed script JSON: " + cursor.error());
  }
  return ScriptParseResult::Success(std::move(script));
}

}  // namespace podwright::pipeline
