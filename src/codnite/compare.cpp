#include <codnite/compare.h>

#include <cmath>
#include <algorithm>
#include <stdexcept>
#include <fmt/format.h>

namespace {

// CRLF and lone CR become LF
std::string NormalizeNewlines(std::string_view str) {
  std::string ret;
  ret.reserve(str.size());
  for (size_t i = 0; i < str.size(); i++) {
    if (str[i] == '\r') {
      ret.push_back('\n');
      if (i + 1 < str.size() && str[i + 1] == '\n') i++;
    } else {
      ret.push_back(str[i]);
    }
  }
  return ret;
}

// Same semantics as std::getline on a stream: eof is set once a read hits the end
class LineReader {
  std::string_view text_;
  size_t pos_;
  bool eof_;
 public:
  explicit LineReader(std::string_view text) : text_(text), pos_(0), eof_(false) {}
  bool eof() const { return eof_; }
  std::string_view Next() {
    if (pos_ >= text_.size()) {
      eof_ = true;
      return {};
    }
    size_t nl = text_.find('\n', pos_);
    std::string_view ret;
    if (nl == std::string_view::npos) {
      ret = text_.substr(pos_);
      pos_ = text_.size();
      eof_ = true;
    } else {
      ret = text_.substr(pos_, nl - pos_);
      pos_ = nl + 1;
    }
    return ret;
  }
};

class Comparer {
  std::string* message_;

  void EOFMessage(bool ans_eof, size_t line, size_t user_lines) {
    if (!message_) return;
    if (ans_eof) *message_ = fmt::format("Unexpected line {}", line);
    else *message_ = fmt::format("Unexpected EOF after line {}", user_lines);
  }

  static std::string Excerpt(std::string_view str, size_t pos) {
    if (pos <= 40 || str.size() <= 80) return std::string(str);
    std::string ret = "...";
    ret += str.substr(pos - 40, 80);
    if (str.size() > pos + 40) ret += "...";
    return ret;
  }

  void DifferMessage(std::string_view header, std::string_view ans, std::string_view usr) {
    if (!message_) return;
    size_t pos = 0;
    for (; pos < ans.size() && pos < usr.size() && ans[pos] == usr[pos]; pos++);
    *message_ = fmt::format("{}\nExpected: {}\nGot: {}", header, Excerpt(ans, pos), Excerpt(usr, pos));
  }

  static std::string_view StripTail(std::string_view str, const char* whites) {
    size_t pos = str.find_last_not_of(whites);
    // npos + 1 == 0
    return str.substr(0, pos + 1);
  }

 public:
  explicit Comparer(std::string* message) : message_(message) {}

  bool LineCompare(std::string_view ans, std::string_view usr) {
    constexpr char kWhites[] = " \n\r\t";
    LineReader f_ans(ans), f_usr(usr);
    size_t line = 1;
    for (; f_ans.eof() == f_usr.eof(); line++) {
      if (f_ans.eof()) return true;
      std::string_view s = StripTail(f_ans.Next(), kWhites);
      std::string_view t = StripTail(f_usr.Next(), kWhites);
      if (s != t) {
        DifferMessage(fmt::format("Line {} differ.", line), s, t);
        return false;
      }
    }
    size_t user_lines = line - 1;
    while (!f_ans.eof() || !f_usr.eof()) {
      std::string_view s = !f_ans.eof() ? f_ans.Next() : f_usr.Next();
      if (s.find_last_not_of(kWhites) != std::string_view::npos) {
        EOFMessage(f_ans.eof(), line, user_lines);
        return false;
      }
      line++;
    }
    return true;
  }

  bool StrictCompare(std::string_view ans, std::string_view usr) {
    size_t len = std::min(ans.size(), usr.size());
    size_t offset = 0;
    for (; offset < len && ans[offset] == usr[offset]; offset++);
    if (offset < len) {
      if (message_) {
        *message_ = fmt::format("Byte {} differ: expected 0x{:02x}, got 0x{:02x}",
            offset, (uint32_t)(uint8_t)ans[offset], (uint32_t)(uint8_t)usr[offset]);
      }
      return false;
    }
    if (ans.size() != usr.size()) {
      if (message_) {
        *message_ = fmt::format("Length differ: expected {} bytes, got {} bytes", ans.size(), usr.size());
      }
      return false;
    }
    return true;
  }

  template <class Func>
  bool WordCompare(std::string_view ans, std::string_view usr, Func&& func) {
    constexpr char kWhites[] = " \n\r\t\x0b\x0c";
    constexpr size_t npos = std::string_view::npos;
    LineReader f_ans(ans), f_usr(usr);
    size_t line = 1;
    for (; f_ans.eof() == f_usr.eof(); line++) {
      if (f_ans.eof()) return true;
      std::string_view s = f_ans.Next(), t = f_usr.Next();
      for (size_t i1 = 0, i2 = 0, word = 1;; word++) {
        i1 = s.find_first_not_of(kWhites, i1);
        i2 = t.find_first_not_of(kWhites, i2);
        if ((i1 == npos) != (i2 == npos)) {
          if (message_) {
            if (i1 == npos) *message_ = fmt::format("Unexpected word: line {}, word {}", line, word);
            else *message_ = fmt::format("Unexpected EOL after line {}, word {}", line, word - 1);
          }
          return false;
        }
        if (i1 == npos) break;
        size_t j1 = s.find_first_of(kWhites, i1);
        size_t j2 = t.find_first_of(kWhites, i2);
        if (j1 == npos) j1 = s.size();
        if (j2 == npos) j2 = t.size();
        if (!func(s.substr(i1, j1 - i1), t.substr(i2, j2 - i2))) {
          DifferMessage(fmt::format("Line {}, word {} differ.", line, word),
                        s.substr(i1, j1 - i1), t.substr(i2, j2 - i2));
          return false;
        }
        i1 = j1, i2 = j2;
      }
    }
    size_t user_lines = line - 1;
    while (!f_ans.eof() || !f_usr.eof()) {
      std::string_view s = !f_ans.eof() ? f_ans.Next() : f_usr.Next();
      if (s.find_last_not_of(kWhites) != npos) {
        EOFMessage(f_ans.eof(), line, user_lines);
        return false;
      }
    }
    return true;
  }
};

bool FloatWordEqual(std::string_view ans, std::string_view usr, long double tolerance) {
  // this avoids treating integers as floating point
  if (ans.find_first_of(".eExXnN") == std::string_view::npos) return ans == usr;
  try {
    size_t ans_len = 0, usr_len = 0;
    long double fans = std::stold(std::string(ans), &ans_len);
    long double fusr = std::stold(std::string(usr), &usr_len);
    if (ans_len != ans.size() || usr_len != usr.size()) return ans == usr;
    return std::fabs(fans - fusr) <= tolerance * std::max(1.0L, std::fabs(fans));
  } catch (std::invalid_argument&) {
    return ans == usr;
  } catch (std::out_of_range&) {
    return ans == usr;
  }
}

} // namespace

bool OutputMatches(std::string_view actual, std::string_view expected,
                   const CompareOptions& opt, std::string* message) {
  std::string ans = NormalizeNewlines(expected), usr = NormalizeNewlines(actual);
  Comparer comparer(message);
  switch (opt.mode) {
    case CompareMode::LINE:
      return comparer.LineCompare(ans, usr);
    case CompareMode::STRICT:
      return comparer.StrictCompare(ans, usr);
    case CompareMode::WHITESPACE:
      return comparer.WordCompare(ans, usr, [](std::string_view a, std::string_view u) { return a == u; });
    case CompareMode::FLOAT: {
      long double tolerance = opt.tolerance;
      return comparer.WordCompare(ans, usr, [tolerance](std::string_view a, std::string_view u) {
        return FloatWordEqual(a, u, tolerance);
      });
    }
  }
  __builtin_unreachable();
}

Verdict Compare(std::string_view actual, std::string_view expected,
                const CompareOptions& opt, std::string* message) {
  return OutputMatches(actual, expected, opt, message) ? Verdict::PASSED : Verdict::WRONG_ANSWER;
}
