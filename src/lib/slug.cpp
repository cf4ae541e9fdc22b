#include <xg/slug.hpp>

#include <cstdint>
#include <utility>
#include <vector>

namespace xg {

  namespace {

    struct code_point {
      char32_t value;
      std::size_t length;
    };

    // Lenient UTF-8 decoding: a malformed byte decodes as itself.
    code_point
    decode(std::string_view s, std::size_t pos) {
      auto byte = [&](std::size_t i) {
        return static_cast<unsigned char>(s[i]);
      };
      unsigned char b0 = byte(pos);
      auto continuation = [&](std::size_t n) {
        for (std::size_t i = 1; i <= n; ++i) {
          if (pos + i >= s.size() || (byte(pos + i) & 0xC0) != 0x80) {
            return false;
          }
        }
        return true;
      };
      if (b0 < 0x80) { return {b0, 1}; }
      if ((b0 & 0xE0) == 0xC0 && continuation(1)) {
        return {static_cast<char32_t>(((b0 & 0x1F) << 6) | (byte(pos + 1) & 0x3F)),
                2};
      }
      if ((b0 & 0xF0) == 0xE0 && continuation(2)) {
        return {static_cast<char32_t>(((b0 & 0x0F) << 12) |
                                      ((byte(pos + 1) & 0x3F) << 6) |
                                      (byte(pos + 2) & 0x3F)),
                3};
      }
      if ((b0 & 0xF8) == 0xF0 && continuation(3)) {
        return {static_cast<char32_t>(((b0 & 0x07) << 18) |
                                      ((byte(pos + 1) & 0x3F) << 12) |
                                      ((byte(pos + 2) & 0x3F) << 6) |
                                      (byte(pos + 3) & 0x3F)),
                4};
      }
      return {b0, 1};
    }

    void
    encode(std::string& out, char32_t cp) {
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

    // Unicode White_Space plus the ASCII separator controls.
    bool
    is_space(char32_t cp) {
      return (cp >= 0x09 && cp <= 0x0D) || (cp >= 0x1C && cp <= 0x20) ||
             cp == 0x85 || cp == 0xA0 || cp == 0x1680 ||
             (cp >= 0x2000 && cp <= 0x200A) || cp == 0x2028 ||
             cp == 0x2029 || cp == 0x202F || cp == 0x205F || cp == 0x3000;
    }

    bool
    is_delimiter(char32_t cp) {
      return cp == ' ' || cp == 0xA0 || cp == '\n' || cp == '\t' ||
             cp == ',' || cp == '_' || cp == '-';
    }

    std::size_t
    previous_start(std::string_view s, std::size_t end) {
      std::size_t pos = end - 1;
      while (pos > 0 && (static_cast<unsigned char>(s[pos]) & 0xC0) == 0x80 &&
             end - pos < 4) {
        --pos;
      }
      return pos;
    }

    void
    append_upper(std::string& out, char32_t cp) {
      if (cp >= 'a' && cp <= 'z') {
        cp -= 0x20;
      } else if (cp == 0xDF) {
        out += "SS";
        return;
      } else if (cp == 0xB5) {
        cp = 0x39C;
      } else if (cp >= 0xE0 && cp <= 0xFE && cp != 0xF7) {
        cp -= 0x20;
      } else if (cp == 0xFF) {
        cp = 0x178;
      } else if (cp >= 0x100 && cp <= 0x137 && (cp & 1) == 1) {
        cp -= 1;
      } else if (cp >= 0x3B1 && cp <= 0x3C9 && cp != 0x3C2) {
        cp -= 0x20;
      } else if (cp == 0x3C2) {
        cp = 0x3A3;
      } else if (cp >= 0x430 && cp <= 0x44F) {
        cp -= 0x20;
      } else if (cp >= 0x450 && cp <= 0x45F) {
        cp -= 0x50;
      }
      encode(out, cp);
    }

    void
    append_capitalized(std::string& out, std::string_view word) {
      if (word.empty()) { return; }
      auto first = decode(word, 0);
      append_upper(out, first.value);
      out.append(word.substr(first.length));
    }

    void
    pop_trailing_space(std::string& out, std::size_t floor) {
      while (out.size() > floor) {
        std::size_t start = previous_start(out, out.size());
        if (start < floor || !is_space(decode(out, start).value)) { return; }
        out.erase(start);
      }
    }

    // \s*\(.*?\)  ('.' does not cross a newline)
    std::string
    strip_parentheticals(std::string_view s) {
      std::string out;
      std::size_t floor = 0;
      std::size_t i = 0;
      while (i < s.size()) {
        if (s[i] == '(') {
          std::size_t j = i + 1;
          while (j < s.size() && s[j] != ')' && s[j] != '\n') {
            ++j;
          }
          if (j < s.size() && s[j] == ')') {
            pop_trailing_space(out, floor);
            floor = out.size();
            i = j + 1;
            continue;
          }
        }
        out += s[i];
        ++i;
      }
      return out;
    }

    const std::vector<std::pair<char, std::string_view>> inner_replacements = {
        {'/', "Slash"}, {':', "Colon"}};

    const std::vector<std::pair<char, std::string_view>> replacements = {
        {'#', "Sharp"},    {'+', "Plus"},   {'.', "Dot"},   {'\\', "Backslash"},
        {'&', "And"},      {'\'', ""},      {'/', "Or"},    {':', ""},
        {'*', "Wildcard"}, {'=', "Equal"},  {'"', ""},      {'%', "Percent"},
        {'<', "Below"},    {'>', "Above"},  {'^', ""}};

    std::string
    spell_out(std::string_view s,
              const std::vector<std::pair<char, std::string_view>>& table) {
      std::string out;
      out.reserve(s.size());
      for (char c : s) {
        bool replaced = false;
        for (const auto& [symbol, word] : table) {
          if (c == symbol) {
            out += ' ';
            out += word;
            out += ' ';
            replaced = true;
            break;
          }
        }
        if (!replaced) { out += c; }
      }
      return out;
    }

    // :\s*'([^']*?)'  -> " <inner, spelled out> "
    std::string
    expand_quoted(std::string_view s) {
      std::string out;
      std::size_t i = 0;
      while (i < s.size()) {
        if (s[i] == ':') {
          std::size_t k = i + 1;
          while (k < s.size()) {
            auto cp = decode(s, k);
            if (!is_space(cp.value)) { break; }
            k += cp.length;
          }
          if (k < s.size() && s[k] == '\'') {
            auto close = s.find('\'', k + 1);
            if (close != std::string_view::npos) {
              out += ' ';
              out += spell_out(s.substr(k + 1, close - k - 1),
                               inner_replacements);
              out += ' ';
              i = close + 1;
              continue;
            }
          }
        }
        out += s[i];
        ++i;
      }
      return out;
    }

    std::string_view
    strip_spaces(std::string_view s) {
      std::size_t begin = 0;
      while (begin < s.size()) {
        auto cp = decode(s, begin);
        if (!is_space(cp.value)) { break; }
        begin += cp.length;
      }
      std::size_t end = s.size();
      while (end > begin) {
        std::size_t start = previous_start(s, end);
        if (!is_space(decode(s, start).value)) { break; }
        end = start;
      }
      return s.substr(begin, end - begin);
    }

    std::vector<std::string_view>
    split_words(std::string_view s) {
      std::vector<std::string_view> words;
      std::size_t word_start = 0;
      std::size_t pos = 0;
      while (pos < s.size()) {
        auto cp = decode(s, pos);
        if (is_delimiter(cp.value)) {
          words.push_back(s.substr(word_start, pos - word_start));
          while (pos < s.size() && is_delimiter(decode(s, pos).value)) {
            pos += decode(s, pos).length;
          }
          word_start = pos;
          continue;
        }
        pos += cp.length;
      }
      words.push_back(s.substr(word_start));
      return words;
    }

  } // namespace

  std::string
  slugify(std::string_view text, slug_role role) {
    std::string s(text);
    if (role == slug_role::property) { std::erase(s, '@'); }
    s = strip_parentheticals(s);
    s = expand_quoted(s);
    s = spell_out(s, replacements);

    auto words = split_words(strip_spaces(s));

    std::string result;
    if (role == slug_role::property) { result = "has"; }
    if (role == slug_role::individual) { result = "ind"; }
    append_capitalized(result, words.front());
    for (std::size_t i = 1; i < words.size(); ++i) {
      append_capitalized(result, words[i]);
    }
    return result;
  }

  std::string
  local_iri(std::string_view name) {
    if (name.find('#') != std::string_view::npos) { return std::string(name); }
    return "#" + std::string(name);
  }

} // namespace xg
