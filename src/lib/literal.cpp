#include <xg/errors.hpp>
#include <xg/literal.hpp>
#include <xg/xml_node.hpp>

#include <stdexcept>
#include <string>
#include <type_traits>

namespace xg {

  std::string_view
  trim(std::string_view s) {
    constexpr std::string_view ws = " \t\n\r\f\v";
    auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) { return {}; }
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
  }

  literal
  literal::text(std::string value, qname datatype) {
    return literal(literal_kind::text, std::move(datatype), std::move(value));
  }

  literal
  literal::parse(literal_kind kind, std::string_view lexical) {
    auto value = trim(lexical);
    switch (kind) {
      case literal_kind::text:
        return text(std::string(value));
      case literal_kind::date:
        return literal(kind, qname(xs_ns, "date"), date(value));
      case literal_kind::integer:
        return literal(kind, qname(xs_ns, "integer"), integer(value));
      case literal_kind::date_fragment: {
        // --MM and ---DD carry no useful structure beyond their number.
        std::string digits;
        for (char c : value) {
          if (c != '-') { digits += c; }
        }
        return literal(kind, qname(xs_ns, "integer"), integer(digits));
      }
    }
    throw std::logic_error("literal: unknown kind");
  }

  literal
  literal::parse(literal_kind kind, const xml_node& node) {
    auto text = node.leading_text();
    if (!text.has_value()) {
      throw empty_value("empty literal in <" + node.name().local_name() +
                        "> at line " + std::to_string(node.line()));
    }
    return parse(kind, *text);
  }

  std::string
  literal::lexical() const {
    return std::visit(
        [](const auto& v) -> std::string {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::string>) {
            return v;
          } else {
            return v.to_string();
          }
        },
        value_);
  }

} // namespace xg
