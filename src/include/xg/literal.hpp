#pragma once

#include <xg/date.hpp>
#include <xg/integer.hpp>
#include <xg/qname.hpp>

#include <string>
#include <string_view>
#include <variant>

namespace xg {

  class xml_node;

  enum class literal_kind { text, date, integer, date_fragment };

  inline const std::string xs_ns = "http://www.w3.org/2001/XMLSchema";

  // Immutable scalar value with the datatype it is serialized under.
  class literal {
    literal_kind kind_ = literal_kind::text;
    qname datatype_;
    std::variant<std::string, date, integer> value_;

    literal(literal_kind kind, qname datatype,
            std::variant<std::string, date, integer> value)
        : kind_(kind), datatype_(std::move(datatype)), value_(std::move(value)) {}

  public:
    static literal
    text(std::string value, qname datatype = qname(xs_ns, "string"));

    // Parse an already extracted lexical value (surrounding whitespace is
    // trimmed).
    static literal
    parse(literal_kind kind, std::string_view lexical);

    // Parse the leading text of an element; throws empty_value when the
    // element has no text at all.
    static literal
    parse(literal_kind kind, const xml_node& node);

    literal_kind
    kind() const {
      return kind_;
    }

    const qname&
    datatype() const {
      return datatype_;
    }

    const std::variant<std::string, date, integer>&
    value() const {
      return value_;
    }

    // Canonical lexical form used for serialization.
    std::string
    lexical() const;

    bool
    operator==(const literal&) const = default;
  };

  std::string_view
  trim(std::string_view s);

} // namespace xg
