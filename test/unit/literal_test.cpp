#include <xg/errors.hpp>
#include <xg/literal.hpp>
#include <xg/xml_node.hpp>

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>

using namespace xg;

TEST_CASE("literal: text keeps its trimmed value", "[literal]") {
  auto lit = literal::parse(literal_kind::text, "  Mini CWE \n");
  CHECK(lit.kind() == literal_kind::text);
  CHECK(lit.datatype() == qname(xs_ns, "string"));
  CHECK(lit.lexical() == "Mini CWE");
  CHECK(std::get<std::string>(lit.value()) == "Mini CWE");
}

TEST_CASE("literal: date values are validated", "[literal]") {
  auto lit = literal::parse(literal_kind::date, "2024-02-29");
  CHECK(lit.datatype() == qname(xs_ns, "date"));
  CHECK(std::get<date>(lit.value()) == date(2024, 2, 29));
  CHECK(lit.lexical() == "2024-02-29");

  CHECK_THROWS_AS(literal::parse(literal_kind::date, "2023-02-29"),
                  std::invalid_argument);
}

TEST_CASE("literal: integer values are canonicalized", "[literal]") {
  auto lit = literal::parse(literal_kind::integer, " 0079 ");
  CHECK(lit.datatype() == qname(xs_ns, "integer"));
  CHECK(lit.lexical() == "79");
  CHECK_THROWS_AS(literal::parse(literal_kind::integer, "seventy"),
                  std::invalid_argument);
}

TEST_CASE("literal: gMonth and gDay become integers", "[literal]") {
  auto month = literal::parse(literal_kind::date_fragment, "--04");
  CHECK(month.kind() == literal_kind::date_fragment);
  CHECK(month.datatype() == qname(xs_ns, "integer"));
  CHECK(month.lexical() == "4");

  auto day = literal::parse(literal_kind::date_fragment, "---31");
  CHECK(day.lexical() == "31");
}

TEST_CASE("literal: explicit datatype for raw markup", "[literal]") {
  qname div{"http://www.w3.org/1999/xhtml", "div"};
  auto lit = literal::text("<div/>", div);
  CHECK(lit.datatype() == div);
  CHECK(lit.datatype().iri() == "http://www.w3.org/1999/xhtml#div");
  CHECK(lit.lexical() == "<div/>");
}

TEST_CASE("literal: element text is read before the first child",
          "[literal]") {
  auto node = xml_node::parse("<Description> Lead text <b>bold</b></Description>");
  auto lit = literal::parse(literal_kind::text, node);
  CHECK(lit.lexical() == "Lead text");
}

TEST_CASE("literal: an element without text raises empty_value",
          "[literal]") {
  auto node = xml_node::parse("<Submission_Date/>");
  CHECK_THROWS_AS(literal::parse(literal_kind::date, node), empty_value);

  auto nested = xml_node::parse("<Summary><b>x</b></Summary>");
  CHECK_THROWS_AS(literal::parse(literal_kind::text, nested), empty_value);
}

TEST_CASE("literal: whitespace-only element text is an empty string",
          "[literal]") {
  auto node = xml_node::parse("<Summary>   </Summary>");
  CHECK(literal::parse(literal_kind::text, node).lexical().empty());
}

TEST_CASE("literal: equality covers kind, datatype and value", "[literal]") {
  CHECK(literal::parse(literal_kind::text, "a") == literal::text("a"));
  CHECK_FALSE(literal::parse(literal_kind::integer, "1") ==
              literal::parse(literal_kind::date_fragment, "1"));
  CHECK_FALSE(literal::text("a") ==
              literal::text("a", qname("urn:x", "string")));
}

TEST_CASE("trim removes ASCII whitespace on both ends", "[literal]") {
  CHECK(trim("  a b \t\r\n") == "a b");
  CHECK(trim("   ").empty());
  CHECK(trim("").empty());
}
