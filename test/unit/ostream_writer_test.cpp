#include <xg/ostream_writer.hpp>
#include <xg/xml_writer.hpp>

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <stdexcept>
#include <string>

using namespace xg;

TEST_CASE("writer: empty element is self-closing", "[ostream_writer]") {
  std::ostringstream os;
  ostream_writer writer(os);

  writer.start_element({"", "root"});
  writer.end_element();

  CHECK(os.str() == "<root/>");
}

TEST_CASE("writer: text and attributes are escaped", "[ostream_writer]") {
  std::ostringstream os;
  ostream_writer writer(os);

  writer.start_element({"", "e"});
  writer.attribute({"", "a"}, "x\"<y>\n");
  writer.characters("1 < 2 & 3");
  writer.end_element();

  CHECK(os.str() ==
        R"(<e a="x&quot;&lt;y>&#10;">1 &lt; 2 &amp; 3</e>)");
}

TEST_CASE("writer: default and prefixed namespaces", "[ostream_writer]") {
  std::ostringstream os;
  ostream_writer writer(os);

  writer.start_element({"urn:owl", "Ontology"});
  writer.namespace_declaration("", "urn:owl");
  writer.namespace_declaration("xml", "http://www.w3.org/XML/1998/namespace");
  writer.attribute({"http://www.w3.org/XML/1998/namespace", "base"}, "urn:b");
  writer.start_element({"urn:owl", "Prefix"});
  writer.end_element();
  writer.end_element();

  CHECK(os.str() ==
        R"(<Ontology xmlns="urn:owl" xmlns:xml="http://www.w3.org/XML/1998/namespace" xml:base="urn:b"><Prefix/></Ontology>)");
}

TEST_CASE("writer: namespace bindings are scoped to elements",
          "[ostream_writer]") {
  std::ostringstream os;
  ostream_writer writer(os);

  writer.start_element({"urn:foo", "root"});
  writer.namespace_declaration("x", "urn:foo");
  writer.start_element({"urn:foo", "child"});
  writer.namespace_declaration("y", "urn:foo");
  writer.end_element();
  writer.start_element({"urn:foo", "sibling"});
  writer.end_element();
  writer.end_element();

  CHECK(os.str() ==
        R"(<x:root xmlns:x="urn:foo"><y:child xmlns:y="urn:foo"/><x:sibling/></x:root>)");
}

TEST_CASE("writer: indentation applies to element-only content",
          "[ostream_writer]") {
  std::ostringstream os;
  ostream_writer writer(os, true);

  writer.xml_declaration();
  writer.start_element({"", "a"});
  writer.start_element({"", "b"});
  writer.characters("text");
  writer.end_element();
  writer.start_element({"", "c"});
  writer.end_element();
  writer.end_element();

  CHECK(os.str() == "<?xml version=\"1.0\"?>\n"
                    "<a>\n"
                    "    <b>text</b>\n"
                    "    <c/>\n"
                    "</a>");
}

TEST_CASE("writer: misuse raises logic_error", "[ostream_writer]") {
  std::ostringstream os;
  ostream_writer writer(os);

  CHECK_THROWS_AS(writer.end_element(), std::logic_error);
  CHECK_THROWS_AS(writer.namespace_declaration("p", "urn:p"),
                  std::logic_error);
}
