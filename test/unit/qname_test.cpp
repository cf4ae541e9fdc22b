#include <xg/qname.hpp>

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>
#include <unordered_map>

using namespace xg;

TEST_CASE("qname default construction is empty", "[qname]") {
  qname q;
  CHECK(q.empty());
  CHECK(q.namespace_uri().empty());
  CHECK(q.local_name().empty());
}

TEST_CASE("qname equality compares namespace and local name", "[qname]") {
  qname a{"urn:ns", "name"};
  CHECK(a == qname{"urn:ns", "name"});
  CHECK(a != qname{"urn:ns", "other"});
  CHECK(a != qname{"urn:other", "name"});
  CHECK(a != qname{"", "name"});
}

TEST_CASE("qname ordering: namespace first, then local", "[qname]") {
  qname a{"aaa", "zzz"};
  qname b{"bbb", "aaa"};
  qname c{"aaa", "aaa"};
  CHECK(a < b);
  CHECK(c < a);
  CHECK(b > c);
}

TEST_CASE("qname clark notation", "[qname]") {
  CHECK(qname{"urn:ns", "e"}.clark() == "{urn:ns}e");
  CHECK(qname{"", "e"}.clark() == "e");
}

TEST_CASE("qname from_clark accepts both forms", "[qname]") {
  CHECK(qname::from_clark("{urn:ns}e") == qname{"urn:ns", "e"});
  CHECK(qname::from_clark("e") == qname{"", "e"});
  CHECK(qname::from_clark("{}e") == qname{"", "e"});
}

TEST_CASE("qname iri joins with a fragment separator", "[qname]") {
  qname q{"http://www.w3.org/2001/XMLSchema", "integer"};
  CHECK(q.iri() == "http://www.w3.org/2001/XMLSchema#integer");
}

TEST_CASE("qname usable as unordered_map key", "[qname]") {
  std::unordered_map<qname, int> map;
  map[qname{"urn:ns", "a"}] = 1;
  map[qname{"urn:ns", "b"}] = 2;
  map[qname{"urn:ns", "a"}] = 3;
  CHECK(map.size() == 2);
  CHECK(map.at(qname{"urn:ns", "a"}) == 3);
}

TEST_CASE("qname stream output uses clark notation", "[qname]") {
  std::ostringstream os;
  os << qname{"urn:ns", "e"};
  CHECK(os.str() == "{urn:ns}e");
}
