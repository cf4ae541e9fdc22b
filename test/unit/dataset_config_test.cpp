#include <xg/dataset_config.hpp>
#include <xg/expat_reader.hpp>

#include <catch2/catch_test_macros.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace xg;

#ifndef XG_TEST_DATA_DIR
#error "XG_TEST_DATA_DIR must be defined"
#endif

#define STRINGIFY(x) #x
#define TOSTRING(x) STRINGIFY(x)

static const std::string data_dir = TOSTRING(XG_TEST_DATA_DIR);

static std::string
read_file(const std::string& path) {
  std::ifstream in(path);
  REQUIRE(in.good());
  std::ostringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

static dataset_config
load_text(const std::string& body, const std::string& attrs = "name=\"t\"") {
  std::string xml = "<dataset xmlns=\"http://xg.dev/dataset\" " + attrs + ">" +
                    body + "</dataset>";
  expat_reader reader(xml);
  return dataset_config::load(reader);
}

TEST_CASE("dataset_config: defaults", "[dataset_config]") {
  auto config = dataset_config::defaults();
  CHECK(config.name.empty());
  CHECK(config.identity.id_attributes == std::vector<std::string>{"ID", "seq"});
  CHECK(config.identity.name_attributes.front() == "Name");
  CHECK(config.identity.type_aliases.size() == 3);
  CHECK(config.identity.type_aliases.at("Weakness") == "CWE");
  CHECK(config.identity.type_aliases.at("Attack_Pattern") == "CAPEC");
  CHECK(config.identity.type_aliases.at("Vulnerability") == "CVE");
  CHECK(config.compiling.alone.empty());
  CHECK(config.compiling.raw_namespaces == std::vector<std::string>{xhtml_ns});
  CHECK(config.compiling.renames.empty());
  CHECK(config.rules.empty());
}

TEST_CASE("dataset_config: ontology IRI", "[dataset_config]") {
  auto config = dataset_config::defaults();
  config.name = "capec";
  CHECK(config.ontology_iri() == "https://owl.caprica-project.org/capec");
  config.base_iri = "https://example.org/onto";
  CHECK(config.ontology_iri() == "https://example.org/onto");
}

TEST_CASE("dataset_config: load the cwe_mini fixture", "[dataset_config]") {
  auto xml = read_file(data_dir + "/cwe_mini_dataset.xml");
  expat_reader reader(xml);
  auto config = dataset_config::load(reader);

  CHECK(config.name == "cwe-mini");
  CHECK(config.ontology_iri() == "https://example.org/cwe-mini");
  CHECK(config.identity.id_attributes == std::vector<std::string>{"ID", "seq"});
  REQUIRE(config.identity.type_aliases.size() == 1);
  CHECK(config.identity.type_aliases.at("Weakness") == "CWE");

  REQUIRE(config.compiling.alone.size() == 2);
  CHECK(config.compiling.alone[0].type == "MemberType");
  CHECK(config.compiling.alone[0].path.empty());
  CHECK(config.compiling.alone[1].type == "RelationshipsType");
  CHECK(config.compiling.raw_namespaces == std::vector<std::string>{xhtml_ns});

  REQUIRE(config.rules.size() == 1);
  const auto& r = config.rules[0];
  CHECK(r.name == "hasPeer");
  REQUIRE(r.body.size() == 3);
  CHECK(r.body[0] == atom::of_class("w", "Weakness"));
  CHECK(r.body[1] == atom::parse_triple(atom_kind::object_property,
                                        "w hasRelatedWeakness r"));
  CHECK(r.body[2] ==
        atom::parse_triple(atom_kind::data_property, "r hasCWEID id"));
  REQUIRE(r.head.size() == 1);
  CHECK(r.head[0].predicate == "peerOf");
}

TEST_CASE("dataset_config: every category", "[dataset_config]") {
  auto config = load_text(R"(
    <id-attribute name="Key"/>
    <name-attribute name="Label"/>
    <name-attribute name="Title"/>
    <rename tag="item" as="Vulnerability"/>
    <alone type="ExecutionFlowType" path="Attack_Step/Technique"/>
    <keep-annotation type="NotesType"/>
    <raw-namespace uri="urn:markup"/>)");

  CHECK(config.identity.id_attributes == std::vector<std::string>{"Key"});
  CHECK(config.identity.name_attributes ==
        std::vector<std::string>{"Label", "Title"});
  CHECK(config.identity.type_aliases.size() == 3);
  CHECK(config.compiling.renames.at("item") == "Vulnerability");
  REQUIRE(config.compiling.alone.size() == 1);
  CHECK(config.compiling.alone[0].path ==
        std::vector<std::string>{"Attack_Step", "Technique"});
  CHECK(config.compiling.keep_annotations ==
        std::vector<std::string>{"NotesType"});
  CHECK(config.compiling.raw_namespaces ==
        std::vector<std::string>{"urn:markup"});
  CHECK(config.ontology_iri() == "https://owl.caprica-project.org/t");
}

TEST_CASE("dataset_config: malformed files", "[dataset_config]") {
  SECTION("wrong root") {
    expat_reader reader("<config name=\"t\"/>");
    CHECK_THROWS_AS(dataset_config::load(reader), std::runtime_error);
  }
  SECTION("missing name") {
    CHECK_THROWS_AS(load_text("", ""), std::runtime_error);
  }
  SECTION("unknown element") {
    CHECK_THROWS_AS(load_text("<synonym type=\"a\"/>"), std::runtime_error);
  }
  SECTION("foreign element") {
    CHECK_THROWS_AS(load_text("<x:alone xmlns:x=\"urn:x\" type=\"a\"/>"),
                    std::runtime_error);
  }
  SECTION("missing attribute") {
    CHECK_THROWS_AS(load_text("<type-alias type=\"Weakness\"/>"),
                    std::runtime_error);
  }
  SECTION("rule without head") {
    CHECK_THROWS_AS(
        load_text("<rule name=\"r\"><body><object>a p b</object></body></rule>"),
        std::runtime_error);
  }
  SECTION("malformed triple") {
    CHECK_THROWS_AS(
        load_text("<rule name=\"r\"><head><data>a p</data></head></rule>"),
        std::runtime_error);
  }
  SECTION("unknown atom") {
    CHECK_THROWS_AS(
        load_text("<rule name=\"r\"><head><same>a b</same></head></rule>"),
        std::runtime_error);
  }
}

TEST_CASE("dataset_config: error messages name the component",
          "[dataset_config]") {
  try {
    load_text("<synonym/>");
    FAIL("expected an exception");
  } catch (const std::runtime_error& e) {
    CHECK(std::string(e.what()).starts_with("dataset_config:"));
  }
}

TEST_CASE("dataset_config: mitre cwe", "[dataset_config]") {
  auto config = dataset_config::mitre("cwe");
  CHECK(config.name == "cwe");
  CHECK(config.ontology_iri() == "https://owl.caprica-project.org/cwe");
  REQUIRE(config.compiling.alone.size() == 2);
  CHECK(config.compiling.alone[0].type == "MemberType");
  CHECK(config.compiling.alone[1].type == "RelationshipsType");

  // hasCAPEC, hasCVE, relatedTo and one rule per relationship nature.
  REQUIRE(config.rules.size() == 10);
  CHECK(config.rules[0].name == "hasCAPEC");
  CHECK(config.rules[0].body[2] ==
        atom::of_class("a", "https://owl.caprica-project.org/capec#AttackPattern"));
  CHECK(config.rules[1].name == "hasCVE");
  CHECK(config.rules[2].name == "relatedTo");

  const auto& child_of = config.rules[6];
  CHECK(child_of.name == "childOf");
  REQUIRE(child_of.body.size() == 4);
  CHECK(child_of.body[0].predicate == "hasRelatedWeakness");
  CHECK(child_of.body[1].object == "indRelatedNatureEnumerationChildOf");
  CHECK(child_of.body[2].predicate == "hasCWEID");
  CHECK(child_of.head[0] ==
        atom::parse_triple(atom_kind::object_property, "s1 childOf s2"));
}

TEST_CASE("dataset_config: mitre capec", "[dataset_config]") {
  auto config = dataset_config::mitre("capec");
  REQUIRE(config.compiling.alone.size() == 2);
  CHECK(config.compiling.alone[1].type == "ExecutionFlowType");
  CHECK(config.compiling.alone[1].path ==
        std::vector<std::string>{"Attack_Step", "Technique"});
  REQUIRE(config.rules.size() == 9);
  CHECK(config.rules[0].name == "hasCWE");
  CHECK(config.rules.back().name == "startsWith");
  CHECK(config.rules.back().body[0].predicate == "hasRelatedAttackPattern");
}

TEST_CASE("dataset_config: mitre cve", "[dataset_config]") {
  auto config = dataset_config::mitre("cve");
  CHECK(config.compiling.renames.at("item") == "Vulnerability");
  CHECK(config.compiling.alone.empty());
  REQUIRE(config.rules.size() == 1);
  CHECK(config.rules[0].head[0].predicate == "hasCWE");
}

TEST_CASE("dataset_config: unknown mitre kinds", "[dataset_config]") {
  CHECK_THROWS_AS(dataset_config::mitre("nvd"), std::runtime_error);
}
