#include <catch2/catch_test_macros.hpp>

#define STRINGIFY_HELPER(x) #x
#define STRINGIFY(x) STRINGIFY_HELPER(x)

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

static const std::string xg_cli = STRINGIFY(XG_CLI);
static const std::string data_dir = STRINGIFY(XG_TEST_DATA_DIR);

static const std::string schema = data_dir + "/cwe_mini.xsd";
static const std::string document = data_dir + "/cwe_mini.xml";
static const std::string config = data_dir + "/cwe_mini_dataset.xml";

// Portable exit code extraction: WEXITSTATUS on POSIX, raw value on Windows
static int
exit_code(int status) {
#ifdef _WIN32
  return status;
#else
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  return -1;
#endif
}

static int
run_cli(const std::string& args) {
  std::string cmd = xg_cli + " " + args + " 2>/dev/null";
  return exit_code(std::system(cmd.c_str()));
}

static int
run_cli_stderr(const std::string& args, std::string& stderr_output) {
  auto tmp = fs::temp_directory_path() / "xg_cli_stderr.txt";
  std::string cmd = xg_cli + " " + args + " 2>" + tmp.string();
  int rc = exit_code(std::system(cmd.c_str()));
  std::ifstream in(tmp);
  stderr_output.assign(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
  fs::remove(tmp);
  return rc;
}

static std::string
make_tmp_dir(const std::string& name) {
  auto dir = fs::temp_directory_path() / ("xg_cli_" + name);
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir.string();
}

static void
cleanup_dir(const std::string& path) {
  fs::remove_all(path);
}

static std::string
read_output(const std::string& path) {
  std::ifstream in(path);
  return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

TEST_CASE("--help exits 0 and produces output", "[cli]") {
  std::string err;
  int rc = run_cli_stderr("--help", err);
  CHECK(rc == 0);
  CHECK(err.find("Usage") != std::string::npos);
}

TEST_CASE("-h exits 0 and produces output", "[cli]") {
  CHECK(run_cli("-h") == 0);
}

TEST_CASE("--version exits 0 and contains version", "[cli]") {
  std::string err;
  int rc = run_cli_stderr("--version", err);
  CHECK(rc == 0);
  CHECK(err.find("xg") != std::string::npos);
}

TEST_CASE("no arguments exits 1 (usage error)", "[cli]") {
  CHECK(run_cli("") == 1);
}

TEST_CASE("unknown option exits 1", "[cli]") {
  CHECK(run_cli("--bogus " + schema + " " + document) == 1);
}

TEST_CASE("option without its argument exits 1", "[cli]") {
  CHECK(run_cli(schema + " " + document + " -o") == 1);
}

TEST_CASE("-c and -k together exit 1", "[cli]") {
  CHECK(run_cli("-c " + config + " -k cwe " + schema + " " + document) == 1);
}

TEST_CASE("schema without documents exits 1", "[cli]") {
  std::string err;
  int rc = run_cli_stderr(schema, err);
  CHECK(rc == 1);
  CHECK(err.find("at least one document") != std::string::npos);
}

TEST_CASE("nonexistent schema file exits 2 (file error)", "[cli]") {
  CHECK(run_cli("nonexistent.xsd " + document) == 2);
}

TEST_CASE("nonexistent document exits 2", "[cli]") {
  std::string out_dir = make_tmp_dir("missing_doc");
  CHECK(run_cli("-o " + out_dir + "/out.owx " + schema + " nonexistent.xml") ==
        2);
  cleanup_dir(out_dir);
}

TEST_CASE("nonexistent configuration exits 2", "[cli]") {
  CHECK(run_cli("-c nonexistent.xml " + schema + " " + document) == 2);
}

TEST_CASE("unwritable output exits 2", "[cli]") {
  std::string out_dir = make_tmp_dir("unwritable");
  cleanup_dir(out_dir);
  CHECK(run_cli("-c " + config + " -o " + out_dir + "/missing/out.owx " +
                schema + " " + document) == 2);
}

TEST_CASE("malformed schema exits 3", "[cli]") {
  std::string err;
  int rc = run_cli_stderr(document + " " + document, err);
  CHECK(rc == 3);
  CHECK(err.find("xg: error compiling schema") != std::string::npos);
}

TEST_CASE("unknown dataset kind exits 3", "[cli]") {
  CHECK(run_cli("-k nvd " + schema + " " + document) == 3);
}

TEST_CASE("malformed configuration exits 3", "[cli]") {
  CHECK(run_cli("-c " + schema + " " + schema + " " + document) == 3);
}

TEST_CASE("document outside the schema exits 4", "[cli]") {
  std::string out_dir = make_tmp_dir("mismatch");
  std::string err;
  int rc = run_cli_stderr("-o " + out_dir + "/out.owx " + schema + " " + schema,
                          err);
  CHECK(rc == 4);
  CHECK(err.find("xg: error converting") != std::string::npos);
  cleanup_dir(out_dir);
}

TEST_CASE("convert with a dataset configuration", "[cli]") {
  std::string out_dir = make_tmp_dir("convert");
  std::string output = out_dir + "/out.owx";

  int rc = run_cli("-c " + config + " -o " + output + " " + schema + " " +
                   document);
  REQUIRE(rc == 0);
  REQUIRE(fs::exists(output));

  auto content = read_output(output);
  CHECK(content.starts_with("<?xml version=\"1.0\"?>"));
  CHECK(content.find("<Ontology") != std::string::npos);
  CHECK(content.find("ontologyIRI=\"https://example.org/cwe-mini\"") !=
        std::string::npos);
  CHECK(content.find("#CWE-79") != std::string::npos);
  CHECK(content.find("<DLSafeRule>") != std::string::npos);
  CHECK(content.ends_with("</Ontology>\n"));

  cleanup_dir(out_dir);
}

TEST_CASE("built-in dataset settings", "[cli]") {
  std::string out_dir = make_tmp_dir("kind");
  std::string output = out_dir + "/cwe.owx";

  int rc = run_cli("-k cwe -o " + output + " " + schema + " " + document);
  REQUIRE(rc == 0);

  auto content = read_output(output);
  CHECK(content.find("ontologyIRI=\"https://owl.caprica-project.org/cwe\"") !=
        std::string::npos);
  CHECK(content.find("<Literal>childOf</Literal>") != std::string::npos);

  cleanup_dir(out_dir);
}

TEST_CASE("several documents share one ontology", "[cli]") {
  std::string out_dir = make_tmp_dir("several");
  std::string output = out_dir + "/out.owx";

  int rc = run_cli("-c " + config + " -o " + output + " " + schema + " " +
                   document + " " + document);
  REQUIRE(rc == 0);

  auto content = read_output(output);
  CHECK(content.find("#CWE-352") != std::string::npos);
  CHECK(content.find("<Ontology") == content.rfind("<Ontology"));

  cleanup_dir(out_dir);
}

TEST_CASE("output is named after the ontology by default", "[cli]") {
  std::string out_dir = make_tmp_dir("default_name");

  SECTION("schema stem") {
    int rc = exit_code(std::system(("cd " + out_dir + " && " + xg_cli + " " +
                                    schema + " " + document + " 2>/dev/null")
                                       .c_str()));
    CHECK(rc == 0);
    CHECK(fs::exists(out_dir + "/cwe_mini.owx"));
  }

  SECTION("-n overrides the name") {
    int rc = exit_code(std::system(("cd " + out_dir + " && " + xg_cli +
                                    " -c " + config + " -n sample " + schema +
                                    " " + document + " 2>/dev/null")
                                       .c_str()));
    CHECK(rc == 0);
    CHECK(fs::exists(out_dir + "/sample.owx"));
    auto content = read_output(out_dir + "/sample.owx");
    // base-iri in the configuration still wins over the name
    CHECK(content.find("ontologyIRI=\"https://example.org/cwe-mini\"") !=
          std::string::npos);
  }

  cleanup_dir(out_dir);
}
