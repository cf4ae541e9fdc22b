#pragma once

#include <xg/schema.hpp>
#include <xg/xml_node.hpp>

#include <string>
#include <unordered_map>
#include <vector>

namespace xg {

  // A type to flatten regardless of its shape. `type` is a local name in the
  // schema's target namespace; a non-empty `path` follows child element
  // names down to an anonymous type.
  struct alone_override {
    std::string type;
    std::vector<std::string> path;
  };

  struct compile_options {
    std::vector<alone_override> alone;
    // Flattened types whose documentation stays on the relation.
    std::vector<std::string> keep_annotations;
    // Namespaces whose wildcard content passes through as raw markup.
    std::vector<std::string> raw_namespaces{xhtml_ns};
    // Element local name -> public name used for relations, individual
    // types and classes.
    std::unordered_map<std::string, std::string> renames;
  };

  class schema_compiler {
  public:
    // Compiles an xs:schema tree and initializes its prelude.
    schema
    compile(const xml_node& root, const compile_options& options = {}) const;
  };

} // namespace xg
