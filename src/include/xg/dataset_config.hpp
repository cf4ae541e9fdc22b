#pragma once

#include <xg/entity.hpp>
#include <xg/rule.hpp>
#include <xg/schema_compiler.hpp>
#include <xg/xml_reader.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace xg {

  inline const std::string dataset_ns = "http://xg.dev/dataset";

  // Everything that adapts the generic engine to one dataset.
  struct dataset_config {
    std::string name;
    std::string base_iri;
    identity_policy identity;
    compile_options compiling;
    std::vector<rule> rules;

    // Identity attributes and type aliases shared by the MITRE datasets,
    // XHTML pass-through, no overrides and no rules.
    static dataset_config
    defaults();

    // defaults() plus the overrides and rules of "capec", "cve" or "cwe".
    // Throws std::runtime_error for any other kind.
    static dataset_config
    mitre(std::string_view kind);

    // Reads a <dataset> document. Categories the document leaves empty keep
    // their defaults().
    static dataset_config
    load(xml_reader& reader);

    std::string
    ontology_iri() const;
  };

} // namespace xg
