#pragma once

#include <xg/entity.hpp>
#include <xg/instance_parser.hpp>
#include <xg/rule.hpp>
#include <xg/xml_writer.hpp>

#include <string>
#include <unordered_set>
#include <vector>

namespace xg {

  inline const std::string owl_ns = "http://www.w3.org/2002/07/owl#";

  struct ontology {
    std::string iri;
    // Prelude declarations first, then the parsed documents.
    std::vector<declaration> entries;
    std::vector<rule> rules;

    // Documents contribute their entities; bare scalars have no subject and
    // are dropped.
    void
    add(const parse_result& result);
  };

  // Serializes an ontology as OWL/XML. Nested individuals are written right
  // after the assertion that reaches them, each at most once.
  class owl_writer {
    xml_writer& writer_;
    const identity_policy& policy_;
    std::unordered_set<const individual*> written_;

    void
    write_class(const owl_class& cls);

    void
    write_note(const relation_note& note);

    void
    write_individual(const individual& ind);

    void
    write_assertion(const std::string& subject, const has& assertion);

    void
    write_rule(const rule& r);

    void
    write_atom(const atom& a);

  public:
    owl_writer(xml_writer& writer, const identity_policy& policy);

    void
    write(const ontology& onto);
  };

} // namespace xg
