#include <xg/owl_writer.hpp>
#include <xg/slug.hpp>

#include <type_traits>

namespace xg {

  namespace {

    const std::string rdf_ns = "http://www.w3.org/1999/02/22-rdf-syntax-ns#";
    const std::string xml_ns = "http://www.w3.org/XML/1998/namespace";
    const std::string xsd_ns = "http://www.w3.org/2001/XMLSchema#";
    const std::string rdfs_ns = "http://www.w3.org/2000/01/rdf-schema#";
    const std::string rdfs_label = rdfs_ns + "label";
    const std::string rdfs_comment = rdfs_ns + "comment";
    const std::string rule_enabled =
        "http://swrl.stanford.edu/ontologies/3.3/swrla.owl#isRuleEnabled";

    qname
    owl(const char* local) {
      return qname(owl_ns, local);
    }

    void
    empty_element(xml_writer& w, const char* local, const char* attr,
                  const std::string& value) {
      w.start_element(owl(local));
      w.attribute(qname("", attr), value);
      w.end_element();
    }

    void
    text_element(xml_writer& w, const char* local, const std::string& text) {
      w.start_element(owl(local));
      w.characters(text);
      w.end_element();
    }

    void
    annotation_assertion(xml_writer& w, const std::string& property,
                         const std::string& subject, const std::string& text) {
      w.start_element(owl("AnnotationAssertion"));
      empty_element(w, "AnnotationProperty", "IRI", property);
      text_element(w, "IRI", subject);
      text_element(w, "Literal", text);
      w.end_element();
    }

    void
    typed_literal(xml_writer& w, const literal& lit) {
      w.start_element(owl("Literal"));
      w.attribute(qname("", "datatypeIRI"), lit.datatype().iri());
      w.characters(lit.lexical());
      w.end_element();
    }

  } // namespace

  void
  ontology::add(const parse_result& result) {
    if (const auto* ind = std::get_if<individual_ptr>(&result)) {
      entries.emplace_back(*ind);
    } else if (const auto* assertions = std::get_if<std::vector<has>>(&result)) {
      for (const auto& assertion : *assertions) {
        for (const auto& value : assertion.values()) {
          if (const auto* ind = std::get_if<individual_ptr>(&value)) {
            entries.emplace_back(*ind);
          }
        }
      }
    }
  }

  owl_writer::owl_writer(xml_writer& writer, const identity_policy& policy)
      : writer_(writer), policy_(policy) {}

  void
  owl_writer::write(const ontology& onto) {
    written_.clear();
    writer_.xml_declaration();
    writer_.start_element(owl("Ontology"));
    writer_.namespace_declaration("", owl_ns);
    writer_.namespace_declaration("rdf", rdf_ns);
    writer_.namespace_declaration("xml", xml_ns);
    writer_.namespace_declaration("xsd", xsd_ns);
    writer_.namespace_declaration("rdfs", rdfs_ns);
    writer_.attribute(qname(xml_ns, "base"), onto.iri);
    writer_.attribute(qname("", "ontologyIRI"), onto.iri);

    const std::pair<const char*, const std::string*> prefixes[] = {
        {"", &onto.iri},     {"owl", &owl_ns},   {"rdf", &rdf_ns},
        {"xml", &xml_ns},    {"xsd", &xsd_ns},   {"rdfs", &rdfs_ns}};
    for (const auto& [name, iri] : prefixes) {
      writer_.start_element(owl("Prefix"));
      writer_.attribute(qname("", "name"), name);
      writer_.attribute(qname("", "IRI"), *iri);
      writer_.end_element();
    }

    for (const auto& entry : onto.entries) {
      std::visit(
          [this](const auto& decl) {
            using T = std::decay_t<decltype(decl)>;
            if constexpr (std::is_same_v<T, owl_class>) {
              write_class(decl);
            } else if constexpr (std::is_same_v<T, relation_note>) {
              write_note(decl);
            } else if (decl) {
              write_individual(*decl);
            }
          },
          entry);
    }
    for (const auto& r : onto.rules) {
      write_rule(r);
    }
    writer_.end_element();
  }

  void
  owl_writer::write_class(const owl_class& cls) {
    auto iri = local_iri(slugify(cls.name));
    writer_.start_element(owl("Declaration"));
    empty_element(writer_, "Class", "IRI", iri);
    writer_.end_element();
    for (const auto& note : cls.annotations) {
      annotation_assertion(writer_, rdfs_comment, iri, note);
    }
  }

  void
  owl_writer::write_note(const relation_note& note) {
    auto iri = local_iri(slugify(note.relation, slug_role::property));
    for (const auto& text : note.annotations) {
      annotation_assertion(writer_, rdfs_comment, iri, text);
    }
  }

  void
  owl_writer::write_individual(const individual& ind) {
    if (ind.ignore() || !written_.insert(&ind).second) return;

    auto slug = ind.slug(policy_);
    auto iri = local_iri(slug);
    writer_.start_element(owl("Declaration"));
    empty_element(writer_, "NamedIndividual", "IRI", iri);
    writer_.end_element();
    annotation_assertion(writer_, rdfs_label, iri, ind.display_name(policy_));
    for (const auto& note : ind.annotations()) {
      annotation_assertion(writer_, rdfs_comment, iri, note);
    }
    if (!ind.type().empty()) {
      writer_.start_element(owl("ClassAssertion"));
      empty_element(writer_, "Class", "IRI", local_iri(slugify(ind.type())));
      empty_element(writer_, "NamedIndividual", "IRI", iri);
      writer_.end_element();
    }
    for (const auto& assertion : ind.assertions()) {
      write_assertion(iri, assertion);
    }
  }

  void
  owl_writer::write_assertion(const std::string& subject,
                              const has& assertion) {
    auto property =
        local_iri(slugify(assertion.attribute(), slug_role::property));
    for (const auto& value : assertion.values()) {
      if (const auto* lit = std::get_if<literal>(&value)) {
        writer_.start_element(owl("DataPropertyAssertion"));
        empty_element(writer_, "DataProperty", "IRI", property);
        empty_element(writer_, "NamedIndividual", "IRI", subject);
        typed_literal(writer_, *lit);
        writer_.end_element();
        continue;
      }
      const auto& target = std::get<individual_ptr>(value);
      if (!target) continue;
      writer_.start_element(owl("ObjectPropertyAssertion"));
      empty_element(writer_, "ObjectProperty", "IRI", property);
      empty_element(writer_, "NamedIndividual", "IRI", subject);
      empty_element(writer_, "NamedIndividual", "IRI",
                    local_iri(target->slug(policy_)));
      writer_.end_element();
      write_individual(*target);
    }
  }

  void
  owl_writer::write_rule(const rule& r) {
    writer_.start_element(owl("DLSafeRule"));

    writer_.start_element(owl("Annotation"));
    empty_element(writer_, "AnnotationProperty", "IRI", rule_enabled);
    writer_.start_element(owl("Literal"));
    writer_.attribute(qname("", "datatypeIRI"), xs_ns + "#boolean");
    writer_.characters("true");
    writer_.end_element();
    writer_.end_element();

    writer_.start_element(owl("Annotation"));
    empty_element(writer_, "AnnotationProperty", "abbreviatedIRI", "rdfs:label");
    text_element(writer_, "Literal", r.name);
    writer_.end_element();

    writer_.start_element(owl("Body"));
    for (const auto& a : r.body) write_atom(a);
    writer_.end_element();
    writer_.start_element(owl("Head"));
    for (const auto& a : r.head) write_atom(a);
    writer_.end_element();

    writer_.end_element();
  }

  void
  owl_writer::write_atom(const atom& a) {
    switch (a.kind) {
      case atom_kind::class_atom:
        writer_.start_element(owl("ClassAtom"));
        empty_element(writer_, "Class", "IRI", local_iri(a.predicate));
        empty_element(writer_, "Variable", "IRI", local_iri(a.subject));
        break;
      case atom_kind::object_property:
        writer_.start_element(owl("ObjectPropertyAtom"));
        empty_element(writer_, "ObjectProperty", "IRI", local_iri(a.predicate));
        empty_element(writer_, "Variable", "IRI", local_iri(a.subject));
        empty_element(writer_, "Variable", "IRI", local_iri(a.object));
        break;
      case atom_kind::data_property:
        writer_.start_element(owl("DataPropertyAtom"));
        empty_element(writer_, "DataProperty", "IRI", local_iri(a.predicate));
        empty_element(writer_, "Variable", "IRI", local_iri(a.subject));
        empty_element(writer_, "Variable", "IRI", local_iri(a.object));
        break;
    }
    writer_.end_element();
  }

} // namespace xg
