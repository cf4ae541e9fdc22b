#include <xg/dataset_config.hpp>
#include <xg/xml_node.hpp>

#include <cctype>
#include <stdexcept>
#include <utility>

namespace xg {

  namespace {

    const std::string mitre_base = "https://owl.caprica-project.org/";

    const std::vector<std::string> relation_natures = {
        "canAlsoBe", "canFollow", "canPrecede", "childOf",
        "peerOf",    "requires",  "startsWith"};

    atom
    object_atom(std::string_view triple) {
      return atom::parse_triple(atom_kind::object_property, triple);
    }

    atom
    data_atom(std::string_view triple) {
      return atom::parse_triple(atom_kind::data_property, triple);
    }

    // relatedTo plus one rule per relationship nature.
    void
    add_relation_rules(std::vector<rule>& rules, const std::string& entry_type,
                       const std::string& kind_upper) {
      const std::string related = "s1 hasRelated" + entry_type + " r";
      const std::string entry_id = "r has" + kind_upper + "ID id";
      rules.push_back({"relatedTo",
                       {object_atom(related), data_atom(entry_id),
                        data_atom("s2 hasID id")},
                       {object_atom("s1 relatedTo s2")}});
      for (const auto& nature : relation_natures) {
        std::string capitalized = nature;
        capitalized[0] = static_cast<char>(
            std::toupper(static_cast<unsigned char>(capitalized[0])));
        rules.push_back(
            {nature,
             {object_atom(related),
              object_atom("r hasNature indRelatedNatureEnumeration" +
                          capitalized),
              data_atom(entry_id), data_atom("s2 hasID id")},
             {object_atom("s1 " + nature + " s2")}});
      }
    }

    std::string
    required(const xml_node& node, std::string_view local) {
      const std::string* value = node.attribute(local);
      if (value == nullptr) {
        throw std::runtime_error("dataset_config: missing attribute '" +
                                 std::string(local) + "' on <" +
                                 node.name().local_name() + "> at line " +
                                 std::to_string(node.line()));
      }
      return *value;
    }

    bool
    in_dataset_ns(const xml_node& node, std::string_view local) {
      return node.name().namespace_uri() == dataset_ns &&
             node.name().local_name() == local;
    }

    std::vector<atom>
    load_atoms(const xml_node& block) {
      std::vector<atom> atoms;
      for (const auto* child : block.elements()) {
        if (in_dataset_ns(*child, "class")) {
          atoms.push_back(
              atom::of_class(required(*child, "subject"), required(*child, "class")));
          continue;
        }
        atom_kind kind;
        if (in_dataset_ns(*child, "object")) {
          kind = atom_kind::object_property;
        } else if (in_dataset_ns(*child, "data")) {
          kind = atom_kind::data_property;
        } else {
          throw std::runtime_error("dataset_config: unexpected <" +
                                   child->name().local_name() +
                                   "> in rule at line " +
                                   std::to_string(child->line()));
        }
        auto text = child->leading_text();
        try {
          atoms.push_back(atom::parse_triple(kind, text ? *text : ""));
        } catch (const std::invalid_argument& e) {
          throw std::runtime_error("dataset_config: line " +
                                   std::to_string(child->line()) + ": " +
                                   e.what());
        }
      }
      return atoms;
    }

    rule
    load_rule(const xml_node& node) {
      rule r;
      r.name = required(node, "name");
      for (const auto* child : node.elements()) {
        if (in_dataset_ns(*child, "body")) {
          r.body = load_atoms(*child);
        } else if (in_dataset_ns(*child, "head")) {
          r.head = load_atoms(*child);
        } else {
          throw std::runtime_error("dataset_config: unexpected <" +
                                   child->name().local_name() + "> in rule '" +
                                   r.name + "'");
        }
      }
      if (r.head.empty()) {
        throw std::runtime_error("dataset_config: rule '" + r.name +
                                 "' has no head");
      }
      return r;
    }

    std::vector<std::string>
    split_path(const std::string& path) {
      std::vector<std::string> steps;
      std::size_t start = 0;
      while (start <= path.size()) {
        auto slash = path.find('/', start);
        if (slash == std::string::npos) slash = path.size();
        if (slash > start) steps.push_back(path.substr(start, slash - start));
        start = slash + 1;
      }
      return steps;
    }

  } // namespace

  dataset_config
  dataset_config::defaults() {
    dataset_config config;
    config.identity = identity_policy::defaults();
    config.identity.type_aliases = {{"Attack_Pattern", "CAPEC"},
                                    {"Vulnerability", "CVE"},
                                    {"Weakness", "CWE"}};
    return config;
  }

  dataset_config
  dataset_config::mitre(std::string_view kind) {
    dataset_config config = defaults();
    config.name = std::string(kind);
    const std::string capec = mitre_base + "capec#";
    const std::string cve = mitre_base + "cve#";
    const std::string cwe = mitre_base + "cwe#";

    if (kind == "cwe") {
      config.compiling.alone = {{"MemberType", {}}, {"RelationshipsType", {}}};
      config.rules.push_back(
          {"hasCAPEC",
           {atom::of_class("w", "Weakness"), data_atom("w hasCAPECID id"),
            atom::of_class("a", capec + "AttackPattern"),
            data_atom("a " + capec + "hasID id")},
           {object_atom("w hasCAPEC a")}});
      config.rules.push_back(
          {"hasCVE",
           {atom::of_class("w", "Weakness"),
            object_atom("w hasObservedExample e"),
            data_atom("e hasReference id"),
            atom::of_class("v", cve + "Vulnerability"),
            data_atom("v " + cve + "hasName id")},
           {object_atom("w hasCVE v")}});
      add_relation_rules(config.rules, "Weakness", "CWE");
    } else if (kind == "capec") {
      config.compiling.alone = {
          {"RelationshipsType", {}},
          {"ExecutionFlowType", {"Attack_Step", "Technique"}}};
      config.rules.push_back(
          {"hasCWE",
           {atom::of_class("a", "AttackPattern"), data_atom("a hasID id"),
            atom::of_class("w", cwe + "Weakness"),
            data_atom("w " + cwe + "hasCAPECID id")},
           {object_atom("a hasCWE w")}});
      add_relation_rules(config.rules, "AttackPattern", "CAPEC");
    } else if (kind == "cve") {
      config.compiling.renames = {{"item", "Vulnerability"}};
      config.rules.push_back(
          {"hasCWE",
           {atom::of_class("v", "Vulnerability"),
            atom::of_class("w", cwe + "Weakness"),
            object_atom("w " + cwe + "hasCVE v")},
           {object_atom("v hasCWE w")}});
    } else {
      throw std::runtime_error("dataset_config: unknown dataset kind '" +
                               std::string(kind) + "'");
    }
    return config;
  }

  dataset_config
  dataset_config::load(xml_reader& reader) {
    xml_node root;
    bool found = false;
    while (reader.read()) {
      if (reader.node_type() == xml_node_type::start_element) {
        root = xml_node(reader, nullptr);
        found = true;
        break;
      }
    }
    if (!found || !in_dataset_ns(root, "dataset")) {
      throw std::runtime_error("dataset_config: expected <dataset> root element "
                               "in namespace " + dataset_ns);
    }

    dataset_config config;
    config.name = required(root, "name");
    if (const auto* base = root.attribute("base-iri")) config.base_iri = *base;
    config.compiling.raw_namespaces.clear();

    for (const auto* child : root.elements()) {
      if (child->name().namespace_uri() != dataset_ns) {
        throw std::runtime_error("dataset_config: unexpected element " +
                                 child->name().clark());
      }
      const auto& tag = child->name().local_name();
      if (tag == "id-attribute") {
        config.identity.id_attributes.push_back(required(*child, "name"));
      } else if (tag == "name-attribute") {
        config.identity.name_attributes.push_back(required(*child, "name"));
      } else if (tag == "type-alias") {
        config.identity.type_aliases.insert_or_assign(required(*child, "type"),
                                                      required(*child, "name"));
      } else if (tag == "rename") {
        config.compiling.renames.insert_or_assign(required(*child, "tag"),
                                                  required(*child, "as"));
      } else if (tag == "alone") {
        alone_override forced{required(*child, "type"), {}};
        if (const auto* path = child->attribute("path")) {
          forced.path = split_path(*path);
        }
        config.compiling.alone.push_back(std::move(forced));
      } else if (tag == "keep-annotation") {
        config.compiling.keep_annotations.push_back(required(*child, "type"));
      } else if (tag == "raw-namespace") {
        config.compiling.raw_namespaces.push_back(required(*child, "uri"));
      } else if (tag == "rule") {
        config.rules.push_back(load_rule(*child));
      } else {
        throw std::runtime_error("dataset_config: unknown element <" + tag +
                                 "> at line " + std::to_string(child->line()));
      }
    }

    auto fallback = defaults();
    if (config.identity.id_attributes.empty()) {
      config.identity.id_attributes = fallback.identity.id_attributes;
    }
    if (config.identity.name_attributes.empty()) {
      config.identity.name_attributes = fallback.identity.name_attributes;
    }
    if (config.identity.type_aliases.empty()) {
      config.identity.type_aliases = fallback.identity.type_aliases;
    }
    if (config.compiling.raw_namespaces.empty()) {
      config.compiling.raw_namespaces = fallback.compiling.raw_namespaces;
    }
    return config;
  }

  std::string
  dataset_config::ontology_iri() const {
    if (!base_iri.empty()) return base_iri;
    return mitre_base + name;
  }

} // namespace xg
