#include <xg/errors.hpp>
#include <xg/instance_parser.hpp>

#include <iterator>
#include <stdexcept>
#include <type_traits>

namespace xg {

  namespace {

    std::string
    where(const xml_node& node) {
      return "<" + node.name().local_name() + "> at line " +
             std::to_string(node.line());
    }

    void
    splice(std::vector<has>& into, std::vector<has> from) {
      into.insert(into.end(), std::make_move_iterator(from.begin()),
                  std::make_move_iterator(from.end()));
    }

  } // namespace

  instance_parser::instance_parser(const schema& s) : schema_(s) {
    if (!schema_.prelude_initialized()) {
      throw std::logic_error("instance_parser: schema prelude not initialized");
    }
  }

  const std::string&
  instance_parser::public_name(const xml_node& node) const {
    return schema_.public_name(node.name().local_name());
  }

  parse_result
  instance_parser::parse(const xml_node& root) const {
    const element_decl* decl = schema_.find_root(root.name());
    if (decl == nullptr) {
      throw unexpected_element("instance_parser: " + root.name().clark() +
                               " is not a declared root element");
    }
    auto handle = schema_.resolve(decl->type);
    // An attribute-only root has no parent to splice into and stays an
    // entity; flattened wrappers reduce to their assertions.
    const auto* complex =
        std::get_if<complex_type>(&schema_.type(handle).definition);
    if (complex != nullptr && complex->alone() && complex->content()) {
      return parse_element(*decl, root);
    }
    auto value = parse_type(handle, root);
    if (auto* lit = std::get_if<literal>(&value)) return std::move(*lit);
    return std::get<individual_ptr>(std::move(value));
  }

  has_target
  instance_parser::parse_type(type_handle handle, const xml_node& node) const {
    const auto& record = schema_.type(handle);
    return std::visit(
        [&](const auto& definition) -> has_target {
          using T = std::decay_t<decltype(definition)>;
          if constexpr (std::is_same_v<T, literal_type>) {
            return literal::parse(definition.kind, node);
          } else if constexpr (std::is_same_v<T, simple_type>) {
            return parse_simple(definition, node);
          } else {
            auto type = public_name(node);
            auto fallback = type + '_' + std::to_string(node.line());
            return std::make_shared<individual>(
                std::move(fallback), std::move(type),
                parse_complex_content(definition, node));
          }
        },
        record.definition);
  }

  has_target
  instance_parser::parse_simple(const simple_type& simple,
                                const xml_node& node) const {
    if (!simple.is_vocabulary()) {
      return parse_type(schema_.resolve(simple.base()), node);
    }
    auto text = node.leading_text();
    if (!text) {
      throw empty_value("instance_parser: empty value in " + where(node));
    }
    return simple.lookup(trim(*text));
  }

  std::vector<has>
  instance_parser::parse_element(const element_decl& decl,
                                 const xml_node& node) const {
    auto handle = schema_.resolve(decl.type);
    auto name = public_name(node);
    if (!schema_.alone(handle)) {
      std::vector<has> result;
      result.emplace_back(std::move(name), parse_type(handle, node));
      return result;
    }
    // Flattened: the wrapper's assertions belong to the enclosing entity and
    // anonymous values take this element's name.
    const auto& complex = std::get<complex_type>(schema_.type(handle).definition);
    auto assertions = parse_complex_content(complex, node);
    for (auto& assertion : assertions) {
      if (assertion.is_placeholder()) assertion = assertion.renamed(name);
    }
    return assertions;
  }

  has
  instance_parser::parse_attribute(const attribute_use& use,
                                   std::string_view raw) const {
    const auto& record = schema_.type(schema_.resolve(use.type));
    if (const auto* lit = std::get_if<literal_type>(&record.definition)) {
      return has(use.name, literal::parse(lit->kind, raw));
    }
    if (const auto* simple = std::get_if<simple_type>(&record.definition)) {
      if (simple->is_vocabulary()) {
        return has(use.name, simple->lookup(trim(raw)));
      }
      return parse_attribute(attribute_use{use.name, simple->base(), use.required},
                             raw);
    }
    throw schema_error("instance_parser: attribute '" + use.name +
                       "' is bound to a complex type");
  }

  std::vector<has>
  instance_parser::parse_attributes(const std::vector<attribute_use>& uses,
                                    const xml_node& node) const {
    std::vector<has> assertions;
    for (const auto& use : uses) {
      if (const auto* raw = node.attribute(use.name)) {
        assertions.push_back(parse_attribute(use, *raw));
      }
    }
    return assertions;
  }

  std::vector<has>
  instance_parser::parse_complex_content(const complex_type& complex,
                                         const xml_node& node) const {
    auto assertions = parse_attributes(complex.attributes(), node);
    if (!complex.content()) return assertions;
    std::visit(
        [&](const auto& content) {
          using T = std::decay_t<decltype(content)>;
          if constexpr (std::is_same_v<T, extension>) {
            splice(assertions, parse_extension(content, node));
          } else if constexpr (std::is_same_v<T, sequence>) {
            if (content.any) {
              assertions.push_back(parse_wildcard(*content.any, node));
            } else {
              splice(assertions, parse_named_children(content.names, node));
            }
          } else {
            splice(assertions, parse_named_children(content.names, node));
          }
        },
        *complex.content());
    return assertions;
  }

  std::vector<has>
  instance_parser::parse_named_children(const dispatch_table& names,
                                        const xml_node& node) const {
    std::vector<has> assertions;
    for (const auto* child : node.elements()) {
      const element_handle* element = names.find(child->name());
      if (element == nullptr) {
        throw unexpected_element("instance_parser: unexpected " +
                                 child->name().clark() + " in " + where(node));
      }
      splice(assertions, parse_element(schema_.element(*element), *child));
    }
    return assertions;
  }

  std::vector<has>
  instance_parser::parse_extension(const extension& ext,
                                   const xml_node& node) const {
    auto assertions = parse_attributes(ext.attributes, node);
    auto base = schema_.resolve(ext.base);
    try {
      if (const auto* complex =
              std::get_if<complex_type>(&schema_.type(base).definition)) {
        splice(assertions, parse_complex_content(*complex, node));
      } else {
        assertions.emplace_back(value_placeholder, parse_type(base, node));
      }
    } catch (const empty_value&) {
      // An empty base value only drops the base assertions.
    }
    return assertions;
  }

  has
  instance_parser::parse_wildcard(const wildcard& any,
                                  const xml_node& node) const {
    // The captured content is re-rooted under an XHTML div.
    xml_node captured(qname(xhtml_ns, "div"), {}, node.children(), node.line());
    const auto& ns = captured.name().namespace_uri();
    if (!any.accepts(ns, schema_.target_namespace())) {
      throw unexpected_namespace("instance_parser: wildcard in " + where(node) +
                                 " does not accept namespace " + ns);
    }
    if (auto handle = schema_.find_type(captured.name())) {
      return has(value_placeholder, parse_type(*handle, captured));
    }
    for (const auto& raw : schema_.raw_namespaces()) {
      if (raw == ns) {
        return has(value_placeholder,
                   literal::text(std::string(trim(captured.markup())),
                                 captured.name()));
      }
    }
    throw unexpected_namespace("instance_parser: namespace " + ns +
                               " is not passed through, in " + where(node));
  }

} // namespace xg
