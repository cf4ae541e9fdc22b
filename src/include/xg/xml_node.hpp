#pragma once

#include <xg/qname.hpp>
#include <xg/xml_reader.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace xg {

  class xml_writer;

  struct xml_attribute {
    qname name;
    std::string value;

    bool
    operator==(const xml_attribute&) const = default;
  };

  // A fully materialized element: documents are held as trees, never
  // streamed, once they reach the schema compiler or the instance parser.
  class xml_node {
    qname name_;
    std::vector<xml_attribute> attributes_;
    std::vector<std::variant<std::string, xml_node>> children_;
    std::size_t line_ = 0;
    namespace_bindings declarations_;
    std::shared_ptr<const namespace_bindings> scope_;

  public:
    using child = std::variant<std::string, xml_node>;

    xml_node() = default;

    xml_node(qname name, std::vector<xml_attribute> attributes,
             std::vector<child> children, std::size_t line = 0)
        : name_(std::move(name)), attributes_(std::move(attributes)),
          children_(std::move(children)), line_(line) {}

    // The reader must be positioned on a start_element event; on return it
    // is positioned on the matching end_element.
    xml_node(xml_reader& reader,
             std::shared_ptr<const namespace_bindings> parent_scope);

    static xml_node
    parse(std::string_view xml);

    const qname&
    name() const {
      return name_;
    }

    const std::vector<xml_attribute>&
    attributes() const {
      return attributes_;
    }

    const std::vector<child>&
    children() const {
      return children_;
    }

    std::size_t
    line() const {
      return line_;
    }

    const namespace_bindings&
    declarations() const {
      return declarations_;
    }

    // Unqualified attribute by local name.
    const std::string*
    attribute(std::string_view local_name) const;

    // Text before the first child element; nullopt when there is none at all.
    std::optional<std::string_view>
    leading_text() const;

    std::vector<const xml_node*>
    elements() const;

    std::vector<const xml_node*>
    elements(const qname& name) const;

    const xml_node*
    first_element(const qname& name) const;

    std::optional<std::string>
    namespace_for_prefix(std::string_view prefix) const;

    std::optional<std::string>
    prefix_for_namespace(std::string_view uri) const;

    void
    write(xml_writer& writer) const;

    std::string
    markup() const;
  };

} // namespace xg
