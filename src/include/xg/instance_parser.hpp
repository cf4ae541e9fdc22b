#pragma once

#include <xg/entity.hpp>
#include <xg/schema.hpp>
#include <xg/xml_node.hpp>

#include <string>
#include <variant>
#include <vector>

namespace xg {

  // What a document root reduces to: a scalar, an entity, or the assertions
  // of a flattened root.
  using parse_result = std::variant<literal, individual_ptr, std::vector<has>>;

  // Turns instance documents into entity graphs. Never mutates the schema,
  // so one compiled schema can serve any number of documents.
  class instance_parser {
    const schema& schema_;

    has_target
    parse_type(type_handle handle, const xml_node& node) const;

    has_target
    parse_simple(const simple_type& simple, const xml_node& node) const;

    std::vector<has>
    parse_element(const element_decl& decl, const xml_node& node) const;

    has
    parse_attribute(const attribute_use& use, std::string_view raw) const;

    std::vector<has>
    parse_attributes(const std::vector<attribute_use>& uses,
                     const xml_node& node) const;

    std::vector<has>
    parse_complex_content(const complex_type& complex,
                          const xml_node& node) const;

    std::vector<has>
    parse_named_children(const dispatch_table& names,
                         const xml_node& node) const;

    std::vector<has>
    parse_extension(const extension& ext, const xml_node& node) const;

    has
    parse_wildcard(const wildcard& any, const xml_node& node) const;

  public:
    explicit instance_parser(const schema& s);

    parse_result
    parse(const xml_node& root) const;

    // Local name after the schema's renames.
    const std::string&
    public_name(const xml_node& node) const;
  };

} // namespace xg
