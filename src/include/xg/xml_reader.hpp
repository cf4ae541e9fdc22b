#pragma once

#include <xg/qname.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace xg {

  enum class xml_node_type {
    start_element,
    end_element,
    characters,
  };

  // (prefix, uri) pairs; the empty prefix is the default namespace.
  using namespace_bindings = std::vector<std::pair<std::string, std::string>>;

  class xml_reader {
  public:
    virtual ~xml_reader() = default;

    virtual bool
    read() = 0;

    virtual xml_node_type
    node_type() const = 0;

    virtual const qname&
    name() const = 0;

    virtual std::size_t
    attribute_count() const = 0;

    virtual const qname&
    attribute_name(std::size_t index) const = 0;

    virtual std::string_view
    attribute_value(std::size_t index) const = 0;

    virtual std::string_view
    attribute_value(const qname& name) const = 0;

    virtual std::string_view
    text() const = 0;

    virtual std::size_t
    depth() const = 0;

    // Line of the current start tag (1-based).
    virtual std::size_t
    line() const = 0;

    // Bindings introduced by the current start tag.
    virtual const namespace_bindings&
    namespace_declarations() const = 0;

    virtual std::string_view
    namespace_uri_for_prefix(std::string_view prefix) const = 0;
  };

} // namespace xg
