#include <xg/expat_reader.hpp>
#include <xg/ostream_writer.hpp>
#include <xg/xml_node.hpp>

#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>

namespace xg {

  xml_node::xml_node(xml_reader& reader,
                     std::shared_ptr<const namespace_bindings> parent_scope)
      : name_(reader.name()), line_(reader.line()),
        declarations_(reader.namespace_declarations()),
        scope_(std::move(parent_scope)) {
    if (!declarations_.empty()) {
      auto scope = std::make_shared<namespace_bindings>();
      if (scope_) { *scope = *scope_; }
      scope->insert(scope->end(), declarations_.begin(), declarations_.end());
      scope_ = std::move(scope);
    }

    for (std::size_t i = 0; i < reader.attribute_count(); ++i) {
      attributes_.push_back(
          {reader.attribute_name(i), std::string(reader.attribute_value(i))});
    }

    std::size_t start_depth = reader.depth();
    while (reader.read()) {
      switch (reader.node_type()) {
        case xml_node_type::start_element:
          children_.emplace_back(xml_node(reader, scope_));
          break;
        case xml_node_type::characters:
          children_.emplace_back(std::string(reader.text()));
          break;
        case xml_node_type::end_element:
          if (reader.depth() == start_depth) { return; }
          break;
      }
    }
    throw std::runtime_error("unexpected end of input while parsing element '" +
                             name_.local_name() + "'");
  }

  xml_node
  xml_node::parse(std::string_view xml) {
    expat_reader reader(xml);
    while (reader.read()) {
      if (reader.node_type() == xml_node_type::start_element) {
        return xml_node(reader, nullptr);
      }
    }
    throw std::runtime_error("XML parse error: no root element");
  }

  const std::string*
  xml_node::attribute(std::string_view local_name) const {
    for (const auto& attr : attributes_) {
      if (attr.name.namespace_uri().empty() &&
          attr.name.local_name() == local_name) {
        return &attr.value;
      }
    }
    return nullptr;
  }

  std::optional<std::string_view>
  xml_node::leading_text() const {
    if (children_.empty()) { return std::nullopt; }
    if (const auto* text = std::get_if<std::string>(&children_.front())) {
      return std::string_view(*text);
    }
    return std::nullopt;
  }

  std::vector<const xml_node*>
  xml_node::elements() const {
    std::vector<const xml_node*> result;
    for (const auto& c : children_) {
      if (const auto* e = std::get_if<xml_node>(&c)) { result.push_back(e); }
    }
    return result;
  }

  std::vector<const xml_node*>
  xml_node::elements(const qname& name) const {
    std::vector<const xml_node*> result;
    for (const auto& c : children_) {
      const auto* e = std::get_if<xml_node>(&c);
      if (e != nullptr && e->name() == name) { result.push_back(e); }
    }
    return result;
  }

  const xml_node*
  xml_node::first_element(const qname& name) const {
    for (const auto& c : children_) {
      const auto* e = std::get_if<xml_node>(&c);
      if (e != nullptr && e->name() == name) { return e; }
    }
    return nullptr;
  }

  std::optional<std::string>
  xml_node::prefix_for_namespace(std::string_view uri) const {
    if (!scope_) { return std::nullopt; }
    for (auto it = scope_->rbegin(); it != scope_->rend(); ++it) {
      if (it->second == uri) { return it->first; }
    }
    return std::nullopt;
  }

  std::optional<std::string>
  xml_node::namespace_for_prefix(std::string_view prefix) const {
    if (prefix == "xml") { return "http://www.w3.org/XML/1998/namespace"; }
    if (!scope_) { return std::nullopt; }
    for (auto it = scope_->rbegin(); it != scope_->rend(); ++it) {
      if (it->first == prefix) { return it->second; }
    }
    return std::nullopt;
  }

  namespace {

    using uri_prefix_map = std::unordered_map<std::string, std::string>;

    bool
    default_prefix_taken(const uri_prefix_map& declared) {
      for (const auto& [uri, prefix] : declared) {
        if (prefix.empty()) { return true; }
      }
      return false;
    }

    void
    write_element(const xml_node& elem, xml_writer& writer,
                  uri_prefix_map declared, int& counter) {
      writer.start_element(elem.name());

      auto ensure = [&](const std::string& uri, bool is_attribute) {
        if (uri.empty() || declared.count(uri)) { return; }
        std::string pfx = elem.prefix_for_namespace(uri).value_or("");
        // Attributes cannot live in the default namespace.
        if (pfx.empty() && (is_attribute || default_prefix_taken(declared))) {
          pfx = "ns" + std::to_string(counter++);
        }
        declared[uri] = pfx;
        writer.namespace_declaration(pfx, uri);
      };

      ensure(elem.name().namespace_uri(), false);
      for (const auto& attr : elem.attributes()) {
        ensure(attr.name.namespace_uri(), true);
      }

      for (const auto& attr : elem.attributes()) {
        writer.attribute(attr.name, attr.value);
      }

      for (const auto& child : elem.children()) {
        std::visit(
            [&](const auto& v) {
              using T = std::decay_t<decltype(v)>;
              if constexpr (std::is_same_v<T, std::string>) {
                writer.characters(v);
              } else {
                write_element(v, writer, declared, counter);
              }
            },
            child);
      }

      writer.end_element();
    }

  } // namespace

  void
  xml_node::write(xml_writer& writer) const {
    int counter = 0;
    write_element(*this, writer, {}, counter);
  }

  std::string
  xml_node::markup() const {
    std::ostringstream os;
    ostream_writer writer(os);
    write(writer);
    return os.str();
  }

} // namespace xg
