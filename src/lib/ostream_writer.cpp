#include <xg/ostream_writer.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace xg {

  namespace {

    const char*
    text_entity(char c) {
      switch (c) {
        case '<': return "&lt;";
        case '>': return "&gt;";
        case '&': return "&amp;";
        default: return nullptr;
      }
    }

    const char*
    attribute_entity(char c) {
      switch (c) {
        case '<': return "&lt;";
        case '&': return "&amp;";
        case '"': return "&quot;";
        case '\n': return "&#10;";
        case '\t': return "&#9;";
        default: return nullptr;
      }
    }

    void
    write_escaped(std::ostream& os, std::string_view s,
                  const char* (*entity)(char)) {
      for (char c : s) {
        if (const char* e = entity(c)) {
          os << e;
        } else {
          os << c;
        }
      }
    }

  } // namespace

  struct ostream_writer::impl {
    std::ostream& os;
    bool indent;

    // Namespace URI -> prefix mapping
    std::unordered_map<std::string, std::string> ns_prefixes;

    // start_element() buffers the tag; attributes and namespace declarations
    // accumulate until child content arrives or the element is closed.
    bool tag_pending = false;
    qname pending_name;
    std::vector<std::pair<qname, std::string>> pending_attrs;
    std::vector<std::pair<std::string, std::string>> pending_ns_decls;

    struct element_frame {
      qname name;
      bool has_text = false;
      bool has_elements = false;
      // (uri, previous prefix or nullopt if uri was unbound)
      std::vector<std::pair<std::string, std::optional<std::string>>> ns_undo;
    };

    std::vector<element_frame> stack;

    impl(std::ostream& os, bool indent) : os(os), indent(indent) {}

    void
    write_prefixed_name(const qname& name) {
      if (!name.namespace_uri().empty()) {
        auto it = ns_prefixes.find(name.namespace_uri());
        if (it != ns_prefixes.end() && !it->second.empty()) {
          os << it->second << ':';
        }
      }
      os << name.local_name();
    }

    void
    write_pending_tag() {
      os << '<';
      write_prefixed_name(pending_name);

      for (const auto& [prefix, uri] : pending_ns_decls) {
        os << (prefix.empty() ? " xmlns=\"" : " xmlns:" + prefix + "=\"");
        write_escaped(os, uri, attribute_entity);
        os << '"';
      }

      for (const auto& [name, value] : pending_attrs) {
        os << ' ';
        write_prefixed_name(name);
        os << "=\"";
        write_escaped(os, value, attribute_entity);
        os << '"';
      }

      pending_ns_decls.clear();
      pending_attrs.clear();
      tag_pending = false;
    }

    // Close the open tag with '>' before child content is written.
    void
    open_pending_tag() {
      if (!tag_pending) { return; }
      write_pending_tag();
      os << '>';
    }

    void
    newline(std::size_t depth) {
      os << '\n';
      for (std::size_t i = 0; i < depth; ++i) {
        os << "    ";
      }
    }
  };

  ostream_writer::ostream_writer(std::ostream& os, bool indent)
      : impl_(std::make_unique<impl>(os, indent)) {}

  ostream_writer::~ostream_writer() = default;
  ostream_writer::ostream_writer(ostream_writer&&) noexcept = default;
  ostream_writer&
  ostream_writer::operator=(ostream_writer&&) noexcept = default;

  void
  ostream_writer::xml_declaration() {
    impl_->os << "<?xml version=\"1.0\"?>";
    if (impl_->indent) { impl_->os << '\n'; }
  }

  void
  ostream_writer::start_element(const qname& name) {
    impl_->open_pending_tag();

    if (!impl_->stack.empty()) {
      auto& parent = impl_->stack.back();
      parent.has_elements = true;
      if (impl_->indent && !parent.has_text) {
        impl_->newline(impl_->stack.size());
      }
    }

    impl_->stack.push_back({name, false, false, {}});
    impl_->tag_pending = true;
    impl_->pending_name = name;
  }

  void
  ostream_writer::end_element() {
    if (impl_->stack.empty()) {
      throw std::logic_error("ostream_writer: end_element without open element");
    }
    auto frame = std::move(impl_->stack.back());
    impl_->stack.pop_back();

    if (impl_->tag_pending) {
      impl_->write_pending_tag();
      impl_->os << "/>";
    } else {
      if (impl_->indent && frame.has_elements && !frame.has_text) {
        impl_->newline(impl_->stack.size());
      }
      impl_->os << "</";
      impl_->write_prefixed_name(frame.name);
      impl_->os << '>';
    }

    for (auto& [uri, prev] : frame.ns_undo) {
      if (prev.has_value()) {
        impl_->ns_prefixes[uri] = std::move(*prev);
      } else {
        impl_->ns_prefixes.erase(uri);
      }
    }
  }

  void
  ostream_writer::attribute(const qname& name, std::string_view value) {
    impl_->pending_attrs.emplace_back(name, std::string(value));
  }

  void
  ostream_writer::characters(std::string_view text) {
    impl_->open_pending_tag();
    if (!impl_->stack.empty()) { impl_->stack.back().has_text = true; }
    write_escaped(impl_->os, text, text_entity);
  }

  void
  ostream_writer::namespace_declaration(std::string_view prefix,
                                        std::string_view uri) {
    if (impl_->stack.empty()) {
      throw std::logic_error(
          "ostream_writer: namespace declaration outside an element");
    }
    std::string uri_str(uri);

    auto it = impl_->ns_prefixes.find(uri_str);
    std::optional<std::string> prev = it != impl_->ns_prefixes.end()
                                          ? std::optional(it->second)
                                          : std::nullopt;
    impl_->stack.back().ns_undo.emplace_back(uri_str, std::move(prev));

    impl_->ns_prefixes[uri_str] = std::string(prefix);
    impl_->pending_ns_decls.emplace_back(std::string(prefix),
                                         std::move(uri_str));
  }

} // namespace xg
