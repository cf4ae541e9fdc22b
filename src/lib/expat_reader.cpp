#include <xg/expat_reader.hpp>

#include <expat.h>

#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace xg {

  namespace {

    const std::string xml_ns = "http://www.w3.org/XML/1998/namespace";

    struct attribute {
      qname name;
      std::string value;
    };

    struct event {
      xml_node_type type;
      qname name;
      std::string text;
      std::vector<attribute> attributes;
      namespace_bindings ns_decls;
      std::size_t depth = 0;
      std::size_t line = 0;
    };

    // Parse "uri\nlocal" into a qname. Unqualified names have no separator.
    qname
    parse_expat_name(const char* expat_name) {
      const char* sep = std::strchr(expat_name, '\n');
      if (sep == nullptr) {
        return qname{"", std::string(expat_name)};
      }
      return qname{std::string(expat_name, sep), std::string(sep + 1)};
    }

  } // namespace

  struct expat_reader::impl {
    XML_Parser parser = nullptr;
    std::vector<event> events;
    namespace_bindings pending_decls;
    std::size_t cursor = 0;
    std::size_t current_depth = 0;

    // One entry per open element while reading.
    std::vector<namespace_bindings> scopes;

    static void XMLCALL
    on_start_namespace(void* user_data, const char* prefix, const char* uri) {
      auto* self = static_cast<impl*>(user_data);
      self->pending_decls.emplace_back(prefix ? prefix : "", uri ? uri : "");
    }

    static void XMLCALL
    on_start_element(void* user_data, const char* name, const char** atts) {
      auto* self = static_cast<impl*>(user_data);
      self->current_depth++;

      event ev;
      ev.type = xml_node_type::start_element;
      ev.name = parse_expat_name(name);
      ev.depth = self->current_depth;
      ev.line = static_cast<std::size_t>(XML_GetCurrentLineNumber(self->parser));
      ev.ns_decls = std::move(self->pending_decls);
      self->pending_decls.clear();

      for (const char** p = atts; *p != nullptr; p += 2) {
        ev.attributes.push_back({parse_expat_name(p[0]), std::string(p[1])});
      }

      self->events.push_back(std::move(ev));
    }

    static void XMLCALL
    on_end_element(void* user_data, const char* name) {
      auto* self = static_cast<impl*>(user_data);

      event ev;
      ev.type = xml_node_type::end_element;
      ev.name = parse_expat_name(name);
      ev.depth = self->current_depth;

      self->events.push_back(std::move(ev));
      self->current_depth--;
    }

    static void XMLCALL
    on_character_data(void* user_data, const char* s, int len) {
      auto* self = static_cast<impl*>(user_data);

      // Coalesce adjacent character data into a single event
      if (!self->events.empty() &&
          self->events.back().type == xml_node_type::characters) {
        self->events.back().text.append(s, static_cast<std::size_t>(len));
        return;
      }

      event ev;
      ev.type = xml_node_type::characters;
      ev.text.assign(s, static_cast<std::size_t>(len));
      ev.depth = self->current_depth;
      self->events.push_back(std::move(ev));
    }

    const event&
    current() const {
      return events[cursor - 1];
    }
  };

  expat_reader::expat_reader(std::string_view xml) : impl_(std::make_unique<impl>()) {
    // '\n' as the namespace separator
    XML_Parser parser = XML_ParserCreateNS(nullptr, '\n');
    if (parser == nullptr) {
      throw std::runtime_error("failed to create expat parser");
    }
    impl_->parser = parser;

    XML_SetUserData(parser, impl_.get());
    XML_SetElementHandler(parser, impl::on_start_element, impl::on_end_element);
    XML_SetCharacterDataHandler(parser, impl::on_character_data);
    XML_SetStartNamespaceDeclHandler(parser, impl::on_start_namespace);

    XML_Status status =
        XML_Parse(parser, xml.data(), static_cast<int>(xml.size()), XML_TRUE);

    if (status == XML_STATUS_ERROR) {
      std::string msg = "XML parse error at line ";
      msg += std::to_string(XML_GetCurrentLineNumber(parser));
      msg += ": ";
      msg += XML_ErrorString(XML_GetErrorCode(parser));
      XML_ParserFree(parser);
      impl_->parser = nullptr;
      throw std::runtime_error(msg);
    }

    XML_ParserFree(parser);
    impl_->parser = nullptr;

    if (impl_->events.empty()) {
      throw std::runtime_error("XML parse error: no content");
    }
  }

  expat_reader::~expat_reader() = default;
  expat_reader::expat_reader(expat_reader&&) noexcept = default;
  expat_reader& expat_reader::operator=(expat_reader&&) noexcept = default;

  bool
  expat_reader::read() {
    if (impl_->cursor >= impl_->events.size()) {
      return false;
    }
    // Leaving an end tag closes its namespace scope.
    if (impl_->cursor > 0 &&
        impl_->current().type == xml_node_type::end_element &&
        !impl_->scopes.empty()) {
      impl_->scopes.pop_back();
    }
    impl_->cursor++;
    if (impl_->current().type == xml_node_type::start_element) {
      impl_->scopes.push_back(impl_->current().ns_decls);
    }
    return true;
  }

  xml_node_type
  expat_reader::node_type() const {
    return impl_->current().type;
  }

  const qname&
  expat_reader::name() const {
    return impl_->current().name;
  }

  std::size_t
  expat_reader::attribute_count() const {
    return impl_->current().attributes.size();
  }

  const qname&
  expat_reader::attribute_name(std::size_t index) const {
    return impl_->current().attributes[index].name;
  }

  std::string_view
  expat_reader::attribute_value(std::size_t index) const {
    return impl_->current().attributes[index].value;
  }

  std::string_view
  expat_reader::attribute_value(const qname& attr_name) const {
    const auto& attrs = impl_->current().attributes;
    for (const auto& attr : attrs) {
      if (attr.name == attr_name) {
        return attr.value;
      }
    }
    return {};
  }

  std::string_view
  expat_reader::text() const {
    return impl_->current().text;
  }

  std::size_t
  expat_reader::depth() const {
    return impl_->current().depth;
  }

  std::size_t
  expat_reader::line() const {
    return impl_->current().line;
  }

  const namespace_bindings&
  expat_reader::namespace_declarations() const {
    return impl_->current().ns_decls;
  }

  std::string_view
  expat_reader::namespace_uri_for_prefix(std::string_view prefix) const {
    if (prefix == "xml") { return xml_ns; }
    for (auto scope = impl_->scopes.rbegin(); scope != impl_->scopes.rend();
         ++scope) {
      for (const auto& [p, uri] : *scope) {
        if (p == prefix) { return uri; }
      }
    }
    return {};
  }

} // namespace xg
