#include <xg/errors.hpp>
#include <xg/schema_compiler.hpp>

#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace xg {

  namespace {

    bool
    is_xs(const xml_node& node, const std::string& local) {
      return node.name().namespace_uri() == xs_ns &&
             node.name().local_name() == local;
    }

    std::vector<const xml_node*>
    xs_children(const xml_node& node, const std::string& local) {
      return node.elements(qname(xs_ns, local));
    }

    const xml_node*
    xs_child(const xml_node& node, const std::string& local) {
      return node.first_element(qname(xs_ns, local));
    }

    std::string
    where(const xml_node& node) {
      return "<" + node.name().local_name() + "> at line " +
             std::to_string(node.line());
    }

    std::string
    req_attr(const xml_node& node, std::string_view local) {
      const std::string* value = node.attribute(local);
      if (value == nullptr) {
        throw schema_error("schema_compiler: missing required attribute '" +
                           std::string(local) + "' on " + where(node));
      }
      return *value;
    }

    // Text directly inside xs:annotation/xs:documentation.
    std::vector<std::string>
    parse_annotation(const xml_node& node) {
      std::vector<std::string> notes;
      for (const auto* annotation : xs_children(node, "annotation")) {
        for (const auto* doc : xs_children(*annotation, "documentation")) {
          for (const auto& child : doc->children()) {
            const auto* text = std::get_if<std::string>(&child);
            if (text == nullptr) continue;
            auto trimmed = trim(*text);
            if (!trimmed.empty()) notes.emplace_back(trimmed);
          }
        }
      }
      return notes;
    }

    struct compile_context {
      schema& target;
      std::string tns;
      bool qualified_locals = false;
      // Elements declared with ref="...", patched once every top-level
      // element is known.
      std::vector<std::pair<element_handle, qname>> element_refs;
      std::unordered_set<element_handle> pending_refs;
      // Repeated tags involving a ref, compared after the refs are patched.
      std::vector<std::pair<element_handle, element_handle>> deferred_checks;

      auto
      same_type() {
        return [this](element_handle bound, element_handle element) {
          if (pending_refs.contains(bound) || pending_refs.contains(element)) {
            deferred_checks.emplace_back(bound, element);
            return true;
          }
          return target.element(bound).type == target.element(element).type;
        };
      }
    };

    // "p:local" through the in-scope prefixes; an unprefixed name uses the
    // default namespace when one is bound, the target namespace otherwise.
    qname
    resolve_qname(const compile_context& ctx, const xml_node& node,
                  const std::string& prefixed_name) {
      auto colon = prefixed_name.find(':');
      if (colon == std::string::npos) {
        auto uri = node.namespace_for_prefix("");
        return qname(uri && !uri->empty() ? *uri : ctx.tns, prefixed_name);
      }
      std::string prefix = prefixed_name.substr(0, colon);
      auto uri = node.namespace_for_prefix(prefix);
      if (!uri) {
        throw schema_error("schema_compiler: unknown namespace prefix '" +
                           prefix + "' on " + where(node));
      }
      return qname(*uri, prefixed_name.substr(colon + 1));
    }

    type_handle
    parse_simple_type(compile_context& ctx, const xml_node& node,
                      const std::string& public_name, bool anonymous);

    type_handle
    parse_complex_type(compile_context& ctx, const xml_node& node,
                       const std::string& public_name, bool anonymous);

    type_ref
    inline_or_named_type(compile_context& ctx, const xml_node& node,
                         const std::string& public_name) {
      if (const auto* type = node.attribute("type")) {
        return resolve_qname(ctx, node, *type);
      }
      if (const auto* ct = xs_child(node, "complexType")) {
        return parse_complex_type(ctx, *ct, public_name, true);
      }
      if (const auto* st = xs_child(node, "simpleType")) {
        return parse_simple_type(ctx, *st, public_name, true);
      }
      // No declared type: treat the content as text.
      return qname(xs_ns, "string");
    }

    attribute_use
    parse_attribute(compile_context& ctx, const xml_node& node) {
      attribute_use use;
      if (const auto* name = node.attribute("name")) {
        use.name = *name;
      } else if (const auto* ref = node.attribute("ref")) {
        use.name = resolve_qname(ctx, node, *ref).local_name();
      } else {
        throw schema_error("schema_compiler: attribute without a name on " +
                           where(node));
      }
      const auto* occurs = node.attribute("use");
      use.required = occurs != nullptr && *occurs == "required";
      use.type = inline_or_named_type(ctx, node, use.name);
      return use;
    }

    std::vector<attribute_use>
    parse_attributes(compile_context& ctx, const xml_node& node) {
      std::vector<attribute_use> attributes;
      for (const auto* child : xs_children(node, "attribute")) {
        attributes.push_back(parse_attribute(ctx, *child));
      }
      return attributes;
    }

    element_handle
    parse_element(compile_context& ctx, const xml_node& node, bool top_level) {
      element_decl decl;
      decl.annotations = parse_annotation(node);

      if (const auto* ref = node.attribute("ref"); ref && !top_level) {
        decl.name = resolve_qname(ctx, node, *ref);
        decl.type = qname(xs_ns, "string");
        auto handle = ctx.target.add_element(std::move(decl));
        ctx.element_refs.emplace_back(handle, ctx.target.element(handle).name);
        ctx.pending_refs.insert(handle);
        return handle;
      }

      std::string name = req_attr(node, "name");
      bool qualified = top_level || ctx.qualified_locals;
      if (const auto* form = node.attribute("form")) {
        qualified = *form == "qualified";
      }
      decl.name = qname(qualified ? ctx.tns : std::string(), name);
      decl.type = inline_or_named_type(ctx, node, name);
      return ctx.target.add_element(std::move(decl));
    }

    choice
    parse_choice(compile_context& ctx, const xml_node& node);

    sequence
    parse_sequence(compile_context& ctx, const xml_node& node) {
      sequence seq;
      std::size_t wildcards = 0;
      for (const auto* child : node.elements()) {
        if (is_xs(*child, "element")) {
          auto element = parse_element(ctx, *child, false);
          seq.elements.push_back(element);
          seq.names.insert(ctx.target.element(element).name, element,
                           ctx.same_type());
        } else if (is_xs(*child, "choice")) {
          auto nested = parse_choice(ctx, *child);
          ++seq.choice_count;
          seq.names.merge(nested.names, ctx.same_type());
        } else if (is_xs(*child, "any")) {
          ++wildcards;
          wildcard any;
          if (const auto* ns = child->attribute("namespace")) {
            any.namespaces = *ns;
          }
          seq.any = std::move(any);
        }
      }
      if (wildcards > 1) {
        throw schema_error("schema_compiler: more than one xs:any in " +
                           where(node));
      }
      if (seq.any && seq.named_children() != 0) {
        throw schema_error("schema_compiler: xs:any mixed with named "
                           "children in " + where(node));
      }
      seq.alone = seq.named_children() <= 1;
      return seq;
    }

    choice
    parse_choice(compile_context& ctx, const xml_node& node) {
      choice ch;
      for (const auto* child : node.elements()) {
        if (is_xs(*child, "element")) {
          auto element = parse_element(ctx, *child, false);
          ch.names.insert(ctx.target.element(element).name, element,
                          ctx.same_type());
        } else if (is_xs(*child, "sequence")) {
          auto branch = parse_sequence(ctx, *child);
          ch.names.merge(branch.names, ctx.same_type());
        }
      }
      return ch;
    }

    std::optional<content_model>
    parse_content(compile_context& ctx, const xml_node& node) {
      if (const auto* seq = xs_child(node, "sequence")) {
        return parse_sequence(ctx, *seq);
      }
      for (const char* wrapper : {"simpleContent", "complexContent"}) {
        for (const auto* content : xs_children(node, wrapper)) {
          if (const auto* ext = xs_child(*content, "extension")) {
            extension e;
            e.base = resolve_qname(ctx, *ext, req_attr(*ext, "base"));
            e.attributes = parse_attributes(ctx, *ext);
            return e;
          }
        }
      }
      if (const auto* ch = xs_child(node, "choice")) {
        return parse_choice(ctx, *ch);
      }
      return std::nullopt;
    }

    qname
    record_name(const compile_context& ctx, const xml_node& node,
                const std::string& public_name, bool anonymous) {
      if (anonymous) return qname(ctx.tns, public_name);
      return qname(ctx.tns, req_attr(node, "name"));
    }

    type_handle
    parse_complex_type(compile_context& ctx, const xml_node& node,
                       const std::string& public_name, bool anonymous) {
      type_record record;
      record.name = record_name(ctx, node, public_name, anonymous);
      record.anonymous = anonymous;
      record.annotations = parse_annotation(node);
      auto attributes = parse_attributes(ctx, node);
      auto content = parse_content(ctx, node);
      record.definition =
          complex_type(record.name.local_name(), std::move(attributes),
                       std::move(content));
      return ctx.target.add_type(std::move(record));
    }

    type_handle
    parse_simple_type(compile_context& ctx, const xml_node& node,
                      const std::string& public_name, bool anonymous) {
      const auto* restriction = xs_child(node, "restriction");
      if (restriction == nullptr) {
        throw schema_error("schema_compiler: only restrictions are supported "
                           "as simple types, in " + where(node));
      }
      type_record record;
      record.name = record_name(ctx, node, public_name, anonymous);
      record.anonymous = anonymous;
      record.annotations = parse_annotation(node);

      type_ref base = qname(xs_ns, "string");
      if (const auto* b = restriction->attribute("base")) {
        base = resolve_qname(ctx, *restriction, *b);
      } else if (const auto* st = xs_child(*restriction, "simpleType")) {
        base = parse_simple_type(ctx, *st, record.name.local_name(), true);
      }
      simple_type simple(record.name.local_name(), std::move(base));
      for (const auto* facet : xs_children(*restriction, "enumeration")) {
        simple.add_value(req_attr(*facet, "value"), parse_annotation(*facet));
      }
      record.definition = std::move(simple);
      return ctx.target.add_type(std::move(record));
    }

    void
    resolve_element_refs(compile_context& ctx) {
      for (const auto& [handle, ref] : ctx.element_refs) {
        const auto* referenced = ctx.target.find_root(ref);
        if (referenced == nullptr) {
          throw unresolved_reference("schema_compiler: no element named " +
                                     ref.clark());
        }
        auto& decl = ctx.target.element(handle);
        decl.type = referenced->type;
        if (decl.annotations.empty()) decl.annotations = referenced->annotations;
      }
      ctx.pending_refs.clear();

      for (const auto& [bound, element] : ctx.deferred_checks) {
        const auto& first = ctx.target.element(bound);
        if (!(first.type == ctx.target.element(element).type)) {
          throw_type_conflict(first.name);
        }
      }
    }

  } // namespace

  schema
  schema_compiler::compile(const xml_node& root,
                           const compile_options& options) const {
    if (!is_xs(root, "schema")) {
      throw schema_error("schema_compiler: expected xs:schema, found " +
                         root.name().clark());
    }
    std::string tns;
    if (const auto* ns = root.attribute("targetNamespace")) tns = *ns;

    schema result(tns);
    compile_context ctx{result, tns};
    if (const auto* form = root.attribute("elementFormDefault")) {
      ctx.qualified_locals = *form == "qualified";
    }

    for (const auto* child : root.elements()) {
      if (is_xs(*child, "element")) {
        result.add_root(parse_element(ctx, *child, true));
      } else if (is_xs(*child, "complexType")) {
        parse_complex_type(ctx, *child, req_attr(*child, "name"), false);
      } else if (is_xs(*child, "simpleType")) {
        parse_simple_type(ctx, *child, req_attr(*child, "name"), false);
      }
    }
    resolve_element_refs(ctx);

    for (const auto& forced : options.alone) {
      qname start(tns, forced.type);
      result.force_alone(forced.path.empty()
                             ? result.resolve(start)
                             : result.find_type_path(start, forced.path));
    }

    std::unordered_set<type_handle> keep;
    for (const auto& name : options.keep_annotations) {
      keep.insert(result.resolve(qname(tns, name)));
    }
    result.set_raw_namespaces(options.raw_namespaces);
    result.set_renames(options.renames);
    result.initialize_prelude(keep);
    return result;
  }

} // namespace xg
