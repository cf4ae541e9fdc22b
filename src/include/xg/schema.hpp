#pragma once

#include <xg/complex_type.hpp>
#include <xg/element_decl.hpp>
#include <xg/entity.hpp>
#include <xg/literal.hpp>
#include <xg/qname.hpp>
#include <xg/schema_fwd.hpp>
#include <xg/simple_type.hpp>

#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

namespace xg {

  inline const std::string xhtml_ns = "http://www.w3.org/1999/xhtml";

  // Built-in scalar type.
  struct literal_type {
    literal_kind kind;
    std::string public_name;
  };

  struct type_record {
    qname name; // local name only for anonymous types
    bool anonymous = false;
    std::variant<literal_type, simple_type, complex_type> definition;
    std::vector<std::string> annotations;
    // Set once when the type's class (or vocabulary) has been declared.
    bool marked = false;
  };

  // Registry of compiled types and elements. Built by schema_compiler,
  // immutable once the prelude has been initialized.
  class schema {
    std::string target_namespace_;
    std::vector<type_record> types_;
    std::unordered_map<qname, type_handle> type_index_;
    std::vector<element_decl> elements_;
    std::vector<element_handle> roots_;
    std::unordered_map<qname, element_handle> root_index_;
    std::vector<std::string> raw_namespaces_{xhtml_ns};
    std::unordered_map<std::string, std::string> renames_;
    std::vector<declaration> prelude_;
    std::unordered_set<std::string> declared_classes_;
    bool prelude_initialized_ = false;

    std::optional<type_handle>
    surviving_child(type_handle wrapper) const;

    bool
    push_annotations(type_handle wrapper,
                     const std::vector<std::string>& annotations,
                     std::vector<bool>& visited);

    void
    note_relations(type_handle wrapper);

    void
    declare_reachable(element_handle element, std::vector<bool>& visited);

    void
    declare_type(type_handle handle, std::vector<bool>& visited);

    void
    declare_vocabulary(type_handle handle);

  public:
    // Registers the built-in literal types.
    explicit schema(std::string target_namespace = {});

    const std::string&
    target_namespace() const {
      return target_namespace_;
    }

    // Builtins are never overridden; a duplicate named type raises
    // schema_error.
    type_handle
    add_type(type_record record);

    element_handle
    add_element(element_decl element);

    void
    add_root(element_handle element);

    const type_record&
    type(type_handle handle) const;

    const element_decl&
    element(element_handle handle) const;

    element_decl&
    element(element_handle handle);

    std::size_t
    type_count() const {
      return types_.size();
    }

    std::size_t
    element_count() const {
      return elements_.size();
    }

    std::optional<type_handle>
    find_type(const qname& name) const;

    // Throws unresolved_reference for names that are not registered.
    type_handle
    resolve(const type_ref& ref) const;

    const element_decl*
    find_root(const qname& name) const;

    const std::vector<element_handle>&
    roots() const {
      return roots_;
    }

    bool
    alone(type_handle handle) const;

    // Follows element local names from a named type down to a (possibly
    // anonymous) nested type.
    type_handle
    find_type_path(const qname& start,
                   const std::vector<std::string>& path) const;

    // Only complex types can be flattened; not allowed once the prelude
    // has been initialized.
    void
    force_alone(type_handle handle);

    const std::vector<std::string>&
    raw_namespaces() const {
      return raw_namespaces_;
    }

    void
    set_raw_namespaces(std::vector<std::string> namespaces) {
      raw_namespaces_ = std::move(namespaces);
    }

    // Element local name -> public name of its relation, individual type
    // and class.
    void
    set_renames(std::unordered_map<std::string, std::string> renames) {
      renames_ = std::move(renames);
    }

    const std::string&
    public_name(const std::string& local_name) const;

    // Pushes wrapper documentation down to the surviving children, then
    // declares a class for the public name of every element bound to a
    // non-flattened complex type reachable from the roots, and the vocabulary of every enumerated simple type. Types in
    // `keep_annotations` keep their documentation on the relation.
    void
    initialize_prelude(const std::unordered_set<type_handle>& keep_annotations = {});

    bool
    prelude_initialized() const {
      return prelude_initialized_;
    }

    const std::vector<declaration>&
    prelude() const {
      return prelude_;
    }
  };

} // namespace xg
