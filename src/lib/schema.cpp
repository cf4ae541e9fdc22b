#include <xg/errors.hpp>
#include <xg/schema.hpp>

#include <algorithm>
#include <stdexcept>
#include <type_traits>

namespace xg {

  namespace {

    struct builtin {
      const char* local_name;
      literal_kind kind;
    };

    constexpr builtin builtins[] = {
        {"string", literal_kind::text},
        {"token", literal_kind::text},
        {"anyURI", literal_kind::text},
        {"date", literal_kind::date},
        {"integer", literal_kind::integer},
        {"gYear", literal_kind::integer},
        {"gMonth", literal_kind::date_fragment},
        {"gDay", literal_kind::date_fragment},
    };

    void
    append(std::vector<std::string>& to, const std::vector<std::string>& from) {
      to.insert(to.end(), from.begin(), from.end());
    }

  } // namespace

  schema::schema(std::string target_namespace)
      : target_namespace_(std::move(target_namespace)) {
    for (const auto& b : builtins) {
      type_record record;
      record.name = qname(xs_ns, b.local_name);
      record.definition = literal_type{b.kind, b.local_name};
      add_type(std::move(record));
    }
  }

  type_handle
  schema::add_type(type_record record) {
    if (prelude_initialized_) {
      throw std::logic_error("schema: types cannot be added after the "
                             "prelude has been initialized");
    }
    type_handle handle = types_.size();
    if (!record.anonymous) {
      if (type_index_.contains(record.name)) {
        if (record.name.namespace_uri() == xs_ns) {
          throw schema_error("schema: built-in type " + record.name.clark() +
                             " cannot be redefined");
        }
        throw schema_error("schema: duplicate type " + record.name.clark());
      }
      type_index_.emplace(record.name, handle);
    }
    types_.push_back(std::move(record));
    return handle;
  }

  element_handle
  schema::add_element(element_decl element) {
    element_handle handle = elements_.size();
    elements_.push_back(std::move(element));
    return handle;
  }

  void
  schema::add_root(element_handle element) {
    const qname& name = elements_.at(element).name;
    if (root_index_.contains(name)) {
      throw schema_error("schema: duplicate element " + name.clark());
    }
    root_index_.emplace(name, element);
    roots_.push_back(element);
  }

  const type_record&
  schema::type(type_handle handle) const {
    return types_.at(handle);
  }

  const element_decl&
  schema::element(element_handle handle) const {
    return elements_.at(handle);
  }

  element_decl&
  schema::element(element_handle handle) {
    return elements_.at(handle);
  }

  std::optional<type_handle>
  schema::find_type(const qname& name) const {
    auto it = type_index_.find(name);
    if (it == type_index_.end()) return std::nullopt;
    return it->second;
  }

  type_handle
  schema::resolve(const type_ref& ref) const {
    if (const auto* handle = std::get_if<type_handle>(&ref)) {
      return *handle;
    }
    const auto& name = std::get<qname>(ref);
    auto handle = find_type(name);
    if (!handle) {
      throw unresolved_reference("schema: no type named " + name.clark());
    }
    return *handle;
  }

  const element_decl*
  schema::find_root(const qname& name) const {
    auto it = root_index_.find(name);
    if (it == root_index_.end()) return nullptr;
    return &elements_[it->second];
  }

  bool
  schema::alone(type_handle handle) const {
    const auto* complex = std::get_if<complex_type>(&types_.at(handle).definition);
    return complex != nullptr && complex->alone();
  }

  type_handle
  schema::find_type_path(const qname& start,
                         const std::vector<std::string>& path) const {
    type_handle current = resolve(start);
    std::string walked = start.clark();
    for (const auto& step : path) {
      const auto* complex =
          std::get_if<complex_type>(&types_[current].definition);
      const dispatch_table* names = nullptr;
      if (complex != nullptr && complex->content()) {
        if (const auto* seq = std::get_if<sequence>(&*complex->content())) {
          names = &seq->names;
        } else if (const auto* ch = std::get_if<choice>(&*complex->content())) {
          names = &ch->names;
        }
      }
      const element_handle* found = nullptr;
      if (names != nullptr) {
        for (const auto& [tag, element] : names->entries()) {
          if (tag.local_name() == step) {
            found = &element;
            break;
          }
        }
      }
      if (found == nullptr) {
        throw unresolved_reference("schema: " + walked +
                                   " has no child element " + step);
      }
      walked += '/' + step;
      current = resolve(elements_[*found].type);
    }
    return current;
  }

  void
  schema::force_alone(type_handle handle) {
    if (prelude_initialized_) {
      throw std::logic_error("schema: flattening a type after the prelude "
                             "has been initialized");
    }
    auto* complex = std::get_if<complex_type>(&types_.at(handle).definition);
    if (complex == nullptr) {
      throw schema_error("schema: only complex types can be flattened, not " +
                         types_[handle].name.clark());
    }
    complex->force_alone();
  }

  const std::string&
  schema::public_name(const std::string& local_name) const {
    auto it = renames_.find(local_name);
    return it == renames_.end() ? local_name : it->second;
  }

  std::optional<type_handle>
  schema::surviving_child(type_handle wrapper) const {
    const auto& complex = std::get<complex_type>(types_[wrapper].definition);
    std::optional<type_ref> child;
    if (complex.content()) {
      if (const auto* seq = std::get_if<sequence>(&*complex.content())) {
        if (seq->elements.size() == 1 && seq->choice_count == 0) {
          child = elements_[seq->elements.front()].type;
        }
      }
    } else if (complex.attributes().size() == 1) {
      child = complex.attributes().front().type;
    }
    if (!child) return std::nullopt;
    if (const auto* name = std::get_if<qname>(&*child)) {
      return find_type(*name);
    }
    return std::get<type_handle>(*child);
  }

  bool
  schema::push_annotations(type_handle wrapper,
                           const std::vector<std::string>& annotations,
                           std::vector<bool>& visited) {
    auto target = surviving_child(wrapper);
    if (!target || visited[*target]) return false;
    visited[*target] = true;

    if (alone(*target)) {
      return push_annotations(*target, annotations, visited);
    }
    auto& record = types_[*target];
    if (std::holds_alternative<literal_type>(record.definition)) return false;
    if (const auto* simple = std::get_if<simple_type>(&record.definition);
        simple != nullptr && !simple->is_vocabulary()) {
      return false;
    }
    if (record.marked) {
      throw std::logic_error("schema: annotations pushed into " +
                             record.name.clark() +
                             " after its class was declared");
    }
    append(record.annotations, annotations);
    return true;
  }

  void
  schema::note_relations(type_handle wrapper) {
    std::vector<std::string> relations;
    for (const auto& element : elements_) {
      std::optional<type_handle> bound;
      if (const auto* name = std::get_if<qname>(&element.type)) {
        bound = find_type(*name);
      } else {
        bound = std::get<type_handle>(element.type);
      }
      if (bound != wrapper) continue;
      const auto& relation = element.name.local_name();
      if (std::find(relations.begin(), relations.end(), relation) ==
          relations.end()) {
        relations.push_back(relation);
      }
    }
    for (auto& relation : relations) {
      prelude_.emplace_back(
          relation_note{std::move(relation), types_[wrapper].annotations});
    }
  }

  void
  schema::declare_vocabulary(type_handle handle) {
    auto& record = types_[handle];
    if (record.marked) return;
    const auto& simple = std::get<simple_type>(record.definition);
    record.marked = true;
    prelude_.emplace_back(owl_class{simple.public_name(), record.annotations});
    for (const auto& value : simple.values()) {
      prelude_.emplace_back(value.singleton);
    }
  }

  void
  schema::declare_reachable(element_handle element, std::vector<bool>& visited) {
    const auto& decl = elements_[element];
    std::optional<type_handle> handle;
    if (const auto* name = std::get_if<qname>(&decl.type)) {
      // Unresolved names fail when a document dereferences them.
      handle = find_type(*name);
    } else {
      handle = std::get<type_handle>(decl.type);
    }
    if (!handle) return;

    // One class per public element name; a shared type may carry several.
    auto& record = types_[*handle];
    if (alone(*handle) ||
        !std::holds_alternative<complex_type>(record.definition)) {
      declare_type(*handle, visited);
      return;
    }
    record.marked = true;
    const auto& name = public_name(decl.name.local_name());
    if (declared_classes_.insert(name).second) {
      owl_class cls;
      cls.name = name;
      append(cls.annotations, decl.annotations);
      append(cls.annotations, record.annotations);
      prelude_.emplace_back(std::move(cls));
    }
    declare_type(*handle, visited);
  }

  void
  schema::declare_type(type_handle handle, std::vector<bool>& visited) {
    if (visited[handle]) return;
    visited[handle] = true;

    const auto& record = types_[handle];
    if (const auto* simple = std::get_if<simple_type>(&record.definition)) {
      if (simple->is_vocabulary()) declare_vocabulary(handle);
      return;
    }
    const auto* complex = std::get_if<complex_type>(&record.definition);
    if (complex == nullptr) return;

    auto declare_ref = [&](const type_ref& ref) {
      std::optional<type_handle> child;
      if (const auto* name = std::get_if<qname>(&ref)) {
        child = find_type(*name);
      } else {
        child = std::get<type_handle>(ref);
      }
      if (child) declare_type(*child, visited);
    };

    for (const auto& attribute : complex->attributes()) {
      declare_ref(attribute.type);
    }
    if (!complex->content()) return;
    std::visit(
        [&](const auto& content) {
          using T = std::decay_t<decltype(content)>;
          if constexpr (std::is_same_v<T, extension>) {
            declare_ref(content.base);
            for (const auto& attribute : content.attributes) {
              declare_ref(attribute.type);
            }
          } else {
            for (const auto& [tag, element] : content.names.entries()) {
              declare_reachable(element, visited);
            }
          }
        },
        *complex->content());
  }

  void
  schema::initialize_prelude(
      const std::unordered_set<type_handle>& keep_annotations) {
    if (prelude_initialized_) {
      throw std::logic_error("schema: prelude already initialized");
    }

    for (type_handle handle = 0; handle < types_.size(); ++handle) {
      if (!alone(handle) || types_[handle].annotations.empty()) continue;
      if (keep_annotations.contains(handle)) {
        note_relations(handle);
        continue;
      }
      std::vector<bool> visited(types_.size(), false);
      visited[handle] = true;
      auto annotations = types_[handle].annotations;
      if (!push_annotations(handle, annotations, visited)) {
        note_relations(handle);
      }
    }

    std::vector<bool> visited(types_.size(), false);
    for (auto root : roots_) {
      declare_reachable(root, visited);
    }
    for (type_handle handle = 0; handle < types_.size(); ++handle) {
      const auto* simple = std::get_if<simple_type>(&types_[handle].definition);
      if (simple != nullptr && simple->is_vocabulary()) {
        declare_vocabulary(handle);
      }
    }

    prelude_initialized_ = true;
  }

} // namespace xg
