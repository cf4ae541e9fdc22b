#pragma once

#include <xg/qname.hpp>
#include <xg/schema_fwd.hpp>

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace xg {

  // Tag -> element lookup built once at compile time; keeps insertion order
  // so walks over it are deterministic.
  class dispatch_table {
    std::vector<std::pair<qname, element_handle>> entries_;
    std::unordered_map<qname, std::size_t> index_;

  public:
    // `same_type(bound, element)` tells whether a repeated tag keeps the
    // type it is already bound to; when it does not, insert raises
    // type_conflict.
    template <typename SameType>
    void
    insert(const qname& tag, element_handle element, SameType&& same_type);

    template <typename SameType>
    void
    merge(const dispatch_table& other, SameType&& same_type) {
      for (const auto& [tag, element] : other.entries_) {
        insert(tag, element, same_type);
      }
    }

    const element_handle*
    find(const qname& tag) const {
      auto it = index_.find(tag);
      if (it == index_.end()) return nullptr;
      return &entries_[it->second].second;
    }

    const std::vector<std::pair<qname, element_handle>>&
    entries() const {
      return entries_;
    }

    std::size_t
    size() const {
      return entries_.size();
    }
  };

  struct wildcard {
    // Raw value of the namespace attribute ("##any" when absent).
    std::string namespaces = "##any";

    bool
    accepts(const std::string& uri, const std::string& target_namespace) const;
  };

  struct sequence {
    std::vector<element_handle> elements;
    std::size_t choice_count = 0;
    std::optional<wildcard> any;
    dispatch_table names;
    bool alone = false;

    std::size_t
    named_children() const {
      return elements.size() + choice_count;
    }
  };

  // Branches are merged into a single table; never alone.
  struct choice {
    dispatch_table names;
  };

  [[noreturn]] void
  throw_type_conflict(const qname& tag);

  template <typename SameType>
  void
  dispatch_table::insert(const qname& tag, element_handle element,
                         SameType&& same_type) {
    auto it = index_.find(tag);
    if (it != index_.end()) {
      if (!same_type(entries_[it->second].second, element)) {
        throw_type_conflict(tag);
      }
      return;
    }
    index_.emplace(tag, entries_.size());
    entries_.emplace_back(tag, element);
  }

} // namespace xg
