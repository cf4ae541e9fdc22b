#pragma once

#include <xg/entity.hpp>
#include <xg/qname.hpp>
#include <xg/schema_fwd.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace xg {

  struct enumeration_value {
    std::string value;
    std::vector<std::string> annotations;
    // Shared by every document that mentions the value.
    individual_ptr singleton;
  };

  // An enumerated vocabulary. A restriction without enumeration facets is an
  // alias of its base type.
  class simple_type {
    std::string public_name_;
    type_ref base_;
    std::vector<enumeration_value> values_;
    std::unordered_map<std::string, std::size_t> index_;

  public:
    simple_type(std::string public_name, type_ref base)
        : public_name_(std::move(public_name)), base_(std::move(base)) {}

    const std::string&
    public_name() const {
      return public_name_;
    }

    const type_ref&
    base() const {
      return base_;
    }

    bool
    is_vocabulary() const {
      return !values_.empty();
    }

    const std::vector<enumeration_value>&
    values() const {
      return values_;
    }

    // Repeated values keep their first declaration.
    void
    add_value(std::string value, std::vector<std::string> annotations);

    // Throws unknown_vocabulary_value.
    const individual_ptr&
    lookup(std::string_view value) const;
  };

} // namespace xg
