#pragma once

#include <xg/literal.hpp>

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace xg {

  class individual;

  using individual_ptr = std::shared_ptr<individual>;

  // Placeholder relation name for a value whose owning element is not known
  // yet (extension base values, wildcard captures).
  inline const std::string value_placeholder = "@@value";

  // Configuration consumed when identities are assigned.
  struct identity_policy {
    std::vector<std::string> id_attributes;
    std::vector<std::string> name_attributes;
    std::unordered_map<std::string, std::string> type_aliases;

    static identity_policy
    defaults();
  };

  using has_target = std::variant<literal, individual_ptr>;

  // Attribute or relation assertion; its subject is whoever holds it.
  class has {
    std::string attribute_;
    std::vector<has_target> values_;

  public:
    has(std::string attribute, has_target value)
        : attribute_(std::move(attribute)) {
      values_.push_back(std::move(value));
    }

    has(std::string attribute, std::vector<has_target> values)
        : attribute_(std::move(attribute)), values_(std::move(values)) {}

    const std::string&
    attribute() const {
      return attribute_;
    }

    const std::vector<has_target>&
    values() const {
      return values_;
    }

    bool
    is_placeholder() const {
      return attribute_ == value_placeholder;
    }

    // Same values under another relation name.
    has
    renamed(std::string attribute) const {
      return has(std::move(attribute), values_);
    }
  };

  class individual {
    std::string fallback_name_;
    std::string type_;
    std::vector<has> assertions_;
    std::vector<std::string> annotations_;
    bool ignore_ = false;

  public:
    individual(std::string fallback_name, std::string type,
               std::vector<has> assertions = {},
               std::vector<std::string> annotations = {}, bool ignore = false)
        : fallback_name_(std::move(fallback_name)), type_(std::move(type)),
          assertions_(std::move(assertions)),
          annotations_(std::move(annotations)), ignore_(ignore) {}

    const std::string&
    fallback_name() const {
      return fallback_name_;
    }

    const std::string&
    type() const {
      return type_;
    }

    const std::vector<has>&
    assertions() const {
      return assertions_;
    }

    const std::vector<std::string>&
    annotations() const {
      return annotations_;
    }

    bool
    ignore() const {
      return ignore_;
    }

    // Value of the first ID attribute (in policy order) that is asserted.
    std::optional<std::string>
    id(const identity_policy& policy) const;

    // Value of the first name attribute (in policy order) that is asserted,
    // or the fallback name.
    std::string
    display_name(const identity_policy& policy) const;

    std::string
    slug(const identity_policy& policy) const;
  };

  struct owl_class {
    std::string name;
    std::vector<std::string> annotations;
  };

  // Documentation that stays on a relation instead of a class.
  struct relation_note {
    std::string relation;
    std::vector<std::string> annotations;
  };

  using declaration = std::variant<owl_class, relation_note, individual_ptr>;

  // Lexical form of a target, for use as an identifier or display name.
  std::string
  target_text(const has_target& target, const identity_policy& policy);

} // namespace xg
