#include <xg/entity.hpp>
#include <xg/slug.hpp>

namespace xg {

  identity_policy
  identity_policy::defaults() {
    identity_policy policy;
    policy.id_attributes = {"ID", "seq"};
    policy.name_attributes = {"Name", "name", "Title", "Term", "Entry_Name"};
    return policy;
  }

  namespace {

    const has*
    first_assertion(const std::vector<has>& assertions,
                    const std::vector<std::string>& attributes) {
      for (const auto& attribute : attributes) {
        for (const auto& assertion : assertions) {
          if (assertion.attribute() == attribute &&
              !assertion.values().empty()) {
            return &assertion;
          }
        }
      }
      return nullptr;
    }

  } // namespace

  std::string
  target_text(const has_target& target, const identity_policy& policy) {
    if (const auto* lit = std::get_if<literal>(&target)) {
      return lit->lexical();
    }
    const auto& ind = std::get<individual_ptr>(target);
    return ind ? ind->display_name(policy) : std::string();
  }

  std::optional<std::string>
  individual::id(const identity_policy& policy) const {
    const has* assertion = first_assertion(assertions_, policy.id_attributes);
    if (assertion == nullptr) { return std::nullopt; }
    return target_text(assertion->values().front(), policy);
  }

  std::string
  individual::display_name(const identity_policy& policy) const {
    // ID-bearing assertions never double as display names.
    std::vector<std::string> names;
    for (const auto& attribute : policy.name_attributes) {
      bool is_id = false;
      for (const auto& id_attribute : policy.id_attributes) {
        if (id_attribute == attribute) { is_id = true; }
      }
      if (!is_id) { names.push_back(attribute); }
    }
    const has* assertion = first_assertion(assertions_, names);
    if (assertion == nullptr) { return fallback_name_; }
    return target_text(assertion->values().front(), policy);
  }

  std::string
  individual::slug(const identity_policy& policy) const {
    if (auto id_value = id(policy)) {
      auto alias = policy.type_aliases.find(type_);
      const std::string& public_type =
          alias != policy.type_aliases.end() ? alias->second : type_;
      return public_type + '-' + *id_value;
    }
    return slugify(type_ + display_name(policy), slug_role::individual);
  }

} // namespace xg
