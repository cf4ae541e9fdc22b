#include <xg/errors.hpp>
#include <xg/simple_type.hpp>

namespace xg {

  void
  simple_type::add_value(std::string value,
                         std::vector<std::string> annotations) {
    if (index_.contains(value)) return;
    auto singleton =
        std::make_shared<individual>(value, public_name_,
                                     std::vector<has>{}, annotations);
    index_.emplace(value, values_.size());
    values_.push_back(enumeration_value{std::move(value),
                                        std::move(annotations),
                                        std::move(singleton)});
  }

  const individual_ptr&
  simple_type::lookup(std::string_view value) const {
    auto it = index_.find(std::string(value));
    if (it == index_.end()) {
      throw unknown_vocabulary_value("enumeration: '" + std::string(value) +
                                     "' is not a value of " + public_name_);
    }
    return values_[it->second].singleton;
  }

} // namespace xg
