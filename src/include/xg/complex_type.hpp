#pragma once

#include <xg/element_decl.hpp>
#include <xg/model_group.hpp>
#include <xg/qname.hpp>
#include <xg/schema_fwd.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace xg {

  // simpleContent or complexContent extension of a base type.
  struct extension {
    type_ref base;
    std::vector<attribute_use> attributes;
  };

  using content_model = std::variant<sequence, choice, extension>;

  class complex_type {
    std::string public_name_;
    std::vector<attribute_use> attributes_;
    std::optional<content_model> content_;
    bool alone_ = false;

  public:
    complex_type(std::string public_name, std::vector<attribute_use> attributes,
                 std::optional<content_model> content)
        : public_name_(std::move(public_name)),
          attributes_(std::move(attributes)), content_(std::move(content)) {
      if (!content_) {
        alone_ = attributes_.size() == 1;
      } else if (auto* seq = std::get_if<sequence>(&*content_)) {
        alone_ = seq->alone && attributes_.size() <= 1;
      }
    }

    const std::string&
    public_name() const {
      return public_name_;
    }

    const std::vector<attribute_use>&
    attributes() const {
      return attributes_;
    }

    const std::optional<content_model>&
    content() const {
      return content_;
    }

    bool
    alone() const {
      return alone_;
    }

    void
    force_alone() {
      alone_ = true;
    }
  };

} // namespace xg
