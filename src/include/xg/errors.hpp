#pragma once

#include <stdexcept>
#include <string>

namespace xg {

  // A literal element carries no text. Extension parsing treats this as
  // "no base value"; everywhere else it aborts the document.
  class empty_value : public std::runtime_error {
  public:
    explicit empty_value(const std::string& what) : std::runtime_error(what) {}
  };

  // An enumeration lookup missed the declared vocabulary.
  class unknown_vocabulary_value : public std::runtime_error {
  public:
    explicit unknown_vocabulary_value(const std::string& what)
        : std::runtime_error(what) {}
  };

  // Two choice branches bind the same tag to different types.
  class type_conflict : public std::runtime_error {
  public:
    explicit type_conflict(const std::string& what) : std::runtime_error(what) {}
  };

  class unresolved_reference : public std::runtime_error {
  public:
    explicit unresolved_reference(const std::string& what)
        : std::runtime_error(what) {}
  };

  // Wildcard content outside the declared and pass-through namespaces.
  class unexpected_namespace : public std::runtime_error {
  public:
    explicit unexpected_namespace(const std::string& what)
        : std::runtime_error(what) {}
  };

  // A document child whose tag the enclosing content model does not declare.
  class unexpected_element : public std::runtime_error {
  public:
    explicit unexpected_element(const std::string& what)
        : std::runtime_error(what) {}
  };

  // Malformed or duplicate schema declarations.
  class schema_error : public std::runtime_error {
  public:
    explicit schema_error(const std::string& what) : std::runtime_error(what) {}
  };

} // namespace xg
