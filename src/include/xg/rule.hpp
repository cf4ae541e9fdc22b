#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace xg {

  enum class atom_kind { class_atom, object_property, data_property };

  // One atom of a rule, over variable names. For class atoms `predicate` is
  // the class and `object` is unused.
  struct atom {
    atom_kind kind = atom_kind::class_atom;
    std::string subject;
    std::string predicate;
    std::string object;

    static atom
    of_class(std::string variable, std::string class_name) {
      return {atom_kind::class_atom, std::move(variable),
              std::move(class_name), {}};
    }

    // Parses "subject predicate object"; the predicate "a" is rejected since
    // class membership is a class atom, not a property.
    static atom
    parse_triple(atom_kind kind, std::string_view triple);

    bool
    operator==(const atom&) const = default;
  };

  // Named implication; the core only carries it to the writer.
  struct rule {
    std::string name;
    std::vector<atom> body;
    std::vector<atom> head;
  };

} // namespace xg
