#include <xg/rule.hpp>

#include <sstream>
#include <stdexcept>

namespace xg {

  atom
  atom::parse_triple(atom_kind kind, std::string_view triple) {
    if (kind == atom_kind::class_atom) {
      throw std::invalid_argument("atom: class atoms are not triples");
    }

    std::istringstream iss{std::string(triple)};
    std::vector<std::string> parts;
    std::string part;
    while (iss >> part) {
      parts.push_back(part);
    }
    if (parts.size() != 3) {
      throw std::invalid_argument("atom: expected 'subject predicate object', got '" +
                                  std::string(triple) + "'");
    }
    if (parts[1] == "a") {
      throw std::invalid_argument("atom: '" + std::string(triple) +
                                  "' is a class atom, not a property atom");
    }
    return {kind, std::move(parts[0]), std::move(parts[1]), std::move(parts[2])};
  }

} // namespace xg
