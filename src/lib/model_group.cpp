#include <xg/errors.hpp>
#include <xg/model_group.hpp>

#include <sstream>

namespace xg {

  void
  throw_type_conflict(const qname& tag) {
    throw type_conflict("choice: element '" + tag.clark() +
                        "' is bound to more than one type");
  }

  bool
  wildcard::accepts(const std::string& uri,
                    const std::string& target_namespace) const {
    if (namespaces == "##any") return true;
    if (namespaces == "##other") {
      return !uri.empty() && uri != target_namespace;
    }

    std::istringstream tokens(namespaces);
    std::string token;
    while (tokens >> token) {
      if (token == "##local") {
        if (uri.empty()) return true;
      } else if (token == "##targetNamespace") {
        if (uri == target_namespace) return true;
      } else if (token == uri) {
        return true;
      }
    }
    return false;
  }

} // namespace xg
