#pragma once

#include <xg/qname.hpp>
#include <xg/schema_fwd.hpp>

#include <string>
#include <vector>

namespace xg {

  struct element_decl {
    qname name;
    type_ref type;
    std::vector<std::string> annotations;
  };

  struct attribute_use {
    std::string name;
    type_ref type;
    // Absent optional attributes are skipped; the flag is informational.
    bool required = false;
  };

} // namespace xg
