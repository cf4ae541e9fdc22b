#pragma once

#include <xg/qname.hpp>

#include <cstddef>
#include <variant>

namespace xg {

  // Stable index into the schema's type arena.
  using type_handle = std::size_t;

  // Stable index into the schema's element arena.
  using element_handle = std::size_t;

  // A reference to a type: inline (anonymous) types are held by handle, every
  // other reference by name, resolved through the registry when dereferenced
  // so declaration order and cycles never matter.
  using type_ref = std::variant<type_handle, qname>;

} // namespace xg
