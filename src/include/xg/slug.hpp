#pragma once

#include <string>
#include <string_view>

namespace xg {

  enum class slug_role { plain, property, individual };

  // Normalized identity for classes (plain), relations (property, "has"
  // prefix) and individuals ("ind" prefix). The output is the join key used
  // by externally written rules, so every step is fixed:
  //   1. property role drops '@'
  //   2. parenthetical asides, with the whitespace before them, are removed
  //   3. `: 'quoted'` segments have '/' and ':' spelled out
  //   4. symbols are spelled out ('#' -> Sharp, '/' -> Or, quotes dropped...)
  //   5. the trimmed text is split on spaces, NBSP, tabs, newlines, ',', '_'
  //      and '-', and the words are capitalized and concatenated.
  std::string
  slugify(std::string_view text, slug_role role = slug_role::plain);

  // "#name" unless the reference already carries a fragment separator.
  std::string
  local_iri(std::string_view name);

} // namespace xg
