#pragma once

#include <ebnf/grammar.hpp>

namespace ebnf {

  // Rewrites immediate left recursion in a rule's top-level alternatives,
  //
  //   R = B1 | ... | Bk | R , T1 | ... | R , Tm ;
  //
  // into
  //
  //   R = ( B1 | ... | Bk ) , { T1 | ... | Tm } ;
  //
  // Rules without a base alternative, with a tail that can match the empty
  // string, or whose left recursion is indirect or hidden behind a nullable
  // prefix are returned unchanged for the validator to reject.
  grammar
  eliminate_left_recursion(grammar input);

} // namespace ebnf
