#pragma once

#include <ebnf/cpp_code.hpp>

#include <string>

namespace ebnf {

  // Renders a cpp_file as header text: `#pragma once`, project includes
  // before system includes, then each namespace with its declarations in
  // order.
  class cpp_writer {
  public:
    std::string
    write(const cpp_file& file) const;
  };

} // namespace ebnf
