#pragma once

#include "derive.h"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace forcegen {

class registry;

struct generate_options {
  std::string builder{ "ch-image -v build" };  // invoked as <builder> [--force] -t ...
  std::string name_prefix{ "ch-image --force" };
  std::string intermediate_tag{ "tmpimg" };
  std::string final_tag{ "tmpimg2" };
  std::string context{ "." };
};

// Shared setup emitted once at the top of the file.
void emit_preamble(std::ostream &out, generate_options const &opts);

// One @test block, or a "# skip:" comment when the derivation is a skip.
void emit_scenario(std::ostream &out,
                   derived_scenario const &item,
                   generate_options const &opts);

void emit(std::ostream &out,
          std::vector<derived_scenario> const &items,
          generate_options const &opts);

struct rendered {
  std::string text;
  std::size_t tests{ 0 };
  std::size_t skipped{ 0 };
};

// Enumerate, derive and emit every scenario of `reg` into memory.
rendered render(registry const &reg, generate_options const &opts);

}  // namespace forcegen
