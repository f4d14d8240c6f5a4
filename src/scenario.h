#pragma once

#include "need.h"
#include "profile.h"

#include <string>
#include <vector>

namespace forcegen {

class registry;

struct scenario {
  profile const *prof;  // owned by the registry
  need category;
  bool forced;
  bool preprep;
};

// Cartesian product in generation order: profile declaration order, then need
// order, then forced ascending, then preprep ascending.
std::vector<scenario> enumerate(std::vector<profile> const &profiles);
std::vector<scenario> enumerate(registry const &reg);

// "alpine_3.9, NEEDED, with --force, no preprep"
std::string describe(scenario const &s);

}  // namespace forcegen
