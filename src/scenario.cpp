#include "scenario.h"

#include "registry.h"

#include <initializer_list>

namespace forcegen {

std::vector<scenario> enumerate(std::vector<profile> const &profiles) {
  std::vector<scenario> result;
  result.reserve(profiles.size() * need_count * 4);

  for (auto const &p : profiles) {
    for (auto const n : all_needs) {
      for (bool const forced : { false, true }) {
        for (bool const preprep : { false, true }) {
          result.push_back(
              scenario{ .prof = &p, .category = n, .forced = forced, .preprep = preprep });
        }
      }
    }
  }

  return result;
}

std::vector<scenario> enumerate(registry const &reg) { return enumerate(reg.profiles()); }

std::string describe(scenario const &s) {
  std::string result{ s.prof->name };
  result.append(", ");
  result.append(need_name(s.category));
  result.append(s.forced ? ", with --force" : ", w/o --force");
  result.append(s.preprep ? ", preprep" : ", no preprep");
  return result;
}

}  // namespace forcegen
