#pragma once

#include "need.h"
#include "scenario.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace forcegen {

struct output_assertion {
  std::string pattern;
  bool extended_regex{ false };  // fixed string unless set
  bool absent{ false };
};

struct file_assertion {
  std::string pattern;  // extended regex
  std::string path;     // absolute path inside the image
  bool absent{ false };
};

struct hook_assertions {
  std::vector<output_assertion> outputs;
  std::vector<file_assertion> files;

  bool empty() const { return outputs.empty() && files.empty(); }
};

// Expected outcome of one scenario. A skip is a normal result, not an error.
struct derivation {
  std::optional<std::string> skip_reason;
  scope effective_scope{ scope::full };
  int status{ 0 };
  std::vector<output_assertion> outputs;
  hook_assertions after_build1;  // intermediate image; only with preprep
  hook_assertions after_build2;  // image under test

  bool skipped() const { return skip_reason.has_value(); }
};

using derived_scenario = std::pair<scenario, derivation>;

// 1 when the command must fail: always for UNNEEDED_FAIL, and for NEEDED
// unless --force is given.
int expected_status(need category, bool forced);

derivation derive(scenario const &s);
std::vector<derived_scenario> derive_all(std::vector<scenario> const &scenarios);

}  // namespace forcegen
