#include "derive.h"

#include "tui.h"

#include <stdexcept>

namespace forcegen {

namespace {

output_assertion fixed(std::string text) {
  return output_assertion{ .pattern = std::move(text) };
}

std::optional<std::string> skip_reason(scenario const &s) {
  if (s.preprep && !(s.forced && s.category == need::needed)) {
    return "preprep not needed";
  }
  if (s.preprep && !s.prof->prep_run) { return "no preparation command"; }
  if (!s.prof->has_command(s.category)) {
    return "no command for " + std::string(need_name(s.category));
  }
  return std::nullopt;
}

std::vector<output_assertion> expected_outputs(scenario const &s) {
  bool const runs_workaround{ s.category == need::needed ||
                              s.category == need::fake_needed };
  std::vector<output_assertion> outs;

  if (s.forced) {
    outs.push_back(fixed("will use --force: " + s.prof->config));
    if (s.category == need::unneeded_win) {
      outs.push_back(fixed("warning: --force specified, but nothing to do"));
    } else if (runs_workaround) {
      outs.push_back(fixed("--force: init OK & modified 1 RUN instructions"));
    }
  } else {
    outs.push_back(fixed("available --force: " + s.prof->config));
    if (runs_workaround) { outs.push_back(fixed("RUN: available here with --force")); }
    if (s.category == need::needed) {
      outs.push_back(fixed("build failed: --force may fix it"));
    } else if (s.category == need::unneeded_fail) {
      outs.push_back(fixed("build failed: current version of --force wouldn't help"));
    }
  }

  return outs;
}

// One install path per scenario: a forced build installs the repository
// through the workaround, which leaves it disabled and supersedes any
// preparatory install; otherwise it must still be enabled.
void derive_hook(scenario const &s, derivation &d) {
  auto const *hook{ s.prof->hook };
  if (!hook) { return; }

  if (s.preprep) {
    for (auto const &pattern : hook->output_patterns) {
      d.after_build1.outputs.push_back(
          output_assertion{ .pattern = pattern, .extended_regex = true });
    }
    for (auto const &file : hook->file_checks) {
      d.after_build1.files.push_back(
          file_assertion{ .pattern = file.pattern, .path = file.path });
    }
  }

  bool const installed_by_workaround{ s.forced && !s.preprep &&
                                      (s.category == need::needed ||
                                       s.category == need::fake_needed) };
  for (auto const &pattern : hook->output_patterns) {
    d.after_build2.outputs.push_back(output_assertion{ .pattern = pattern,
                                                       .extended_regex = true,
                                                       .absent = !installed_by_workaround });
  }

  // Image contents are only known when an install path ran and the build
  // succeeded. Both paths are forced, and a forced build leaves the
  // repository disabled.
  if ((!s.preprep && !installed_by_workaround) || d.status != 0) { return; }
  for (auto const &file : hook->file_checks) {
    d.after_build2.files.push_back(
        file_assertion{ .pattern = file.pattern, .path = file.path, .absent = true });
  }
}

}  // namespace

int expected_status(need category, bool forced) {
  switch (category) {
    case need::unneeded_fail: return 1;
    case need::unneeded_win: return 0;
    case need::fake_needed: return 0;
    case need::needed: return forced ? 0 : 1;
  }
  throw std::logic_error("no expected status for need " +
                         std::to_string(static_cast<int>(category)));
}

derivation derive(scenario const &s) {
  derivation d;

  if (auto reason{ skip_reason(s) }) {
    tui::trace("derive: skip %s: %s", describe(s).c_str(), reason->c_str());
    d.skip_reason = std::move(reason);
    return d;
  }

  d.effective_scope = (s.prof->default_scope == scope::standard || s.category == need::needed)
                          ? scope::standard
                          : scope::full;
  d.status = expected_status(s.category, s.forced);
  d.outputs = expected_outputs(s);
  derive_hook(s, d);

  tui::trace("derive: run %s: scope %s, status %d, %zu outputs",
             describe(s).c_str(),
             std::string(scope_name(d.effective_scope)).c_str(),
             d.status,
             d.outputs.size());
  return d;
}

std::vector<derived_scenario> derive_all(std::vector<scenario> const &scenarios) {
  std::vector<derived_scenario> result;
  result.reserve(scenarios.size());
  for (auto const &s : scenarios) { result.emplace_back(s, derive(s)); }
  return result;
}

}  // namespace forcegen
