#include "emit.h"

#include "registry.h"
#include "scenario.h"
#include "tui.h"
#include "util.h"

#include <algorithm>
#include <sstream>

namespace forcegen {

namespace {

constexpr char const *kIndent{ "    " };

std::string builder_name(generate_options const &opts) {
  auto const end{ opts.builder.find(' ') };
  return opts.builder.substr(0, end);
}

std::string image_path(std::string const &tag, std::string const &path) {
  return "\"$CH_IMAGE_STORAGE\"/img/" + tag + path;
}

void emit_outputs(std::ostream &out, std::vector<output_assertion> const &outputs) {
  for (auto const &o : outputs) {
    std::string const grep{ std::string("echo \"$output\" | grep ") +
                            (o.extended_regex ? "-Eq" : "-Fq") + " -- " +
                            util_shell_quote(o.pattern) };
    if (o.absent) {
      out << kIndent << "! " << grep << " || false\n";
    } else {
      out << kIndent << grep << '\n';
    }
  }
}

void emit_files(std::ostream &out,
                std::vector<file_assertion> const &files,
                std::string const &tag) {
  for (auto const &f : files) {
    auto const path{ image_path(tag, f.path) };
    std::string const ls{ "ls -lh " + path };
    std::string const grep{ "grep -Eq -- " + util_shell_quote(f.pattern) + ' ' + path };
    if (f.absent) {
      out << kIndent << "! ( " << ls << " && " << grep << " ) || false\n";
    } else {
      // Separate statements: errexit ignores a failure on the left of &&.
      out << kIndent << ls << '\n';
      out << kIndent << grep << '\n';
    }
  }
}

void emit_hook(std::ostream &out,
               capability_hook const *hook,
               hook_assertions const &assertions,
               std::string const &tag) {
  if (!hook || assertions.empty()) { return; }
  out << kIndent << "# " << hook->name << ": " << hook->description << '\n';
  emit_outputs(out, assertions.outputs);
  emit_files(out, assertions.files, tag);
}

void emit_build(std::ostream &out,
                generate_options const &opts,
                bool forced,
                std::string const &tag,
                std::string const &from,
                std::string const &run,
                int status) {
  out << kIndent << "run " << opts.builder << (forced ? " --force" : "") << " -t " << tag
      << " -f - " << opts.context << " << 'EOF'\n";
  out << "FROM " << from << '\n';
  out << "RUN " << run << '\n';
  out << "EOF\n";
  out << kIndent << "echo \"$output\"\n";
  out << kIndent << "[[ $status -eq " << status << " ]]\n";
}

}  // namespace

void emit_preamble(std::ostream &out, generate_options const &opts) {
  auto const name{ builder_name(opts) };
  out << "# This file is generated by forcegen. Do not edit; regenerate instead.\n"
      << "\n"
      << "load ../common\n"
      << "\n"
      << "setup () {\n"
      << kIndent << "[[ $CH_TEST_BUILDER = " << util_shell_quote(name) << " ]] || skip "
      << util_shell_quote(name + " only") << '\n'
      << "}\n";
}

void emit_scenario(std::ostream &out,
                   derived_scenario const &item,
                   generate_options const &opts) {
  auto const &[s, d]{ item };
  auto const &p{ *s.prof };

  if (d.skipped()) {
    out << "\n# skip: " << describe(s) << ": " << *d.skip_reason << '\n';
    return;
  }

  out << "\n@test \"" << opts.name_prefix << ": " << describe(s) << "\" {\n";
  out << kIndent << "scope " << scope_name(d.effective_scope) << '\n';
  for (auto const &arch : p.arch_excludes) { out << kIndent << "arch_exclude " << arch << '\n'; }
  out << '\n';

  std::string from{ p.base };
  if (s.preprep) {
    out << kIndent << "# build 1: intermediate image for preparatory commands\n";
    emit_build(out, opts, false, opts.intermediate_tag, p.base, *p.prep_run, 0);
    emit_hook(out, p.hook, d.after_build1, opts.intermediate_tag);
    from = opts.intermediate_tag;
  } else {
    out << kIndent << "# build 1: skipped, no preparatory image\n";
  }
  out << '\n';

  out << kIndent << "# build 2: image under test\n";
  emit_build(out, opts, s.forced, opts.final_tag, from, *p.command(s.category), d.status);
  emit_outputs(out, d.outputs);
  emit_hook(out, p.hook, d.after_build2, opts.final_tag);
  out << "}\n";
}

void emit(std::ostream &out,
          std::vector<derived_scenario> const &items,
          generate_options const &opts) {
  emit_preamble(out, opts);
  for (auto const &item : items) { emit_scenario(out, item, opts); }
}

rendered render(registry const &reg, generate_options const &opts) {
  auto const items{ derive_all(enumerate(reg)) };

  std::ostringstream oss;
  emit(oss, items, opts);

  rendered result;
  result.text = oss.str();
  result.skipped = static_cast<std::size_t>(
      std::ranges::count_if(items, [](auto const &item) { return item.second.skipped(); }));
  result.tests = items.size() - result.skipped;

  tui::debug("Rendered %zu tests (%zu skipped) from %zu profiles",
             result.tests,
             result.skipped,
             reg.profiles().size());
  return result;
}

}  // namespace forcegen
