#include "terminal.hpp"
#include "ncurses_terminal.hpp"
#include "interface.hpp"
#include "input.hpp"
#include "form.hpp"
#include "literal.hpp"
#include "text_input.hpp"
#include "select_input.hpp"
#include "yes_no_input.hpp"
#include "dynamic_element.hpp"
#include "dependency.hpp"
#include "config.hpp"
#include "log.hpp"
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

// Static rows around two dynamic elements; Left/Right on a dynamic element reshapes the layout.
static Form layout_form() {
  Form form;
  Step first;
  first.emplace<DynamicElement>("D0");
  first.emplace<Literal>("E0S1");
  first.emplace<Literal>("E1S1\nE1S2\nE1S3");
  first.emplace<Literal>("E2S1");
  first.emplace<Literal>("E3S1");
  first.emplace<Literal>("E4S1\nE4S2");
  form.add_step(std::move(first));

  Step second;
  second.emplace<Literal>("E5S1\nE5S2");
  second.emplace<Literal>("E6S1");
  second.emplace<DynamicElement>("D1");
  second.emplace<Literal>("E7S1");
  form.add_step(std::move(second));
  return form;
}

static Form basic_form(DependencySequence& deps) {
  Form form;
  DependencyId name_given = deps.next();
  DependencyId empty_scope = deps.next();

  Step name;
  name.emplace<Literal>("Name: ", Style{TF_COLOR_ACCENT, false});
  name.emplace<TextInput>(false).set_evaluation(name_given, Evaluation::is_empty());
  name.emplace<Literal>("  (required)", Style{TF_COLOR_MUTED, false}).set_dependency(name_given, Action::Show);
  form.add_step(std::move(name));

  // type(scope): summary, the parentheses only around a non-empty scope
  Step summary;
  summary.emplace<SelectInput>("Select the commit type.", std::vector<SelectOption>{
      {"feat", "implemented a new feature"},
      {"bug", "fixed existing behavior"},
      {"docs", "added documentation"},
      {"chore", "non-source changes"},
  });
  summary.emplace<Literal>("(").set_dependency(empty_scope, Action::Hide);
  summary.emplace<TextInput>(false).set_evaluation(empty_scope, Evaluation::is_empty());
  summary.emplace<Literal>(")").set_dependency(empty_scope, Action::Hide);
  summary.emplace<Literal>(": ");
  summary.emplace<TextInput>(false);
  form.add_step(std::move(summary));

  Step breaking;
  breaking.emplace<YesNoInput>("Breaking change");
  form.add_step(std::move(breaking));

  Step body;
  body.emplace<Literal>("Description (Tab to finish):", Style{TF_COLOR_ACCENT, false});
  body.emplace<TextInput>(true);
  form.add_step(std::move(body));
  return form;
}

int main(int argc, char** argv) {
  std::string which = "basic";
  int max_width = TF_MAX_WIDTH;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-w" && i + 1 < argc) max_width = std::atoi(argv[++i]);
    else which = arg;
  }

  std::string msg;
  if (!init_logging(msg)) std::cerr << "ttyform: " << msg << "\n";

  DependencySequence deps;
  Form form = which == "layout" ? layout_form() : basic_form(deps);

  bool ok = false;
  {
    Terminal term;
    if (!term.open(msg)) {
      std::cerr << "ttyform: " << msg << "\n";
      return 1;
    }
    NcursesTerminal screen;
    Interface interface(screen);
    interface.set_max_width(max_width);
    NcursesInput input;
    ok = form.execute(interface, input, msg);
  }

  if (!ok) {
    std::cerr << "ttyform: " << msg << "\n";
    return 1;
  }
  if (form.outcome() != FormOutcome::Completed) return 130;
  std::cout << form.result();
  return 0;
}
