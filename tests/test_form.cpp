#include "form.hpp"
#include "config.hpp"
#include "dependency.hpp"
#include "dynamic_element.hpp"
#include "headless_terminal.hpp"
#include "interface.hpp"
#include "literal.hpp"
#include "select_input.hpp"
#include "text_input.hpp"
#include "yes_no_input.hpp"
#include <cassert>
#include <stdexcept>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Replays keys and lets a test inspect the screen before each one is delivered.
class WatchedInput : public IInputDevice {
public:
  explicit WatchedInput(std::function<void(std::size_t)> watch) : watch_(std::move(watch)) {}
  void push(const Key& key) { keys_.push_back(key); }
  void type(const std::string& text) {
    for (char c : text) keys_.push_back(c == '\n' ? Key::of(KeyCode::Enter) : Key::character(static_cast<char32_t>(c)));
  }
  std::optional<Key> read_key() override {
    if (keys_.empty()) return std::nullopt;
    watch_(delivered_++);
    Key k = keys_.front();
    keys_.pop_front();
    return k;
  }
private:
  std::function<void(std::size_t)> watch_;
  std::deque<Key> keys_;
  std::size_t delivered_ = 0;
};

static Form name_age_form() {
  Form form;
  Step name;
  name.emplace<Literal>("Name: ");
  name.emplace<TextInput>();
  form.add_step(std::move(name));
  Step age;
  age.emplace<Literal>("Age: ");
  age.emplace<TextInput>();
  form.add_step(std::move(age));
  return form;
}

static void test_fills_steps_in_order() {
  HeadlessTerminal term(10, 40);
  Interface iface(term);
  Form form = name_age_form();
  ScriptedInput input;
  input.type("Ann\n42\n");

  std::string msg;
  assert(form.execute(iface, input, msg));
  assert(form.outcome() == FormOutcome::Completed);
  assert(form.result() == "Name: Ann\nAge: 42\n");
  assert(term.row_text(0) == "Name: Ann");
  assert(term.row_text(1) == "Age: 42");
  // the terminal cursor is parked below the form
  assert(term.cursor().row == 2 && term.cursor().col == 0);
}

static void test_later_steps_appear_when_reached() {
  HeadlessTerminal term(10, 40);
  Interface iface(term);
  Form form = name_age_form();
  WatchedInput input([&](std::size_t n) {
    if (n == 0) {
      assert(term.row_text(0) == "Name:");
      assert(term.row_text(1).empty());
      assert(term.cursor_visible());
      assert(term.cursor().row == 0 && term.cursor().col == 6);
    } else if (n == 2) {
      assert(term.cursor().col == 8);
    } else if (n == 3) {
      assert(term.row_text(1) == "Age:");
      assert(term.cursor().row == 1 && term.cursor().col == 5);
      assert(form.active() == (ElementId{1, 1}));
    }
  });
  input.type("An\n7\n");

  std::string msg;
  assert(form.execute(iface, input, msg));
  assert(form.result() == "Name: An\nAge: 7\n");
}

static void test_cancel_and_back_navigation() {
  {
    HeadlessTerminal term(10, 40);
    Interface iface(term);
    Form form = name_age_form();
    ScriptedInput input{Key::character(U'x'), Key::of(KeyCode::CtrlC), Key::character(U'y')};
    std::string msg;
    assert(form.execute(iface, input, msg));
    assert(form.outcome() == FormOutcome::Cancelled);
    assert(input.pending() == 1);
  }
  {
    // running out of input cancels
    HeadlessTerminal term(10, 40);
    Interface iface(term);
    Form form = name_age_form();
    ScriptedInput input;
    input.type("x");
    std::string msg;
    assert(form.execute(iface, input, msg));
    assert(form.outcome() == FormOutcome::Cancelled);
  }
  {
    // Esc on the first input cancels
    HeadlessTerminal term(10, 40);
    Interface iface(term);
    Form form = name_age_form();
    ScriptedInput input{Key::of(KeyCode::Esc)};
    std::string msg;
    assert(form.execute(iface, input, msg));
    assert(form.outcome() == FormOutcome::Cancelled);
  }
  {
    HeadlessTerminal term(10, 40);
    Interface iface(term);
    Form form = name_age_form();
    ScriptedInput input;
    input.type("A\n");
    input.push(Key::of(KeyCode::Esc));
    input.type("B");
    input.push(Key::of(KeyCode::Tab));
    input.type("C");
    input.push(Key::of(KeyCode::BackTab));
    input.push(Key::of(KeyCode::Tab));
    input.type("D\n");
    std::string msg;
    assert(form.execute(iface, input, msg));
    assert(form.outcome() == FormOutcome::Completed);
    assert(form.result() == "Name: AB\nAge: CD\n");
    assert(term.row_text(0) == "Name: AB");
    assert(term.row_text(1) == "Age: CD");
  }
}

static Form required_name_form(DependencyId id) {
  Form form;
  Step name;
  name.emplace<TextInput>().set_evaluation(id, Evaluation::is_empty());
  name.emplace<Literal>("(required)").set_dependency(id, Action::Show);
  form.add_step(std::move(name));
  Step other;
  other.emplace<TextInput>();
  form.add_step(std::move(other));
  return form;
}

static void test_dependency_shows_and_hides_a_literal() {
  DependencySequence deps;
  DependencyId id = deps.next();
  {
    HeadlessTerminal term(10, 40);
    Interface iface(term);
    Form form = required_name_form(id);
    WatchedInput input([&](std::size_t n) {
      if (n == 0) assert(term.row_text(0) == "(required)");
      if (n == 1) assert(term.row_text(0) == "x");
    });
    input.type("x\n\n");
    std::string msg;
    assert(form.execute(iface, input, msg));
    assert(form.result() == "x\n\n");
    assert(form.dependency_state().get_source(id) == (ElementId{0, 0}));
    assert(!form.dependency_state().get_evaluation(id));
  }
  {
    HeadlessTerminal term(10, 40);
    Interface iface(term);
    Form form = required_name_form(id);
    ScriptedInput input;
    input.type("x");
    input.push(Key::of(KeyCode::Backspace));
    input.type("\n\n");
    std::string msg;
    assert(form.execute(iface, input, msg));
    assert(term.row_text(0) == "(required)");
    assert(form.result() == "(required)\n\n");
  }
}

static void test_multi_line_input_grows_and_shrinks() {
  HeadlessTerminal term(10, 40);
  Interface iface(term);
  Form form;
  Step notes;
  notes.emplace<Literal>("Notes:");
  notes.emplace<TextInput>(true);
  form.add_step(std::move(notes));
  Step end;
  end.emplace<Literal>("End ");
  end.emplace<TextInput>();
  form.add_step(std::move(end));

  WatchedInput input([&](std::size_t n) {
    if (n == 4) {
      assert(iface.line_count() == 4);
      assert(term.row_text(0) == "Notes:");
      assert(term.row_text(1) == "a");
      assert(term.row_text(2) == "bc");
      assert(term.cursor().row == 2 && term.cursor().col == 2);
    }
    if (n == 7) {
      // backspacing over the line break released its block line
      assert(iface.line_count() == 3);
      assert(term.row_text(1) == "a");
      assert(term.row_text(2).empty());
      assert(term.cursor().row == 1 && term.cursor().col == 1);
    }
  });
  input.type("a\nbc");
  input.push(Key::of(KeyCode::Backspace));
  input.push(Key::of(KeyCode::Backspace));
  input.push(Key::of(KeyCode::Backspace));
  input.type("\nz");
  input.push(Key::of(KeyCode::Tab));
  input.type("ok\n");

  std::string msg;
  assert(form.execute(iface, input, msg));
  assert(form.outcome() == FormOutcome::Completed);
  assert(form.result() == "Notes:a\nz\nEnd ok\n");
  assert(term.row_text(1) == "a");
  assert(term.row_text(2) == "z");
  assert(term.row_text(3) == "End ok");
}

static void test_wrapped_input_moves_by_screen_rows() {
  HeadlessTerminal term(10, 5);
  Interface iface(term);
  Form form;
  Step step;
  step.emplace<TextInput>(true);
  form.add_step(std::move(step));

  WatchedInput input([&](std::size_t n) {
    if (n == 7) {
      assert(term.row_text(1) == "abcde");
      assert(term.row_text(2) == "fg");
      assert(term.cursor().row == 2 && term.cursor().col == 2);
    }
  });
  input.type("abcdefg");
  input.push(Key::of(KeyCode::Up));
  input.type("X");
  input.push(Key::of(KeyCode::Tab));

  std::string msg;
  assert(form.execute(iface, input, msg));
  assert(form.result() == "abXcdefg\n");
}

static void test_dynamic_element_through_the_form() {
  HeadlessTerminal term(10, 40);
  Interface iface(term);
  Form form;
  Step first;
  first.emplace<DynamicElement>("D");
  first.emplace<Literal>("E0");
  form.add_step(std::move(first));

  WatchedInput input([&](std::size_t n) {
    if (n == 1) {
      assert(term.row_text(0) == "DS1DS0");
      assert(term.row_text(1) == "E0");
      // the cursor follows the base segment
      assert(term.cursor().row == 0 && term.cursor().col == 3);
    }
    if (n == 2) {
      assert(term.row_text(0) == "DS0");
      assert(term.row_text(1) == "DS2");
      assert(term.row_text(2) == "E0");
    }
  });
  input.push(Key::of(KeyCode::Right));
  input.push(Key::of(KeyCode::Right));
  input.push(Key::of(KeyCode::Enter));

  std::string msg;
  assert(form.execute(iface, input, msg));
  assert(form.outcome() == FormOutcome::Completed);
  assert(form.result() == "DS2E0\n");
}

static void test_select_input_drawer_and_yes_no_answer() {
  DependencySequence deps;
  DependencyId is_bug = deps.next();
  HeadlessTerminal term(10, 40);
  Interface iface(term);
  Form form;
  Step summary;
  summary.emplace<SelectInput>("Select the commit type.", std::vector<SelectOption>{
      {"feat", "implemented a new feature"},
      {"bug", "fixed existing behavior"},
      {"docs", "added documentation"},
  }).set_evaluation(is_bug, Evaluation::equal("bug"));
  summary.emplace<Literal>(": ");
  summary.emplace<TextInput>();
  form.add_step(std::move(summary));
  Step breaking;
  breaking.emplace<YesNoInput>("Breaking");
  form.add_step(std::move(breaking));

  const Style muted{TF_COLOR_MUTED, false};
  const Style selected{TF_COLOR_SELECTED, false};
  WatchedInput input([&](std::size_t n) {
    if (n == 0) {
      // the drawer pushes the rest of the step below it
      assert(term.row_text(0) == "feat");
      assert(term.row_text(1) == "Select the commit type.");
      assert(term.row_text(2) == " > feat - implemented a new feature");
      assert(term.row_text(3) == "   bug - fixed existing behavior");
      assert(term.row_text(4) == "   docs - added documentation");
      assert(term.row_text(5) == ":");
      assert(term.style_at(2, 1) == selected);
      assert(term.style_at(3, 3) == muted);
      assert(term.cursor().row == 0 && term.cursor().col == 0);
    } else if (n == 1) {
      // Up from the first option wraps to the last
      assert(term.row_text(0) == "docs");
      assert(term.row_text(2) == "   feat - implemented a new feature");
      assert(term.row_text(4) == " > docs - added documentation");
      assert(term.style_at(4, 1) == selected);
    } else if (n == 3) {
      assert(term.row_text(0) == "bug");
      assert(term.row_text(3) == " > bug - fixed existing behavior");
    } else if (n == 4) {
      // leaving the select folds the drawer away and rejoins the row
      assert(iface.line_count() == 2);
      assert(term.row_text(0) == "bug:");
      assert(term.row_text(1).empty());
      assert(term.cursor().row == 0 && term.cursor().col == 5);
    } else if (n == 8) {
      assert(term.row_text(0) == "bug: fix");
      assert(term.row_text(1) == "Breaking: No");
      assert(term.style_at(1, 0) == muted);
      assert(term.cursor().row == 1 && term.cursor().col == 0);
    } else if (n == 9) {
      assert(term.row_text(1) == "Breaking: Yes");
      assert(!term.style_at(1, 0));
    }
  });
  input.push(Key::of(KeyCode::Up));
  input.push(Key::of(KeyCode::Down));
  input.push(Key::of(KeyCode::Down));
  input.push(Key::of(KeyCode::Enter));
  input.type("fix\n");
  input.push(Key::of(KeyCode::Down));
  input.push(Key::of(KeyCode::Enter));

  std::string msg;
  assert(form.execute(iface, input, msg));
  assert(form.outcome() == FormOutcome::Completed);
  assert(form.result() == "bug: fix\nBreaking: Yes\n");
  assert(form.dependency_state().get_evaluation(is_bug));
  assert(term.row_text(0) == "bug: fix");
  assert(term.row_text(1) == "Breaking: Yes");
}

static void test_select_input_comes_back_on_retreat() {
  HeadlessTerminal term(10, 40);
  Interface iface(term);
  Form form;
  Step step;
  step.emplace<SelectInput>("Pick:", std::vector<SelectOption>{{"a", "first"}, {"b", "second"}});
  step.emplace<TextInput>();
  form.add_step(std::move(step));

  WatchedInput input([&](std::size_t n) {
    if (n == 2) assert(term.row_text(0) == "b");
    if (n == 3) assert(term.row_text(0) == "bx");
    if (n == 4) {
      assert(term.row_text(0) == "b");
      assert(term.row_text(1) == "Pick:");
      assert(term.row_text(3) == " > b - second");
      assert(term.row_text(4) == "x");
    }
  });
  input.push(Key::of(KeyCode::Down));
  input.push(Key::of(KeyCode::Tab));
  input.type("x");
  input.push(Key::of(KeyCode::Esc));
  input.push(Key::of(KeyCode::Down));
  input.push(Key::of(KeyCode::Tab));
  input.push(Key::of(KeyCode::Enter));

  std::string msg;
  assert(form.execute(iface, input, msg));
  assert(form.result() == "ax\n");
  assert(iface.line_count() == 1);
  assert(term.row_text(0) == "ax");

  bool threw = false;
  try { SelectInput empty("Pick:", {}); } catch (const std::invalid_argument&) { threw = true; }
  assert(threw);
  SelectInput two("Pick:", {{"a", "first"}, {"b", "second"}});
  two.select(1);
  assert(two.value() == "b");
  threw = false;
  try { two.select(2); } catch (const std::out_of_range&) { threw = true; }
  assert(threw);
}

static void test_yes_no_omits_a_no_answer() {
  DependencySequence deps;
  DependencyId breaking = deps.next();
  HeadlessTerminal term(10, 40);
  Interface iface(term);
  Form form;
  Step first;
  first.emplace<YesNoInput>("Breaking").set_evaluation(breaking, Evaluation::equal("Yes"));
  first.emplace<Literal>(" (major bump)").set_dependency(breaking, Action::Show);
  form.add_step(std::move(first));
  Step second;
  second.emplace<TextInput>();
  form.add_step(std::move(second));

  WatchedInput input([&](std::size_t n) {
    if (n == 1) assert(term.row_text(0) == "Breaking: Yes (major bump)");
    if (n == 2) assert(term.row_text(0) == "Breaking: No");
    if (n == 3) assert(term.row_text(0).empty());
  });
  input.type("yn\nz\n");

  std::string msg;
  assert(form.execute(iface, input, msg));
  assert(form.result() == "\nz\n");
  assert(term.row_text(1) == "z");

  {
    // without omission a "No" stays on screen and in the result
    HeadlessTerminal term2(10, 40);
    Interface iface2(term2);
    Form kept;
    Step only;
    only.emplace<YesNoInput>("Breaking", false);
    kept.add_step(std::move(only));
    ScriptedInput keys;
    keys.type("\n");
    assert(kept.execute(iface2, keys, msg));
    assert(kept.result() == "Breaking: No\n");
    assert(term2.row_text(0) == "Breaking: No");
    assert(!term2.style_at(0, 0));
  }
}

static void test_forms_without_inputs_complete_at_once() {
  HeadlessTerminal term(10, 40);
  Interface iface(term);
  Form form;
  Step a;
  a.emplace<Literal>("a");
  form.add_step(std::move(a));
  form.add_step(Step());
  Step b;
  b.emplace<Literal>("b");
  form.add_step(std::move(b));
  ScriptedInput input{Key::character(U'z')};

  std::string msg;
  assert(form.execute(iface, input, msg));
  assert(form.outcome() == FormOutcome::Completed);
  assert(input.pending() == 1);
  assert(term.row_text(0) == "a");
  assert(term.row_text(2) == "b");
  assert(form.result() == "a\n\nb\n");

  Form empty;
  assert(empty.execute(iface, input, msg));
  assert(empty.outcome() == FormOutcome::Completed);
}

static void test_paint_failure_is_reported() {
  HeadlessTerminal term(0, 0);
  Interface iface(term);
  Form form = name_age_form();
  ScriptedInput input;
  std::string msg;
  assert(!form.execute(iface, input, msg));
  assert(!msg.empty());
}

int main() {
  test_fills_steps_in_order();
  test_later_steps_appear_when_reached();
  test_cancel_and_back_navigation();
  test_dependency_shows_and_hides_a_literal();
  test_multi_line_input_grows_and_shrinks();
  test_wrapped_input_moves_by_screen_rows();
  test_dynamic_element_through_the_form();
  test_select_input_drawer_and_yes_no_answer();
  test_select_input_comes_back_on_retreat();
  test_yes_no_omits_a_no_answer();
  test_forms_without_inputs_complete_at_once();
  test_paint_failure_is_reported();
  return 0;
}
