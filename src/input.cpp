#include "input.hpp"
#include <cctype>

namespace {

struct Binding {
  KeyCode code;
  int ch;
  unsigned mods;
  EditCommand cmd;
};

using K = EditCommand::Kind;

const Binding kBindings[] = {
  {KeyCode::Char, 'x', ModCtrl, EditCommand::of(K::Quit)},
  {KeyCode::Char, 'o', ModCtrl, EditCommand::of(K::Save)},
  {KeyCode::Char, 'g', ModCtrl, EditCommand::of(K::ToggleHelp)},
  {KeyCode::Up, 0, ModNone, EditCommand::move(Direction::Up)},
  {KeyCode::Down, 0, ModNone, EditCommand::move(Direction::Down)},
  {KeyCode::Left, 0, ModNone, EditCommand::move(Direction::Left)},
  {KeyCode::Right, 0, ModNone, EditCommand::move(Direction::Right)},
  {KeyCode::Home, 0, ModNone, EditCommand::move(Direction::Home)},
  {KeyCode::End, 0, ModNone, EditCommand::move(Direction::End)},
  {KeyCode::PageUp, 0, ModNone, EditCommand::move(Direction::PageUp)},
  {KeyCode::PageDown, 0, ModNone, EditCommand::move(Direction::PageDown)},
  {KeyCode::Enter, 0, ModNone, EditCommand::of(K::InsertNewline)},
  {KeyCode::Backspace, 0, ModNone, EditCommand::of(K::DeleteBackward)},
  {KeyCode::Escape, 0, ModNone, EditCommand::of(K::Cancel)},
};

bool is_printable(int ch) {
  return (ch >= 0x20 && ch <= 0x7e) || (ch >= 0x80 && ch <= 0xff);
}

} // namespace

EditCommand InputDispatcher::map_key(const KeyEvent& ev, InputMode mode) {
  int ch = ev.code == KeyCode::Char ? std::tolower(ev.ch & 0xff) : 0;
  unsigned mods = ev.mods & ~static_cast<unsigned>(ModShift);
  for (const Binding& b : kBindings) {
    if (b.code != ev.code || b.mods != mods) continue;
    if (b.code == KeyCode::Char && b.ch != ch) continue;
    if (mode == InputMode::HelpOverlay && b.cmd.kind != K::ToggleHelp && b.cmd.kind != K::Quit) {
      return EditCommand::of(K::NoOp);
    }
    return b.cmd;
  }
  if (mode == InputMode::HelpOverlay) return EditCommand::of(K::NoOp);
  if (ev.code == KeyCode::Char && mods == ModNone && is_printable(ev.ch)) {
    return EditCommand::insert_char(static_cast<char>(ev.ch));
  }
  return EditCommand::of(K::NoOp);
}

void InputDispatcher::collapse_repeats(std::vector<KeyEvent>& batch) {
  std::vector<KeyEvent> out;
  out.reserve(batch.size());
  for (const KeyEvent& ev : batch) {
    // UTF-8 continuation bytes may legitimately repeat ("\xe0\xa0\xa0")
    bool continuation = ev.code == KeyCode::Char && ev.mods == ModNone && ev.ch >= 0x80 && ev.ch <= 0xbf;
    if (!out.empty() && out.back() == ev && !continuation) continue;
    out.push_back(ev);
  }
  batch.swap(out);
}

bool InputDispatcher::fill(ITerminal& term) {
  std::vector<KeyEvent> batch(1);
  if (!term.read_key(batch[0])) return false;
  KeyEvent ev;
  while (term.poll_key(ev)) batch.push_back(ev);
  if (collapse_) collapse_repeats(batch);
  pending_.insert(pending_.end(), batch.begin(), batch.end());
  return true;
}

bool InputDispatcher::next_command(ITerminal& term, InputMode mode, EditCommand& out) {
  if (pending_.empty() && !fill(term)) return false;
  KeyEvent ev = pending_.front();
  pending_.pop_front();
  if (ev.code == KeyCode::Resize) {
    resized_ = true;
    out = EditCommand::of(K::NoOp);
    return true;
  }
  out = map_key(ev, mode);
  return true;
}

bool InputDispatcher::take_resized() {
  bool r = resized_;
  resized_ = false;
  return r;
}
