#include "settings.hpp"
#include <cstdlib>
#include <sstream>
#include <vector>
#include "cmd_registry.hpp"
#include "file_reader.hpp"
#include "config.hpp"
#include "text_util.hpp"

static CommandRegistry::Handler toggle(bool& flag, const std::string& name) {
  return [&flag, name](const std::vector<std::string>& args, std::string& msg) {
    if (args.empty()) { flag = !flag; msg = name + (flag ? " on" : " off"); return true; }
    const std::string& opt = args[0];
    if (opt == "on") { flag = true; msg = name + " on"; return true; }
    if (opt == "off") { flag = false; msg = name + " off"; return true; }
    msg = "set " + name + ": use set " + name + " on|off";
    return false;
  };
}

static void register_commands(CommandRegistry& registry, Settings& s) {
  registry.register_command("set number", toggle(s.show_line_numbers, "number"));
  registry.register_command("set helpbar", toggle(s.show_helpbar, "helpbar"));
  registry.register_command("set collapse", toggle(s.collapse_repeats, "collapse"));
  registry.register_command("set newline", [&s](const std::vector<std::string>& args, std::string& msg) {
    if (args.size() == 1 && args[0] == "lf") { s.new_file_ending = LineEnding::LF; msg = "newline lf"; return true; }
    if (args.size() == 1 && args[0] == "crlf") { s.new_file_ending = LineEnding::CRLF; msg = "newline crlf"; return true; }
    msg = "set newline: use set newline lf|crlf";
    return false;
  });
}

static bool run_line(const CommandRegistry& registry, const std::string& raw, std::string& msg) {
  std::string s = trim(raw);
  if (s.empty() || s[0] == '#' || s[0] == '"') return true;
  if (s[0] == ':') s.erase(s.begin());
  std::istringstream iss(s);
  std::vector<std::string> toks;
  for (std::string t; iss >> t;) toks.push_back(t);
  if (toks.empty()) return true;
  std::string name = toks[0];
  size_t argi = 1;
  if (toks.size() >= 2 && registry.contains(toks[0] + " " + toks[1])) {
    name = toks[0] + " " + toks[1];
    argi = 2;
  }
  std::vector<std::string> args(toks.begin() + static_cast<std::ptrdiff_t>(argi), toks.end());
  return registry.execute(name, args, msg);
}

std::optional<std::filesystem::path> default_rc_path() {
  if (const char* rc = std::getenv(MNANO_RC_ENV); rc && *rc) return std::filesystem::path(rc);
  const char* home = std::getenv("HOME");
  if (!home || !*home) return std::nullopt;
  return std::filesystem::path(home) / MNANO_RC_FILE;
}

bool apply_rc_line(Settings& s, const std::string& line, std::string& msg) {
  CommandRegistry registry;
  register_commands(registry, s);
  return run_line(registry, line, msg);
}

bool load_rc(const std::filesystem::path& path, Settings& s, std::string& msg) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return true;
  SplitText text;
  if (!mmap_readlines(path, text, msg)) return false;
  CommandRegistry registry;
  register_commands(registry, s);
  bool ok = true;
  int lineno = 0;
  for (const std::string& line : text.lines) {
    lineno++;
    std::string m;
    if (!run_line(registry, line, m)) {
      ok = false;
      msg = path.filename().string() + ":" + std::to_string(lineno) + ": " + m;
    }
  }
  return ok;
}
