#include "text_buffer.hpp"
#include <algorithm>
#include <iterator>
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include "posix_fd.hpp"
#include "file_reader.hpp"
#include "config.hpp"
#include "text_util.hpp"

TextBuffer::TextBuffer() : lines_(1) {}

bool TextBuffer::empty() const { return lines_.size() == 1 && lines_[0].empty(); }
int TextBuffer::line_count() const { return static_cast<int>(lines_.size()); }
const std::string& TextBuffer::line(int r) const { return lines_[static_cast<size_t>(r)]; }

std::string TextBuffer::text() const {
  std::string s;
  serialize(s);
  return s;
}

void TextBuffer::init_from_lines(std::vector<std::string> lines) {
  lines_ = std::move(lines);
  if (lines_.empty()) lines_.emplace_back();
  cursor_ = Cursor{};
  modified_ = false;
}

Cursor TextBuffer::clamp(Cursor c) const {
  c.row = std::clamp(c.row, 0, line_count() - 1);
  const std::string& s = line(c.row);
  c.col = std::clamp(c.col, 0, static_cast<int>(s.size()));
  c.col = static_cast<int>(utf8_floor(s, static_cast<size_t>(c.col)));
  return c;
}

Cursor TextBuffer::insert_char(Cursor pos, char ch) {
  pos = clamp(pos);
  std::string& s = lines_[static_cast<size_t>(pos.row)];
  s.insert(s.begin() + pos.col, ch);
  modified_ = true;
  cursor_ = Cursor{pos.row, pos.col + 1};
  return cursor_;
}

Cursor TextBuffer::insert_newline(Cursor pos) {
  pos = clamp(pos);
  std::string& s = lines_[static_cast<size_t>(pos.row)];
  std::string right = s.substr(static_cast<size_t>(pos.col));
  s.erase(static_cast<size_t>(pos.col));
  lines_.insert(lines_.begin() + pos.row + 1, std::move(right));
  modified_ = true;
  cursor_ = Cursor{pos.row + 1, 0};
  return cursor_;
}

Cursor TextBuffer::delete_backward(Cursor pos) {
  pos = clamp(pos);
  if (pos.col > 0) {
    std::string& s = lines_[static_cast<size_t>(pos.row)];
    size_t start = utf8_prev(s, static_cast<size_t>(pos.col));
    s.erase(start, static_cast<size_t>(pos.col) - start);
    modified_ = true;
    cursor_ = Cursor{pos.row, static_cast<int>(start)};
  } else if (pos.row > 0) {
    std::string& prev = lines_[static_cast<size_t>(pos.row - 1)];
    int join_col = static_cast<int>(prev.size());
    prev += lines_[static_cast<size_t>(pos.row)];
    lines_.erase(lines_.begin() + pos.row);
    modified_ = true;
    cursor_ = Cursor{pos.row - 1, join_col};
  } else {
    cursor_ = pos;
  }
  return cursor_;
}

Cursor TextBuffer::move_cursor(Direction dir, int page) {
  Cursor c = clamp(cursor_);
  int last_row = line_count() - 1;
  const std::string& cur = line(c.row);
  int len = static_cast<int>(cur.size());
  // vertical moves keep the screen column, not the byte offset
  int screen_col = utf8_column(cur, static_cast<size_t>(c.col));
  auto to_row = [&](int row) {
    c.row = row;
    c.col = static_cast<int>(utf8_offset(line(row), screen_col));
  };
  page = std::max(1, page);
  switch (dir) {
    case Direction::Up:
      if (c.row > 0) to_row(c.row - 1);
      break;
    case Direction::Down:
      if (c.row < last_row) to_row(c.row + 1);
      break;
    case Direction::Left:
      if (c.col > 0) c.col = static_cast<int>(utf8_prev(cur, static_cast<size_t>(c.col)));
      else if (c.row > 0) { c.row--; c.col = static_cast<int>(line(c.row).size()); }
      break;
    case Direction::Right:
      if (c.col < len) c.col = static_cast<int>(utf8_next(cur, static_cast<size_t>(c.col)));
      else if (c.row < last_row) { c.row++; c.col = 0; }
      break;
    case Direction::Home:
      c.col = 0;
      break;
    case Direction::End:
      c.col = len;
      break;
    case Direction::PageUp:
      to_row(std::max(0, c.row - page));
      break;
    case Direction::PageDown:
      to_row(std::min(last_row, c.row + page));
      break;
  }
  cursor_ = clamp(c);
  return cursor_;
}

void TextBuffer::serialize(std::string& out) const {
  const char* nl = ending_ == LineEnding::CRLF ? "\r\n" : "\n";
  size_t n = lines_.size();
  for (size_t i = 0; i < n; ++i) {
    out += lines_[i];
    if (i + 1 < n || final_newline_) out += nl;
  }
}

bool TextBuffer::from_stream(std::istream& in, TextBuffer& out, std::string& msg) {
  if (!in) { msg = "can not read input"; return false; }
  std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) { msg = "read error"; return false; }
  SplitText st;
  if (!split_lines(data, st, msg)) return false;
  out.init_from_lines(std::move(st.lines));
  out.ending_ = st.ending;
  out.final_newline_ = st.final_newline;
  msg = "read " + std::to_string(out.line_count()) + " lines";
  return true;
}

TextBuffer TextBuffer::from_file(const std::filesystem::path& path, std::string& msg, bool& ok) {
  TextBuffer b;
  SplitText st;
  ok = mmap_readlines(path, st, msg);
  if (!ok) return b;
  b.init_from_lines(std::move(st.lines));
  b.ending_ = st.ending;
  b.final_newline_ = st.final_newline;
  return b;
}

bool TextBuffer::write_stream(std::ostream& out, std::string& msg) {
  std::string data;
  serialize(data);
  out.write(data.data(), static_cast<std::streamsize>(data.size()));
  out.flush();
  if (!out) { msg = "write failed"; return false; }
  modified_ = false;
  msg = "Wrote " + std::to_string(line_count()) + " lines";
  return true;
}

bool TextBuffer::write_file(const std::filesystem::path& path, std::string& msg) {
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  mode_t mode = 0644;
  struct stat st{};
  if (::stat(path.string().c_str(), &st) == 0) mode = st.st_mode & 07777;
  UniqueFd ufd(::open(tmp.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, mode));
  if (!ufd.valid()) {
    msg = std::string("write file failed: ") + path.string();
    return false;
  }
  auto fail = [&]() {
    ufd.close();
    std::error_code ec;
    std::filesystem::remove(tmp, ec);
    msg = std::string("write file failed: ") + path.string();
    return false;
  };
  std::string data;
  serialize(data);
  if (!write_all(ufd.get(), data.data(), data.size(), MNANO_WRITE_CHUNK_SIZE)) return fail();
#if defined(__APPLE__)
  if (::fsync(ufd.get()) != 0) return fail();
#else
  if (::fdatasync(ufd.get()) != 0) return fail();
#endif
  if (!ufd.close()) return fail();
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    msg = std::string("write file failed: ") + path.string();
    return false;
  }
  modified_ = false;
  msg = "Wrote " + std::to_string(line_count()) + " lines";
  return true;
}
