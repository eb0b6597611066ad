#include "file_reader.hpp"
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include "posix_fd.hpp"

bool is_valid_utf8(std::string_view data) {
  size_t i = 0, n = data.size();
  while (i < n) {
    unsigned char c = static_cast<unsigned char>(data[i]);
    if (c < 0x80) { i++; continue; }
    int extra = 0;
    unsigned cp = 0;
    if (c >= 0xC2 && c <= 0xDF) { extra = 1; cp = c & 0x1F; }
    else if (c >= 0xE0 && c <= 0xEF) { extra = 2; cp = c & 0x0F; }
    else if (c >= 0xF0 && c <= 0xF4) { extra = 3; cp = c & 0x07; }
    else return false;
    if (i + static_cast<size_t>(extra) >= n) return false;
    for (int k = 1; k <= extra; ++k) {
      unsigned char cc = static_cast<unsigned char>(data[i + k]);
      if ((cc & 0xC0) != 0x80) return false;
      cp = (cp << 6) | (cc & 0x3F);
    }
    // overlong forms, surrogates, beyond U+10FFFF
    if (extra == 2 && (cp < 0x800 || (cp >= 0xD800 && cp <= 0xDFFF))) return false;
    if (extra == 3 && (cp < 0x10000 || cp > 0x10FFFF)) return false;
    i += static_cast<size_t>(extra) + 1;
  }
  return true;
}

bool split_lines(std::string_view data, SplitText& out, std::string& msg) {
  out.lines.clear();
  out.ending = LineEnding::LF;
  out.final_newline = false;
  if (!is_valid_utf8(data)) {
    msg = "can not decode file: invalid UTF-8";
    return false;
  }
  size_t n = data.size();
  size_t first_nl = data.find('\n');
  if (first_nl != std::string_view::npos && first_nl > 0 && data[first_nl - 1] == '\r') {
    out.ending = LineEnding::CRLF;
  }
  bool crlf = out.ending == LineEnding::CRLF;
  size_t start = 0;
  for (size_t i = 0; i < n; ++i) {
    if (data[i] != '\n') continue;
    size_t end = i;
    if (crlf && end > start && data[end - 1] == '\r') end--;
    out.lines.emplace_back(data.substr(start, end - start));
    start = i + 1;
  }
  if (start < n) {
    out.lines.emplace_back(data.substr(start));
  } else if (n > 0) {
    out.final_newline = true;
  }
  if (out.lines.empty()) out.lines.emplace_back("");
  return true;
}

bool mmap_readlines(const std::filesystem::path& path,
                    SplitText& out,
                    std::string& msg) {
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY));
  if (!fd.valid()) { msg = std::string("can not open file: ") + path.string(); return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = std::string("can not read file stat: ") + path.string(); return false; }
  if (S_ISDIR(st.st_mode)) { msg = std::string("is a directory: ") + path.string(); return false; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) {
    out.lines.assign(1, std::string());
    out.ending = LineEnding::LF;
    out.final_newline = false;
    msg = std::string("opened file: ") + path.string();
    return true;
  }
  void* mem = ::mmap(nullptr, n, PROT_READ, MAP_PRIVATE, fd.get(), 0);
  if (mem == MAP_FAILED) { msg = std::string("can not mmap file: ") + path.string(); return false; }
  const char* data = static_cast<const char*>(mem);
  (void)::madvise(mem, n, MADV_SEQUENTIAL);
  bool ok = split_lines(std::string_view(data, n), out, msg);
  ::munmap(mem, n);
  if (!ok) { msg += ": " + path.string(); return false; }
  msg = std::string("opened file: ") + path.string();
  return true;
}
