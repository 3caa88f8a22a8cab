#include "file_reader.hpp"
#include "posix_fd.hpp"
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

void split_raw_lines(std::string_view text, std::vector<std::string>& out_lines) {
  size_t start = 0;
  size_t n = text.size();
  for (size_t i = 0; i < n; ++i) {
    if (text[i] == '\n') {
      out_lines.emplace_back(text.substr(start, i + 1 - start));
      start = i + 1;
    }
  }
  if (start < n) out_lines.emplace_back(text.substr(start));
}

bool mmap_read_raw_lines(const std::filesystem::path& path,
                         std::vector<std::string>& out_lines,
                         std::string& msg) {
  out_lines.clear();
  UniqueFd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
  if (!fd.valid()) { msg = std::string("can not open file: ") + path.string(); return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = std::string("can not read file stat: ") + path.string(); return false; }
  if (!S_ISREG(st.st_mode)) { msg = std::string("not a regular file: ") + path.string(); return false; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) { msg = std::string("opened file: ") + path.string(); return true; }
  void* mem = ::mmap(nullptr, n, PROT_READ, MAP_PRIVATE, fd.get(), 0);
  if (mem == MAP_FAILED) { msg = std::string("can not mmap file: ") + path.string(); return false; }
  const char* data = static_cast<const char*>(mem);
  (void)::madvise(mem, n, MADV_SEQUENTIAL);

  split_raw_lines(std::string_view(data, n), out_lines);

  ::munmap(mem, n);
  msg = std::string("opened file: ") + path.string();
  return true;
}
