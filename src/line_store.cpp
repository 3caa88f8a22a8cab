#include "line_store.hpp"
#include <cstring>
#include <cerrno>
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include "posix_fd.hpp"
#include "file_reader.hpp"

template <typename Core>
void BasicLineStore<Core>::ensure_terminated() {
  size_t n = line_count();
  if (n == 0) return;
  const std::string& last = line(n - 1);
  if (!last.empty() && last.back() == '\n') return;
  std::string s = last;
  s.push_back('\n');
  replace_line(n - 1, s);
}

template <typename Core>
std::string BasicLineStore<Core>::serialize() const {
  size_t n = line_count();
  size_t total = 0;
  for (size_t i = 0; i < n; ++i) total += line(i).size();
  std::string out;
  out.reserve(total);
  for (size_t i = 0; i < n; ++i) out += line(i);
  return out;
}

template <typename Core>
BasicLineStore<Core> BasicLineStore<Core>::from_text(std::string_view text) {
  BasicLineStore b;
  std::vector<std::string> ls;
  split_raw_lines(text, ls);
  b.init_from_lines(std::move(ls));
  return b;
}

template <typename Core>
BasicLineStore<Core> BasicLineStore<Core>::from_file(const std::filesystem::path& path, std::string& msg, bool& ok) {
  BasicLineStore b;
  ok = true;
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    if (ec) {
      ok = false;
      msg = std::string("can not stat file: ") + path.string() + ": " + ec.message();
      return b;
    }
    msg = std::string("new file: ") + path.string();
    return b;
  }
  std::vector<std::string> ls;
  if (!mmap_read_raw_lines(path, ls, msg)) {
    ok = false;
    return b;
  }
  b.init_from_lines(std::move(ls));
  return b;
}

template <typename Core>
bool BasicLineStore<Core>::write_all(int fd, const std::string& shown, std::string& msg) const {
  std::vector<char> buf(static_cast<size_t>(IE_WRITE_CHUNK_SIZE));
  size_t used = 0;
  auto write_span = [&](const char* p, size_t len) -> bool {
    while (len > 0) {
      ssize_t w = ::write(fd, p, len);
      if (w < 0) {
        if (errno == EINTR) continue;
        msg = std::string("write file failed: ") + shown + ": " + std::strerror(errno);
        return false;
      }
      p += w;
      len -= static_cast<size_t>(w);
    }
    return true;
  };
  size_t n = line_count();
  for (size_t i = 0; i < n; ++i) {
    const std::string& s = line(i);
    if (s.size() > buf.size() - used) {
      if (used > 0) {
        if (!write_span(buf.data(), used)) return false;
        used = 0;
      }
      if (s.size() >= buf.size()) {
        if (!write_span(s.data(), s.size())) return false;
        continue;
      }
    }
    std::memcpy(buf.data() + used, s.data(), s.size());
    used += s.size();
  }
  if (used > 0 && !write_span(buf.data(), used)) return false;
  return true;
}

static mode_t creation_mode() {
  mode_t mask = ::umask(0);
  ::umask(mask);
  return static_cast<mode_t>(0666 & ~mask);
}

template <typename Core>
bool BasicLineStore<Core>::write_file(const std::filesystem::path& path, std::string& msg, WriteMode mode) const {
  std::error_code ec;
  std::filesystem::path target = path;
  if (std::filesystem::is_symlink(path, ec)) {
    std::filesystem::path resolved = std::filesystem::weakly_canonical(path, ec);
    if (ec) { msg = std::string("can not resolve link: ") + path.string() + ": " + ec.message(); return false; }
    target = resolved;
  }

  if (mode == WriteMode::InPlace) {
    UniqueFd ufd(::open(target.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0666));
    if (!ufd.valid()) { msg = std::string("write file failed: ") + target.string() + ": " + std::strerror(errno); return false; }
    if (!write_all(ufd.get(), target.string(), msg)) return false;
    if (::fsync(ufd.get()) != 0 || !ufd.close()) {
      msg = std::string("write file failed: ") + target.string() + ": " + std::strerror(errno);
      return false;
    }
    msg = std::string("saved file: ") + path.string();
    return true;
  }

  mode_t perm = creation_mode();
  struct stat st{};
  if (::stat(target.c_str(), &st) == 0) perm = st.st_mode & 07777;

  std::string tmpl = target.string() + ".XXXXXX";
  std::vector<char> name(tmpl.begin(), tmpl.end());
  name.push_back('\0');
  UniqueFd ufd(::mkostemp(name.data(), O_CLOEXEC));
  if (!ufd.valid()) {
    msg = std::string("write file failed: ") + tmpl + ": " + std::strerror(errno);
    return false;
  }
  std::string tmp(name.data());
  auto fail = [&](const std::string& what) {
    msg = std::string("write file failed: ") + what + ": " + std::strerror(errno);
    ufd.reset();
    ::unlink(tmp.c_str());
    return false;
  };
  if (::fchmod(ufd.get(), perm) != 0) return fail(tmp);
  if (!write_all(ufd.get(), tmp, msg)) {
    ufd.reset();
    ::unlink(tmp.c_str());
    return false;
  }
#if defined(__APPLE__)
  if (::fsync(ufd.get()) != 0) return fail(tmp);
#else
  if (::fdatasync(ufd.get()) != 0) return fail(tmp);
#endif
  if (!ufd.close()) return fail(tmp);
  std::filesystem::rename(tmp, target, ec);
  if (ec) {
    msg = std::string("write file failed: ") + target.string() + ": " + ec.message();
    ::unlink(tmp.c_str());
    return false;
  }
  msg = std::string("saved file: ") + path.string();
  return true;
}

template class BasicLineStore<VectorLineStoreCore>;
template class BasicLineStore<GapLineStoreCore>;
