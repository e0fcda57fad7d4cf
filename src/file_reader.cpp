#include "file_reader.hpp"
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <span>
#include "posix_fd.hpp"

static std::string errno_text() { return std::string(std::strerror(errno)); }

bool mmap_read_rope(const std::filesystem::path& path,
                    ByteRope& out,
                    std::string& msg) {
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY));
  if (!fd.valid()) { msg = "can not open file: " + path.string() + " (" + errno_text() + ")"; return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = "can not read file stat: " + path.string() + " (" + errno_text() + ")"; return false; }
  if (!S_ISREG(st.st_mode)) { msg = "not a regular file: " + path.string(); return false; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) { out = ByteRope(); msg = "opened file: " + path.string() + " (empty)"; return true; }
  void* mem = ::mmap(nullptr, n, PROT_READ, MAP_PRIVATE, fd.get(), 0);
  if (mem == MAP_FAILED) { msg = "can not mmap file: " + path.string() + " (" + errno_text() + ")"; return false; }
  const auto* data = static_cast<const std::uint8_t*>(mem);
  (void)::madvise(mem, n, MADV_SEQUENTIAL);
  // the rope copies into its own leaves, so the mapping can go right after
  out = ByteRope::from_bytes(std::span<const std::uint8_t>(data, n));
  ::munmap(mem, n);
  msg = "opened file: " + path.string() + " (" + std::to_string(n) + " bytes)";
  return true;
}

bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg) {
  out_lines.clear();
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY));
  if (!fd.valid()) { msg = "can not open file: " + path.string() + " (" + errno_text() + ")"; return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = "can not read file stat: " + path.string() + " (" + errno_text() + ")"; return false; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) return true;
  void* mem = ::mmap(nullptr, n, PROT_READ, MAP_PRIVATE, fd.get(), 0);
  if (mem == MAP_FAILED) { msg = "can not mmap file: " + path.string() + " (" + errno_text() + ")"; return false; }
  const char* data = static_cast<const char*>(mem);
  size_t start = 0;
  for (size_t i = 0; i <= n; ++i) {
    if (i < n && data[i] != '\n') continue;
    size_t end = i;
    if (end > start && data[end - 1] == '\r') end--;
    if (i < n || end > start) out_lines.emplace_back(data + start, end - start);
    start = i + 1;
  }
  ::munmap(mem, n);
  return true;
}
