#include "byte_buffer.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <vector>
#include "config.hpp"
#include "file_reader.hpp"
#include "posix_fd.hpp"

ByteBuffer ByteBuffer::from_bytes(std::span<const std::uint8_t> data) {
  return ByteBuffer(ByteRope::from_bytes(data));
}

ByteBuffer ByteBuffer::splice(ByteRange r, std::span<const std::uint8_t> replacement) const {
  return ByteBuffer(rope_.splice(r, replacement));
}

bool ByteBuffer::from_file(const std::filesystem::path& path, ByteBuffer& out, std::string& msg) {
  ByteRope rope;
  if (!mmap_read_rope(path, rope, msg)) return false;
  out = ByteBuffer(std::move(rope));
  return true;
}

bool ByteBuffer::write_file(const std::filesystem::path& path, std::string& msg) const {
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  auto fail = [&](const std::filesystem::path& p) {
    msg = "write file failed: " + p.string() + " (" + std::strerror(errno) + ")";
    return false;
  };
  UniqueFd ufd(::open(tmp.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
  if (!ufd.valid()) return fail(tmp);
  std::vector<std::uint8_t> buf(static_cast<size_t>(HXV_WRITE_CHUNK_SIZE));
  size_t used = 0;
  auto write_span = [&](const std::uint8_t* p, size_t len) -> bool {
    size_t remain = len;
    while (remain > 0) {
      ssize_t w = ::write(ufd.get(), p, remain);
      if (w < 0) {
        if (errno == EINTR) continue;
        return false;
      }
      p += w;
      remain -= static_cast<size_t>(w);
    }
    return true;
  };
  auto abort_write = [&]() {
    int saved = errno;
    ufd.close_checked();
    ::unlink(tmp.string().c_str());
    errno = saved;
    return fail(tmp);
  };
  auto it = rope_.chunks(ByteRange{0, length()});
  std::span<const std::uint8_t> chunk;
  while (it.next(chunk)) {
    if (chunk.size() > buf.size() - used) {
      if (used > 0 && !write_span(buf.data(), used)) return abort_write();
      used = 0;
      if (chunk.size() >= buf.size()) {
        if (!write_span(chunk.data(), chunk.size())) return abort_write();
        continue;
      }
    }
    std::memcpy(buf.data() + used, chunk.data(), chunk.size());
    used += chunk.size();
  }
  if (used > 0 && !write_span(buf.data(), used)) return abort_write();
#if defined(__APPLE__)
  if (::fsync(ufd.get()) != 0) return abort_write();
#else
  if (::fdatasync(ufd.get()) != 0) return abort_write();
#endif
  if (!ufd.close_checked()) return abort_write();
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    msg = "write file failed: " + path.string() + " (" + ec.message() + ")";
    std::filesystem::remove(tmp, ec);
    return false;
  }
  msg = "saved file: " + path.string() + " (" + std::to_string(length()) + " bytes)";
  return true;
}
