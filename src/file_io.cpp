#include "file_io.hpp"
#include "posix_fd.hpp"
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

bool mmap_read_file(const std::filesystem::path& path, std::string& out, std::string& msg) {
  out.clear();
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY));
  if (!fd.valid()) { msg = std::string("can not open file: ") + path.string(); return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = std::string("can not read file stat: ") + path.string(); return false; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) return true;
  void* mem = ::mmap(nullptr, n, PROT_READ, MAP_PRIVATE, fd.get(), 0);
  if (mem == MAP_FAILED) { msg = std::string("can not mmap file: ") + path.string(); return false; }
  (void)::madvise(mem, n, MADV_SEQUENTIAL);
  out.assign(static_cast<const char*>(mem), n);
  ::munmap(mem, n);
  return true;
}

bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg) {
  out_lines.clear();
  std::string data;
  if (!mmap_read_file(path, data, msg)) return false;
  size_t n = data.size();
  size_t start = 0;
  for (size_t i = 0; i < n; ++i) {
    if (data[i] == '\n') {
      size_t end = i;
      if (end > start && data[end - 1] == '\r') end--;
      out_lines.emplace_back(data, start, end - start);
      start = i + 1;
    }
  }
  if (start < n) {
    size_t end = n;
    if (end > start && data[end - 1] == '\r') end--;
    out_lines.emplace_back(data, start, end - start);
  }
  return true;
}

bool write_file_atomic(const std::filesystem::path& path, const std::string& data, std::string& msg) {
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  UniqueFd ufd(::open(tmp.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
  if (!ufd.valid()) {
    msg = std::string("write file failed: ") + tmp.string();
    return false;
  }
  if (!write_all(ufd.get(), data.data(), data.size())) {
    msg = std::string("write file failed: ") + tmp.string();
    return false;
  }
#if defined(__APPLE__)
  if (::fsync(ufd.get()) != 0) { msg = std::string("write file failed: ") + tmp.string(); return false; }
#else
  if (::fdatasync(ufd.get()) != 0) { msg = std::string("write file failed: ") + tmp.string(); return false; }
#endif
  ufd.reset();
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) { msg = std::string("write file failed: ") + path.string(); return false; }
  msg = std::string("saved file: ") + path.string();
  return true;
}
