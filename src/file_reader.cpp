#include "file_reader.hpp"
#include "posix_fd.hpp"
#include <sys/mman.h>
#include <sys/stat.h>

static void split_lines(const char* data, size_t n, std::vector<std::string>& out) {
  size_t start = 0;
  for (size_t i = 0; i < n; ++i) {
    if (data[i] != '\n') continue;
    size_t end = i;
    if (end > start && data[end - 1] == '\r') end--;
    out.emplace_back(data + start, end - start);
    start = i + 1;
  }
  // a final newline does not open another line
  if (start < n) {
    size_t end = n;
    if (end > start && data[end - 1] == '\r') end--;
    out.emplace_back(data + start, end - start);
  }
}

bool mmapReadLines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg) {
  out_lines.clear();
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY | O_CLOEXEC));
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
  split_lines(data, n, out_lines);
  ::munmap(mem, n);
  msg = std::string("opened file: ") + path.string();
  return true;
}
