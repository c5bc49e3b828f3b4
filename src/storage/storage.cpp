#include "bathycat/storage/storage.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <vector>

#include <rclcpp/rclcpp.hpp>

#include "bathycat/common/errors.hpp"

namespace bathycat::storage {

namespace fs = std::filesystem;

namespace {

inline std::string sys_err(const std::string& msg) {
  return msg + ": " + std::strerror(errno);
}

std::string join(const std::string& root, const std::string& rel) {
  return (fs::path(root) / rel).string();
}

// Best effort: the entry is already in place, fsync only hardens it.
void sync_dir(const fs::path& dir) {
  const int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (dfd >= 0) {
    ::fsync(dfd);
    ::close(dfd);
  }
}

// mkdir that tolerates a concurrent creator. Returns true if it made `dir`.
bool make_dir(const fs::path& dir) {
  if (::mkdir(dir.c_str(), 0755) == 0) {
    sync_dir(dir.parent_path());
    return true;
  }
  if (errno != EEXIST) {
    throw StorageError(sys_err("mkdir(" + dir.string() + ") failed"));
  }
  return false;
}

// Closes the fd and unlinks the temporary file unless released.
class TempFile {
public:
  explicit TempFile(std::string path) : path_(std::move(path)) {}
  ~TempFile() {
    if (fd_ >= 0) ::close(fd_);
    if (!released_) ::unlink(path_.c_str());
  }
  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;

  int& fd() { return fd_; }
  const std::string& path() const { return path_; }
  void release() { released_ = true; }

private:
  std::string path_;
  int fd_ = -1;
  bool released_ = false;
};

bool is_writable_dir(const std::string& path) {
  struct stat st{};
  return ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode) &&
         ::access(path.c_str(), W_OK) == 0;
}

std::string decode_mount_field(const std::string& field) {
  std::string out;
  for (std::size_t i = 0; i < field.size(); ++i) {
    if (field[i] == '\\' && i + 3 < field.size()) {
      const std::string oct = field.substr(i + 1, 3);
      if (oct.find_first_not_of("01234567") == std::string::npos) {
        out += static_cast<char>(std::stoi(oct, nullptr, 8));
        i += 3;
        continue;
      }
    }
    out += field[i];
  }
  return out;
}

}  // namespace

FilesystemStorage::FilesystemStorage(std::string root, uint64_t min_free_bytes,
                                     std::string mount_point)
  : root_(std::move(root)),
    min_free_bytes_(min_free_bytes),
    mount_point_(std::move(mount_point)) {}

void FilesystemStorage::check_mounted() const {
  if (mount_point_.empty()) return;
  struct stat mnt{};
  struct stat parent{};
  const std::string parent_path = fs::path(mount_point_).parent_path().string();
  if (::stat(mount_point_.c_str(), &mnt) != 0 || ::stat(parent_path.c_str(), &parent) != 0) {
    throw StorageError(sys_err("stat(" + mount_point_ + ") failed"));
  }
  // An unmounted mount point is a plain directory on its parent's device.
  if (mnt.st_dev == parent.st_dev) {
    throw StorageError("removable medium at " + mount_point_ + " is not mounted");
  }
}

void FilesystemStorage::prepare() {
  check_mounted();

  std::vector<fs::path> missing;
  std::error_code ec;
  for (fs::path p = root_; !p.empty() && !fs::exists(p, ec); p = p.parent_path()) {
    missing.push_back(p);
    if (p == p.parent_path()) break;
  }
  for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
    make_dir(*it);
  }

  struct stat st{};
  if (::stat(root_.c_str(), &st) != 0) {
    throw StorageError(sys_err("stat(" + root_ + ") failed"));
  }
  root_dev_ = st.st_dev;
  prepared_ = true;
}

void FilesystemStorage::check_ready() {
  check_mounted();
  struct stat st{};
  if (::stat(root_.c_str(), &st) != 0) {
    throw StorageError(sys_err("storage root " + root_ + " is gone"));
  }
  if (prepared_ && st.st_dev != root_dev_) {
    throw StorageError("storage root " + root_ + " moved to another device");
  }
  if (!is_writable_dir(root_)) {
    throw StorageError("storage root " + root_ + " is not a writable directory");
  }
  const uint64_t free = free_bytes();
  if (free < min_free_bytes_) {
    throw StorageError("storage root " + root_ + " has only " +
                       std::to_string(free / (1024 * 1024)) + " MB free");
  }
}

void FilesystemStorage::make_dirs_under_root(const std::string& relative_dir) const {
  if (!is_writable_dir(root_)) {
    throw StorageError("storage root " + root_ + " is not a writable directory");
  }
  fs::path dir = root_;
  for (const auto& part : fs::path(relative_dir)) {
    dir /= part;
    make_dir(dir);
  }
}

uint64_t FilesystemStorage::free_bytes() const {
  struct statvfs st{};
  if (::statvfs(root_.c_str(), &st) != 0) {
    throw StorageError(sys_err("statvfs(" + root_ + ") failed"));
  }
  return static_cast<uint64_t>(st.f_bavail) * st.f_frsize;
}

void FilesystemStorage::write_atomic(const std::string& relative_path,
                                     const uint8_t* data, std::size_t size) {
  const fs::path final_path = fs::path(root_) / relative_path;
  const fs::path dir = final_path.parent_path();
  make_dirs_under_root(fs::path(relative_path).parent_path().string());

  TempFile tmp((dir / ("." + final_path.filename().string() + ".tmp")).string());
  tmp.fd() = ::open(tmp.path().c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (tmp.fd() < 0) {
    throw StorageError(sys_err("open(" + tmp.path() + ") failed"));
  }

  std::size_t off = 0;
  while (off < size) {
    const ssize_t n = ::write(tmp.fd(), data + off, size - off);
    if (n < 0) {
      if (errno == EINTR) continue;
      throw StorageError(sys_err("write(" + tmp.path() + ") failed"));
    }
    off += static_cast<std::size_t>(n);
  }
  if (::fsync(tmp.fd()) != 0) {
    throw StorageError(sys_err("fsync(" + tmp.path() + ") failed"));
  }
  const int fd = tmp.fd();
  tmp.fd() = -1;
  if (::close(fd) != 0) {
    throw StorageError(sys_err("close(" + tmp.path() + ") failed"));
  }

  if (::rename(tmp.path().c_str(), final_path.c_str()) != 0) {
    throw StorageError(sys_err("rename to " + final_path.string() + " failed"));
  }
  tmp.release();

  // Persist the directory entry too.
  sync_dir(dir);
}

void FilesystemStorage::remove(const std::string& relative_path) {
  const std::string path = join(root_, relative_path);
  if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
    throw StorageError(sys_err("unlink(" + path + ") failed"));
  }
}

CleanupResult FilesystemStorage::remove_older_than(std::chrono::seconds max_age) {
  CleanupResult result;
  const fs::path images = fs::path(root_) / "images";
  std::error_code ec;
  if (!fs::is_directory(images, ec)) {
    return result;
  }
  const auto cutoff = fs::file_time_type::clock::now() - max_age;

  std::vector<fs::path> day_dirs;
  for (fs::recursive_directory_iterator it(images, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code entry_ec;
    if (it->is_directory(entry_ec)) {
      day_dirs.push_back(it->path());
      continue;
    }
    if (!it->is_regular_file(entry_ec)) continue;
    const auto mtime = it->last_write_time(entry_ec);
    if (entry_ec || mtime >= cutoff) continue;

    const uint64_t size = it->file_size(entry_ec);
    if (::unlink(it->path().c_str()) != 0) {
      throw StorageError(sys_err("unlink(" + it->path().string() + ") failed"));
    }
    ++result.files;
    if (!entry_ec) result.bytes += size;
  }
  if (ec) {
    throw StorageError("cannot scan " + images.string() + ": " + ec.message());
  }

  // Deepest first, so emptied day directories go too.
  for (auto it = day_dirs.rbegin(); it != day_dirs.rend(); ++it) {
    fs::remove(*it, ec);  // fails harmlessly when not empty
  }
  return result;
}

std::vector<MountEntry> parse_mounts(const std::string& text) {
  std::vector<MountEntry> out;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    std::istringstream ls(line);
    MountEntry m;
    if (!(ls >> m.device >> m.mount_point >> m.fs_type)) continue;
    m.mount_point = decode_mount_field(m.mount_point);
    out.push_back(std::move(m));
  }
  return out;
}

StorageRoot select_storage_root(const StorageParams& params, const std::string& mounts_file) {
  auto logger = rclcpp::get_logger("bathycat.storage");

  if (params.prefer_removable) {
    std::ifstream f(mounts_file);
    std::stringstream buf;
    buf << f.rdbuf();

    for (const auto& m : parse_mounts(buf.str())) {
      for (const auto& prefix : params.mount_prefixes) {
        const bool under = m.mount_point.size() > prefix.size() &&
                           m.mount_point.compare(0, prefix.size(), prefix) == 0 &&
                           m.mount_point[prefix.size()] == '/';
        if (!under || !is_writable_dir(m.mount_point)) continue;

        const std::string root = join(m.mount_point, "bathycat");
        RCLCPP_INFO(logger, "Using removable storage %s (%s, %s)",
                    root.c_str(), m.device.c_str(), m.fs_type.c_str());
        return StorageRoot{root, m.mount_point};
      }
    }
    RCLCPP_WARN(logger, "No writable removable medium under the mount prefixes, "
                        "falling back to %s", params.local_path.c_str());
  }
  return StorageRoot{params.local_path, ""};
}

}  // namespace bathycat::storage
