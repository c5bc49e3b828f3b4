#pragma once

#include <sys/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "bathycat/common/config.hpp"

namespace bathycat::storage {

/// What one retention pass removed.
struct CleanupResult {
  uint64_t files = 0;
  uint64_t bytes = 0;
};

/// The storage target. Paths are relative to root(). All failures throw
/// StorageError.
class Storage {
public:
  virtual ~Storage() = default;

  virtual std::string root() const = 0;

  /// Create the root. Called once at session start, before check_ready().
  virtual void prepare() {}

  /// Reachable, writable and above the free-space floor. Never creates the
  /// root: a root that went away means the medium went away.
  virtual void check_ready() = 0;

  /// Write to a temporary name in the same directory, flush, then rename.
  /// Parent directories are created as needed.
  virtual void write_atomic(const std::string& relative_path,
                            const uint8_t* data, std::size_t size) = 0;

  void write_atomic(const std::string& relative_path, const std::string& text) {
    write_atomic(relative_path, reinterpret_cast<const uint8_t*>(text.data()), text.size());
  }

  virtual void remove(const std::string& relative_path) = 0;

  virtual uint64_t free_bytes() const = 0;

  /// Delete images (and their sidecars) last modified more than `max_age`
  /// ago. Session summaries are kept.
  virtual CleanupResult remove_older_than(std::chrono::seconds max_age) = 0;
};

/// A directory on a local or removable filesystem. With a mount point, the
/// root lives on that mount and every check confirms it is still mounted.
class FilesystemStorage : public Storage {
public:
  FilesystemStorage(std::string root, uint64_t min_free_bytes, std::string mount_point = "");

  std::string root() const override { return root_; }
  void prepare() override;
  void check_ready() override;
  void write_atomic(const std::string& relative_path,
                    const uint8_t* data, std::size_t size) override;
  using Storage::write_atomic;
  void remove(const std::string& relative_path) override;
  uint64_t free_bytes() const override;
  CleanupResult remove_older_than(std::chrono::seconds max_age) override;

private:
  void check_mounted() const;
  void make_dirs_under_root(const std::string& relative_dir) const;

  std::string root_;
  uint64_t min_free_bytes_;
  std::string mount_point_;
  dev_t root_dev_ = 0;
  bool prepared_ = false;
};

/// A mounted filesystem as listed in /proc/mounts.
struct MountEntry {
  std::string device;
  std::string mount_point;
  std::string fs_type;
};

/// Parse the /proc/mounts format. Octal escapes (\040) are decoded.
std::vector<MountEntry> parse_mounts(const std::string& text);

/// Where records go. `mount_point` is empty for the local fallback.
struct StorageRoot {
  std::string path;
  std::string mount_point;
};

/// Pick the storage root: `<mount>/bathycat` on the first writable mount
/// under one of the configured prefixes, else the local path.
StorageRoot select_storage_root(const StorageParams& params,
                                const std::string& mounts_file = "/proc/mounts");

}  // namespace bathycat::storage
