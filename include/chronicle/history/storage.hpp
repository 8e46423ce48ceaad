#pragma once

#include "chronicle/common/time.hpp"
#include "chronicle/history/record.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace chronicle::history {

struct StorageInfo {
  std::filesystem::path base_dir;
  std::size_t session_count = 0;
  std::size_t file_count = 0;
  std::size_t partition_count = 0;
  std::uintmax_t total_bytes = 0;
};

class IHistoryStorage {
public:
  virtual ~IHistoryStorage() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  /// Appends one record. False on validation or I/O failure; never throws.
  [[nodiscard]] virtual bool store(const HistoryRecord &record) = 0;
  /// Every parseable line of the session, oldest partition first, in file order.
  [[nodiscard]] virtual std::vector<RawRecord> read_all(const std::string &session_id) = 0;
  /// Removes lines timestamped before `cutoff`; returns the number removed.
  [[nodiscard]] virtual std::size_t cleanup(common::Timestamp cutoff) = 0;
  /// What cleanup(cutoff) would remove, without touching any file.
  [[nodiscard]] virtual std::size_t count_before(common::Timestamp cutoff) = 0;
  [[nodiscard]] virtual std::vector<std::string> list_sessions() = 0;
  [[nodiscard]] virtual StorageInfo storage_info() = 0;
};

using Clock = std::function<common::Timestamp()>;

/// JSON-lines store laid out as `<base>/sessions/<YYYYMM>/<session_id>.jsonl`, where
/// YYYYMM is the UTC month of the write that created the file. Session ids that
/// cannot be used as a file name are rejected by store().
class FileHistoryStorage final : public IHistoryStorage {
public:
  explicit FileHistoryStorage(std::filesystem::path base_dir, Clock clock = common::now_timestamp);

  [[nodiscard]] std::string_view name() const override { return "file"; }
  [[nodiscard]] bool store(const HistoryRecord &record) override;
  [[nodiscard]] std::vector<RawRecord> read_all(const std::string &session_id) override;
  [[nodiscard]] std::size_t cleanup(common::Timestamp cutoff) override;
  [[nodiscard]] std::size_t count_before(common::Timestamp cutoff) override;
  [[nodiscard]] std::vector<std::string> list_sessions() override;
  [[nodiscard]] StorageInfo storage_info() override;

  [[nodiscard]] const std::filesystem::path &base_dir() const { return base_dir_; }
  [[nodiscard]] std::filesystem::path sessions_dir() const;
  [[nodiscard]] std::filesystem::path session_file(const std::string &session_id,
                                                   const std::string &partition) const;
  /// Sessions with a lock registered; cleanup drops the ones nobody holds.
  [[nodiscard]] std::size_t tracked_session_locks() const;

private:
  struct SessionFile {
    std::string session_id;
    std::filesystem::path path;
  };

  [[nodiscard]] std::shared_ptr<std::mutex> session_mutex(const std::string &session_id);
  [[nodiscard]] std::vector<std::filesystem::path> partition_dirs() const;
  [[nodiscard]] std::vector<SessionFile> all_session_files() const;
  [[nodiscard]] std::size_t prune_file(const SessionFile &file, common::Timestamp cutoff,
                                       bool dry_run, bool &deleted);
  void remove_empty_partitions();
  void release_idle_session_locks();

  std::filesystem::path base_dir_;
  Clock clock_;
  mutable std::mutex registry_mutex_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> session_mutexes_;
  // Shared by writers; exclusive while cleanup removes partition directories.
  std::shared_mutex layout_mutex_;
};

/// False for ids that are empty, "." or "..", or that contain '/', '\\' or NUL.
[[nodiscard]] bool is_valid_session_filename(const std::string &session_id);

} // namespace chronicle::history
