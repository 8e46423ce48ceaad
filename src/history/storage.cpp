#include "chronicle/history/storage.hpp"

#include "chronicle/common/fs.hpp"
#include "chronicle/common/json_util.hpp"
#include "chronicle/observability/global.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>

namespace chronicle::history {

namespace {

constexpr const char *SESSIONS_FOLDER = "sessions";
constexpr const char *LOG_EXTENSION = ".jsonl";
constexpr const char *COMPONENT = "history.storage";

bool is_partition_name(const std::string &name) {
  return name.size() == 6 &&
         std::all_of(name.begin(), name.end(),
                     [](const char ch) { return std::isdigit(static_cast<unsigned char>(ch)); });
}

std::vector<std::string> read_lines(const std::filesystem::path &path) {
  std::vector<std::string> lines;
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return lines;
  }
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(std::move(line));
  }
  return lines;
}

// A line counts as expired only when it parses and carries a timestamp before
// the cutoff; anything unreadable is kept.
bool line_expired(const std::string &line, const common::Timestamp cutoff) {
  if (!common::json_is_valid_object(line)) {
    return false;
  }
  const auto fields = common::json_parse_flat(line);
  const auto it = fields.find("timestamp");
  if (it == fields.end()) {
    return false;
  }
  const auto timestamp = common::parse_iso8601(it->second);
  return timestamp.has_value() && *timestamp < cutoff;
}

} // namespace

bool is_valid_session_filename(const std::string &session_id) {
  if (session_id.empty() || session_id == "." || session_id == "..") {
    return false;
  }
  return session_id.find_first_of(std::string("/\\\0", 3)) == std::string::npos;
}

FileHistoryStorage::FileHistoryStorage(std::filesystem::path base_dir, Clock clock)
    : base_dir_(std::move(base_dir)), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = common::now_timestamp;
  }
}

std::filesystem::path FileHistoryStorage::sessions_dir() const {
  return base_dir_ / SESSIONS_FOLDER;
}

std::filesystem::path FileHistoryStorage::session_file(const std::string &session_id,
                                                       const std::string &partition) const {
  return sessions_dir() / partition / (session_id + LOG_EXTENSION);
}

void FileHistoryStorage::release_idle_session_locks() {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  std::erase_if(session_mutexes_, [](const auto &entry) { return entry.second.use_count() == 1; });
}

std::size_t FileHistoryStorage::tracked_session_locks() const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  return session_mutexes_.size();
}

std::shared_ptr<std::mutex> FileHistoryStorage::session_mutex(const std::string &session_id) {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto &slot = session_mutexes_[session_id];
  if (slot == nullptr) {
    slot = std::make_shared<std::mutex>();
  }
  return slot;
}

bool FileHistoryStorage::store(const HistoryRecord &record) {
  const std::string type(record_type_of(record));
  const std::string &session_id = session_id_of(record);

  if (const auto valid = validate_record(record); !valid.ok()) {
    observability::record_error(COMPONENT, "rejected record: " + valid.error());
    observability::record_history_write(type, session_id, false);
    return false;
  }
  if (!is_valid_session_filename(session_id)) {
    observability::record_error(COMPONENT, "session id is not a usable file name: " + session_id);
    observability::record_history_write(type, session_id, false);
    return false;
  }

  std::string line;
  try {
    line = encode_record_json(record);
  } catch (const std::exception &ex) {
    observability::record_error(COMPONENT, "failed to serialise " + type + " record " +
                                               record_id_of(record) + ": " + ex.what());
    observability::record_history_write(type, session_id, false);
    return false;
  }
  line.push_back('\n');

  const std::string partition = common::month_partition(clock_());
  const auto path = session_file(session_id, partition);

  std::shared_lock<std::shared_mutex> layout(layout_mutex_);
  const auto file_lock = session_mutex(session_id);
  std::lock_guard<std::mutex> lock(*file_lock);

  if (const auto dir = common::ensure_dir(path.parent_path()); !dir.ok()) {
    observability::record_error(COMPONENT, dir.error());
    observability::record_history_write(type, session_id, false);
    return false;
  }

  std::ofstream out(path, std::ios::binary | std::ios::app);
  if (!out) {
    observability::record_error(COMPONENT, "unable to open " + path.string());
    observability::record_history_write(type, session_id, false);
    return false;
  }
  out.write(line.data(), static_cast<std::streamsize>(line.size()));
  out.flush();
  if (!out) {
    observability::record_error(COMPONENT, "failed appending to " + path.string());
    observability::record_history_write(type, session_id, false);
    return false;
  }

  observability::record_history_write(type, session_id, true);
  return true;
}

std::vector<std::filesystem::path> FileHistoryStorage::partition_dirs() const {
  std::vector<std::filesystem::path> dirs;
  std::error_code ec;
  if (!std::filesystem::is_directory(sessions_dir(), ec)) {
    return dirs;
  }
  for (std::filesystem::directory_iterator it(sessions_dir(), ec), end; !ec && it != end;
       it.increment(ec)) {
    if (it->is_directory(ec) && is_partition_name(it->path().filename().string())) {
      dirs.push_back(it->path());
    }
  }
  std::sort(dirs.begin(), dirs.end());
  return dirs;
}

std::vector<FileHistoryStorage::SessionFile> FileHistoryStorage::all_session_files() const {
  std::vector<SessionFile> files;
  for (const auto &dir : partition_dirs()) {
    std::vector<SessionFile> in_partition;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end;
         it.increment(ec)) {
      const auto &path = it->path();
      if (!it->is_regular_file(ec) || path.extension() != LOG_EXTENSION) {
        continue;
      }
      in_partition.push_back(SessionFile{.session_id = path.stem().string(), .path = path});
    }
    std::sort(in_partition.begin(), in_partition.end(),
              [](const SessionFile &a, const SessionFile &b) { return a.path < b.path; });
    files.insert(files.end(), in_partition.begin(), in_partition.end());
  }
  return files;
}

std::vector<RawRecord> FileHistoryStorage::read_all(const std::string &session_id) {
  std::vector<RawRecord> records;
  if (!is_valid_session_filename(session_id)) {
    return records;
  }

  const auto file_lock = session_mutex(session_id);
  std::lock_guard<std::mutex> lock(*file_lock);

  const std::string filename = session_id + LOG_EXTENSION;
  for (const auto &dir : partition_dirs()) {
    const auto path = dir / filename;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
      continue;
    }
    for (const auto &line : read_lines(path)) {
      if (line.empty() || !common::json_is_valid_object(line)) {
        continue;
      }
      records.push_back(common::json_parse_flat(line));
    }
  }
  return records;
}

std::size_t FileHistoryStorage::prune_file(const SessionFile &file,
                                           const common::Timestamp cutoff, const bool dry_run,
                                           bool &deleted) {
  deleted = false;
  const auto file_lock = session_mutex(file.session_id);
  std::lock_guard<std::mutex> lock(*file_lock);

  std::vector<std::string> kept;
  std::size_t removed = 0;
  for (auto &line : read_lines(file.path)) {
    if (line.empty()) {
      continue;
    }
    if (line_expired(line, cutoff)) {
      ++removed;
    } else {
      kept.push_back(std::move(line));
    }
  }

  if (dry_run || removed == 0) {
    return removed;
  }

  if (kept.empty()) {
    std::error_code ec;
    std::filesystem::remove(file.path, ec);
    if (ec) {
      observability::record_error(COMPONENT,
                                  "failed removing " + file.path.string() + ": " + ec.message());
      return 0;
    }
    deleted = true;
    return removed;
  }

  std::string content;
  for (const auto &line : kept) {
    content += line;
    content.push_back('\n');
  }
  if (const auto status = common::write_file_atomic(file.path, content); !status.ok()) {
    observability::record_error(COMPONENT, status.error());
    return 0;
  }
  return removed;
}

void FileHistoryStorage::remove_empty_partitions() {
  std::unique_lock<std::shared_mutex> layout(layout_mutex_);
  for (const auto &dir : partition_dirs()) {
    std::error_code ec;
    if (std::filesystem::is_empty(dir, ec) && !ec) {
      std::filesystem::remove(dir, ec);
    }
  }
}

std::size_t FileHistoryStorage::cleanup(const common::Timestamp cutoff) {
  std::size_t removed = 0;
  std::uint64_t deleted_files = 0;
  for (const auto &file : all_session_files()) {
    bool deleted = false;
    removed += prune_file(file, cutoff, false, deleted);
    if (deleted) {
      ++deleted_files;
    }
  }
  remove_empty_partitions();
  release_idle_session_locks();
  observability::record_cleanup(removed, deleted_files);
  return removed;
}

std::size_t FileHistoryStorage::count_before(const common::Timestamp cutoff) {
  std::size_t count = 0;
  for (const auto &file : all_session_files()) {
    bool deleted = false;
    count += prune_file(file, cutoff, true, deleted);
  }
  return count;
}

std::vector<std::string> FileHistoryStorage::list_sessions() {
  std::set<std::string> ids;
  for (const auto &file : all_session_files()) {
    ids.insert(file.session_id);
  }
  return {ids.begin(), ids.end()};
}

StorageInfo FileHistoryStorage::storage_info() {
  StorageInfo info;
  info.base_dir = base_dir_;
  info.partition_count = partition_dirs().size();
  std::set<std::string> ids;
  for (const auto &file : all_session_files()) {
    ids.insert(file.session_id);
    ++info.file_count;
    std::error_code ec;
    const auto size = std::filesystem::file_size(file.path, ec);
    if (!ec) {
      info.total_bytes += size;
    }
  }
  info.session_count = ids.size();
  return info;
}

} // namespace chronicle::history
