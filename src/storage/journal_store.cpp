#include "osync/storage/journal_store.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

namespace osync::storage {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string errno_message(const std::string& what, const fs::path& path) {
    return what + " '" + path.string() + "': " + std::strerror(errno);
}

std::string encode_batch(const WriteBatch& batch) {
    json ops = json::array();
    for (const auto& op : batch.ops()) {
        if (op.value.has_value()) {
            ops.push_back(json{{"k", op.key}, {"v", *op.value}});
        } else {
            ops.push_back(json{{"k", op.key}});
        }
    }
    return json{{"ops", std::move(ops)}}.dump() + "\n";
}

void apply_ops(std::map<std::string, std::string>& entries, const json& ops) {
    for (const auto& op : ops) {
        const auto key = op.at("k").get<std::string>();
        const auto value = op.find("v");
        if (value != op.end()) {
            entries[key] = value->get<std::string>();
        } else {
            entries.erase(key);
        }
    }
}

Result<void> fsync_directory(const fs::path& dir) {
    const int fd = ::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return Err<void>(ErrorKind::Storage, errno_message("Failed to open directory", dir));
    }
    const int rc = ::fsync(fd);
    ::close(fd);
    if (rc != 0) {
        return Err<void>(ErrorKind::Storage, errno_message("Failed to sync directory", dir));
    }
    return Ok();
}

} // namespace

JournalStore::JournalStore(fs::path path, Options options)
    : path_(std::move(path)), options_(options) {}

JournalStore::~JournalStore() {
    close_fd();
}

Result<std::unique_ptr<JournalStore>> JournalStore::open(const fs::path& path) {
    return open(path, Options{});
}

Result<std::unique_ptr<JournalStore>> JournalStore::open(const fs::path& path, Options options) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Err<std::unique_ptr<JournalStore>>(
                ErrorKind::Storage, "Failed to create directory: " + path.parent_path().string());
        }
    }

    std::unique_ptr<JournalStore> store(new JournalStore(path, options));
    if (auto res = store->replay(); res.is_error()) {
        return Err<std::unique_ptr<JournalStore>>(res.error());
    }
    if (auto res = store->open_for_append(); res.is_error()) {
        return Err<std::unique_ptr<JournalStore>>(res.error());
    }

    spdlog::debug("[Journal] opened {} ({} keys, {} lines)", path.string(),
                  store->entries_.size(), store->journal_lines_);
    return Ok(std::move(store));
}

Result<std::optional<std::string>> JournalStore::get(const std::string& key) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return Ok(std::optional<std::string>{});
    }
    return Ok(std::optional<std::string>{it->second});
}

Result<std::vector<KeyValue>> JournalStore::scan(const std::string& prefix) const {
    std::shared_lock lock(mutex_);
    std::vector<KeyValue> out;
    for (auto it = entries_.lower_bound(prefix); it != entries_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        out.emplace_back(it->first, it->second);
    }
    return Ok(std::move(out));
}

Result<void> JournalStore::commit(const WriteBatch& batch) {
    if (batch.empty()) {
        return Ok();
    }

    std::unique_lock lock(mutex_);
    if (fd_ < 0) {
        return Err<void>(ErrorKind::Storage, "Journal is not open: " + path_.string());
    }
    if (poisoned_) {
        return Err<void>(ErrorKind::Storage, "Journal " + path_.string() + " holds a partial batch; reopen it");
    }

    struct stat before {};
    if (::fstat(fd_, &before) != 0) {
        return Err<void>(ErrorKind::Storage, errno_message("Failed to stat journal", path_));
    }

    // Durable first, visible second: readers never observe an uncommitted batch.
    if (auto res = write_line(fd_, encode_batch(batch)); res.is_error()) {
        // A fragment left behind would swallow the next batch on replay.
        if (::ftruncate(fd_, before.st_size) != 0) {
            poisoned_ = true;
            spdlog::error("[Journal] {} could not be rolled back to {} bytes: {}", path_.string(),
                          static_cast<long long>(before.st_size), std::strerror(errno));
        } else {
            spdlog::warn("[Journal] rolled {} back to {} bytes after failed commit: {}", path_.string(),
                         static_cast<long long>(before.st_size), res.error().message);
        }
        return res;
    }

    for (const auto& op : batch.ops()) {
        if (op.value.has_value()) {
            entries_[op.key] = *op.value;
        } else {
            entries_.erase(op.key);
        }
    }
    ++journal_lines_;

    if (options_.compact_threshold > 0 && journal_lines_ >= options_.compact_threshold) {
        if (auto res = compact_locked(); res.is_error()) {
            // The commit itself is durable; a failed compaction only costs replay time.
            spdlog::warn("[Journal] compaction of {} failed: {}", path_.string(), res.error().message);
        }
    }
    return Ok();
}

Result<void> JournalStore::compact() {
    std::unique_lock lock(mutex_);
    return compact_locked();
}

std::size_t JournalStore::journal_lines() const {
    std::shared_lock lock(mutex_);
    return journal_lines_;
}

Result<void> JournalStore::replay() {
    entries_.clear();
    journal_lines_ = 0;

    if (!fs::exists(path_)) {
        return Ok();
    }

    std::ifstream input(path_, std::ios::binary);
    if (!input) {
        return Err<void>(ErrorKind::Storage, "Failed to open journal: " + path_.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    const std::string data = buffer.str();
    input.close();

    std::size_t offset = 0;
    std::size_t good_end = 0;
    while (offset < data.size()) {
        const auto newline = data.find('\n', offset);
        if (newline == std::string::npos) {
            break; // torn tail: batch without terminator
        }
        const auto line = data.substr(offset, newline - offset);
        try {
            const auto document = json::parse(line);
            apply_ops(entries_, document.at("ops"));
        } catch (const json::exception& e) {
            spdlog::warn("[Journal] discarding corrupt batch at offset {} of {}: {}",
                         offset, path_.string(), e.what());
            break;
        }
        ++journal_lines_;
        offset = newline + 1;
        good_end = offset;
    }

    if (good_end < data.size()) {
        spdlog::warn("[Journal] truncating {} from {} to {} bytes after torn write",
                     path_.string(), data.size(), good_end);
        if (::truncate(path_.c_str(), static_cast<off_t>(good_end)) != 0) {
            return Err<void>(ErrorKind::Storage, errno_message("Failed to truncate journal", path_));
        }
    }
    return Ok();
}

Result<void> JournalStore::open_for_append() {
    close_fd();
    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        return Err<void>(ErrorKind::Storage, errno_message("Failed to open journal", path_));
    }
    return Ok();
}

Result<void> JournalStore::write_line(int fd, const std::string& line) const {
    const char* data = line.data();
    std::size_t remaining = line.size();
    while (remaining > 0) {
        const ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Err<void>(ErrorKind::Storage, errno_message("Failed to write journal", path_));
        }
        data += written;
        remaining -= static_cast<std::size_t>(written);
    }

    if (options_.sync_writes && ::fsync(fd) != 0) {
        return Err<void>(ErrorKind::Storage, errno_message("Failed to sync journal", path_));
    }
    return Ok();
}

Result<void> JournalStore::compact_locked() {
    const fs::path temp_path = path_.string() + ".compact";

    const int fd = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return Err<void>(ErrorKind::Storage, errno_message("Failed to create", temp_path));
    }

    WriteBatch snapshot;
    for (const auto& [key, value] : entries_) {
        snapshot.put(key, value);
    }

    Result<void> written = snapshot.empty() ? Ok() : write_line(fd, encode_batch(snapshot));
    if (written.is_ok() && !options_.sync_writes && ::fsync(fd) != 0) {
        written = Err<void>(ErrorKind::Storage, errno_message("Failed to sync", temp_path));
    }
    ::close(fd);
    if (written.is_error()) {
        std::error_code ignored;
        fs::remove(temp_path, ignored);
        return written;
    }

    std::error_code ec;
    fs::rename(temp_path, path_, ec);
    if (ec) {
        return Err<void>(ErrorKind::Storage, "Failed to replace journal " + path_.string() + ": " + ec.message());
    }
    if (auto res = fsync_directory(path_.parent_path()); res.is_error()) {
        return res;
    }

    journal_lines_ = snapshot.empty() ? 0 : 1;
    spdlog::debug("[Journal] compacted {} to {} keys", path_.string(), entries_.size());
    return open_for_append();
}

void JournalStore::close_fd() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace osync::storage
