#pragma once

/**
 * @file journal_store.hpp
 * @brief Crash-safe LocalPersistence backed by an append-only journal file
 *
 * HOW IT WORKS:
 * 1. Every commit() is serialized as one JSON line {"ops":[...]} and
 *    appended to the journal with a single write() followed by fsync().
 * 2. The full key space is mirrored in memory (std::map) for reads.
 * 3. open() replays the journal line by line. A trailing line without its
 *    newline, or one that does not parse, is a torn write from a crash: it is
 *    dropped and the file is truncated back to the last complete batch.
 * 4. A commit whose write or fsync fails is cut back off the file, so the
 *    next batch starts on a clean line. If that rollback fails too, the store
 *    refuses commits until it is reopened.
 * 5. compact() rewrites the current state as a single batch into a sibling
 *    file and renames it over the journal, so a crash during compaction
 *    leaves either the old or the new journal, never a mix.
 *
 * THREAD SAFETY:
 * Reads share a std::shared_mutex; commits and compaction are exclusive.
 */

#include "osync/storage/local_persistence.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <shared_mutex>

namespace osync::storage {

class JournalStore : public LocalPersistence {
public:
    struct Options {
        bool sync_writes = true;              ///< fsync after every commit
        std::size_t compact_threshold = 4096; ///< auto-compact after this many journal lines (0 = never)
    };

    static Result<std::unique_ptr<JournalStore>> open(const std::filesystem::path& path);
    static Result<std::unique_ptr<JournalStore>> open(const std::filesystem::path& path, Options options);

    ~JournalStore() override;

    JournalStore(const JournalStore&) = delete;
    JournalStore& operator=(const JournalStore&) = delete;

    Result<std::optional<std::string>> get(const std::string& key) const override;
    Result<std::vector<KeyValue>> scan(const std::string& prefix) const override;
    Result<void> commit(const WriteBatch& batch) override;

    Result<void> compact();

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::size_t journal_lines() const;

private:
    JournalStore(std::filesystem::path path, Options options);

    Result<void> replay();
    Result<void> open_for_append();
    Result<void> write_line(int fd, const std::string& line) const;
    Result<void> compact_locked();
    void close_fd() noexcept;

    std::filesystem::path path_;
    Options options_;
    std::map<std::string, std::string> entries_;
    std::size_t journal_lines_ = 0;
    int fd_ = -1;
    bool poisoned_ = false; ///< A failed commit could not be rolled back
    mutable std::shared_mutex mutex_;
};

} // namespace osync::storage
