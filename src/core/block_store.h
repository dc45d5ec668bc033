#pragma once

#include <atomic>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

/// Key-value capability the block cache is built on. Implementations must be
/// safe to call from several fetch threads at once. put() is best-effort:
/// a false return is logged by the caller and never fails a request.
class BlockStore {
public:
    virtual ~BlockStore() = default;

    /// Return the stored bytes, or std::nullopt on a miss.
    virtual std::optional<std::string> get(const std::string& key) = 0;

    /// Store bytes under key, replacing any previous value.
    virtual bool put(const std::string& key, const std::string& bytes) = 0;
};

/// In-process LRU store bounded by the total number of payload bytes.
class MemoryBlockStore : public BlockStore {
public:
    /// capacity_bytes = 0 means unbounded.
    explicit MemoryBlockStore(int64_t capacity_bytes = 0);

    std::optional<std::string> get(const std::string& key) override;
    bool put(const std::string& key, const std::string& bytes) override;

    size_t entryCount() const;
    int64_t sizeBytes() const;

private:
    using LruList = std::list<std::string>;

    struct Entry {
        std::string bytes;
        LruList::iterator lru_pos;
    };

    void evictLocked();

    mutable std::mutex mutex_;
    int64_t capacity_;
    int64_t size_ = 0;
    LruList lru_;   // front = most recently used
    std::unordered_map<std::string, Entry> entries_;
};

/// Store keeping one file per key below a directory.
///
/// Files are named after the FNV-1a hash of the key and start with the full
/// key on its own line, so a hash collision reads as a miss. Writes go to a
/// temporary file that is renamed into place.
class DiskBlockStore : public BlockStore {
public:
    /// @throws std::runtime_error if the directory cannot be created.
    explicit DiskBlockStore(const std::string& directory);

    std::optional<std::string> get(const std::string& key) override;
    bool put(const std::string& key, const std::string& bytes) override;

    /// Path of the file holding key (whether or not it exists).
    std::string pathForKey(const std::string& key) const;

private:
    std::string directory_;
    std::atomic<uint64_t> tmp_counter_{0};
};
