#include "block_store.h"
#include "cache_key.h"
#include "logger.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

// ── MemoryBlockStore ───────────────────────────────────────────

MemoryBlockStore::MemoryBlockStore(int64_t capacity_bytes)
    : capacity_(capacity_bytes < 0 ? 0 : capacity_bytes)
{
}

std::optional<std::string> MemoryBlockStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    lru_.splice(lru_.begin(), lru_, it->second.lru_pos);
    return it->second.bytes;
}

bool MemoryBlockStore::put(const std::string& key, const std::string& bytes) {
    const int64_t len = static_cast<int64_t>(bytes.size());
    if (capacity_ > 0 && len > capacity_) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        size_ -= static_cast<int64_t>(it->second.bytes.size());
        it->second.bytes = bytes;
        lru_.splice(lru_.begin(), lru_, it->second.lru_pos);
    } else {
        lru_.push_front(key);
        entries_.emplace(key, Entry{bytes, lru_.begin()});
    }
    size_ += len;
    evictLocked();
    return true;
}

size_t MemoryBlockStore::entryCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

int64_t MemoryBlockStore::sizeBytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return size_;
}

void MemoryBlockStore::evictLocked() {
    if (capacity_ == 0) return;
    // Never evicts the entry just inserted: it sits at the front and fits.
    while (size_ > capacity_ && lru_.size() > 1) {
        const std::string& victim = lru_.back();
        auto it = entries_.find(victim);
        size_ -= static_cast<int64_t>(it->second.bytes.size());
        entries_.erase(it);
        lru_.pop_back();
    }
}

// ── DiskBlockStore ─────────────────────────────────────────────

DiskBlockStore::DiskBlockStore(const std::string& directory)
    : directory_(directory)
{
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec || !fs::is_directory(directory_)) {
        throw std::runtime_error("DiskBlockStore: cannot use directory "
            + directory_ + ": " + ec.message());
    }
}

std::string DiskBlockStore::pathForKey(const std::string& key) const {
    char name[17];
    std::snprintf(name, sizeof(name), "%016llx",
                  static_cast<unsigned long long>(fnv1a64(key)));
    // Two-level fan-out keeps directories small.
    return (fs::path(directory_) / std::string(name, 2) / (std::string(name) + ".blk")).string();
}

std::optional<std::string> DiskBlockStore::get(const std::string& key) {
    std::ifstream ifs(pathForKey(key), std::ios::binary);
    if (!ifs.is_open()) {
        return std::nullopt;
    }

    std::string stored_key;
    if (!std::getline(ifs, stored_key) || stored_key != key) {
        return std::nullopt;
    }

    std::string bytes((std::istreambuf_iterator<char>(ifs)),
                      std::istreambuf_iterator<char>());
    if (ifs.bad()) {
        Logger::instance().warn("DiskBlockStore: read error for " + key);
        return std::nullopt;
    }
    return bytes;
}

bool DiskBlockStore::put(const std::string& key, const std::string& bytes) {
    if (key.find('\n') != std::string::npos) {
        return false;
    }

    const fs::path target = pathForKey(key);
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        Logger::instance().warn("DiskBlockStore: mkdir failed: " + ec.message());
        return false;
    }

    std::ostringstream tmp_name;
    tmp_name << target.filename().string() << ".tmp." << tmp_counter_.fetch_add(1);
    const fs::path tmp = target.parent_path() / tmp_name.str();

    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            Logger::instance().warn("DiskBlockStore: cannot open " + tmp.string());
            return false;
        }
        ofs << key << '\n';
        ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        if (!ofs.good()) {
            ofs.close();
            fs::remove(tmp, ec);
            Logger::instance().warn("DiskBlockStore: write failed for " + key);
            return false;
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        Logger::instance().warn("DiskBlockStore: rename failed: " + ec.message());
        return false;
    }
    return true;
}
