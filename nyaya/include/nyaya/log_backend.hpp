#pragma once
// LogBackend: append-only record log with an in-memory view
//
// Design:
// - Append-only: puts and tombstones are appended, never rewritten in place
// - Self-describing entries: magic, length, sequence, checksum per entry
// - Crash recovery: open() replays valid entries and stops at a torn tail
// - Compaction: rewrite live records to a temp file, fsync, rename
// - flock() around appends so two processes never interleave an entry

#include "storage.hpp"
#include "log.hpp"
#include <cerrno>
#include <cstdio>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace nyaya {

enum class LogOp : uint8_t {
    Put = 1,
    Tombstone = 2,
};

// Entry header (fixed size for easy parsing)
struct LogEntryHeader {
    uint32_t magic;       // 0x4E594C47 "NYLG"
    uint32_t length;      // Total entry length (header + data)
    uint64_t sequence;    // Monotonic sequence number
    uint64_t timestamp;   // Unix millis
    LogOp op;
    uint8_t format;       // NYAYA_LOG_FORMAT_VERSION
    uint8_t reserved[2];
    uint32_t checksum;    // CRC32 of data
};

static_assert(sizeof(LogEntryHeader) == 32, "LogEntryHeader must be 32 bytes");

constexpr uint32_t LOG_MAGIC = 0x4E594C47;  // "NYLG"

inline uint32_t crc32(const uint8_t* data, size_t length) {
    uint32_t crc = 0xFFFFFFFF;
    for (size_t i = 0; i < length; ++i) {
        crc ^= data[i];
        for (int j = 0; j < 8; ++j) {
            crc = (crc >> 1) ^ (0xEDB88320 & -(crc & 1));
        }
    }
    return ~crc;
}

// RAII advisory lock on a file descriptor
class ScopedFileLock {
public:
    ScopedFileLock(int fd, bool exclusive) : fd_(fd) {
        if (fd_ >= 0) {
            flock(fd_, exclusive ? LOCK_EX : LOCK_SH);
        }
    }

    ~ScopedFileLock() {
        if (fd_ >= 0) {
            flock(fd_, LOCK_UN);
        }
    }

    ScopedFileLock(const ScopedFileLock&) = delete;
    ScopedFileLock& operator=(const ScopedFileLock&) = delete;

private:
    int fd_;
};

// Fsync parent directory so a rename is durable
inline bool fsync_dir(const std::string& path) {
    auto slash = path.find_last_of('/');
    std::string dir = (slash == std::string::npos) ? "." : path.substr(0, slash);
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (dfd < 0) return false;
    int rc = ::fsync(dfd);
    ::close(dfd);
    return rc == 0;
}

// Write-all helper; short writes are retried, errors reported by errno
inline bool write_all(int fd, const uint8_t* data, size_t size) {
    while (size > 0) {
        ssize_t n = ::write(fd, data, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        size -= static_cast<size_t>(n);
    }
    return true;
}

class LogBackend : public StorageBackend {
public:
    explicit LogBackend(const std::string& path) : path_(path) {
        fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
        if (fd_ < 0) {
            throw GraphError::unavailable("cannot open " + path + ": " + std::strerror(errno));
        }
        replay();
    }

    ~LogBackend() override {
        if (fd_ >= 0) ::close(fd_);
    }

    LogBackend(const LogBackend&) = delete;
    LogBackend& operator=(const LogBackend&) = delete;

    void put(const TripleId& id, const Triple& triple) override {
        auto bytes = encode(triple);
        std::unique_lock lock(mutex_);
        check_open();
        append(LogOp::Put, id, bytes);
        live_[id] = std::move(bytes);
    }

    std::optional<Triple> get(const TripleId& id) const override {
        std::shared_lock lock(mutex_);
        check_open();
        auto it = live_.find(id);
        if (it == live_.end()) return std::nullopt;
        return decode_triple(it->second);
    }

    bool remove(const TripleId& id) override {
        std::unique_lock lock(mutex_);
        check_open();
        auto it = live_.find(id);
        if (it == live_.end()) return false;
        append(LogOp::Tombstone, id, {});
        live_.erase(it);
        return true;
    }

    bool exists(const TripleId& id) const override {
        std::shared_lock lock(mutex_);
        check_open();
        return live_.count(id) > 0;
    }

    std::vector<Triple> iter_all() const override {
        std::shared_lock lock(mutex_);
        check_open();
        std::vector<Triple> out;
        out.reserve(live_.size());
        for (const auto& [id, bytes] : live_) {
            try {
                out.push_back(decode_triple(bytes));
            } catch (const GraphError& e) {
                if (e.kind() != GraphErrorKind::Serialization) throw;
                log_warn("log", "%s: skipping undecodable entry %s: %s",
                         path_.c_str(), id.short_hex().c_str(), e.what());
            }
        }
        return out;
    }

    size_t count() const override {
        std::shared_lock lock(mutex_);
        check_open();
        return live_.size();
    }

    // On-disk size of the log, including superseded entries until compact()
    size_t size_bytes() const override {
        std::shared_lock lock(mutex_);
        check_open();
        struct stat st;
        if (::fstat(fd_, &st) != 0) {
            throw GraphError::storage("fstat " + path_ + ": " + std::strerror(errno));
        }
        return static_cast<size_t>(st.st_size);
    }

    void flush() override {
        std::unique_lock lock(mutex_);
        check_open();
        if (::fsync(fd_) != 0) {
            throw GraphError::storage("fsync " + path_ + ": " + std::strerror(errno));
        }
    }

    void close() override {
        std::unique_lock lock(mutex_);
        if (fd_ < 0) return;
        int rc = ::fsync(fd_);
        ::close(fd_);
        fd_ = -1;
        live_.clear();
        if (rc != 0) {
            throw GraphError::storage("fsync " + path_ + ": " + std::strerror(errno));
        }
    }

    const char* name() const override { return "log"; }

    // Rewrite the log with only live records. Returns bytes reclaimed.
    size_t compact() {
        std::unique_lock lock(mutex_);
        check_open();

        struct stat st;
        size_t before = ::fstat(fd_, &st) == 0 ? static_cast<size_t>(st.st_size) : 0;

        std::string tmp = path_ + ".tmp." + std::to_string(::getpid());
        int tmp_fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (tmp_fd < 0) {
            throw GraphError::storage("compact " + tmp + ": " + std::strerror(errno));
        }

        uint64_t seq = 0;
        bool ok = true;
        for (const auto& [id, bytes] : live_) {
            auto entry = build_entry(LogOp::Put, ++seq, id, bytes);
            if (!write_all(tmp_fd, entry.data(), entry.size())) { ok = false; break; }
        }
        if (ok && ::fsync(tmp_fd) != 0) ok = false;
        ::close(tmp_fd);

        if (!ok || ::rename(tmp.c_str(), path_.c_str()) != 0) {
            std::string err = std::strerror(errno);
            ::unlink(tmp.c_str());
            throw GraphError::storage("compact " + path_ + ": " + err);
        }
        fsync_dir(path_);

        // The old descriptor still points at the unlinked file
        ::close(fd_);
        fd_ = ::open(path_.c_str(), O_RDWR | O_APPEND | O_CLOEXEC);
        if (fd_ < 0) {
            throw GraphError::unavailable("reopen " + path_ + ": " + std::strerror(errno));
        }
        sequence_ = seq;

        size_t after = ::fstat(fd_, &st) == 0 ? static_cast<size_t>(st.st_size) : 0;
        log_debug("log", "compacted %s: %zu -> %zu bytes", path_.c_str(), before, after);
        return before > after ? before - after : 0;
    }

    uint64_t sequence() const {
        std::shared_lock lock(mutex_);
        return sequence_;
    }

private:
    static std::vector<uint8_t> build_entry(LogOp op, uint64_t seq, const TripleId& id,
                                            const std::vector<uint8_t>& payload) {
        std::vector<uint8_t> data;
        data.reserve(id.bytes.size() + payload.size());
        data.insert(data.end(), id.bytes.begin(), id.bytes.end());
        data.insert(data.end(), payload.begin(), payload.end());

        LogEntryHeader header{};
        header.magic = LOG_MAGIC;
        header.length = static_cast<uint32_t>(sizeof(header) + data.size());
        header.sequence = seq;
        header.timestamp = static_cast<uint64_t>(now());
        header.op = op;
        header.format = NYAYA_LOG_FORMAT_VERSION;
        header.checksum = crc32(data.data(), data.size());

        std::vector<uint8_t> entry(sizeof(header));
        std::memcpy(entry.data(), &header, sizeof(header));
        entry.insert(entry.end(), data.begin(), data.end());
        return entry;
    }

    // Caller holds the unique lock
    void append(LogOp op, const TripleId& id, const std::vector<uint8_t>& payload) {
        auto entry = build_entry(op, sequence_ + 1, id, payload);
        ScopedFileLock file_lock(fd_, true);
        if (!write_all(fd_, entry.data(), entry.size())) {
            throw GraphError::storage("append " + path_ + ": " + std::strerror(errno));
        }
        ++sequence_;
    }

    void replay() {
        ScopedFileLock file_lock(fd_, true);

        struct stat st;
        if (::fstat(fd_, &st) != 0) {
            throw GraphError::unavailable("fstat " + path_ + ": " + std::strerror(errno));
        }
        std::vector<uint8_t> buf(static_cast<size_t>(st.st_size));
        size_t got = 0;
        while (got < buf.size()) {
            ssize_t n = ::pread(fd_, buf.data() + got, buf.size() - got, static_cast<off_t>(got));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) break;
            got += static_cast<size_t>(n);
        }
        buf.resize(got);

        size_t pos = 0;
        size_t applied = 0;
        while (pos + sizeof(LogEntryHeader) <= buf.size()) {
            LogEntryHeader header;
            std::memcpy(&header, buf.data() + pos, sizeof(header));

            if (header.magic != LOG_MAGIC || header.length < sizeof(header) + 32 ||
                pos + header.length > buf.size()) {
                break;
            }

            const uint8_t* data = buf.data() + pos + sizeof(header);
            size_t data_len = header.length - sizeof(header);
            if (crc32(data, data_len) != header.checksum) {
                log_warn("log", "%s: checksum mismatch at offset %zu, ignoring tail",
                         path_.c_str(), pos);
                break;
            }

            TripleId id;
            std::memcpy(id.bytes.data(), data, id.bytes.size());
            if (header.op == LogOp::Put) {
                live_[id] = std::vector<uint8_t>(data + 32, data + data_len);
            } else if (header.op == LogOp::Tombstone) {
                live_.erase(id);
            }
            sequence_ = std::max(sequence_, header.sequence);
            pos += header.length;
            ++applied;
        }

        // Cut a torn tail so new appends are not stranded behind it
        if (pos < buf.size()) {
            log_warn("log", "%s: truncating %zu trailing bytes after entry %zu",
                     path_.c_str(), buf.size() - pos, applied);
            if (::ftruncate(fd_, static_cast<off_t>(pos)) != 0) {
                throw GraphError::storage("truncate " + path_ + ": " + std::strerror(errno));
            }
        }
        log_debug("log", "replayed %zu entries from %s (%zu live)",
                  applied, path_.c_str(), live_.size());
    }

    void check_open() const {
        if (fd_ < 0) throw GraphError::unavailable("log backend is closed: " + path_);
    }

    std::string path_;
    int fd_ = -1;
    uint64_t sequence_ = 0;
    std::unordered_map<TripleId, std::vector<uint8_t>, TripleIdHash> live_;
    mutable std::shared_mutex mutex_;
};

} // namespace nyaya
