#pragma once
// Durable ledger log: one file, append-only
//
// Design:
// - Append-only: never overwrite, never lose
// - File locking: brief exclusive lock around each append
// - Self-describing records: magic, length, sequence, kind, format, checksum
// - Body is the entry as msgpack
// - Crash recovery: replay valid records, stop at the first torn or
//   corrupt one and cut the file back to the last good record

#include "types.hpp"
#include "log.hpp"
#include "ledger.hpp"
#include "config.hpp"
#include "version.hpp"
#include <nlohmann/json.hpp>
#include <cerrno>
#include <cstring>
#include <memory>
#include <string>
#include <vector>
#include <sys/file.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

namespace pramana {

// Ledger record header (fixed size for easy parsing)
struct LedgerRecordHeader {
    uint32_t magic;         // 0x50524D4C "PRML"
    uint32_t length;        // Total record length (header + body)
    uint64_t sequence;      // Ledger sequence
    uint64_t timestamp;     // Unix millis
    uint8_t kind;           // EntryKind
    uint8_t format_major;   // PRAMANA_FORMAT_VERSION_MAJOR at write time
    uint8_t format_minor;
    uint8_t reserved;
    uint32_t checksum;      // CRC32 of body
};

static_assert(sizeof(LedgerRecordHeader) == 32, "LedgerRecordHeader must be 32 bytes");

constexpr uint32_t LEDGER_MAGIC = 0x50524D4C;  // "PRML"
constexpr size_t LEDGER_MAX_BODY = 64 * 1024 * 1024;

// RAII file lock
class ScopedFileLock {
public:
    ScopedFileLock(int fd, bool exclusive) : fd_(fd) {
        if (fd_ >= 0 && ::flock(fd_, exclusive ? LOCK_EX : LOCK_SH) != 0) {
            throw LedgerIoError(std::string("flock: ") + std::strerror(errno));
        }
    }

    ~ScopedFileLock() {
        if (fd_ >= 0) {
            ::flock(fd_, LOCK_UN);
        }
    }

    ScopedFileLock(const ScopedFileLock&) = delete;
    ScopedFileLock& operator=(const ScopedFileLock&) = delete;

private:
    int fd_;
};

class FileLedgerStore : public LedgerStore {
public:
    explicit FileLedgerStore(std::string path, bool sync = true)
        : path_(std::move(path)), sync_(sync) {
        fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT, 0644);
        if (fd_ < 0) {
            throw LedgerIoError("open " + path_ + ": " + std::strerror(errno));
        }
    }

    ~FileLedgerStore() override {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    FileLedgerStore(const FileLedgerStore&) = delete;
    FileLedgerStore& operator=(const FileLedgerStore&) = delete;

    void persist(const LedgerEntry& entry) override {
        json j = entry;
        std::vector<uint8_t> body = json::to_msgpack(j);
        if (body.size() > LEDGER_MAX_BODY) {
            throw LedgerIoError("entry " + std::to_string(entry.sequence) + " too large");
        }

        LedgerRecordHeader header;
        header.magic = LEDGER_MAGIC;
        header.length = static_cast<uint32_t>(sizeof(LedgerRecordHeader) + body.size());
        header.sequence = entry.sequence;
        header.timestamp = static_cast<uint64_t>(entry.timestamp);
        header.kind = static_cast<uint8_t>(entry.kind);
        header.format_major = PRAMANA_FORMAT_VERSION_MAJOR;
        header.format_minor = PRAMANA_FORMAT_VERSION_MINOR;
        header.reserved = 0;
        header.checksum = crc32(body.data(), body.size());

        // Acquire exclusive lock, seek to end, write, sync, unlock
        ScopedFileLock lock(fd_, true);
        off_t end = ::lseek(fd_, 0, SEEK_END);
        if (end < 0) {
            throw LedgerIoError("seek " + path_ + ": " + std::strerror(errno));
        }
        if (!write_all(&header, sizeof(header)) || !write_all(body.data(), body.size()) ||
            (sync_ && ::fsync(fd_) != 0)) {
            int err = errno;
            // Cut the partial record so the next append starts clean
            if (::ftruncate(fd_, end) != 0) {
                log_warn("ledger", "could not trim partial record in %s", path_.c_str());
            }
            throw LedgerIoError("append to " + path_ + ": " + std::strerror(err));
        }
    }

    std::vector<LedgerEntry> load() override {
        ScopedFileLock lock(fd_, true);
        std::vector<LedgerEntry> entries;

        if (::lseek(fd_, 0, SEEK_SET) < 0) {
            throw LedgerIoError("seek " + path_ + ": " + std::strerror(errno));
        }

        off_t good_end = 0;
        LedgerRecordHeader header;
        const char* stop_reason = nullptr;
        while (true) {
            ssize_t n = ::read(fd_, &header, sizeof(header));
            if (n == 0) break;
            if (n != static_cast<ssize_t>(sizeof(header))) {
                stop_reason = "torn header";
                break;
            }
            if (header.magic != LEDGER_MAGIC) {
                stop_reason = "invalid magic";
                break;
            }
            if (!version::format_compatible(header.format_major, header.format_minor)) {
                throw LedgerIoError(path_ + ": record format " +
                                    std::to_string(header.format_major) + "." +
                                    std::to_string(header.format_minor) + " is not supported");
            }
            if (header.length < sizeof(header) ||
                header.length - sizeof(header) > LEDGER_MAX_BODY) {
                stop_reason = "bad length";
                break;
            }
            size_t body_size = header.length - sizeof(header);
            std::vector<uint8_t> body(body_size);
            if (::read(fd_, body.data(), body_size) != static_cast<ssize_t>(body_size)) {
                stop_reason = "incomplete record";
                break;
            }
            if (crc32(body.data(), body.size()) != header.checksum) {
                stop_reason = "checksum mismatch";
                break;
            }
            if (!valid_entry_kind(header.kind)) {
                stop_reason = "unknown entry kind";
                break;
            }

            LedgerEntry entry;
            try {
                entry = json::from_msgpack(body).get<LedgerEntry>();
            } catch (const json::exception& e) {
                log_warn("ledger", "undecodable record at seq %llu: %s",
                         static_cast<unsigned long long>(header.sequence), e.what());
                stop_reason = "undecodable body";
                break;
            } catch (const LedgerError& e) {
                log_warn("ledger", "undecodable record at seq %llu: %s",
                         static_cast<unsigned long long>(header.sequence), e.what());
                stop_reason = "undecodable body";
                break;
            }
            if (entry.sequence != header.sequence ||
                entry.sequence != entries.size() + 1) {
                stop_reason = "sequence mismatch";
                break;
            }

            entries.push_back(std::move(entry));
            good_end = ::lseek(fd_, 0, SEEK_CUR);
        }

        if (stop_reason != nullptr) {
            struct stat st;
            long long size = ::fstat(fd_, &st) == 0 ? static_cast<long long>(st.st_size) : -1;
            log_warn("ledger", "%s: %s after seq %zu, dropping bytes %lld..%lld",
                     path_.c_str(), stop_reason, entries.size(),
                     static_cast<long long>(good_end), size);
            if (::ftruncate(fd_, good_end) != 0) {
                throw LedgerIoError("truncate " + path_ + ": " + std::strerror(errno));
            }
            if (sync_) ::fsync(fd_);
        }

        log_debug("ledger", "recovered %zu entries from %s", entries.size(), path_.c_str());
        return entries;
    }

    std::string describe() const override { return "file:" + path_; }

    const std::string& path() const { return path_; }

private:
    bool write_all(const void* data, size_t size) {
        const uint8_t* p = static_cast<const uint8_t*>(data);
        while (size > 0) {
            ssize_t n = ::write(fd_, p, size);
            if (n < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            p += n;
            size -= static_cast<size_t>(n);
        }
        return true;
    }

    std::string path_;
    bool sync_;
    int fd_ = -1;
};

// Memory store for an empty path, file store otherwise
inline std::shared_ptr<LedgerStore> make_ledger_store(const LedgerConfig& config) {
    if (config.path.empty()) {
        return std::make_shared<MemoryLedgerStore>();
    }
    return std::make_shared<FileLedgerStore>(config.path, config.fsync);
}

} // namespace pramana
