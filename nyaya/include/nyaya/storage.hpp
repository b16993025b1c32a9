#pragma once
// Storage: TripleId -> canonical triple bytes
//
// StorageBackend is the whole contract a backend has to meet. The graph store
// only ever talks to this interface; which implementation sits behind it is
// decided once, when the store is opened (see open_backend in config.hpp).
//
// Contract:
// - put/get/remove/exists are individually thread-safe
// - no multi-operation atomicity
// - iter_all order is unspecified
// - every method except close() throws BackendUnavailable after close()

#include "codec.hpp"
#include "error.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace nyaya {

class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    virtual void put(const TripleId& id, const Triple& triple) = 0;
    virtual std::optional<Triple> get(const TripleId& id) const = 0;
    virtual bool remove(const TripleId& id) = 0;
    virtual std::vector<Triple> iter_all() const = 0;
    virtual size_t count() const = 0;
    virtual size_t size_bytes() const = 0;
    virtual void flush() = 0;
    virtual void close() = 0;

    virtual bool exists(const TripleId& id) const { return get(id).has_value(); }

    virtual const char* name() const = 0;
};

// ═══════════════════════════════════════════════════════════════════════════
// MemoryBackend: volatile, nothing survives close()
// ═══════════════════════════════════════════════════════════════════════════

class MemoryBackend : public StorageBackend {
public:
    MemoryBackend() = default;

    MemoryBackend(const MemoryBackend&) = delete;
    MemoryBackend& operator=(const MemoryBackend&) = delete;

    void put(const TripleId& id, const Triple& triple) override {
        auto bytes = encode(triple);
        std::unique_lock lock(mutex_);
        check_open();
        auto it = data_.find(id);
        if (it != data_.end()) {
            bytes_ -= it->second.size();
            it->second = std::move(bytes);
            bytes_ += it->second.size();
        } else {
            bytes_ += bytes.size();
            data_.emplace(id, std::move(bytes));
        }
    }

    std::optional<Triple> get(const TripleId& id) const override {
        std::shared_lock lock(mutex_);
        check_open();
        auto it = data_.find(id);
        if (it == data_.end()) return std::nullopt;
        return decode_triple(it->second);
    }

    bool remove(const TripleId& id) override {
        std::unique_lock lock(mutex_);
        check_open();
        auto it = data_.find(id);
        if (it == data_.end()) return false;
        bytes_ -= it->second.size();
        data_.erase(it);
        return true;
    }

    bool exists(const TripleId& id) const override {
        std::shared_lock lock(mutex_);
        check_open();
        return data_.count(id) > 0;
    }

    std::vector<Triple> iter_all() const override {
        std::shared_lock lock(mutex_);
        check_open();
        std::vector<Triple> out;
        out.reserve(data_.size());
        for (const auto& [id, bytes] : data_) {
            out.push_back(decode_triple(bytes));
        }
        return out;
    }

    size_t count() const override {
        std::shared_lock lock(mutex_);
        check_open();
        return data_.size();
    }

    size_t size_bytes() const override {
        std::shared_lock lock(mutex_);
        check_open();
        return bytes_ + data_.size() * sizeof(TripleId);
    }

    void flush() override {
        std::shared_lock lock(mutex_);
        check_open();
    }

    void close() override {
        std::unique_lock lock(mutex_);
        data_.clear();
        bytes_ = 0;
        closed_ = true;
    }

    const char* name() const override { return "memory"; }

private:
    void check_open() const {
        if (closed_) throw GraphError::unavailable("memory backend is closed");
    }

    mutable std::shared_mutex mutex_;
    std::unordered_map<TripleId, std::vector<uint8_t>, TripleIdHash> data_;
    size_t bytes_ = 0;
    bool closed_ = false;
};

} // namespace nyaya
