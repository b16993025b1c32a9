#pragma once
// GraphStore: content-addressed triples over a pluggable backend
//
// Design:
// - The backend is the source of truth: TripleId -> canonical bytes
// - Three derived in-memory indices: subject, predicate, object -> {TripleId}
// - Object keys are the tagged value encoding, so Integer(1) and String("1")
//   land in different buckets
// - Index hits are candidates only; every candidate is loaded and re-checked
//   against the full pattern, so a stale index costs time, never correctness
// - Indices are rebuilt from iter_all() when the store is opened

#include "storage.hpp"
#include "log.hpp"
#include <algorithm>
#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace nyaya {

// Read-only view of facts. Joins, validation and proof checking run
// against this, so they work the same over a store or an overlay.
class FactSource {
public:
    virtual ~FactSource() = default;

    virtual std::vector<Triple> find(const TriplePattern& pattern) const = 0;
    virtual std::optional<Triple> get(const TripleId& id) const = 0;

    virtual bool contains(const Triple& t) const {
        return !find(TriplePattern::exact(t)).empty();
    }
};

struct GraphStats {
    size_t triple_count = 0;
    size_t subject_count = 0;
    size_t predicate_count = 0;
    size_t object_count = 0;
    size_t storage_bytes = 0;
};

using TripleIdSet = std::unordered_set<TripleId, TripleIdHash>;

// ═══════════════════════════════════════════════════════════════════════════
// TripleIndex: the three derived indices
// ═══════════════════════════════════════════════════════════════════════════

class TripleIndex {
public:
    // Returns false if the id was already indexed
    bool add(const TripleId& id, const Triple& t) {
        if (!all_.insert(id).second) return false;
        by_subject_[node_key(t.subject)].insert(id);
        by_predicate_[t.predicate.name].insert(id);
        by_object_[value_key(t.object)].insert(id);
        return true;
    }

    bool remove(const TripleId& id, const Triple& t) {
        if (all_.erase(id) == 0) return false;
        erase_from(by_subject_, node_key(t.subject), id);
        erase_from(by_predicate_, t.predicate.name, id);
        erase_from(by_object_, value_key(t.object), id);
        return true;
    }

    // Drop an id whose triple is no longer loadable. Linear in bucket count.
    void forget(const TripleId& id) {
        if (all_.erase(id) == 0) return;
        for (auto* index : {&by_subject_, &by_predicate_, &by_object_}) {
            for (auto it = index->begin(); it != index->end();) {
                it->second.erase(id);
                it = it->second.empty() ? index->erase(it) : std::next(it);
            }
        }
    }

    bool contains(const TripleId& id) const { return all_.count(id) > 0; }

    // Candidate ids for a pattern with at least one bound field.
    // Starts from the smallest bucket and intersects the rest into it.
    std::vector<TripleId> candidates(const TriplePattern& pattern) const {
        std::vector<const TripleIdSet*> sets;
        if (pattern.subject) {
            auto it = by_subject_.find(node_key(*pattern.subject));
            if (it == by_subject_.end()) return {};
            sets.push_back(&it->second);
        }
        if (pattern.predicate) {
            auto it = by_predicate_.find(pattern.predicate->name);
            if (it == by_predicate_.end()) return {};
            sets.push_back(&it->second);
        }
        if (pattern.object) {
            auto it = by_object_.find(value_key(*pattern.object));
            if (it == by_object_.end()) return {};
            sets.push_back(&it->second);
        }
        if (sets.empty()) return std::vector<TripleId>(all_.begin(), all_.end());

        std::sort(sets.begin(), sets.end(),
            [](const TripleIdSet* a, const TripleIdSet* b) { return a->size() < b->size(); });

        std::vector<TripleId> out;
        out.reserve(sets.front()->size());
        for (const auto& id : *sets.front()) {
            bool in_all = true;
            for (size_t i = 1; i < sets.size() && in_all; ++i) {
                in_all = sets[i]->count(id) > 0;
            }
            if (in_all) out.push_back(id);
        }
        return out;
    }

    size_t size() const { return all_.size(); }
    size_t subject_count() const { return by_subject_.size(); }
    size_t predicate_count() const { return by_predicate_.size(); }
    size_t object_count() const { return by_object_.size(); }

    void clear() {
        all_.clear();
        by_subject_.clear();
        by_predicate_.clear();
        by_object_.clear();
    }

private:
    using Buckets = std::unordered_map<std::string, TripleIdSet>;

    static void erase_from(Buckets& index, const std::string& key, const TripleId& id) {
        auto it = index.find(key);
        if (it == index.end()) return;
        it->second.erase(id);
        if (it->second.empty()) index.erase(it);
    }

    TripleIdSet all_;
    Buckets by_subject_;
    Buckets by_predicate_;
    Buckets by_object_;
};

struct QueryResult {
    std::vector<Triple> triples;
    size_t total_count = 0;
    bool has_more = false;
};

class GraphStore;

// Paged pattern query. Results are ordered by TripleId so pages are stable.
class QueryBuilder {
public:
    QueryBuilder(const GraphStore& store, TriplePattern pattern)
        : store_(store), pattern_(std::move(pattern)) {}

    QueryBuilder& limit(size_t n) { limit_ = n; return *this; }
    QueryBuilder& offset(size_t n) { offset_ = n; return *this; }

    QueryResult execute() const;

private:
    const GraphStore& store_;
    TriplePattern pattern_;
    size_t limit_ = 0;   // 0 = unlimited
    size_t offset_ = 0;
};

// ═══════════════════════════════════════════════════════════════════════════
// GraphStore
// ═══════════════════════════════════════════════════════════════════════════

class GraphStore : public FactSource {
public:
    explicit GraphStore(std::unique_ptr<StorageBackend> backend)
        : backend_(std::move(backend)) {
        if (!backend_) throw GraphError::unavailable("no storage backend");
        rebuild_indices();
    }

    GraphStore(const GraphStore&) = delete;
    GraphStore& operator=(const GraphStore&) = delete;

    // ═══════════════════════════════════════════════════════════════════════
    // Writes
    // ═══════════════════════════════════════════════════════════════════════

    // Idempotent: inserting a stored triple again is a successful no-op
    TripleId insert(const Triple& t) {
        return insert_checked(t).first;
    }

    // Same as insert, also reports whether this call stored the triple
    std::pair<TripleId, bool> insert_checked(const Triple& t) {
        check_triple(t);
        TripleId id = triple_id(t);

        std::unique_lock lock(mutex_);
        if (index_.contains(id)) return {id, false};
        backend_->put(id, t);
        index_.add(id, t);
        return {id, true};
    }

    // For callers that want duplicates reported
    TripleId insert_strict(const Triple& t) {
        auto [id, inserted] = insert_checked(t);
        if (!inserted) {
            throw GraphError(GraphErrorKind::Duplicate, t.to_string() + " already stored as " + id.short_hex());
        }
        return id;
    }

    // Inserts each triple; duplicates (in the store or within the batch) are skipped
    std::vector<TripleId> insert_batch(const std::vector<Triple>& triples) {
        std::vector<TripleId> ids;
        ids.reserve(triples.size());
        size_t added = 0;
        for (const auto& t : triples) {
            auto [id, inserted] = insert_checked(t);
            ids.push_back(id);
            if (inserted) ++added;
        }
        log_debug("GraphStore", "batch: %zu of %zu new", added, triples.size());
        return ids;
    }

    // Returns whether the triple existed
    // A payload that no longer decodes is still removed
    bool remove(const TripleId& id) {
        std::unique_lock lock(mutex_);
        std::optional<Triple> t;
        try {
            t = backend_->get(id);
        } catch (const GraphError& e) {
            if (e.kind() != GraphErrorKind::Serialization) throw;
            log_warn("GraphStore", "removing undecodable %s: %s", id.short_hex().c_str(), e.what());
        }
        bool existed = backend_->remove(id);
        if (t) {
            index_.remove(id, *t);
        } else {
            index_.forget(id);
        }
        return existed;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Reads
    // ═══════════════════════════════════════════════════════════════════════

    std::optional<Triple> get(const TripleId& id) const override {
        return backend_->get(id);
    }

    bool contains(const TripleId& id) const {
        return backend_->exists(id);
    }

    bool contains(const Triple& t) const override {
        return backend_->exists(triple_id(t));
    }

    std::vector<Triple> find(const TriplePattern& pattern) const override {
        if (pattern.is_wildcard()) {
            return backend_->iter_all();
        }
        if (pattern.is_exact()) {
            Triple t(*pattern.subject, *pattern.predicate, *pattern.object);
            if (backend_->exists(triple_id(t))) return {t};
            return {};
        }

        std::vector<TripleId> ids;
        {
            std::shared_lock lock(mutex_);
            ids = index_.candidates(pattern);
        }

        std::vector<Triple> out;
        out.reserve(ids.size());
        for (const auto& id : ids) {
            auto t = backend_->get(id);
            if (t && pattern.matches(*t)) out.push_back(std::move(*t));
        }
        return out;
    }

    QueryBuilder query(TriplePattern pattern) const {
        return QueryBuilder(*this, std::move(pattern));
    }

    // Nodes reachable from start along node-valued objects (depth-first).
    // Empty predicates = follow every predicate. start itself is not reported.
    std::vector<NodeId> traverse(const NodeId& start,
                                 const std::vector<Predicate>& predicates = {}) const {
        std::vector<NodeId> reached;
        std::unordered_set<NodeId, NodeIdHash> visited{start};
        std::vector<NodeId> stack{start};

        while (!stack.empty()) {
            NodeId current = std::move(stack.back());
            stack.pop_back();

            std::vector<Triple> edges;
            if (predicates.empty()) {
                edges = find(TriplePattern::any().with_subject(current));
            } else {
                for (const auto& p : predicates) {
                    auto hits = find(TriplePattern::any().with_subject(current).with_predicate(p));
                    edges.insert(edges.end(), hits.begin(), hits.end());
                }
            }
            std::sort(edges.begin(), edges.end());

            for (const auto& e : edges) {
                const NodeId* next = e.object.as_node();
                if (next && visited.insert(*next).second) {
                    reached.push_back(*next);
                    stack.push_back(*next);
                }
            }
        }
        return reached;
    }

    GraphStats stats() const {
        GraphStats s;
        {
            std::shared_lock lock(mutex_);
            s.triple_count = index_.size();
            s.subject_count = index_.subject_count();
            s.predicate_count = index_.predicate_count();
            s.object_count = index_.object_count();
        }
        s.storage_bytes = backend_->size_bytes();
        return s;
    }

    size_t count() const {
        std::shared_lock lock(mutex_);
        return index_.size();
    }

    // Re-derive all indices from the backend. Returns triples indexed.
    size_t rebuild_indices() {
        auto all = backend_->iter_all();
        std::unique_lock lock(mutex_);
        index_.clear();
        for (const auto& t : all) {
            index_.add(triple_id(t), t);
        }
        log_debug("GraphStore", "rebuilt indices from %zu triples (%s backend)",
                  index_.size(), backend_->name());
        return index_.size();
    }

    void flush() { backend_->flush(); }
    void close() { backend_->close(); }

    StorageBackend& backend() { return *backend_; }
    const StorageBackend& backend() const { return *backend_; }

private:
    static void check_field(const std::string& field, const char* what, const Triple& t) {
        if (field.size() > MAX_FIELD_BYTES) {
            throw GraphError(GraphErrorKind::InvalidTriple,
                             std::string(what) + " of " + std::to_string(field.size()) +
                             " bytes exceeds the " + std::to_string(MAX_FIELD_BYTES) +
                             " byte limit (subject " + t.subject.to_string().substr(0, 64) + ")");
        }
    }

    static void check_triple(const Triple& t) {
        check_field(t.subject.name, "subject", t);
        check_field(t.predicate.name, "predicate", t);
        if (const std::string* s = t.object.as_string()) check_field(*s, "object string", t);
        if (const NodeId* n = t.object.as_node()) check_field(n->name, "object node", t);

        if (t.predicate.empty()) {
            throw GraphError(GraphErrorKind::InvalidTriple, "empty predicate in " + t.to_string());
        }
        if (t.subject.is_named() && t.subject.name.empty()) {
            throw GraphError(GraphErrorKind::InvalidTriple, "empty subject in " + t.to_string());
        }
        const NodeId* obj = t.object.as_node();
        if (obj && obj->is_named() && obj->name.empty()) {
            throw GraphError(GraphErrorKind::InvalidTriple, "empty object node in " + t.to_string());
        }
    }

    std::unique_ptr<StorageBackend> backend_;
    TripleIndex index_;
    mutable std::shared_mutex mutex_;
};

inline QueryResult QueryBuilder::execute() const {
    std::vector<std::pair<TripleId, Triple>> keyed;
    for (auto& t : store_.find(pattern_)) {
        TripleId id = triple_id(t);
        keyed.emplace_back(id, std::move(t));
    }
    std::sort(keyed.begin(), keyed.end(),
        [](const auto& a, const auto& b) { return a.first < b.first; });

    QueryResult result;
    result.total_count = keyed.size();
    size_t begin = std::min(offset_, keyed.size());
    size_t end = limit_ == 0 ? keyed.size() : std::min(keyed.size(), begin + limit_);
    for (size_t i = begin; i < end; ++i) {
        result.triples.push_back(std::move(keyed[i].second));
    }
    result.has_more = end < keyed.size();
    return result;
}

} // namespace nyaya
