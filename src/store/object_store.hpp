/**
 * @file object_store.hpp
 * @brief Authoritative in-memory registry of cluster objects.
 * @author Dimitris Kafetzis
 *
 * Every object is one alternative of a fixed tagged variant (Node, Workload,
 * Placement) stored under (kind, id) together with a revision counter and a
 * creation sequence number. All writes go through revision-checked
 * operations; a stale revision yields ErrorCode::Conflict and no mutation.
 *
 * Multi-object writes (binding a workload to a node, releasing it again)
 * are expressed as a WriteBatch and committed atomically: either every
 * operation applies or none does.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace kubesim {

// ─────────────────────────────────────────────
// Object kinds
// ─────────────────────────────────────────────

enum class ObjectKind : uint8_t {
    Node,
    Workload,
    Placement
};

[[nodiscard]] constexpr std::string_view to_string(ObjectKind kind) noexcept {
    switch (kind) {
        case ObjectKind::Node:      return "node";
        case ObjectKind::Workload:  return "workload";
        case ObjectKind::Placement: return "placement";
    }
    return "unknown";
}

using Object = std::variant<Node, Workload, Placement>;

template <typename T> struct kind_of;
template <> struct kind_of<Node>      { static constexpr ObjectKind value = ObjectKind::Node; };
template <> struct kind_of<Workload>  { static constexpr ObjectKind value = ObjectKind::Workload; };
template <> struct kind_of<Placement> { static constexpr ObjectKind value = ObjectKind::Placement; };

template <typename T>
inline constexpr ObjectKind kind_of_v = kind_of<T>::value;

/**
 * @brief An object as read from the store.
 */
template <typename T>
struct Versioned {
    T object;
    Revision revision{0};
    uint64_t sequence{0};       ///< Store-wide creation order
};

template <typename T>
using Mutation = std::function<Result<void>(T&)>;

// ─────────────────────────────────────────────
// Change notification
// ─────────────────────────────────────────────

enum class StoreEventType : uint8_t {
    Created,
    Updated,
    Deleted
};

struct StoreEvent {
    ObjectKind kind;
    std::string id;
    StoreEventType type;
    Revision revision{0};
};

using StoreWatcher = std::function<void(const std::vector<StoreEvent>&)>;

// ─────────────────────────────────────────────
// WriteBatch
// ─────────────────────────────────────────────

/**
 * @brief An ordered set of revision-checked operations committed atomically.
 */
class WriteBatch {
public:
    /// Create a new object. An empty id is filled in by the store.
    template <typename T>
    WriteBatch& create(T object);

    /// Apply `mutation` if the object is still at `expected` revision.
    template <typename T>
    WriteBatch& update(const std::string& id, Revision expected, Mutation<T> mutation);

    /// Remove the object if it is still at `expected` revision.
    template <typename T>
    WriteBatch& remove(const std::string& id, Revision expected);

    [[nodiscard]] bool empty() const noexcept { return ops_.empty(); }
    [[nodiscard]] size_t size() const noexcept { return ops_.size(); }

private:
    friend class ObjectStore;

    enum class OpType : uint8_t { Create, Update, Delete };

    struct Op {
        OpType type;
        ObjectKind kind;
        std::string id;
        Revision expected{0};
        std::optional<Object> initial;
        std::function<Result<void>(Object&)> mutation;
    };

    std::vector<Op> ops_;
};

/**
 * @brief Outcome of a committed batch, one entry per operation.
 */
struct CommitResult {
    std::vector<std::string> ids;
    std::vector<Revision> revisions;    ///< 0 for deletions
};

// ─────────────────────────────────────────────
// ObjectStore
// ─────────────────────────────────────────────

/**
 * @brief The single synchronization point for all cluster state.
 *
 * Readers take a shared lock and receive copies; commits take an exclusive
 * lock. Watchers run after the lock is released, on the committing thread.
 */
class ObjectStore {
public:
    ObjectStore() = default;

    // Non-copyable, non-movable
    ObjectStore(const ObjectStore&) = delete;
    ObjectStore& operator=(const ObjectStore&) = delete;

    // ── Reads ────────────────────────────────
    template <typename T>
    [[nodiscard]] Result<Versioned<T>> get(const std::string& id) const;

    /// All objects of kind T accepted by `filter`, in ascending id order.
    template <typename T>
    [[nodiscard]] std::vector<Versioned<T>> list(
        const std::function<bool(const T&)>& filter = {}) const;

    [[nodiscard]] size_t count(ObjectKind kind) const;

    // ── Writes ───────────────────────────────
    template <typename T>
    Result<Versioned<T>> create(T object);

    template <typename T>
    Result<Revision> update(const std::string& id, Revision expected, Mutation<T> mutation);

    template <typename T>
    Result<void> remove(const std::string& id, Revision expected);

    Result<CommitResult> commit(WriteBatch batch);

    // ── Observation ──────────────────────────
    void watch(StoreWatcher watcher);

    /// Number of object mutations committed since construction.
    [[nodiscard]] uint64_t mutation_count() const noexcept;

private:
    struct Key {
        ObjectKind kind;
        std::string id;

        auto operator<=>(const Key&) const = default;
    };

    struct Entry {
        Object object;
        Revision revision{0};
        uint64_t sequence{0};
    };

    std::string generate_id(ObjectKind kind);
    void notify(const std::vector<StoreEvent>& events);

    mutable std::shared_mutex mutex_;
    std::map<Key, Entry> entries_;
    uint64_t next_sequence_{1};
    std::array<uint64_t, 3> id_counters_{};
    std::atomic<uint64_t> mutations_{0};

    std::mutex watchers_mutex_;
    std::vector<StoreWatcher> watchers_;
};

// ═══════════════════════════════════════════════
// Template Implementation
// ═══════════════════════════════════════════════

template <typename T>
WriteBatch& WriteBatch::create(T object) {
    std::string id = object.id;
    ops_.push_back(Op{
        .type = OpType::Create,
        .kind = kind_of_v<T>,
        .id = std::move(id),
        .expected = 0,
        .initial = Object{std::move(object)},
        .mutation = {}
    });
    return *this;
}

template <typename T>
WriteBatch& WriteBatch::update(const std::string& id, Revision expected, Mutation<T> mutation) {
    ops_.push_back(Op{
        .type = OpType::Update,
        .kind = kind_of_v<T>,
        .id = id,
        .expected = expected,
        .initial = std::nullopt,
        .mutation = [m = std::move(mutation)](Object& obj) -> Result<void> {
            return m(std::get<T>(obj));
        }
    });
    return *this;
}

template <typename T>
WriteBatch& WriteBatch::remove(const std::string& id, Revision expected) {
    ops_.push_back(Op{
        .type = OpType::Delete,
        .kind = kind_of_v<T>,
        .id = id,
        .expected = expected,
        .initial = std::nullopt,
        .mutation = {}
    });
    return *this;
}

template <typename T>
Result<Versioned<T>> ObjectStore::get(const std::string& id) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(Key{kind_of_v<T>, id});
    if (it == entries_.end()) {
        return Error{ErrorCode::NotFound,
                     std::string{to_string(kind_of_v<T>)} + " '" + id + "' not found"};
    }
    return Versioned<T>{std::get<T>(it->second.object), it->second.revision,
                        it->second.sequence};
}

template <typename T>
std::vector<Versioned<T>> ObjectStore::list(const std::function<bool(const T&)>& filter) const {
    std::shared_lock lock(mutex_);
    std::vector<Versioned<T>> result;
    auto first = entries_.lower_bound(Key{kind_of_v<T>, std::string{}});
    for (auto it = first; it != entries_.end() && it->first.kind == kind_of_v<T>; ++it) {
        const auto& object = std::get<T>(it->second.object);
        if (filter && !filter(object)) continue;
        result.push_back(Versioned<T>{object, it->second.revision, it->second.sequence});
    }
    return result;
}

template <typename T>
Result<Versioned<T>> ObjectStore::create(T object) {
    WriteBatch batch;
    batch.create(std::move(object));
    auto committed = commit(std::move(batch));
    if (!committed) return committed.error();
    return get<T>(committed->ids.front());
}

template <typename T>
Result<Revision> ObjectStore::update(const std::string& id, Revision expected,
                                     Mutation<T> mutation) {
    WriteBatch batch;
    batch.update<T>(id, expected, std::move(mutation));
    auto committed = commit(std::move(batch));
    if (!committed) return committed.error();
    return committed->revisions.front();
}

template <typename T>
Result<void> ObjectStore::remove(const std::string& id, Revision expected) {
    WriteBatch batch;
    batch.remove<T>(id, expected);
    auto committed = commit(std::move(batch));
    if (!committed) return committed.error();
    return Result<void>{};
}

}  // namespace kubesim
