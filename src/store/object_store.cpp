/**
 * @file object_store.cpp
 * @brief ObjectStore commit path, id generation and watcher dispatch.
 * @author Dimitris Kafetzis
 */

#include "store/object_store.hpp"

#include <iomanip>
#include <sstream>

namespace kubesim {

namespace {

std::string describe(ObjectKind kind, const std::string& id) {
    return std::string{to_string(kind)} + " '" + id + "'";
}

}  // anonymous namespace

size_t ObjectStore::count(ObjectKind kind) const {
    std::shared_lock lock(mutex_);
    size_t n = 0;
    auto first = entries_.lower_bound(Key{kind, std::string{}});
    for (auto it = first; it != entries_.end() && it->first.kind == kind; ++it) {
        ++n;
    }
    return n;
}

Result<CommitResult> ObjectStore::commit(WriteBatch batch) {
    if (batch.empty()) {
        return CommitResult{};
    }

    CommitResult result;
    std::vector<StoreEvent> events;

    {
        std::unique_lock lock(mutex_);

        // Stage every operation against a private overlay first; entries_
        // is only touched once the whole batch has validated.
        std::map<Key, std::optional<Entry>> staged;

        auto lookup = [&](const Key& key) -> std::optional<Entry> {
            if (auto it = staged.find(key); it != staged.end()) return it->second;
            if (auto it = entries_.find(key); it != entries_.end()) return it->second;
            return std::nullopt;
        };

        uint64_t sequence = next_sequence_;

        for (auto& op : batch.ops_) {
            switch (op.type) {
                case WriteBatch::OpType::Create: {
                    std::string id = op.id.empty() ? generate_id(op.kind) : op.id;
                    Key key{op.kind, id};
                    if (lookup(key).has_value()) {
                        return Error{ErrorCode::Conflict,
                                     describe(op.kind, id) + " already exists"};
                    }
                    Object object = std::move(*op.initial);
                    std::visit([&id](auto& o) { o.id = id; }, object);
                    staged[key] = Entry{std::move(object), 1, sequence++};
                    result.ids.push_back(id);
                    result.revisions.push_back(1);
                    events.push_back({op.kind, id, StoreEventType::Created, 1});
                    break;
                }
                case WriteBatch::OpType::Update: {
                    Key key{op.kind, op.id};
                    auto current = lookup(key);
                    if (!current) {
                        return Error{ErrorCode::NotFound, describe(op.kind, op.id) + " not found"};
                    }
                    if (current->revision != op.expected) {
                        return Error{ErrorCode::Conflict,
                                     describe(op.kind, op.id) + " is at revision "
                                     + std::to_string(current->revision) + ", expected "
                                     + std::to_string(op.expected)};
                    }
                    auto applied = op.mutation(current->object);
                    if (!applied) {
                        return applied.error();
                    }
                    current->revision += 1;
                    result.ids.push_back(op.id);
                    result.revisions.push_back(current->revision);
                    events.push_back({op.kind, op.id, StoreEventType::Updated, current->revision});
                    staged[key] = std::move(current);
                    break;
                }
                case WriteBatch::OpType::Delete: {
                    Key key{op.kind, op.id};
                    auto current = lookup(key);
                    if (!current) {
                        return Error{ErrorCode::NotFound, describe(op.kind, op.id) + " not found"};
                    }
                    if (current->revision != op.expected) {
                        return Error{ErrorCode::Conflict,
                                     describe(op.kind, op.id) + " is at revision "
                                     + std::to_string(current->revision) + ", expected "
                                     + std::to_string(op.expected)};
                    }
                    staged[key] = std::nullopt;
                    result.ids.push_back(op.id);
                    result.revisions.push_back(0);
                    events.push_back({op.kind, op.id, StoreEventType::Deleted, current->revision});
                    break;
                }
            }
        }

        for (auto& [key, entry] : staged) {
            if (entry) {
                entries_.insert_or_assign(key, std::move(*entry));
            } else {
                entries_.erase(key);
            }
        }
        next_sequence_ = sequence;
        mutations_.fetch_add(batch.ops_.size());
    }

    notify(events);
    return result;
}

void ObjectStore::watch(StoreWatcher watcher) {
    std::lock_guard lock(watchers_mutex_);
    watchers_.push_back(std::move(watcher));
}

uint64_t ObjectStore::mutation_count() const noexcept {
    return mutations_.load();
}

std::string ObjectStore::generate_id(ObjectKind kind) {
    // Called with mutex_ held exclusively; skips ids already taken by
    // explicitly named objects.
    auto& counter = id_counters_[static_cast<size_t>(kind)];
    for (;;) {
        std::ostringstream oss;
        oss << to_string(kind) << '-' << std::setw(6) << std::setfill('0') << ++counter;
        auto id = oss.str();
        if (entries_.find(Key{kind, id}) == entries_.end()) return id;
    }
}

void ObjectStore::notify(const std::vector<StoreEvent>& events) {
    std::vector<StoreWatcher> watchers;
    {
        std::lock_guard lock(watchers_mutex_);
        watchers = watchers_;
    }
    for (const auto& watcher : watchers) {
        watcher(events);
    }
}

}  // namespace kubesim
