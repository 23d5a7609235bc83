#pragma once

#include <namesake/core/types.h>
#include <namesake/vector/vector_index.h>

#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>

namespace namesake::storage {

/**
 * Durable source of index entries. The vector index is rebuilt on start by replaying every
 * entry; replay order is append order and later entries for an id replace earlier ones.
 * An entry with an empty embedding records the removal of its id.
 */
class IDurableStore {
public:
    virtual ~IDurableStore() = default;

    virtual Result<void> append(const vector::IndexEntry& entry) = 0;
    Result<void> appendRemoval(const std::string& id) {
        return append(vector::IndexEntry{id, {}, {}});
    }

    // Visits every stored entry; returns the number visited
    virtual Result<size_t> scan(const std::function<void(const vector::IndexEntry&)>& fn) = 0;
};

/**
 * Append-only JSON lines file, one {"id", "label", "embedding"} object per line.
 */
class JsonlEntryStore : public IDurableStore {
public:
    explicit JsonlEntryStore(std::filesystem::path path);
    ~JsonlEntryStore() override;

    Result<void> append(const vector::IndexEntry& entry) override;
    Result<size_t> scan(const std::function<void(const vector::IndexEntry&)>& fn) override;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::mutex mutex_;
    std::ofstream out_;
};

/**
 * Replays every stored entry into `index`, applying removals. Entries the index rejects are
 * logged and skipped. Returns the number of entries applied.
 */
Result<size_t> rebuildIndex(IDurableStore& store, vector::VectorIndex& index);

} // namespace namesake::storage
