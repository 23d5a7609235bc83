#include <namesake/storage/entry_store.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <string>

namespace namesake::storage {

using json = nlohmann::json;

JsonlEntryStore::JsonlEntryStore(std::filesystem::path path) : path_(std::move(path)) {}

JsonlEntryStore::~JsonlEntryStore() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (out_.is_open()) {
        out_.flush();
    }
}

Result<void> JsonlEntryStore::append(const vector::IndexEntry& entry) {
    json line = {{"id", entry.id}, {"label", entry.label}, {"embedding", entry.vector}};
    const std::string text = line.dump();

    std::lock_guard<std::mutex> lock(mutex_);
    if (!out_.is_open()) {
        std::error_code ec;
        if (path_.has_parent_path()) {
            std::filesystem::create_directories(path_.parent_path(), ec);
            if (ec) {
                return Error{ErrorCode::WriteError, "Cannot create directory " +
                                                        path_.parent_path().string() + ": " +
                                                        ec.message()};
            }
        }
        out_.open(path_, std::ios::out | std::ios::app);
        if (!out_) {
            return Error{ErrorCode::WriteError, "Cannot open entry store " + path_.string()};
        }
    }
    out_ << text << '\n';
    out_.flush();
    if (!out_) {
        return Error{ErrorCode::WriteError, "Failed writing entry store " + path_.string()};
    }
    return Result<void>();
}

Result<size_t> JsonlEntryStore::scan(const std::function<void(const vector::IndexEntry&)>& fn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (out_.is_open()) {
            out_.flush();
        }
    }

    std::ifstream in(path_);
    if (!in) {
        if (!std::filesystem::exists(path_)) {
            spdlog::debug("[EntryStore] {} does not exist yet", path_.string());
            return size_t{0};
        }
        return Error{ErrorCode::PermissionDenied, "Cannot read entry store " + path_.string()};
    }

    size_t visited = 0;
    size_t lineNo = 0;
    std::string line;
    while (std::getline(in, line)) {
        ++lineNo;
        if (line.empty()) {
            continue;
        }
        try {
            auto doc = json::parse(line);
            vector::IndexEntry entry;
            entry.id = doc.at("id").get<std::string>();
            entry.label = doc.at("label").get<std::string>();
            entry.vector = doc.at("embedding").get<Embedding>();
            fn(entry);
            ++visited;
        } catch (const json::exception& e) {
            spdlog::warn("[EntryStore] Skipping malformed line {} of {}: {}", lineNo,
                         path_.string(), e.what());
        }
    }
    return visited;
}

Result<size_t> rebuildIndex(IDurableStore& store, vector::VectorIndex& index) {
    size_t applied = 0;
    size_t rejected = 0;
    auto scanned = store.scan([&](const vector::IndexEntry& entry) {
        if (entry.vector.empty()) {
            if (!index.contains(entry.id)) {
                return;
            }
            if (auto r = index.remove(entry.id); r) {
                ++applied;
            } else {
                ++rejected;
                spdlog::warn("[EntryStore] Removal of {} failed: {}", entry.id, r.error().message);
            }
            return;
        }
        if (auto r = index.upsert(entry); r) {
            ++applied;
        } else {
            ++rejected;
            spdlog::warn("[EntryStore] Entry {} rejected by index: {}", entry.id,
                         r.error().message);
        }
    });
    if (!scanned) {
        return scanned.error();
    }
    spdlog::info("[EntryStore] Rebuilt index from {} entries ({} applied, {} rejected, {} live)",
                 scanned.value(), applied, rejected, index.size());
    return applied;
}

} // namespace namesake::storage
