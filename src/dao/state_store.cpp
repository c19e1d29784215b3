// PrivDAO - State Store
// Copyright (c) 2024 PrivDAO Developers
// MIT License

#include "privdao/dao/state_store.h"
#include "privdao/core/serialize.h"
#include "privdao/util/logging.h"

namespace privdao {
namespace dao {

namespace {

const std::string EVENT_SEQUENCE_KEY = db::MakeKey(db::prefix::META, "event-seq");

Result StorageError(const db::Status& status, const char* what) {
    LogErrorF(util::LogCategory::DB, "%s: %s", what, status.ToString().c_str());
    return Result::Error(DaoError::STORAGE_FAILURE, std::string(what) + ": " + status.ToString());
}

std::string EncodeU64(uint64_t value) {
    DataStream ss;
    ser_writedata64(ss, value);
    return ss.Str();
}

} // namespace

std::string RecordKey(char prefix, const Hash256& key) {
    return db::MakeKey(prefix, db::Slice(reinterpret_cast<const char*>(key.data()), key.size()));
}

std::string EventKey(uint64_t sequence) {
    char be[8];
    for (int i = 7; i >= 0; --i) {
        be[i] = static_cast<char>(sequence & 0xFF);
        sequence >>= 8;
    }
    return db::MakeKey(db::prefix::EVENT, db::Slice(be, sizeof(be)));
}

// ============================================================================
// StateStore
// ============================================================================

Result StateStore::Read(const std::string& key, std::optional<std::string>& out) const {
    std::string value;
    db::Status s = db_.Get(key, &value);
    if (s.IsNotFound()) {
        out.reset();
        return Result::Ok();
    }
    if (!s.ok()) {
        return StorageError(s, "read failed");
    }
    out = std::move(value);
    return Result::Ok();
}

Result StateStore::NextEventSequence(uint64_t& out) const {
    std::optional<std::string> raw;
    Result r = Read(EVENT_SEQUENCE_KEY, raw);
    if (!r.ok()) return r;
    if (!raw) {
        out = 0;
        return Result::Ok();
    }
    if (raw->size() != 8) {
        return Result::Error(DaoError::CORRUPT_RECORD, "bad event sequence counter");
    }
    DataStream ss(*raw);
    out = ser_readdata64(ss);
    return Result::Ok();
}

Result StateStore::ReadEvents(uint64_t fromSequence, size_t maxCount,
                              std::vector<Event>& out) const {
    out.clear();
    std::unique_ptr<db::Iterator> it = db_.NewIterator();
    db::Slice eventPrefix(&db::prefix::EVENT, 1);
    std::string start = EventKey(fromSequence);

    for (it->Seek(start); it->Valid() && out.size() < maxCount; it->Next()) {
        if (!it->key().starts_with(eventPrefix)) {
            break;
        }
        db::Slice value = it->value();
        auto event = Event::Deserialize(reinterpret_cast<const Byte*>(value.data()),
                                        value.size());
        if (!event) {
            return Result::Error(DaoError::CORRUPT_RECORD, "undecodable event");
        }
        out.push_back(std::move(*event));
    }
    db::Status s = it->status();
    if (!s.ok()) {
        return StorageError(s, "event scan failed");
    }
    return Result::Ok();
}

// ============================================================================
// Transaction
// ============================================================================

Result Transaction::Get(const std::string& key, std::optional<std::string>& out) const {
    auto it = writes_.find(key);
    if (it != writes_.end()) {
        out = it->second;
        return Result::Ok();
    }
    return store_.Read(key, out);
}

void Transaction::Put(const std::string& key, const std::string& value) {
    writes_[key] = value;
}

Result Transaction::Commit() {
    if (committed_) {
        return Result::Error(DaoError::STORAGE_FAILURE, "transaction already committed");
    }
    if (Empty()) {
        committed_ = true;
        return Result::Ok();
    }

    db::WriteBatch batch;
    for (const auto& [key, value] : writes_) {
        batch.Put(key, value);
    }

    if (!events_.empty()) {
        uint64_t sequence;
        Result r = store_.NextEventSequence(sequence);
        if (!r.ok()) return r;

        for (Event& event : events_) {
            event.sequence = sequence++;
            std::vector<Byte> bytes = event.Serialize();
            batch.Put(EventKey(event.sequence), std::string(bytes.begin(), bytes.end()));
        }
        batch.Put(EVENT_SEQUENCE_KEY, EncodeU64(sequence));
    }

    db::Status s = store_.db_.Write(&batch);
    if (!s.ok()) {
        return StorageError(s, "commit failed");
    }
    committed_ = true;
    LogDebugF(util::LogCategory::DB, "committed %zu writes, %zu events",
              writes_.size(), events_.size());
    return Result::Ok();
}

} // namespace dao
} // namespace privdao
