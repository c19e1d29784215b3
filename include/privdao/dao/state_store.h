// PrivDAO - State Store
// Copyright (c) 2024 PrivDAO Developers
// MIT License
//
// Transactional access to governance state. A Transaction stages writes in
// an overlay that reads through to the database; Commit applies the
// overlay and the staged events in a single atomic WriteBatch. A
// Transaction destroyed without Commit leaves the database untouched.

#ifndef PRIVDAO_DAO_STATE_STORE_H
#define PRIVDAO_DAO_STATE_STORE_H

#include "privdao/core/types.h"
#include "privdao/dao/errors.h"
#include "privdao/dao/events.h"
#include "privdao/db/database.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace privdao {
namespace dao {

/// Database key for a record addressed by a 32-byte key
std::string RecordKey(char prefix, const Hash256& key);

/// Database key of an event log entry (big endian, so keys sort by sequence)
std::string EventKey(uint64_t sequence);

/**
 * Committed governance state over a key-value database.
 */
class StateStore {
public:
    explicit StateStore(db::Database& db) : db_(db) {}

    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;

    /// Committed value of a key; nullopt if absent
    Result Read(const std::string& key, std::optional<std::string>& out) const;

    /// Sequence number the next committed event will receive
    Result NextEventSequence(uint64_t& out) const;

    /// Up to maxCount events starting at fromSequence
    Result ReadEvents(uint64_t fromSequence, size_t maxCount, std::vector<Event>& out) const;

private:
    friend class Transaction;

    db::Database& db_;
};

/**
 * Staged changes against a StateStore.
 */
class Transaction {
public:
    explicit Transaction(StateStore& store) : store_(store) {}

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    /// Staged value if any, otherwise the committed one
    Result Get(const std::string& key, std::optional<std::string>& out) const;

    void Put(const std::string& key, const std::string& value);

    /// Load and decode a record; a record that fails to decode is CORRUPT_RECORD
    template<typename Record>
    Result Load(char prefix, const Hash256& key, std::optional<Record>& out) const {
        std::optional<std::string> raw;
        Result r = Get(RecordKey(prefix, key), raw);
        if (!r.ok()) return r;
        if (!raw) {
            out.reset();
            return Result::Ok();
        }
        out = Record::Deserialize(reinterpret_cast<const Byte*>(raw->data()), raw->size());
        if (!out) {
            return Result::Error(DaoError::CORRUPT_RECORD,
                                 "undecodable record " + key.ToHex());
        }
        return Result::Ok();
    }

    template<typename Record>
    void Store(char prefix, const Hash256& key, const Record& record) {
        std::vector<Byte> bytes = record.Serialize();
        Put(RecordKey(prefix, key), std::string(bytes.begin(), bytes.end()));
    }

    /// Stage an event; it is logged with the state change on Commit
    void Emit(Event event) { events_.push_back(std::move(event)); }

    /// Staged events (sequence numbers are valid after Commit)
    const std::vector<Event>& Events() const { return events_; }

    bool Empty() const { return writes_.empty() && events_.empty(); }

    /// Apply all staged writes and events atomically
    Result Commit();

private:
    StateStore& store_;
    std::map<std::string, std::string> writes_;
    std::vector<Event> events_;
    bool committed_{false};
};

} // namespace dao
} // namespace privdao

#endif // PRIVDAO_DAO_STATE_STORE_H
