// PrivDAO - In-Memory Database
// Copyright (c) 2024 PrivDAO Developers
// MIT License
//
// Ordered in-memory implementation of the database interface, used by
// tests and by tools that do not need persistence.

#ifndef PRIVDAO_DB_MEMORYDB_H
#define PRIVDAO_DB_MEMORYDB_H

#include "privdao/db/database.h"
#include <map>
#include <mutex>

namespace privdao {
namespace db {

/**
 * Simple in-memory database.
 */
class MemoryDatabase : public Database {
private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;

public:
    MemoryDatabase() = default;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;

    /// Iterators see a snapshot taken at creation time
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_.size();
    }
};

/**
 * Iterator over a snapshot of a MemoryDatabase.
 */
class MemoryIterator : public Iterator {
private:
    std::map<std::string, std::string> snapshot_;
    std::map<std::string, std::string>::const_iterator iter_;

public:
    explicit MemoryIterator(std::map<std::string, std::string> snapshot)
        : snapshot_(std::move(snapshot)), iter_(snapshot_.end()) {}

    bool Valid() const override { return iter_ != snapshot_.end(); }

    void SeekToFirst() override { iter_ = snapshot_.begin(); }

    void Seek(const Slice& target) override {
        iter_ = snapshot_.lower_bound(target.ToString());
    }

    void Next() override {
        if (iter_ != snapshot_.end()) {
            ++iter_;
        }
    }

    Slice key() const override { return Slice(iter_->first); }

    Slice value() const override { return Slice(iter_->second); }

    Status status() const override { return Status::Ok(); }
};

} // namespace db
} // namespace privdao

#endif // PRIVDAO_DB_MEMORYDB_H
