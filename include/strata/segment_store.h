/************************************************************************
Strata Segment Store

Immutable, content-addressed blocks of rows. A segment is an Arrow
RecordBatch identified by the hash of its IPC encoding, so equal content
always maps to the same SegmentId and is stored once. Table states hold
references to segments; a segment is reclaimed when the last reference
is released.
**************************************************************************/

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <arrow/api.h>

#include <strata/status.h>

namespace strata {

// 16 lowercase hex digits of the 64-bit content hash
using SegmentId = std::string;

struct SegmentStoreStats {
    size_t segment_count = 0;
    size_t referenced_count = 0;
    size_t total_bytes = 0;
    size_t total_rows = 0;
    uint64_t dedup_hits = 0;
    uint64_t reclaimed = 0;
};

class SegmentStore {
public:
    /**
     * @brief Open a segment store
     *
     * @param directory Directory holding "<id>.arrow" files; empty keeps
     *        segments in memory only
     * @param store Output store
     */
    static Status Open(const std::string& directory, std::unique_ptr<SegmentStore>* store);

    SegmentStore(const SegmentStore&) = delete;
    SegmentStore& operator=(const SegmentStore&) = delete;

    /**
     * @brief Store an immutable block of rows
     *
     * Returns the content-derived id. Storing identical content again
     * returns the same id without adding a segment.
     */
    Status Put(const std::shared_ptr<arrow::RecordBatch>& batch, SegmentId* id);

    /**
     * @brief Fetch a segment's rows. NotFound if unknown or reclaimed.
     */
    Status Get(const SegmentId& id, std::shared_ptr<arrow::RecordBatch>* batch) const;

    // Schema of a stored segment without materializing its rows twice
    Status GetSchema(const SegmentId& id, std::shared_ptr<arrow::Schema>* schema) const;

    Status Retain(const SegmentId& id);

    // Drops one reference; at zero the segment is deleted from memory and disk
    Status Release(const SegmentId& id);

    bool Contains(const SegmentId& id) const;
    size_t RefCount(const SegmentId& id) const;

    // Number of distinct segments
    size_t Size() const;

    /**
     * @brief Delete orphaned segments that no table state references
     *
     * Orphans are segments recovered from disk and segments whose writer
     * abandoned them. Other segments are left alone even at zero references
     * since a writer may be about to commit them.
     */
    Status SweepUnreferenced(size_t* removed);

    // Writer gave up on a segment it put; the next sweep may delete it
    void Abandon(const SegmentId& id);

    SegmentStoreStats GetStats() const;

private:
    explicit SegmentStore(std::string directory);

    struct Entry {
        mutable std::shared_ptr<arrow::RecordBatch> batch;  // null until first load
        size_t size_bytes = 0;
        size_t ref_count = 0;
        bool orphaned = false;   // recovered from disk or abandoned, until re-put
    };

    Status LoadExisting();
    Status LoadBatch(const SegmentId& id, std::shared_ptr<arrow::RecordBatch>* batch) const;
    Status WriteFile(const SegmentId& id, const std::string& bytes) const;
    void RemoveFile(const SegmentId& id) const;
    std::string PathFor(const SegmentId& id) const;

    std::string directory_;

    mutable std::mutex mutex_;
    std::unordered_map<SegmentId, Entry> segments_;
    uint64_t dedup_hits_ = 0;
    uint64_t reclaimed_ = 0;
};

// Content id of a batch without storing it
Status ComputeSegmentId(const std::shared_ptr<arrow::RecordBatch>& batch, SegmentId* id);

} // namespace strata
