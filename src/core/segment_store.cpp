#include "strata/segment_store.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

#include <arrow/io/api.h>
#include <arrow/ipc/api.h>

#include "strata/arrow_serialization.h"
#include "strata/logging.h"

namespace fs = std::filesystem;

namespace strata {

STRATA_LOG_TAG(SegmentStore);

namespace {

constexpr const char* kSegmentSuffix = ".arrow";

std::string FormatSegmentId(uint64_t hash) {
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(hash));
    return std::string(buf, 16);
}

bool IsSegmentId(const std::string& name) {
    if (name.size() != 16) return false;
    for (char c : name) {
        bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        if (!hex) return false;
    }
    return true;
}

// A segment file is an IPC stream holding exactly one batch; its bytes are
// what the id hashes
arrow::Result<std::shared_ptr<arrow::Buffer>> EncodeBatch(const arrow::RecordBatch& batch) {
    ARROW_ASSIGN_OR_RAISE(auto sink, arrow::io::BufferOutputStream::Create());
    ARROW_ASSIGN_OR_RAISE(auto writer, arrow::ipc::MakeStreamWriter(sink, batch.schema()));
    ARROW_RETURN_NOT_OK(writer->WriteRecordBatch(batch));
    ARROW_RETURN_NOT_OK(writer->Close());
    return sink->Finish();
}

arrow::Result<std::shared_ptr<arrow::RecordBatch>> DecodeBatch(std::shared_ptr<arrow::Buffer> bytes) {
    auto input = std::make_shared<arrow::io::BufferReader>(std::move(bytes));
    ARROW_ASSIGN_OR_RAISE(auto reader, arrow::ipc::RecordBatchStreamReader::Open(input));
    ARROW_ASSIGN_OR_RAISE(auto batch, reader->Next());
    if (!batch) {
        return arrow::Status::Invalid("stream holds no batch");
    }
    ARROW_ASSIGN_OR_RAISE(auto extra, reader->Next());
    if (extra) {
        return arrow::Status::Invalid("stream holds more than one batch");
    }
    ARROW_RETURN_NOT_OK(batch->ValidateFull());
    return batch;
}

Status EncodeSegment(const std::shared_ptr<arrow::RecordBatch>& batch, std::string* bytes, SegmentId* id) {
    if (!batch) {
        return Status::InvalidArgument("Null RecordBatch provided");
    }
    auto encoded = EncodeBatch(*batch);
    if (!encoded.ok()) {
        return Status::IOError("Failed to encode segment: " + encoded.status().ToString());
    }
    *bytes = encoded.ValueOrDie()->ToString();
    *id = FormatSegmentId(Fnv1a64(*bytes));
    return Status::OK();
}

} // namespace

Status ComputeSegmentId(const std::shared_ptr<arrow::RecordBatch>& batch, SegmentId* id) {
    std::string bytes;
    return EncodeSegment(batch, &bytes, id);
}

SegmentStore::SegmentStore(std::string directory)
    : directory_(std::move(directory)) {}

Status SegmentStore::Open(const std::string& directory, std::unique_ptr<SegmentStore>* store) {
    if (!store) {
        return Status::InvalidArgument("Null output store pointer");
    }

    std::unique_ptr<SegmentStore> result(new SegmentStore(directory));
    if (!directory.empty()) {
        std::error_code ec;
        fs::create_directories(directory, ec);
        if (ec) {
            return Status::IOError("Failed to create segment directory " + directory + ": " + ec.message());
        }
        STRATA_RETURN_NOT_OK(result->LoadExisting());
    }

    *store = std::move(result);
    return Status::OK();
}

Status SegmentStore::LoadExisting() {
    std::error_code ec;
    for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& path = it->path();
        if (path.extension() != kSegmentSuffix) continue;

        std::string name = path.stem().string();
        if (!IsSegmentId(name)) {
            STRATA_LOG_WARN(SegmentStore) << "Ignoring stray file " << path.string();
            continue;
        }

        Entry entry;
        entry.size_bytes = static_cast<size_t>(fs::file_size(path, ec));
        if (ec) break;
        entry.orphaned = true;
        segments_.emplace(name, std::move(entry));
    }
    if (ec) {
        return Status::IOError("Failed to scan segment directory " + directory_ + ": " + ec.message());
    }

    STRATA_LOG_INFO(SegmentStore) << "Indexed " << segments_.size() << " segments in " << directory_;
    return Status::OK();
}

std::string SegmentStore::PathFor(const SegmentId& id) const {
    return (fs::path(directory_) / (id + kSegmentSuffix)).string();
}

Status SegmentStore::WriteFile(const SegmentId& id, const std::string& bytes) const {
    std::string final_path = PathFor(id);
    std::string tmp_path = final_path + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return Status::IOError("Failed to open " + tmp_path);
        }
        file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        if (!file) {
            return Status::IOError("Failed to write " + tmp_path);
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, final_path, ec);
    if (ec) {
        fs::remove(tmp_path, ec);
        return Status::IOError("Failed to publish segment " + id);
    }
    return Status::OK();
}

void SegmentStore::RemoveFile(const SegmentId& id) const {
    if (directory_.empty()) return;
    std::error_code ec;
    fs::remove(PathFor(id), ec);
    if (ec) {
        STRATA_LOG_WARN(SegmentStore) << "Failed to remove segment file " << id << ": " << ec.message();
    }
}

Status SegmentStore::LoadBatch(const SegmentId& id, std::shared_ptr<arrow::RecordBatch>* batch) const {
    std::ifstream file(PathFor(id), std::ios::binary);
    if (!file) {
        return Status::NotFound("Segment file missing: " + id);
    }
    std::string bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    if (FormatSegmentId(Fnv1a64(bytes)) != id) {
        return Status::Corruption("Segment content does not match id " + id);
    }
    auto decoded = DecodeBatch(arrow::Buffer::FromString(std::move(bytes)));
    if (!decoded.ok()) {
        return Status::Corruption("Segment " + id + " is unreadable: " + decoded.status().ToString());
    }
    *batch = decoded.MoveValueUnsafe();
    return Status::OK();
}

Status SegmentStore::Put(const std::shared_ptr<arrow::RecordBatch>& batch, SegmentId* id) {
    if (!id) {
        return Status::InvalidArgument("Null output id pointer");
    }

    std::string bytes;
    SegmentId segment_id;
    STRATA_RETURN_NOT_OK(EncodeSegment(batch, &bytes, &segment_id));

    std::shared_ptr<arrow::RecordBatch> existing;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = segments_.find(segment_id);
        if (it == segments_.end()) {
            if (!directory_.empty()) {
                STRATA_RETURN_NOT_OK(WriteFile(segment_id, bytes));
            }
            Entry entry;
            entry.batch = batch;
            entry.size_bytes = bytes.size();
            segments_.emplace(segment_id, std::move(entry));

            STRATA_LOG_DEBUG(SegmentStore) << "Stored segment " << segment_id
                                           << " rows=" << batch->num_rows()
                                           << " bytes=" << bytes.size();
            *id = segment_id;
            return Status::OK();
        }

        if (it->second.size_bytes != bytes.size()) {
            return Status::Corruption("Content hash collision on segment " + segment_id);
        }
        // A writer is about to reference it; keep it out of the orphan sweep
        it->second.orphaned = false;
        existing = it->second.batch;
    }

    if (!existing) {
        STRATA_RETURN_NOT_OK(Get(segment_id, &existing));
    }
    if (!existing->Equals(*batch)) {
        return Status::Corruption("Content hash collision on segment " + segment_id);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++dedup_hits_;
    }
    *id = segment_id;
    return Status::OK();
}

Status SegmentStore::Get(const SegmentId& id, std::shared_ptr<arrow::RecordBatch>* batch) const {
    if (!batch) {
        return Status::InvalidArgument("Null output batch pointer");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = segments_.find(id);
        if (it == segments_.end()) {
            return Status::NotFound("Segment " + id);
        }
        if (it->second.batch) {
            *batch = it->second.batch;
            return Status::OK();
        }
    }

    // Segment files are immutable, so loading outside the lock is safe
    std::shared_ptr<arrow::RecordBatch> loaded;
    STRATA_RETURN_NOT_OK(LoadBatch(id, &loaded));

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = segments_.find(id);
    if (it == segments_.end()) {
        return Status::NotFound("Segment " + id);
    }
    if (!it->second.batch) {
        it->second.batch = loaded;
    }
    *batch = it->second.batch;
    return Status::OK();
}

Status SegmentStore::GetSchema(const SegmentId& id, std::shared_ptr<arrow::Schema>* schema) const {
    std::shared_ptr<arrow::RecordBatch> batch;
    STRATA_RETURN_NOT_OK(Get(id, &batch));
    *schema = batch->schema();
    return Status::OK();
}

Status SegmentStore::Retain(const SegmentId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = segments_.find(id);
    if (it == segments_.end()) {
        return Status::NotFound("Segment " + id);
    }
    ++it->second.ref_count;
    return Status::OK();
}

Status SegmentStore::Release(const SegmentId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = segments_.find(id);
    if (it == segments_.end()) {
        return Status::NotFound("Segment " + id);
    }
    if (it->second.ref_count == 0) {
        return Status::InternalError("Release of unreferenced segment " + id);
    }

    if (--it->second.ref_count == 0) {
        RemoveFile(id);
        segments_.erase(it);
        ++reclaimed_;
        STRATA_LOG_DEBUG(SegmentStore) << "Reclaimed segment " << id;
    }
    return Status::OK();
}

bool SegmentStore::Contains(const SegmentId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return segments_.count(id) > 0;
}

size_t SegmentStore::RefCount(const SegmentId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = segments_.find(id);
    return it == segments_.end() ? 0 : it->second.ref_count;
}

size_t SegmentStore::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return segments_.size();
}

Status SegmentStore::SweepUnreferenced(size_t* removed) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (auto it = segments_.begin(); it != segments_.end();) {
        if (it->second.orphaned && it->second.ref_count == 0) {
            RemoveFile(it->first);
            it = segments_.erase(it);
            ++count;
        } else {
            ++it;
        }
    }
    reclaimed_ += count;
    if (removed) *removed = count;
    if (count > 0) {
        STRATA_LOG_INFO(SegmentStore) << "Swept " << count << " orphaned segments";
    }
    return Status::OK();
}

void SegmentStore::Abandon(const SegmentId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = segments_.find(id);
    if (it != segments_.end() && it->second.ref_count == 0) {
        it->second.orphaned = true;
    }
}

SegmentStoreStats SegmentStore::GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SegmentStoreStats stats;
    stats.segment_count = segments_.size();
    for (const auto& [id, entry] : segments_) {
        if (entry.ref_count > 0) ++stats.referenced_count;
        stats.total_bytes += entry.size_bytes;
        if (entry.batch) stats.total_rows += static_cast<size_t>(entry.batch->num_rows());
    }
    stats.dedup_hits = dedup_hits_;
    stats.reclaimed = reclaimed_;
    return stats;
}

} // namespace strata
