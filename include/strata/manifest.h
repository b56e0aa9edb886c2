/************************************************************************
Strata Manifest

Append-only metadata log. Every record is one line of JSON; the log is
replayed in order on open and rewritten in compacted form after purges.
A torn final line (crash mid-append) is ignored on replay.
**************************************************************************/

#pragma once

#include <cstdio>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <strata/status.h>

namespace strata {

class Manifest {
public:
    using Record = nlohmann::json;

    /**
     * @brief Open (creating if absent) the manifest at path
     *
     * An empty path yields a manifest that accepts and drops every record.
     */
    static Status Open(const std::string& path, bool sync, std::unique_ptr<Manifest>* manifest);

    ~Manifest();

    Manifest(const Manifest&) = delete;
    Manifest& operator=(const Manifest&) = delete;

    // Replay every record in file order
    Status Replay(const std::function<Status(const Record&)>& apply) const;

    Status Append(const Record& record);
    Status Append(const std::vector<Record>& records);

    // Atomically replace the log with the given records
    Status Rewrite(const std::vector<Record>& records);

    bool persistent() const { return !path_.empty(); }
    const std::string& path() const { return path_; }

private:
    Manifest(std::string path, bool sync);

    Status TrimTornTail();
    Status OpenForAppend();
    Status WriteLines(std::FILE* file, const std::vector<Record>& records) const;

    std::string path_;
    bool sync_;

    std::mutex mutex_;
    std::FILE* file_ = nullptr;
};

} // namespace strata
