#include "strata/manifest.h"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <unistd.h>

#include "strata/logging.h"

namespace fs = std::filesystem;

namespace strata {

STRATA_LOG_TAG(Manifest);

Manifest::Manifest(std::string path, bool sync)
    : path_(std::move(path)), sync_(sync) {}

Manifest::~Manifest() {
    if (file_) {
        std::fclose(file_);
    }
}

Status Manifest::Open(const std::string& path, bool sync, std::unique_ptr<Manifest>* manifest) {
    if (!manifest) {
        return Status::InvalidArgument("Null output manifest pointer");
    }

    std::unique_ptr<Manifest> result(new Manifest(path, sync));
    if (result->persistent()) {
        std::error_code ec;
        auto parent = fs::path(path).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent, ec);
            if (ec) {
                return Status::IOError("Failed to create " + parent.string() + ": " + ec.message());
            }
        }
        STRATA_RETURN_NOT_OK(result->TrimTornTail());
        STRATA_RETURN_NOT_OK(result->OpenForAppend());
    }

    *manifest = std::move(result);
    return Status::OK();
}

Status Manifest::TrimTornTail() {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return Status::OK();
    }

    std::ifstream in(path_, std::ios::binary);
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (contents.empty() || contents.back() == '\n') {
        return Status::OK();
    }

    size_t keep = contents.find_last_of('\n');
    keep = (keep == std::string::npos) ? 0 : keep + 1;
    STRATA_LOG_WARN(Manifest) << "Truncating torn tail of " << path_ << " ("
                              << (contents.size() - keep) << " bytes)";
    fs::resize_file(path_, keep, ec);
    if (ec) {
        return Status::IOError("Failed to truncate manifest " + path_ + ": " + ec.message());
    }
    return Status::OK();
}

Status Manifest::OpenForAppend() {
    file_ = std::fopen(path_.c_str(), "ab");
    if (!file_) {
        return Status::IOError("Failed to open manifest " + path_);
    }
    return Status::OK();
}

Status Manifest::Replay(const std::function<Status(const Record&)>& apply) const {
    if (!persistent()) {
        return Status::OK();
    }

    std::ifstream in(path_);
    if (!in) {
        return Status::OK();
    }

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty()) continue;

        Record record = Record::parse(line, nullptr, false);
        if (record.is_discarded()) {
            if (in.peek() == std::char_traits<char>::eof()) {
                STRATA_LOG_WARN(Manifest) << "Ignoring torn tail record at line " << line_no;
                break;
            }
            return Status::Corruption("Malformed manifest record at line " + std::to_string(line_no) +
                                      " of " + path_);
        }

        try {
            STRATA_RETURN_NOT_OK(apply(record));
        } catch (const nlohmann::json::exception& e) {
            return Status::Corruption("Bad manifest record at line " + std::to_string(line_no) +
                                      ": " + e.what());
        }
    }

    STRATA_LOG_DEBUG(Manifest) << "Replayed " << line_no << " lines from " << path_;
    return Status::OK();
}

Status Manifest::WriteLines(std::FILE* file, const std::vector<Record>& records) const {
    std::string buffer;
    for (const auto& record : records) {
        buffer += record.dump();
        buffer += '\n';
    }

    if (std::fwrite(buffer.data(), 1, buffer.size(), file) != buffer.size()) {
        return Status::IOError("Short write to manifest " + path_);
    }
    if (std::fflush(file) != 0) {
        return Status::IOError("Failed to flush manifest " + path_);
    }
    if (sync_ && ::fsync(fileno(file)) != 0) {
        return Status::IOError("Failed to sync manifest " + path_);
    }
    return Status::OK();
}

Status Manifest::Append(const Record& record) {
    return Append(std::vector<Record>{record});
}

Status Manifest::Append(const std::vector<Record>& records) {
    if (!persistent() || records.empty()) {
        return Status::OK();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_) {
        STRATA_RETURN_NOT_OK(OpenForAppend());
    }
    return WriteLines(file_, records);
}

Status Manifest::Rewrite(const std::vector<Record>& records) {
    if (!persistent()) {
        return Status::OK();
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::string tmp_path = path_ + ".tmp";
    std::FILE* tmp = std::fopen(tmp_path.c_str(), "wb");
    if (!tmp) {
        return Status::IOError("Failed to open " + tmp_path);
    }
    Status status = WriteLines(tmp, records);
    std::fclose(tmp);
    if (!status.ok()) {
        std::error_code ec;
        fs::remove(tmp_path, ec);
        return status;
    }

    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }

    std::error_code ec;
    fs::rename(tmp_path, path_, ec);
    if (ec) {
        // The old log is still intact; reopen it for further appends
        Status reopen = OpenForAppend();
        if (!reopen.ok()) return reopen;
        return Status::IOError("Failed to replace manifest " + path_ + ": " + ec.message());
    }

    STRATA_LOG_INFO(Manifest) << "Compacted " << path_ << " to " << records.size() << " records";
    return OpenForAppend();
}

} // namespace strata
