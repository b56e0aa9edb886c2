#include "strata/arrow_serialization.h"

namespace strata {

Status SerializeArrowSchema(const std::shared_ptr<arrow::Schema>& schema, std::string* bytes) {
    if (!schema) {
        return Status::InvalidArgument("Null Schema provided");
    }

    auto buffer_result = arrow::ipc::SerializeSchema(*schema);
    if (!buffer_result.ok()) {
        return Status::IOError("Failed to serialize schema: " + buffer_result.status().ToString());
    }

    auto buffer = buffer_result.ValueOrDie();
    bytes->assign(reinterpret_cast<const char*>(buffer->data()), buffer->size());
    return Status::OK();
}

Status DeserializeArrowSchema(const std::string& bytes, std::shared_ptr<arrow::Schema>* schema) {
    auto buffer = std::make_shared<arrow::Buffer>(
        reinterpret_cast<const uint8_t*>(bytes.data()), static_cast<int64_t>(bytes.size()));
    arrow::io::BufferReader reader(buffer);

    arrow::ipc::DictionaryMemo memo;
    auto schema_result = arrow::ipc::ReadSchema(&reader, &memo);
    if (!schema_result.ok()) {
        return Status::Corruption("Failed to read schema: " + schema_result.status().ToString());
    }

    *schema = schema_result.ValueOrDie();
    return Status::OK();
}

uint64_t Fnv1a64(const std::string& data) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : data) {
        hash ^= static_cast<uint64_t>(c);
        hash *= 1099511628211ULL;
    }
    return hash;
}

std::string HexEncode(const std::string& data) {
    static const char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (unsigned char c : data) {
        out.push_back(kDigits[c >> 4]);
        out.push_back(kDigits[c & 0x0f]);
    }
    return out;
}

namespace {

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

Status HexDecode(const std::string& hex, std::string* data) {
    if (hex.size() % 2 != 0) {
        return Status::Corruption("Odd-length hex string");
    }
    std::string out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = HexValue(hex[i]);
        int lo = HexValue(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return Status::Corruption("Invalid hex digit");
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
    }
    *data = std::move(out);
    return Status::OK();
}

} // namespace strata
