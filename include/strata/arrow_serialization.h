/**
 * Arrow Serialization Utilities
 *
 * Schema encoding for the catalog manifest (IPC schema message, hex
 * embedded in JSON records) and the content hash behind segment ids.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <arrow/ipc/api.h>

#include "strata/status.h"

namespace strata {

/**
 * @brief Serialize a bare Arrow Schema (no batches) to IPC bytes
 */
Status SerializeArrowSchema(const std::shared_ptr<arrow::Schema>& schema, std::string* bytes);

Status DeserializeArrowSchema(const std::string& bytes, std::shared_ptr<arrow::Schema>* schema);

/**
 * @brief 64-bit FNV-1a over a byte string
 */
uint64_t Fnv1a64(const std::string& data);

// Lowercase hex encoding/decoding, used to embed binary blobs in manifests
std::string HexEncode(const std::string& data);
Status HexDecode(const std::string& hex, std::string* data);

} // namespace strata
