#pragma once

#include <memory>
#include <string>
#include <vector>

#include <arrow/api.h>

#include <strata/status.h>
#include <strata/variant.h>

namespace strata {

/**
 * @brief One output column of a variant projection
 *
 * Reads `column` (utf8 holding JSON text), extracts `path` and casts the
 * result to `type`. Supported types are utf8, int64, float64, boolean,
 * date32 and timestamp (from ISO-8601 text); a null type keeps the
 * extracted value as JSON text (a VARIANT column). With parse_json set, an
 * extracted string is parsed as JSON first, and null when malformed.
 */
struct ProjectionSpec {
    std::string output_name;
    std::string column;
    std::string path;
    std::shared_ptr<arrow::DataType> type;
    bool try_cast = false;   // null instead of kCastError
    bool parse_json = false;
};

/**
 * @brief Project one path out of a VARIANT column
 *
 * Null source rows and absent paths produce nulls. Malformed JSON in a
 * row is kInvalidArgument and a failed cast is kCastError, unless
 * try_cast is set, in which case the row becomes null.
 */
Status ProjectVariantColumn(const std::shared_ptr<arrow::RecordBatch>& batch,
                            const std::string& column,
                            const VariantPath& path,
                            const std::shared_ptr<arrow::DataType>& target_type,
                            bool try_cast,
                            std::shared_ptr<arrow::Array>* result);

Status ProjectVariantColumn(const std::shared_ptr<arrow::RecordBatch>& batch,
                            const std::string& column,
                            const VariantPath& path,
                            const std::shared_ptr<arrow::DataType>& target_type,
                            bool try_cast,
                            bool parse_json,
                            std::shared_ptr<arrow::Array>* result);

// Builds a batch with one column per spec, in order
Status Project(const std::shared_ptr<arrow::RecordBatch>& batch,
               const std::vector<ProjectionSpec>& specs,
               std::shared_ptr<arrow::RecordBatch>* result);

} // namespace strata
