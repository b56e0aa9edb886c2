#include "strata/projection.h"

#include <cmath>

#include <arrow/compute/api.h>

namespace strata {

namespace {

Status RowValue(const arrow::StringArray& source, int64_t row, const VariantPath& path, bool parse_json,
                Variant* value) {
    if (source.IsNull(row)) {
        *value = Variant::Null();
        return Status::OK();
    }
    Variant document;
    Status status = Parse(source.GetString(row), &document);
    if (!status.ok()) {
        return Status::InvalidArgument("Row " + std::to_string(row) + ": " + status.message());
    }
    *value = Extract(document, path);
    if (parse_json && value->is_string()) {
        // TRY_PARSE_JSON on a field holding serialized JSON
        *value = SafeParse(value->string_value());
    }
    return Status::OK();
}

Status AppendString(const Variant& value, arrow::StringBuilder* builder) {
    Variant cast;
    STRATA_RETURN_NOT_OK(Cast(value, VariantKind::kString, &cast));
    return Status::FromArrowStatus(builder->Append(cast.string_value()));
}

Status AppendJson(const Variant& value, arrow::StringBuilder* builder) {
    return Status::FromArrowStatus(builder->Append(value.ToJson()));
}

Status AppendInt64(const Variant& value, arrow::Int64Builder* builder) {
    Variant cast;
    STRATA_RETURN_NOT_OK(Cast(value, VariantKind::kNumber, &cast));
    if (cast.is_integer()) {
        return Status::FromArrowStatus(builder->Append(cast.integer_value()));
    }
    const double d = cast.double_value();
    if (d != std::trunc(d) || d < -9223372036854775808.0 || d >= 9223372036854775808.0) {
        return Status::CastError("Numeric value '" + cast.ToJson() + "' is not an integer");
    }
    return Status::FromArrowStatus(builder->Append(static_cast<int64_t>(d)));
}

Status AppendDouble(const Variant& value, arrow::DoubleBuilder* builder) {
    Variant cast;
    STRATA_RETURN_NOT_OK(Cast(value, VariantKind::kNumber, &cast));
    return Status::FromArrowStatus(builder->Append(cast.double_value()));
}

Status AppendBoolean(const Variant& value, arrow::BooleanBuilder* builder) {
    Variant cast;
    STRATA_RETURN_NOT_OK(Cast(value, VariantKind::kBoolean, &cast));
    return Status::FromArrowStatus(builder->Append(cast.boolean_value()));
}

Status ComputeKernelsReady() {
    static const arrow::Status initialized = arrow::compute::Initialize();
    return Status::FromArrowStatus(initialized);
}

// ISO-8601 text to a date32 or timestamp scalar; dates drop the time of day
Status AppendTemporal(const Variant& value,
                      const std::shared_ptr<arrow::DataType>& type,
                      arrow::ArrayBuilder* builder) {
    if (!value.is_string()) {
        return Status::CastError(std::string("Cannot cast ") + VariantKindToString(value.kind()) +
                                 " to " + type->ToString());
    }
    const bool is_date = type->id() == arrow::Type::DATE32;
    auto parse_type = is_date ? arrow::timestamp(arrow::TimeUnit::MICRO) : type;
    auto parsed = arrow::compute::Cast(arrow::Datum(std::make_shared<arrow::StringScalar>(value.string_value())),
                                       parse_type);
    if (!parsed.ok()) {
        return Status::CastError("Timestamp '" + value.string_value() + "' is not recognized as " +
                                 type->ToString());
    }
    arrow::Datum out = parsed.MoveValueUnsafe();
    if (is_date) {
        arrow::compute::CastOptions options = arrow::compute::CastOptions::Safe(type);
        options.allow_time_truncate = true;
        auto day = arrow::compute::Cast(out, options);
        if (!day.ok()) {
            return Status::CastError("Date '" + value.string_value() + "' is out of range");
        }
        out = day.MoveValueUnsafe();
    }
    return Status::FromArrowStatus(builder->AppendScalar(*out.scalar()));
}

template <typename Builder, typename AppendFn>
Status BuildColumn(Builder* builder,
                   const arrow::StringArray& source,
                   const VariantPath& path,
                   bool try_cast,
                   bool parse_json,
                   AppendFn append,
                   std::shared_ptr<arrow::Array>* result) {
    STRATA_RETURN_NOT_OK(Status::FromArrowStatus(builder->Reserve(source.length())));

    for (int64_t row = 0; row < source.length(); ++row) {
        Variant value;
        Status status = RowValue(source, row, path, parse_json, &value);
        if (status.ok() && !value.is_null()) {
            status = append(value, builder);
            if (status.ok()) continue;
        }
        if (!status.ok() && !try_cast) {
            return status;
        }
        STRATA_RETURN_NOT_OK(Status::FromArrowStatus(builder->AppendNull()));
    }

    auto finished = builder->Finish();
    if (!finished.ok()) {
        return Status::FromArrowStatus(finished.status());
    }
    *result = finished.ValueOrDie();
    return Status::OK();
}

template <typename Builder, typename AppendFn>
Status BuildColumn(const arrow::StringArray& source,
                   const VariantPath& path,
                   bool try_cast,
                   bool parse_json,
                   AppendFn append,
                   std::shared_ptr<arrow::Array>* result) {
    Builder builder;
    return BuildColumn(&builder, source, path, try_cast, parse_json, append, result);
}

} // namespace

Status ProjectVariantColumn(const std::shared_ptr<arrow::RecordBatch>& batch,
                            const std::string& column,
                            const VariantPath& path,
                            const std::shared_ptr<arrow::DataType>& target_type,
                            bool try_cast,
                            std::shared_ptr<arrow::Array>* result) {
    return ProjectVariantColumn(batch, column, path, target_type, try_cast, /*parse_json=*/false, result);
}

Status ProjectVariantColumn(const std::shared_ptr<arrow::RecordBatch>& batch,
                            const std::string& column,
                            const VariantPath& path,
                            const std::shared_ptr<arrow::DataType>& target_type,
                            bool try_cast,
                            bool parse_json,
                            std::shared_ptr<arrow::Array>* result) {
    if (!batch) {
        return Status::InvalidArgument("Null RecordBatch provided");
    }
    if (!result) {
        return Status::InvalidArgument("Null output array provided");
    }

    auto array = batch->GetColumnByName(column);
    if (!array) {
        return Status::NotFound("Column '" + column + "' not found");
    }
    if (array->type_id() != arrow::Type::STRING) {
        return Status::InvalidArgument("Column '" + column + "' is " + array->type()->ToString() +
                                       ", expected a utf8 VARIANT column");
    }
    const auto& source = static_cast<const arrow::StringArray&>(*array);

    if (!target_type) {
        return BuildColumn<arrow::StringBuilder>(source, path, try_cast, parse_json, AppendJson, result);
    }
    switch (target_type->id()) {
        case arrow::Type::STRING:
            return BuildColumn<arrow::StringBuilder>(source, path, try_cast, parse_json, AppendString, result);
        case arrow::Type::INT64:
            return BuildColumn<arrow::Int64Builder>(source, path, try_cast, parse_json, AppendInt64, result);
        case arrow::Type::DOUBLE:
            return BuildColumn<arrow::DoubleBuilder>(source, path, try_cast, parse_json, AppendDouble, result);
        case arrow::Type::BOOL:
            return BuildColumn<arrow::BooleanBuilder>(source, path, try_cast, parse_json, AppendBoolean, result);
        case arrow::Type::DATE32:
        case arrow::Type::TIMESTAMP: {
            STRATA_RETURN_NOT_OK(ComputeKernelsReady());
            auto made = arrow::MakeBuilder(target_type);
            if (!made.ok()) {
                return Status::FromArrowStatus(made.status());
            }
            std::unique_ptr<arrow::ArrayBuilder> builder = made.MoveValueUnsafe();
            auto append = [&target_type](const Variant& value, arrow::ArrayBuilder* out) {
                return AppendTemporal(value, target_type, out);
            };
            return BuildColumn(builder.get(), source, path, try_cast, parse_json, append, result);
        }
        default:
            return Status::NotImplemented("Projection to " + target_type->ToString() + " is not supported");
    }
}

Status Project(const std::shared_ptr<arrow::RecordBatch>& batch,
               const std::vector<ProjectionSpec>& specs,
               std::shared_ptr<arrow::RecordBatch>* result) {
    if (!batch) {
        return Status::InvalidArgument("Null RecordBatch provided");
    }
    if (!result) {
        return Status::InvalidArgument("Null output batch provided");
    }

    arrow::FieldVector fields;
    arrow::ArrayVector columns;
    fields.reserve(specs.size());
    columns.reserve(specs.size());

    for (const auto& spec : specs) {
        VariantPath path;
        STRATA_RETURN_NOT_OK(ParsePath(spec.path, &path));

        std::shared_ptr<arrow::Array> column;
        STRATA_RETURN_NOT_OK(ProjectVariantColumn(batch, spec.column, path, spec.type,
                                                  spec.try_cast, spec.parse_json, &column));
        fields.push_back(arrow::field(spec.output_name, column->type()));
        columns.push_back(std::move(column));
    }

    *result = arrow::RecordBatch::Make(arrow::schema(fields), batch->num_rows(), columns);
    return Status::OK();
}

} // namespace strata
