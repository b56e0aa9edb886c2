/************************************************************************
Strata Variant

Semi-structured value: a tagged, immutable tree of null, boolean,
number, string, array and object nodes. Children are shared between
trees, never copied, and no operation mutates an existing value.
**************************************************************************/

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <strata/status.h>

namespace strata {

enum class VariantKind {
    kNull,
    kBoolean,
    kNumber,
    kString,
    kArray,
    kObject,
};

const char* VariantKindToString(VariantKind kind);

class Variant {
public:
    using Array = std::vector<Variant>;
    using Object = std::map<std::string, Variant>;

    // The null variant
    Variant();

    static Variant Null() { return Variant(); }
    static Variant Boolean(bool value);
    static Variant Integer(int64_t value);
    static Variant Double(double value);
    static Variant String(std::string value);
    static Variant MakeArray(Array elements);
    static Variant MakeObject(Object fields);

    VariantKind kind() const;
    bool is_null() const { return kind() == VariantKind::kNull; }
    bool is_boolean() const { return kind() == VariantKind::kBoolean; }
    bool is_number() const { return kind() == VariantKind::kNumber; }
    bool is_string() const { return kind() == VariantKind::kString; }
    bool is_array() const { return kind() == VariantKind::kArray; }
    bool is_object() const { return kind() == VariantKind::kObject; }

    // Numbers keep whether they were written as integers
    bool is_integer() const;

    // Accessors return a neutral value when the kind does not match
    bool boolean_value() const;
    int64_t integer_value() const;
    double double_value() const;
    const std::string& string_value() const;
    const Array& array_elements() const;
    const Object& object_fields() const;

    size_t size() const;

    // Canonical JSON text (object keys sorted, doubles shortest round-trip)
    std::string ToJson() const;

    bool operator==(const Variant& other) const;
    bool operator!=(const Variant& other) const { return !(*this == other); }

private:
    struct Node;
    explicit Variant(std::shared_ptr<const Node> node);

    std::shared_ptr<const Node> node_;
};

/**
 * @brief One step of a path: an object field or an array index
 */
struct PathElement {
    enum class Type { kField, kIndex };

    Type type;
    std::string field;
    int64_t index = 0;

    static PathElement Field(std::string name) { return PathElement{Type::kField, std::move(name), 0}; }
    static PathElement Index(int64_t i) { return PathElement{Type::kIndex, std::string(), i}; }
};

using VariantPath = std::vector<PathElement>;

/**
 * @brief Parse Snowflake-style path text
 *
 * Accepts "a.b[0]", "a:b", "[2].name" and quoted keys ("a"."b c"). The
 * leading ':' of "v:path" notation is optional.
 */
Status ParsePath(const std::string& text, VariantPath* path);

std::string PathToString(const VariantPath& path);

/**
 * @brief Descend value along path
 *
 * Total: an absent field, an out-of-range index or a step into a
 * non-container yields the null variant.
 */
Variant Extract(const Variant& value, const VariantPath& path);

/**
 * @brief Convert between kinds using the widest-lossless rule
 *
 * Null converts to null. Strings parse as numbers with the standard
 * numeric grammar; numbers format as exact decimals; only boolean
 * sources convert to boolean. Anything else is kCastError.
 */
Status Cast(const Variant& value, VariantKind target, Variant* result);

// TRY_CAST: the null variant instead of a cast error
Variant TryCast(const Variant& value, VariantKind target);

// Deepest array/object nesting Parse accepts
constexpr int kMaxVariantDepth = 512;

/**
 * @brief PARSE_JSON: strict parse, kInvalidArgument on malformed text
 *
 * Documents nested deeper than kMaxVariantDepth count as malformed.
 */
Status Parse(const std::string& text, Variant* value);

/**
 * @brief TRY_PARSE_JSON: the null variant on malformed input, never fails
 */
Variant SafeParse(const std::string& text);

// OBJECT_KEYS: array of the object's keys, null for non-objects
Variant ObjectKeys(const Variant& value);

} // namespace strata
