#include "strata/variant.h"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>

#include <nlohmann/json.hpp>

namespace strata {

using json = nlohmann::json;

const char* VariantKindToString(VariantKind kind) {
    switch (kind) {
        case VariantKind::kNull:    return "NULL";
        case VariantKind::kBoolean: return "BOOLEAN";
        case VariantKind::kNumber:  return "NUMBER";
        case VariantKind::kString:  return "STRING";
        case VariantKind::kArray:   return "ARRAY";
        case VariantKind::kObject:  return "OBJECT";
    }
    return "UNKNOWN";
}

struct Variant::Node {
    VariantKind kind = VariantKind::kNull;
    bool boolean = false;
    bool integral = false;
    int64_t integer = 0;
    double real = 0.0;
    std::string string;
    Array array;
    Object object;
};

namespace {

const std::string& EmptyString() {
    static const std::string empty;
    return empty;
}

const Variant::Array& EmptyArray() {
    static const Variant::Array empty;
    return empty;
}

const Variant::Object& EmptyObject() {
    static const Variant::Object empty;
    return empty;
}

} // namespace

Variant::Variant() = default;

Variant::Variant(std::shared_ptr<const Node> node) : node_(std::move(node)) {}

Variant Variant::Boolean(bool value) {
    auto node = std::make_shared<Node>();
    node->kind = VariantKind::kBoolean;
    node->boolean = value;
    return Variant(std::move(node));
}

Variant Variant::Integer(int64_t value) {
    auto node = std::make_shared<Node>();
    node->kind = VariantKind::kNumber;
    node->integral = true;
    node->integer = value;
    node->real = static_cast<double>(value);
    return Variant(std::move(node));
}

Variant Variant::Double(double value) {
    if (!std::isfinite(value)) {
        return Variant();
    }
    auto node = std::make_shared<Node>();
    node->kind = VariantKind::kNumber;
    node->real = value;
    return Variant(std::move(node));
}

Variant Variant::String(std::string value) {
    auto node = std::make_shared<Node>();
    node->kind = VariantKind::kString;
    node->string = std::move(value);
    return Variant(std::move(node));
}

Variant Variant::MakeArray(Array elements) {
    auto node = std::make_shared<Node>();
    node->kind = VariantKind::kArray;
    node->array = std::move(elements);
    return Variant(std::move(node));
}

Variant Variant::MakeObject(Object fields) {
    auto node = std::make_shared<Node>();
    node->kind = VariantKind::kObject;
    node->object = std::move(fields);
    return Variant(std::move(node));
}

VariantKind Variant::kind() const {
    return node_ ? node_->kind : VariantKind::kNull;
}

bool Variant::is_integer() const {
    return is_number() && node_->integral;
}

bool Variant::boolean_value() const {
    return is_boolean() && node_->boolean;
}

int64_t Variant::integer_value() const {
    if (!is_number()) return 0;
    return node_->integral ? node_->integer : static_cast<int64_t>(node_->real);
}

double Variant::double_value() const {
    return is_number() ? node_->real : 0.0;
}

const std::string& Variant::string_value() const {
    return is_string() ? node_->string : EmptyString();
}

const Variant::Array& Variant::array_elements() const {
    return is_array() ? node_->array : EmptyArray();
}

const Variant::Object& Variant::object_fields() const {
    return is_object() ? node_->object : EmptyObject();
}

size_t Variant::size() const {
    switch (kind()) {
        case VariantKind::kArray:  return node_->array.size();
        case VariantKind::kObject: return node_->object.size();
        default:                   return 0;
    }
}

namespace {

json ToNlohmann(const Variant& value) {
    switch (value.kind()) {
        case VariantKind::kNull:
            return nullptr;
        case VariantKind::kBoolean:
            return value.boolean_value();
        case VariantKind::kNumber:
            if (value.is_integer()) return value.integer_value();
            return value.double_value();
        case VariantKind::kString:
            return value.string_value();
        case VariantKind::kArray: {
            json out = json::array();
            for (const auto& element : value.array_elements()) {
                out.push_back(ToNlohmann(element));
            }
            return out;
        }
        case VariantKind::kObject: {
            json out = json::object();
            for (const auto& [key, field] : value.object_fields()) {
                out[key] = ToNlohmann(field);
            }
            return out;
        }
    }
    return nullptr;
}

Variant FromNlohmann(const json& j) {
    switch (j.type()) {
        case json::value_t::boolean:
            return Variant::Boolean(j.get<bool>());
        case json::value_t::number_integer:
            return Variant::Integer(j.get<int64_t>());
        case json::value_t::number_unsigned: {
            uint64_t u = j.get<uint64_t>();
            if (u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return Variant::Integer(static_cast<int64_t>(u));
            }
            return Variant::Double(static_cast<double>(u));
        }
        case json::value_t::number_float:
            return Variant::Double(j.get<double>());
        case json::value_t::string:
            return Variant::String(j.get<std::string>());
        case json::value_t::array: {
            Variant::Array elements;
            elements.reserve(j.size());
            for (const auto& element : j) {
                elements.push_back(FromNlohmann(element));
            }
            return Variant::MakeArray(std::move(elements));
        }
        case json::value_t::object: {
            Variant::Object fields;
            for (auto it = j.begin(); it != j.end(); ++it) {
                fields.emplace(it.key(), FromNlohmann(it.value()));
            }
            return Variant::MakeObject(std::move(fields));
        }
        default:
            return Variant::Null();
    }
}

std::string FormatNumber(const Variant& value) {
    if (value.is_integer()) {
        return std::to_string(value.integer_value());
    }
    // nlohmann emits the shortest text that round-trips the double
    return json(value.double_value()).dump();
}

std::string Trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

// [sign] digits [. digits] [e [sign] digits], or [sign] . digits [...]
bool MatchesNumericGrammar(const std::string& text, bool* integral) {
    size_t i = 0;
    const size_t n = text.size();
    if (i < n && (text[i] == '+' || text[i] == '-')) ++i;

    size_t int_digits = 0;
    while (i < n && std::isdigit(static_cast<unsigned char>(text[i]))) { ++i; ++int_digits; }

    size_t frac_digits = 0;
    bool has_point = false;
    if (i < n && text[i] == '.') {
        has_point = true;
        ++i;
        while (i < n && std::isdigit(static_cast<unsigned char>(text[i]))) { ++i; ++frac_digits; }
    }
    if (int_digits + frac_digits == 0) return false;

    bool has_exponent = false;
    if (i < n && (text[i] == 'e' || text[i] == 'E')) {
        has_exponent = true;
        ++i;
        if (i < n && (text[i] == '+' || text[i] == '-')) ++i;
        size_t exp_digits = 0;
        while (i < n && std::isdigit(static_cast<unsigned char>(text[i]))) { ++i; ++exp_digits; }
        if (exp_digits == 0) return false;
    }

    *integral = !has_point && !has_exponent;
    return i == n;
}

Status ParseNumber(const std::string& raw, Variant* result) {
    std::string text = Trim(raw);
    bool integral = false;
    if (!MatchesNumericGrammar(text, &integral)) {
        return Status::CastError("Numeric value '" + raw + "' is not recognized");
    }

    if (integral) {
        const char* begin = text.data();
        if (*begin == '+') ++begin;
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(begin, text.data() + text.size(), value);
        if (ec == std::errc() && ptr == text.data() + text.size()) {
            *result = Variant::Integer(value);
            return Status::OK();
        }
        // Out of int64 range: fall through to double
    }

    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || !std::isfinite(value)) {
        return Status::CastError("Numeric value '" + raw + "' is out of range");
    }
    *result = Variant::Double(value);
    return Status::OK();
}

} // namespace

std::string Variant::ToJson() const {
    return ToNlohmann(*this).dump();
}

bool Variant::operator==(const Variant& other) const {
    if (kind() != other.kind()) return false;
    switch (kind()) {
        case VariantKind::kNull:
            return true;
        case VariantKind::kBoolean:
            return boolean_value() == other.boolean_value();
        case VariantKind::kNumber:
            if (is_integer() && other.is_integer()) {
                return integer_value() == other.integer_value();
            }
            return double_value() == other.double_value();
        case VariantKind::kString:
            return string_value() == other.string_value();
        case VariantKind::kArray:
            return array_elements() == other.array_elements();
        case VariantKind::kObject:
            return object_fields() == other.object_fields();
    }
    return false;
}

// ============================================================================
// Paths
// ============================================================================

Status ParsePath(const std::string& text, VariantPath* path) {
    if (!path) {
        return Status::InvalidArgument("Null output path");
    }
    VariantPath result;
    size_t i = 0;
    const size_t n = text.size();

    auto parse_quoted = [&](char quote, std::string* out) -> Status {
        ++i;  // opening quote
        std::string name;
        while (i < n) {
            if (text[i] == quote) {
                if (i + 1 < n && text[i + 1] == quote) {
                    name.push_back(quote);
                    i += 2;
                    continue;
                }
                ++i;
                *out = std::move(name);
                return Status::OK();
            }
            name.push_back(text[i++]);
        }
        return Status::InvalidArgument("Unterminated quoted key in path '" + text + "'");
    };

    auto parse_name = [&](std::string* out) -> Status {
        if (i < n && text[i] == '"') {
            return parse_quoted('"', out);
        }
        size_t start = i;
        while (i < n && text[i] != '.' && text[i] != ':' && text[i] != '[') ++i;
        if (i == start) {
            return Status::InvalidArgument("Empty key in path '" + text + "' at offset " +
                                           std::to_string(start));
        }
        *out = text.substr(start, i - start);
        return Status::OK();
    };

    auto parse_bracket = [&]() -> Status {
        ++i;  // '['
        if (i < n && (text[i] == '\'' || text[i] == '"')) {
            std::string name;
            STRATA_RETURN_NOT_OK(parse_quoted(text[i], &name));
            result.push_back(PathElement::Field(std::move(name)));
        } else {
            size_t start = i;
            while (i < n && std::isdigit(static_cast<unsigned char>(text[i]))) ++i;
            if (i == start) {
                return Status::InvalidArgument("Expected array index in path '" + text + "'");
            }
            int64_t index = 0;
            auto [ptr, ec] = std::from_chars(text.data() + start, text.data() + i, index);
            if (ec != std::errc()) {
                return Status::InvalidArgument("Array index out of range in path '" + text + "'");
            }
            result.push_back(PathElement::Index(index));
        }
        if (i >= n || text[i] != ']') {
            return Status::InvalidArgument("Expected ']' in path '" + text + "'");
        }
        ++i;
        return Status::OK();
    };

    if (i < n && text[i] == ':') ++i;
    if (i >= n) {
        return Status::InvalidArgument("Empty path");
    }

    if (text[i] == '[') {
        STRATA_RETURN_NOT_OK(parse_bracket());
    } else {
        std::string name;
        STRATA_RETURN_NOT_OK(parse_name(&name));
        result.push_back(PathElement::Field(std::move(name)));
    }

    while (i < n) {
        char c = text[i];
        if (c == '.' || c == ':') {
            ++i;
            std::string name;
            STRATA_RETURN_NOT_OK(parse_name(&name));
            result.push_back(PathElement::Field(std::move(name)));
        } else if (c == '[') {
            STRATA_RETURN_NOT_OK(parse_bracket());
        } else {
            return Status::InvalidArgument("Unexpected '" + std::string(1, c) + "' in path '" + text + "'");
        }
    }

    *path = std::move(result);
    return Status::OK();
}

std::string PathToString(const VariantPath& path) {
    std::string out;
    for (const auto& element : path) {
        if (element.type == PathElement::Type::kIndex) {
            out += "[" + std::to_string(element.index) + "]";
        } else {
            if (!out.empty()) out += ".";
            out += element.field;
        }
    }
    return out;
}

Variant Extract(const Variant& value, const VariantPath& path) {
    Variant current = value;
    for (const auto& element : path) {
        if (element.type == PathElement::Type::kField) {
            if (!current.is_object()) return Variant::Null();
            const auto& fields = current.object_fields();
            auto it = fields.find(element.field);
            if (it == fields.end()) return Variant::Null();
            current = it->second;
        } else {
            if (!current.is_array()) return Variant::Null();
            const auto& elements = current.array_elements();
            if (element.index < 0 || static_cast<size_t>(element.index) >= elements.size()) {
                return Variant::Null();
            }
            current = elements[static_cast<size_t>(element.index)];
        }
    }
    return current;
}

// ============================================================================
// Casts
// ============================================================================

Status Cast(const Variant& value, VariantKind target, Variant* result) {
    if (!result) {
        return Status::InvalidArgument("Null output variant");
    }
    if (value.kind() == target || value.is_null()) {
        *result = value;
        return Status::OK();
    }

    switch (target) {
        case VariantKind::kNull:
            *result = Variant::Null();
            return Status::OK();

        case VariantKind::kNumber:
            if (value.is_string()) {
                return ParseNumber(value.string_value(), result);
            }
            if (value.is_boolean()) {
                *result = Variant::Integer(value.boolean_value() ? 1 : 0);
                return Status::OK();
            }
            break;

        case VariantKind::kString:
            if (value.is_number()) {
                *result = Variant::String(FormatNumber(value));
                return Status::OK();
            }
            if (value.is_boolean()) {
                *result = Variant::String(value.boolean_value() ? "true" : "false");
                return Status::OK();
            }
            *result = Variant::String(value.ToJson());
            return Status::OK();

        case VariantKind::kBoolean:
        case VariantKind::kArray:
        case VariantKind::kObject:
            break;
    }

    return Status::CastError(std::string("Cannot cast ") + VariantKindToString(value.kind()) +
                             " to " + VariantKindToString(target));
}

Variant TryCast(const Variant& value, VariantKind target) {
    Variant result;
    if (!Cast(value, target, &result).ok()) {
        return Variant::Null();
    }
    return result;
}

// ============================================================================
// Parsing
// ============================================================================

Status Parse(const std::string& text, Variant* value) {
    // Conversion and destruction of the tree recurse once per level
    bool too_deep = false;
    json::parser_callback_t limit_depth = [&too_deep](int depth, json::parse_event_t event, json&) {
        if ((event == json::parse_event_t::object_start || event == json::parse_event_t::array_start) &&
            depth >= kMaxVariantDepth) {
            too_deep = true;
            return false;
        }
        return true;
    };
    json parsed = json::parse(text, limit_depth, /*allow_exceptions=*/false);
    if (too_deep) {
        return Status::InvalidArgument("JSON nesting exceeds " + std::to_string(kMaxVariantDepth) + " levels");
    }
    if (parsed.is_discarded()) {
        return Status::InvalidArgument("Error parsing JSON: '" +
                                       (text.size() > 64 ? text.substr(0, 64) + "..." : text) + "'");
    }
    *value = FromNlohmann(parsed);
    return Status::OK();
}

Variant SafeParse(const std::string& text) {
    Variant value;
    if (!Parse(text, &value).ok()) {
        return Variant::Null();
    }
    return value;
}

Variant ObjectKeys(const Variant& value) {
    if (!value.is_object()) {
        return Variant::Null();
    }
    Variant::Array keys;
    keys.reserve(value.size());
    for (const auto& [key, field] : value.object_fields()) {
        keys.push_back(Variant::String(key));
    }
    return Variant::MakeArray(std::move(keys));
}

} // namespace strata
