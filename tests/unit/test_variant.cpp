/**
 * Variant Value Engine Tests
 *
 * Path parsing, total extraction, cast rules and JSON parsing.
 */

#include <gtest/gtest.h>
#include <strata/variant.h>

namespace strata {

class VariantTest : public ::testing::Test {
protected:
    Variant ParseOrDie(const std::string& text) {
        Variant value;
        Status status = Parse(text, &value);
        EXPECT_TRUE(status.ok()) << status.ToString();
        return value;
    }

    Variant Get(const Variant& value, const std::string& path_text) {
        VariantPath path;
        Status status = ParsePath(path_text, &path);
        EXPECT_TRUE(status.ok()) << status.ToString();
        return Extract(value, path);
    }
};

TEST_F(VariantTest, ParseKinds) {
    Variant value = ParseOrDie(R"({"a": 1, "b": 2.5, "c": "x", "d": true, "e": null, "f": [1, 2]})");
    ASSERT_TRUE(value.is_object());
    EXPECT_EQ(value.size(), 6u);
    EXPECT_TRUE(Get(value, "a").is_integer());
    EXPECT_EQ(Get(value, "a").integer_value(), 1);
    EXPECT_DOUBLE_EQ(Get(value, "b").double_value(), 2.5);
    EXPECT_FALSE(Get(value, "b").is_integer());
    EXPECT_EQ(Get(value, "c").string_value(), "x");
    EXPECT_TRUE(Get(value, "d").boolean_value());
    EXPECT_TRUE(Get(value, "e").is_null());
    EXPECT_EQ(Get(value, "f").size(), 2u);
}

TEST_F(VariantTest, StrictParseRejectsMalformed) {
    Variant value;
    EXPECT_TRUE(Parse("{\"a\": ", &value).IsInvalidArgument());
    EXPECT_TRUE(Parse("", &value).IsInvalidArgument());
}

TEST_F(VariantTest, SafeParseNeverFails) {
    EXPECT_TRUE(SafeParse("{not json").is_null());
    EXPECT_TRUE(SafeParse("").is_null());
    EXPECT_EQ(SafeParse("[1,2,3]").size(), 3u);
}

TEST_F(VariantTest, NestingDepthIsBounded) {
    auto nested = [](int depth) { return std::string(depth, '[') + std::string(depth, ']'); };

    Variant value = ParseOrDie(nested(kMaxVariantDepth));
    EXPECT_TRUE(value.is_array());

    Variant rejected;
    EXPECT_TRUE(Parse(nested(kMaxVariantDepth + 1), &rejected).IsInvalidArgument());
    EXPECT_TRUE(SafeParse(nested(kMaxVariantDepth + 1)).is_null());
    EXPECT_TRUE(SafeParse(nested(200000)).is_null());
    EXPECT_TRUE(SafeParse(std::string(200000, '{')).is_null());

    std::string objects;
    for (int i = 0; i < 1000; ++i) objects += "{\"k\":";
    objects += "1" + std::string(1000, '}');
    EXPECT_TRUE(SafeParse(objects).is_null());
}

TEST_F(VariantTest, PathSyntax) {
    Variant value = ParseOrDie(R"({"company": {"name": "Acme", "tags": ["a", "b"]}, "odd key": {"x": 7}})");
    EXPECT_EQ(Get(value, "company.name").string_value(), "Acme");
    EXPECT_EQ(Get(value, "company:name").string_value(), "Acme");
    EXPECT_EQ(Get(value, ":company.name").string_value(), "Acme");
    EXPECT_EQ(Get(value, "company.tags[1]").string_value(), "b");
    EXPECT_EQ(Get(value, "company['name']").string_value(), "Acme");
    EXPECT_EQ(Get(value, "\"odd key\".x").integer_value(), 7);

    Variant array = ParseOrDie(R"([{"id": 10}, {"id": 20}])");
    EXPECT_EQ(Get(array, "[1].id").integer_value(), 20);
}

TEST_F(VariantTest, MalformedPaths) {
    VariantPath path;
    EXPECT_TRUE(ParsePath("", &path).IsInvalidArgument());
    EXPECT_TRUE(ParsePath("a..b", &path).IsInvalidArgument());
    EXPECT_TRUE(ParsePath("a[", &path).IsInvalidArgument());
    EXPECT_TRUE(ParsePath("a[x]", &path).IsInvalidArgument());
    EXPECT_TRUE(ParsePath("\"unterminated", &path).IsInvalidArgument());
}

TEST_F(VariantTest, ExtractionIsTotal) {
    Variant value = ParseOrDie(R"({"a": {"b": [1, 2]}, "s": "text"})");
    EXPECT_TRUE(Get(value, "missing").is_null());
    EXPECT_TRUE(Get(value, "a.b[5]").is_null());
    EXPECT_TRUE(Get(value, "a.b.c").is_null());
    EXPECT_TRUE(Get(value, "s[0]").is_null());
    EXPECT_TRUE(Get(value, "s.x").is_null());
    EXPECT_TRUE(Get(Variant::Null(), "a.b").is_null());
}

TEST_F(VariantTest, CastNullToAnything) {
    for (auto kind : {VariantKind::kBoolean, VariantKind::kNumber, VariantKind::kString,
                      VariantKind::kArray, VariantKind::kObject}) {
        Variant result = Variant::Boolean(true);
        ASSERT_TRUE(Cast(Variant::Null(), kind, &result).ok());
        EXPECT_TRUE(result.is_null());
    }
}

TEST_F(VariantTest, CastStringToNumber) {
    Variant result;
    ASSERT_TRUE(Cast(Variant::String(" 42 "), VariantKind::kNumber, &result).ok());
    EXPECT_TRUE(result.is_integer());
    EXPECT_EQ(result.integer_value(), 42);

    ASSERT_TRUE(Cast(Variant::String("-1.5e2"), VariantKind::kNumber, &result).ok());
    EXPECT_DOUBLE_EQ(result.double_value(), -150.0);

    EXPECT_TRUE(Cast(Variant::String("12abc"), VariantKind::kNumber, &result).IsCastError());
    EXPECT_TRUE(Cast(Variant::String("0x10"), VariantKind::kNumber, &result).IsCastError());
    EXPECT_TRUE(Cast(Variant::String("nan"), VariantKind::kNumber, &result).IsCastError());
    EXPECT_TRUE(Cast(Variant::String(""), VariantKind::kNumber, &result).IsCastError());
}

TEST_F(VariantTest, CastToString) {
    Variant result;
    ASSERT_TRUE(Cast(Variant::Integer(-7), VariantKind::kString, &result).ok());
    EXPECT_EQ(result.string_value(), "-7");

    ASSERT_TRUE(Cast(Variant::Double(0.1), VariantKind::kString, &result).ok());
    EXPECT_EQ(result.string_value(), "0.1");

    ASSERT_TRUE(Cast(Variant::Boolean(false), VariantKind::kString, &result).ok());
    EXPECT_EQ(result.string_value(), "false");

    ASSERT_TRUE(Cast(ParseOrDie(R"({"b": 1, "a": [true]})"), VariantKind::kString, &result).ok());
    EXPECT_EQ(result.string_value(), R"({"a":[true],"b":1})");
}

TEST_F(VariantTest, CastToBooleanOnlyFromBoolean) {
    Variant result;
    ASSERT_TRUE(Cast(Variant::Boolean(true), VariantKind::kBoolean, &result).ok());
    EXPECT_TRUE(result.boolean_value());
    EXPECT_TRUE(Cast(Variant::Integer(1), VariantKind::kBoolean, &result).IsCastError());
    EXPECT_TRUE(Cast(Variant::String("true"), VariantKind::kBoolean, &result).IsCastError());

    ASSERT_TRUE(Cast(Variant::Boolean(true), VariantKind::kNumber, &result).ok());
    EXPECT_EQ(result.integer_value(), 1);
}

TEST_F(VariantTest, ContainersDoNotCastToScalars) {
    Variant result;
    EXPECT_TRUE(Cast(ParseOrDie("[1]"), VariantKind::kNumber, &result).IsCastError());
    EXPECT_TRUE(Cast(Variant::Integer(1), VariantKind::kArray, &result).IsCastError());
    EXPECT_TRUE(Cast(Variant::String("{}"), VariantKind::kObject, &result).IsCastError());
}

TEST_F(VariantTest, TryCastYieldsNull) {
    EXPECT_TRUE(TryCast(Variant::String("abc"), VariantKind::kNumber).is_null());
    EXPECT_EQ(TryCast(Variant::String("3"), VariantKind::kNumber).integer_value(), 3);
}

TEST_F(VariantTest, ObjectKeys) {
    Variant keys = ObjectKeys(ParseOrDie(R"({"z": 1, "a": 2})"));
    ASSERT_TRUE(keys.is_array());
    ASSERT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys.array_elements()[0].string_value(), "a");
    EXPECT_EQ(keys.array_elements()[1].string_value(), "z");
    EXPECT_TRUE(ObjectKeys(Variant::Integer(1)).is_null());
}

TEST_F(VariantTest, EqualityAndSharing) {
    Variant a = ParseOrDie(R"({"x": [1, 2.0, "s"]})");
    Variant b = ParseOrDie(R"({"x": [1, 2.0, "s"]})");
    EXPECT_EQ(a, b);
    EXPECT_NE(a, ParseOrDie(R"({"x": [1, 2.0]})"));

    // Copies share structure and stay equal
    Variant copy = a;
    EXPECT_EQ(copy, a);
    EXPECT_EQ(Variant::Integer(2), Variant::Double(2.0));
}

TEST_F(VariantTest, JsonRoundTrip) {
    const std::string text = R"({"a":[1,2.5,null,false],"b":{"c":"d"}})";
    EXPECT_EQ(ParseOrDie(text).ToJson(), text);
}

} // namespace strata

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
