#include <catch2/catch_test_macros.hpp>
#include "core/error.hpp"
#include "http/request_parameter_obfuscator.hpp"

#include <sstream>
#include <string>

using namespace httpobf;

namespace {

RequestParameterObfuscator create_obfuscator(RequestParameterObfuscator::Builder& builder) {
    const auto obfuscator = Obfuscator::all();
    return builder
        .with_parameter("foo", obfuscator)
        .with_parameter("no-value", obfuscator, CaseSensitivity::CASE_SENSITIVE)
        .build();
}

RequestParameterObfuscator create_obfuscator() {
    auto builder = RequestParameterObfuscator::builder();
    return create_obfuscator(builder);
}

RequestParameterObfuscator create_limited_obfuscator(std::optional<std::string> indicator,
                                                     bool set_indicator) {
    auto builder = RequestParameterObfuscator::builder();
    auto limited = builder.limit_to(12);
    if (set_indicator) {
        limited.with_truncated_indicator(std::move(indicator));
    }
    return create_obfuscator(builder);
}

std::string obfuscate_stream(const Obfuscator& obfuscator, const std::string& input) {
    std::istringstream in(input);
    std::string out;
    StringSink sink(out);
    obfuscator.obfuscate_text(in, sink);
    return out;
}

const std::string kInput = "foo=bar&hello=world&empty=&no-value";
const std::string kWrappedInput = "xfoo=bar&hello=world&empty=&no-valuey";
const std::string kExpected = "foo=***&hello=world&empty=&no-value";

} // anonymous namespace

// ============================================================================
// Unlimited
// ============================================================================

TEST_CASE("RequestParameterObfuscator: obfuscate full text", "[params]") {
    const auto obfuscator = create_obfuscator();
    CHECK(obfuscator.obfuscate_text(kInput) == kExpected);
}

TEST_CASE("RequestParameterObfuscator: obfuscate span", "[params]") {
    const auto obfuscator = create_obfuscator();
    CHECK(obfuscator.obfuscate_text(kWrappedInput, 1, kWrappedInput.size() - 1) == kExpected);

    std::string out;
    StringSink sink(out);
    obfuscator.obfuscate_text(kWrappedInput, 1, kWrappedInput.size() - 1, sink);
    CHECK(out == kExpected);
}

TEST_CASE("RequestParameterObfuscator: obfuscate short spans", "[params]") {
    const auto obfuscator = create_obfuscator();
    CHECK(obfuscator.obfuscate_text(kWrappedInput, 1, 7) == "foo=**");
    CHECK(obfuscator.obfuscate_text(kWrappedInput, 1, 4) == "foo");
    CHECK(obfuscator.obfuscate_text(kWrappedInput, 1, 1).empty());
}

TEST_CASE("RequestParameterObfuscator: obfuscate stream", "[params]") {
    const auto obfuscator = create_obfuscator();
    CHECK(obfuscate_stream(obfuscator, kInput) == kExpected);
    CHECK(obfuscate_stream(obfuscator, "").empty());
}

TEST_CASE("RequestParameterObfuscator: no-value parameter with a value", "[params]") {
    const auto obfuscator = create_obfuscator();
    CHECK(obfuscator.obfuscate_text("no-value=secret&foo") == "no-value=******&foo");
}

TEST_CASE("RequestParameterObfuscator: delimiters are preserved", "[params]") {
    const auto obfuscator = create_obfuscator();
    CHECK(obfuscator.obfuscate_text("&&foo=bar&&") == "&&foo=***&&");
    CHECK(obfuscator.obfuscate_text("&") == "&");
    CHECK(obfuscator.obfuscate_text("=") == "=");
    CHECK(obfuscator.obfuscate_text("").empty());
    CHECK(obfuscate_stream(obfuscator, "&&foo=bar&&") == "&&foo=***&&");
}

TEST_CASE("RequestParameterObfuscator: only the first '=' separates name and value", "[params]") {
    const auto obfuscator = create_obfuscator();
    CHECK(obfuscator.obfuscate_text("foo=a=b") == "foo=***");
}

TEST_CASE("RequestParameterObfuscator: names are decoded for lookup but copied verbatim", "[params]") {
    const auto obfuscator = create_obfuscator();
    CHECK(obfuscator.obfuscate_text("f%6Fo=bar") == "f%6Fo=***");
    CHECK(obfuscator.obfuscate_text("fo%6F=bar") == "fo%6F=***");
}

TEST_CASE("RequestParameterObfuscator: values are decoded and re-encoded", "[params]") {
    const auto obfuscator = RequestParameterObfuscator::builder()
        .with_parameter("foo", Obfuscator::portion(0, 2))
        .with_parameter("bar", Obfuscator::fixed_value("a b&c"))
        .build();

    // "a+b%26cd" decodes to "a b&cd" (6 chars)
    CHECK(obfuscator.obfuscate_text("foo=a+b%26cd") == "foo=****cd");
    CHECK(obfuscator.obfuscate_text("bar=x") == "bar=a+b%26c");
}

TEST_CASE("RequestParameterObfuscator: unmatched segments are never decoded", "[params]") {
    const auto obfuscator = create_obfuscator();
    CHECK(obfuscator.obfuscate_text("hello=%zz&x=%") == "hello=%zz&x=%");
}

TEST_CASE("RequestParameterObfuscator: malformed escapes in matched segments throw", "[params]") {
    const auto obfuscator = create_obfuscator();
    CHECK_THROWS_AS(obfuscator.obfuscate_text("foo=%zz"), DecodingError);
    CHECK_THROWS_AS(obfuscator.obfuscate_text("foo=abc%"), DecodingError);
    CHECK_THROWS_AS(obfuscator.obfuscate_text("%2=bar"), DecodingError);

    // Still usable afterwards
    CHECK(obfuscator.obfuscate_text(kInput) == kExpected);
}

// ============================================================================
// Encodings
// ============================================================================

TEST_CASE("RequestParameterObfuscator: UTF-8 values", "[params][encoding]") {
    const auto obfuscator = RequestParameterObfuscator::builder()
        .with_parameter("name", Obfuscator::portion(1, 0))
        .build();

    // The two-byte char is kept whole
    CHECK(obfuscator.obfuscate_text("name=%C3%A9t") == "name=%C3%A9*");
}

TEST_CASE("RequestParameterObfuscator: ISO-8859-1 values keep whole chars", "[params][encoding]") {
    const auto obfuscator = RequestParameterObfuscator::builder()
        .with_encoding(Charset::ISO_8859_1)
        .with_parameter("name", Obfuscator::portion(1, 0))
        .with_parameter("all", Obfuscator::all())
        .build();

    CHECK(obfuscator.obfuscate_text("name=%E9t") == "name=%E9*");
    CHECK(obfuscator.obfuscate_text("all=%E9t%E9") == "all=***");
}

TEST_CASE("RequestParameterObfuscator: ISO-8859-1 values", "[params][encoding]") {
    const auto obfuscator = RequestParameterObfuscator::builder()
        .with_encoding(Charset::ISO_8859_1)
        .with_parameter("name", Obfuscator::none())
        .build();

    CHECK(obfuscator.encoding() == Charset::ISO_8859_1);
    CHECK(obfuscator.obfuscate_text("name=%E9t%E9") == "name=%E9t%E9");
    CHECK(obfuscator.obfuscate_text("name=%C3%A9") == "name=%C3%A9");
}

TEST_CASE("RequestParameterObfuscator: US-ASCII cannot re-encode non-ASCII output", "[params][encoding]") {
    const auto obfuscator = RequestParameterObfuscator::builder()
        .with_encoding(Charset::US_ASCII)
        .with_parameter("name", Obfuscator::fixed_value("\xC3\xA9"))
        .build();

    CHECK_THROWS_AS(obfuscator.obfuscate_text("name=x"), EncodingError);
}

// ============================================================================
// Limited
// ============================================================================

TEST_CASE("RequestParameterObfuscator: limit with default indicator", "[params][limit]") {
    const auto obfuscator = create_limited_obfuscator(std::nullopt, false);
    const std::string expected = "foo=***&hell... (total: 35)";

    CHECK(obfuscator.obfuscate_text(kInput) == expected);
    CHECK(obfuscator.obfuscate_text(kWrappedInput, 1, kWrappedInput.size() - 1) == expected);
    CHECK(obfuscate_stream(obfuscator, kInput) == expected);
}

TEST_CASE("RequestParameterObfuscator: limit without indicator", "[params][limit]") {
    const auto obfuscator = create_limited_obfuscator(std::nullopt, true);
    const std::string expected = "foo=***&hell";

    CHECK(obfuscator.obfuscate_text(kInput) == expected);
    CHECK(obfuscator.obfuscate_text(kWrappedInput, 1, kWrappedInput.size() - 1) == expected);
    CHECK(obfuscate_stream(obfuscator, kInput) == expected);
}

TEST_CASE("RequestParameterObfuscator: limit with custom indicator", "[params][limit]") {
    const auto obfuscator = create_limited_obfuscator(" [{} chars]", true);
    CHECK(obfuscator.obfuscate_text(kInput) == "foo=***&hell [35 chars]");
}

TEST_CASE("RequestParameterObfuscator: output exactly at the limit is not truncated", "[params][limit]") {
    const auto obfuscator = RequestParameterObfuscator::builder()
        .with_parameter("foo", Obfuscator::all())
        .limit_to(7)
        .build();

    CHECK(obfuscator.obfuscate_text("foo=bar") == "foo=***");
    CHECK(obfuscator.obfuscate_text("foo=bar&") == "foo=***... (total: 8)");
}

TEST_CASE("RequestParameterObfuscator: limit 0", "[params][limit]") {
    const auto obfuscator = RequestParameterObfuscator::builder()
        .limit_to(0)
        .build();

    CHECK(obfuscator.obfuscate_text("").empty());
    CHECK(obfuscator.obfuscate_text("a") == "... (total: 1)");
}

TEST_CASE("RequestParameterObfuscator: limit beyond the output changes nothing", "[params][limit]") {
    auto builder = RequestParameterObfuscator::builder();
    builder.limit_to(1024);
    const auto obfuscator = create_obfuscator(builder);

    CHECK(obfuscator.obfuscate_text(kInput) == kExpected);
    CHECK(obfuscator.limit() == 1024u);
}

TEST_CASE("RequestParameterObfuscator: negative limit throws", "[params][limit]") {
    auto builder = RequestParameterObfuscator::builder();
    CHECK_THROWS_AS(builder.limit_to(-1), IllegalConfigurationError);
}

TEST_CASE("RequestParameterObfuscator: invalid indicator template throws", "[params][limit]") {
    auto builder = RequestParameterObfuscator::builder();
    auto limited = builder.limit_to(10);
    CHECK_THROWS_AS(limited.with_truncated_indicator("... (total: {"), IllegalConfigurationError);
    CHECK_THROWS_AS(limited.with_truncated_indicator("{} and {}"), IllegalConfigurationError);
    CHECK_NOTHROW(limited.with_truncated_indicator("no placeholder"));
}

// ============================================================================
// Single values
// ============================================================================

TEST_CASE("RequestParameterObfuscator: obfuscate_parameter case-sensitive", "[params][single]") {
    auto builder = RequestParameterObfuscator::builder();
    builder.case_sensitive_by_default();
    const auto obfuscator = create_obfuscator(builder);

    struct Row { const char* name; const char* value; const char* expected; };
    const Row rows[] = {
        {"foo", "bar", "***"},
        {"Foo", "bar", "bar"},
        {"hello", "world", "world"},
        {"no-value", "", ""},
    };

    for (const auto& row : rows) {
        INFO(row.name);
        CHECK(obfuscator.obfuscate_parameter(row.name, row.value) == row.expected);

        std::string out = "x";
        obfuscator.obfuscate_parameter(row.name, row.value, out);
        CHECK(out == std::string("x") + row.expected);

        std::ostringstream os;
        StreamSink sink(os);
        obfuscator.obfuscate_parameter(row.name, row.value, sink);
        CHECK(os.str() == row.expected);

        const auto obfuscated = obfuscator.obfuscate_parameter_value(row.name, row.value);
        CHECK(obfuscated.value() == row.value);
        CHECK(obfuscated.to_string() == row.expected);
    }
}

TEST_CASE("RequestParameterObfuscator: obfuscate_parameter case-insensitive", "[params][single]") {
    auto builder = RequestParameterObfuscator::builder();
    builder.case_insensitive_by_default();
    const auto obfuscator = create_obfuscator(builder);

    CHECK(obfuscator.obfuscate_parameter("foo", "bar") == "***");
    CHECK(obfuscator.obfuscate_parameter("Foo", "bar") == "***");
    CHECK(obfuscator.obfuscate_parameter("hello", "world") == "world");
    CHECK(obfuscator.obfuscate_parameter("no-value", "") == "");
    // Explicitly case-sensitive
    CHECK(obfuscator.obfuscate_parameter("No-Value", "abc") == "abc");
}

TEST_CASE("RequestParameterObfuscator: single values are not percent-coded", "[params][single]") {
    const auto obfuscator = RequestParameterObfuscator::builder()
        .with_parameter("foo", Obfuscator::none())
        .build();
    CHECK(obfuscator.obfuscate_parameter("foo", "a+b%20c") == "a+b%20c");
}

// ============================================================================
// Builder
// ============================================================================

TEST_CASE("RequestParameterObfuscator: builder rejects duplicates and nulls", "[params][builder]") {
    auto builder = RequestParameterObfuscator::builder();
    builder.with_parameter("foo", Obfuscator::all());
    CHECK_THROWS_AS(builder.with_parameter("foo", Obfuscator::all()), DuplicateKeyError);
    CHECK_THROWS_AS(builder.with_parameter("bar", nullptr), NullArgumentError);
    CHECK_NOTHROW(builder.with_parameter("foo", Obfuscator::all(), CaseSensitivity::CASE_INSENSITIVE));
}

TEST_CASE("RequestParameterObfuscator: limit builder forwards to the builder", "[params][builder]") {
    const auto obfuscator = RequestParameterObfuscator::builder()
        .limit_to(5)
            .with_truncated_indicator(std::nullopt)
            .with_parameter("foo", Obfuscator::all())
        .case_insensitive_by_default()
        .with_parameter("bar", Obfuscator::all())
        .build();

    CHECK(obfuscator.limit() == 5u);
    CHECK_FALSE(obfuscator.truncated_indicator().has_value());
    CHECK(obfuscator.obfuscate_text("BAR=xy") == "BAR=*");
}

TEST_CASE("RequestParameterObfuscator: transform", "[params][builder]") {
    auto builder = RequestParameterObfuscator::builder();
    int calls = 0;
    const std::string result = builder.transform([&](RequestParameterObfuscator::Builder& b) {
        ++calls;
        CHECK(&b == &builder);
        return std::string("result");
    });

    CHECK(result == "result");
    CHECK(calls == 1);
}

TEST_CASE("RequestParameterObfuscator: describe", "[params]") {
    const auto obfuscator = create_limited_obfuscator(std::nullopt, false);
    CHECK(obfuscator.describe() ==
        "RequestParameterObfuscator[obfuscators={foo=all('*'), no-value=all('*')},"
        "encoding=UTF-8,limit=12,truncated_indicator=\"... (total: {})\"]");
}

TEST_CASE("RequestParameterObfuscator: defaults", "[params]") {
    const auto obfuscator = RequestParameterObfuscator::builder().build();
    CHECK(obfuscator.obfuscators().empty());
    CHECK(obfuscator.encoding() == Charset::UTF_8);
    CHECK_FALSE(obfuscator.limit().has_value());
    CHECK(obfuscator.truncated_indicator() == std::string(kDefaultTruncatedIndicator));
    CHECK(obfuscator.obfuscate_text(kInput) == kInput);
}
