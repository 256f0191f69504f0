#include <catch2/catch_test_macros.hpp>
#include "core/error.hpp"
#include "http/header_obfuscator.hpp"

#include <sstream>

using namespace httpobf;

namespace {

HeaderObfuscator create_obfuscator() {
    return HeaderObfuscator::builder()
        .with_header("authorization", Obfuscator::all())
        .build();
}

} // anonymous namespace

TEST_CASE("HeaderObfuscator: obfuscate_header", "[headers]") {
    const auto obfuscator = create_obfuscator();

    struct Row { const char* name; const char* value; const char* expected; };
    const Row rows[] = {
        {"authorization", "value", "*****"},
        {"Authorization", "value", "*****"},
        {"AUTHORIZATION", "value", "*****"},
        {"other", "value", "value"},
        {"Other", "value", "value"},
    };

    for (const auto& row : rows) {
        INFO(row.name);
        CHECK(obfuscator.obfuscate_header(row.name, row.value) == row.expected);

        std::string out = "x";
        obfuscator.obfuscate_header(row.name, row.value, out);
        CHECK(out == std::string("x") + row.expected);

        std::ostringstream os;
        StreamSink sink(os);
        obfuscator.obfuscate_header(row.name, row.value, sink);
        CHECK(os.str() == row.expected);
    }
}

TEST_CASE("HeaderObfuscator: obfuscate_header_value keeps the original", "[headers]") {
    const auto obfuscator = create_obfuscator();

    const auto obfuscated = obfuscator.obfuscate_header_value("Authorization", "Bearer abc");
    CHECK(obfuscated.value() == "Bearer abc");
    CHECK(obfuscated.to_string() == "**********");

    const auto untouched = obfuscator.obfuscate_header_value("Accept", "text/html");
    CHECK(untouched.to_string() == "text/html");
}

TEST_CASE("HeaderObfuscator: values are not parsed or percent-coded", "[headers]") {
    const auto obfuscator = HeaderObfuscator::builder()
        .with_header("Cookie", Obfuscator::portion(2, 0))
        .build();

    CHECK(obfuscator.obfuscate_header("cookie", "a=%20&b=c") == "a=*******");
}

TEST_CASE("HeaderObfuscator: obfuscator lookup", "[headers]") {
    const auto obfuscator = create_obfuscator();
    CHECK(obfuscator.obfuscator("AUTHORIZATION").describe() == "all('*')");
    CHECK(obfuscator.obfuscator("other").describe() == "none()");
    CHECK(obfuscator.obfuscators().size() == 1);
}

TEST_CASE("HeaderObfuscator: duplicate names differing in case throw", "[headers]") {
    auto builder = HeaderObfuscator::builder();
    builder.with_header("Authorization", Obfuscator::all());
    CHECK_THROWS_AS(builder.with_header("authorization", Obfuscator::all()), DuplicateKeyError);
    CHECK_THROWS_AS(builder.with_header("Cookie", nullptr), NullArgumentError);
}

TEST_CASE("HeaderObfuscator: transform", "[headers]") {
    auto builder = HeaderObfuscator::builder();
    const auto obfuscator = builder
        .transform([](HeaderObfuscator::Builder& b) -> HeaderObfuscator::Builder& {
            return b.with_header("X-Api-Key", Obfuscator::fixed_length(3));
        })
        .build();

    CHECK(obfuscator.obfuscate_header("x-api-key", "secret") == "***");
}

TEST_CASE("HeaderObfuscator: describe", "[headers]") {
    CHECK(create_obfuscator().describe() == "HeaderObfuscator[obfuscators={authorization(ci)=all('*')}]");
}
