#pragma once

#include "core/obfuscator.hpp"
#include "core/obfuscator_map.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace httpobf {

/**
 * @brief Obfuscates request parameters in query strings and form data
 *
 * Input is a sequence of '&'-separated segments. For each "name=value"
 * segment whose percent-decoded name has an obfuscator, the value is
 * decoded, obfuscated and re-encoded; every other segment is copied
 * byte-for-byte. Names are never re-encoded.
 *
 * With a limit, at most `limit` chars of obfuscated output are produced.
 * If more would have been produced and a truncated indicator is set, the
 * indicator (formatted with the total input length) is appended after the
 * truncated output.
 *
 * Usage:
 *   auto obfuscator = RequestParameterObfuscator::builder()
 *       .with_parameter("password", Obfuscator::fixed_length(3))
 *       .case_insensitive_by_default()
 *       .with_parameter("token", Obfuscator::all())
 *       .limit_to(1024)
 *       .build();
 *
 * Immutable once built; safe for concurrent use.
 */
class RequestParameterObfuscator final : public Obfuscator {
public:
    class Builder;
    class LimitBuilder;

    [[nodiscard]] static Builder builder();

    // ---- Single values (no parsing, no percent-coding, no limit) -----------

    [[nodiscard]] std::string obfuscate_parameter(std::string_view name, std::string_view value) const;
    void obfuscate_parameter(std::string_view name, std::string_view value, std::string& destination) const;
    void obfuscate_parameter(std::string_view name, std::string_view value, CharSink& destination) const;

    /// value() of the result is the given value, unchanged.
    [[nodiscard]] Obfuscated<std::string> obfuscate_parameter_value(std::string_view name, std::string value) const;

    // ---- Accessors ---------------------------------------------------------

    [[nodiscard]] const ObfuscatorMap& obfuscators() const { return obfuscators_; }
    [[nodiscard]] Charset encoding() const { return encoding_; }
    [[nodiscard]] std::optional<size_t> limit() const { return limit_; }
    [[nodiscard]] const std::optional<std::string>& truncated_indicator() const { return truncated_indicator_; }

    [[nodiscard]] std::string describe() const override;

protected:
    void obfuscate_range(std::string_view text, CharSink& destination) const override;
    void obfuscate_stream(std::istream& input, CharSink& destination) const override;

private:
    explicit RequestParameterObfuscator(const Builder& builder);

    void obfuscate_segments(std::string_view text, CharSink& destination) const;

    /// Returns the number of chars read from input.
    size_t obfuscate_segments(std::istream& input, CharSink& destination) const;

    void obfuscate_key_value(std::string_view segment, CharSink& destination) const;

    void append_truncated_indicator(size_t total_length, CharSink& destination) const;

    ObfuscatorMap obfuscators_;
    Charset encoding_;
    std::optional<size_t> limit_;
    std::optional<std::string> truncated_indicator_;
};

/**
 * @brief Builder for RequestParameterObfuscator
 *
 * Parameters are case-sensitive by default. The default applies to
 * parameters added after it is changed.
 */
class RequestParameterObfuscator::Builder {
public:
    Builder() = default;

    /**
     * @throws NullArgumentError if obfuscator is null
     * @throws DuplicateKeyError if the parameter was already added with the same case sensitivity
     */
    Builder& with_parameter(std::string name, ObfuscatorPtr obfuscator);
    Builder& with_parameter(std::string name, ObfuscatorPtr obfuscator, CaseSensitivity case_sensitivity);

    Builder& case_sensitive_by_default();
    Builder& case_insensitive_by_default();

    /// Default: UTF-8.
    Builder& with_encoding(Charset encoding);

    /**
     * @brief Limit the obfuscated output to `limit` chars
     *
     * The returned LimitBuilder refers to this builder and must not outlive it.
     * @throws IllegalConfigurationError if limit is negative
     */
    LimitBuilder limit_to(int64_t limit);

    /// Apply f to this builder and return its result.
    template<typename F>
    decltype(auto) transform(F&& f) {
        return std::forward<F>(f)(*this);
    }

    [[nodiscard]] RequestParameterObfuscator build() const;

private:
    friend class RequestParameterObfuscator;
    friend class RequestParameterObfuscator::LimitBuilder;

    ObfuscatorMapBuilder obfuscators_;
    Charset encoding_ = Charset::UTF_8;
    std::optional<size_t> limit_;
    std::optional<std::string> truncated_indicator_{std::string(kDefaultTruncatedIndicator)};
};

/**
 * @brief Returned by Builder::limit_to() to configure the truncated indicator
 */
class RequestParameterObfuscator::LimitBuilder {
public:
    explicit LimitBuilder(Builder& builder) : builder_(builder) {}

    /**
     * @brief std::format template with one integer placeholder; nullopt disables it
     * @throws IllegalConfigurationError if the template cannot be formatted
     */
    LimitBuilder& with_truncated_indicator(std::optional<std::string> indicator);

    Builder& with_parameter(std::string name, ObfuscatorPtr obfuscator) {
        return builder_.with_parameter(std::move(name), std::move(obfuscator));
    }

    Builder& with_parameter(std::string name, ObfuscatorPtr obfuscator, CaseSensitivity case_sensitivity) {
        return builder_.with_parameter(std::move(name), std::move(obfuscator), case_sensitivity);
    }

    Builder& case_sensitive_by_default() { return builder_.case_sensitive_by_default(); }
    Builder& case_insensitive_by_default() { return builder_.case_insensitive_by_default(); }
    Builder& with_encoding(Charset encoding) { return builder_.with_encoding(encoding); }

    /// Back to the parameter builder.
    Builder& end() { return builder_; }

    [[nodiscard]] RequestParameterObfuscator build() const { return builder_.build(); }

private:
    Builder& builder_;
};

} // namespace httpobf
