#include "http/request_parameter_obfuscator.hpp"
#include "core/char_sink.hpp"
#include "core/error.hpp"
#include "core/percent_codec.hpp"

#include <format>

namespace httpobf {

RequestParameterObfuscator::RequestParameterObfuscator(const Builder& builder)
    : obfuscators_(builder.obfuscators_.build()),
      encoding_(builder.encoding_),
      limit_(builder.limit_),
      truncated_indicator_(builder.truncated_indicator_) {}

RequestParameterObfuscator::Builder RequestParameterObfuscator::builder() {
    return Builder();
}

// ============================================================================
// Parameter strings
// ============================================================================

void RequestParameterObfuscator::obfuscate_range(std::string_view text, CharSink& destination) const {
    if (!limit_) {
        obfuscate_segments(text, destination);
        return;
    }

    LimitedSink limited(destination, *limit_);
    obfuscate_segments(text, limited);
    if (limited.limit_exceeded()) {
        append_truncated_indicator(text.size(), destination);
    }
}

void RequestParameterObfuscator::obfuscate_stream(std::istream& input, CharSink& destination) const {
    if (!limit_) {
        obfuscate_segments(input, destination);
        return;
    }

    LimitedSink limited(destination, *limit_);
    const size_t total_length = obfuscate_segments(input, limited);
    if (limited.limit_exceeded()) {
        append_truncated_indicator(total_length, destination);
    }
}

void RequestParameterObfuscator::obfuscate_segments(std::string_view text, CharSink& destination) const {
    size_t start = 0;
    size_t index;
    while ((index = text.find('&', start)) != std::string_view::npos) {
        obfuscate_key_value(text.substr(start, index - start), destination);
        destination.append('&');
        start = index + 1;
    }
    // Final segment, no trailing '&'
    obfuscate_key_value(text.substr(start), destination);
}

size_t RequestParameterObfuscator::obfuscate_segments(std::istream& input, CharSink& destination) const {
    std::string segment;
    size_t count = 0;
    char c;
    while (read_char(input, c)) {
        ++count;
        if (c == '&') {
            obfuscate_key_value(segment, destination);
            segment.clear();
            destination.append('&');
        } else {
            segment += c;
        }
    }
    obfuscate_key_value(segment, destination);
    return count;
}

void RequestParameterObfuscator::obfuscate_key_value(std::string_view segment, CharSink& destination) const {
    const size_t eq = segment.find('=');
    if (eq == std::string_view::npos) {
        // Bare key, no value to obfuscate
        destination.append(segment);
        return;
    }

    const std::string name = percent::decode(segment.substr(0, eq), encoding_);
    const Obfuscator* obfuscator = obfuscators_.find(name);
    if (obfuscator == nullptr) {
        destination.append(segment);
        return;
    }

    const std::string value = percent::decode(segment.substr(eq + 1), encoding_);
    destination.append(segment.substr(0, eq + 1));
    destination.append(percent::encode(obfuscator->obfuscate_text(value), encoding_));
}

void RequestParameterObfuscator::append_truncated_indicator(size_t total_length, CharSink& destination) const {
    if (!truncated_indicator_) return;
    destination.append(std::vformat(*truncated_indicator_, std::make_format_args(total_length)));
}

// ============================================================================
// Single values
// ============================================================================

std::string RequestParameterObfuscator::obfuscate_parameter(std::string_view name, std::string_view value) const {
    return obfuscators_.get_or_none(name).obfuscate_text(value);
}

void RequestParameterObfuscator::obfuscate_parameter(std::string_view name, std::string_view value,
                                                     std::string& destination) const {
    obfuscators_.get_or_none(name).obfuscate_text(value, destination);
}

void RequestParameterObfuscator::obfuscate_parameter(std::string_view name, std::string_view value,
                                                     CharSink& destination) const {
    obfuscators_.get_or_none(name).obfuscate_text(value, destination);
}

Obfuscated<std::string> RequestParameterObfuscator::obfuscate_parameter_value(std::string_view name,
                                                                              std::string value) const {
    return obfuscators_.get_or_none(name).obfuscate_object(std::move(value));
}

std::string RequestParameterObfuscator::describe() const {
    return std::format("RequestParameterObfuscator[obfuscators={},encoding={},limit={},truncated_indicator={}]",
        obfuscators_.describe(),
        charset_to_string(encoding_),
        limit_ ? std::to_string(*limit_) : "none",
        truncated_indicator_ ? std::format("\"{}\"", *truncated_indicator_) : "none");
}

// ============================================================================
// Builder
// ============================================================================

RequestParameterObfuscator::Builder& RequestParameterObfuscator::Builder::with_parameter(
    std::string name, ObfuscatorPtr obfuscator) {
    obfuscators_.with_entry(std::move(name), std::move(obfuscator));
    return *this;
}

RequestParameterObfuscator::Builder& RequestParameterObfuscator::Builder::with_parameter(
    std::string name, ObfuscatorPtr obfuscator, CaseSensitivity case_sensitivity) {
    obfuscators_.with_entry(std::move(name), std::move(obfuscator), case_sensitivity);
    return *this;
}

RequestParameterObfuscator::Builder& RequestParameterObfuscator::Builder::case_sensitive_by_default() {
    obfuscators_.case_sensitive_by_default();
    return *this;
}

RequestParameterObfuscator::Builder& RequestParameterObfuscator::Builder::case_insensitive_by_default() {
    obfuscators_.case_insensitive_by_default();
    return *this;
}

RequestParameterObfuscator::Builder& RequestParameterObfuscator::Builder::with_encoding(Charset encoding) {
    encoding_ = encoding;
    return *this;
}

RequestParameterObfuscator::LimitBuilder RequestParameterObfuscator::Builder::limit_to(int64_t limit) {
    if (limit < 0) {
        throw IllegalConfigurationError(std::format("Limit must not be negative, got {}", limit));
    }
    limit_ = static_cast<size_t>(limit);
    return LimitBuilder(*this);
}

RequestParameterObfuscator RequestParameterObfuscator::Builder::build() const {
    return RequestParameterObfuscator(*this);
}

RequestParameterObfuscator::LimitBuilder& RequestParameterObfuscator::LimitBuilder::with_truncated_indicator(
    std::optional<std::string> indicator) {
    if (indicator) {
        try {
            size_t sample_total = 0;
            (void)std::vformat(*indicator, std::make_format_args(sample_total));
        } catch (const std::format_error& e) {
            throw IllegalConfigurationError(
                std::format("Invalid truncated indicator '{}': {}", *indicator, e.what()));
        }
    }
    builder_.truncated_indicator_ = std::move(indicator);
    return *this;
}

} // namespace httpobf
