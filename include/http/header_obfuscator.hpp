#pragma once

#include "core/obfuscator.hpp"
#include "core/obfuscator_map.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace httpobf {

/**
 * @brief Obfuscates header values by header name
 *
 * Header names are always matched case-insensitively. Values are passed to
 * the obfuscator as-is: no parsing, no percent-coding, no limit. Headers
 * without an obfuscator are returned unchanged.
 */
class HeaderObfuscator {
public:
    class Builder;

    [[nodiscard]] static Builder builder();

    [[nodiscard]] std::string obfuscate_header(std::string_view name, std::string_view value) const;
    void obfuscate_header(std::string_view name, std::string_view value, std::string& destination) const;
    void obfuscate_header(std::string_view name, std::string_view value, CharSink& destination) const;

    /// value() of the result is the given value, unchanged.
    [[nodiscard]] Obfuscated<std::string> obfuscate_header_value(std::string_view name, std::string value) const;

    /// The obfuscator for a header, Obfuscator::none() if there is none.
    [[nodiscard]] const Obfuscator& obfuscator(std::string_view name) const;

    [[nodiscard]] const ObfuscatorMap& obfuscators() const { return obfuscators_; }

    [[nodiscard]] std::string describe() const;

private:
    explicit HeaderObfuscator(ObfuscatorMap obfuscators) : obfuscators_(std::move(obfuscators)) {}

    ObfuscatorMap obfuscators_;
};

class HeaderObfuscator::Builder {
public:
    /**
     * @throws NullArgumentError if obfuscator is null
     * @throws DuplicateKeyError if the header was already added (case-insensitive)
     */
    Builder& with_header(std::string name, ObfuscatorPtr obfuscator);

    template<typename F>
    decltype(auto) transform(F&& f) {
        return std::forward<F>(f)(*this);
    }

    [[nodiscard]] HeaderObfuscator build() const;

private:
    ObfuscatorMapBuilder obfuscators_;
};

} // namespace httpobf
