#pragma once

#include "core/obfuscator.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace httpobf {

/**
 * @brief Immutable name -> obfuscator lookup
 *
 * Every entry carries its own case sensitivity. Case-sensitive entries are
 * matched exactly and take precedence; case-insensitive entries are matched
 * with ASCII case folding. A case-sensitive "Foo" and a case-insensitive
 * "foo" are independent entries.
 *
 * Built once by ObfuscatorMapBuilder; safe for concurrent reads.
 */
class ObfuscatorMap {
public:
    struct Entry {
        std::string name;
        ObfuscatorPtr obfuscator;
        CaseSensitivity case_sensitivity;
    };

    ObfuscatorMap() = default;

    /// nullptr if no entry matches.
    [[nodiscard]] const Obfuscator* find(std::string_view name) const;

    /// The matching obfuscator, or Obfuscator::none() if no entry matches.
    [[nodiscard]] const Obfuscator& get_or_none(std::string_view name) const;

    /// Entries in insertion order.
    [[nodiscard]] const std::vector<Entry>& entries() const { return entries_; }

    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

    /// e.g. {foo=all('*'), authorization(ci)=fixed_length(8, '*')}
    [[nodiscard]] std::string describe() const;

private:
    friend class ObfuscatorMapBuilder;

    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> case_sensitive_;
    std::unordered_map<std::string, size_t> case_insensitive_;  // keyed by lower-case name
};

/**
 * @brief Builder for ObfuscatorMap
 *
 * The default case sensitivity (initially CASE_SENSITIVE) is captured into
 * each entry when it is added and does not survive build().
 */
class ObfuscatorMapBuilder {
public:
    /**
     * @brief Add an entry using the current default case sensitivity
     * @throws NullArgumentError if obfuscator is null
     * @throws DuplicateKeyError if the name was already added with the same sensitivity
     */
    ObfuscatorMapBuilder& with_entry(std::string name, ObfuscatorPtr obfuscator);

    ObfuscatorMapBuilder& with_entry(std::string name, ObfuscatorPtr obfuscator,
                                     CaseSensitivity case_sensitivity);

    ObfuscatorMapBuilder& case_sensitive_by_default();
    ObfuscatorMapBuilder& case_insensitive_by_default();

    [[nodiscard]] CaseSensitivity default_case_sensitivity() const { return default_case_sensitivity_; }

    [[nodiscard]] ObfuscatorMap build() const;

private:
    ObfuscatorMap map_;
    CaseSensitivity default_case_sensitivity_ = CaseSensitivity::CASE_SENSITIVE;
};

} // namespace httpobf
