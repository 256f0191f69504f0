#include "core/obfuscator_map.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace httpobf {

// ============================================================================
// ObfuscatorMap
// ============================================================================

const Obfuscator* ObfuscatorMap::find(std::string_view name) const {
    if (entries_.empty()) return nullptr;

    if (!case_sensitive_.empty()) {
        const auto it = case_sensitive_.find(std::string(name));
        if (it != case_sensitive_.end()) {
            return entries_[it->second].obfuscator.get();
        }
    }
    if (!case_insensitive_.empty()) {
        const auto it = case_insensitive_.find(utils::to_lower(name));
        if (it != case_insensitive_.end()) {
            return entries_[it->second].obfuscator.get();
        }
    }
    return nullptr;
}

const Obfuscator& ObfuscatorMap::get_or_none(std::string_view name) const {
    if (const Obfuscator* obfuscator = find(name)) {
        return *obfuscator;
    }
    static const ObfuscatorPtr none = Obfuscator::none();
    return *none;
}

std::string ObfuscatorMap::describe() const {
    std::string result = "{";
    for (size_t i = 0; i < entries_.size(); ++i) {
        const auto& entry = entries_[i];
        if (i > 0) result += ", ";
        result += entry.name;
        if (entry.case_sensitivity == CaseSensitivity::CASE_INSENSITIVE) {
            result += "(ci)";
        }
        result += '=';
        result += entry.obfuscator->describe();
    }
    result += '}';
    return result;
}

// ============================================================================
// ObfuscatorMapBuilder
// ============================================================================

ObfuscatorMapBuilder& ObfuscatorMapBuilder::with_entry(std::string name, ObfuscatorPtr obfuscator) {
    return with_entry(std::move(name), std::move(obfuscator), default_case_sensitivity_);
}

ObfuscatorMapBuilder& ObfuscatorMapBuilder::with_entry(std::string name, ObfuscatorPtr obfuscator,
                                                       CaseSensitivity case_sensitivity) {
    if (!obfuscator) {
        throw NullArgumentError(std::format("Obfuscator for '{}' must not be null", name));
    }

    auto& index = (case_sensitivity == CaseSensitivity::CASE_SENSITIVE)
        ? map_.case_sensitive_
        : map_.case_insensitive_;
    std::string key = (case_sensitivity == CaseSensitivity::CASE_SENSITIVE)
        ? name
        : utils::to_lower(name);

    if (index.contains(key)) {
        throw DuplicateKeyError(std::format("Duplicate key: '{}' ({})",
            name, case_sensitivity_to_string(case_sensitivity)));
    }

    index.emplace(std::move(key), map_.entries_.size());
    map_.entries_.push_back({std::move(name), std::move(obfuscator), case_sensitivity});
    return *this;
}

ObfuscatorMapBuilder& ObfuscatorMapBuilder::case_sensitive_by_default() {
    default_case_sensitivity_ = CaseSensitivity::CASE_SENSITIVE;
    return *this;
}

ObfuscatorMapBuilder& ObfuscatorMapBuilder::case_insensitive_by_default() {
    default_case_sensitivity_ = CaseSensitivity::CASE_INSENSITIVE;
    return *this;
}

ObfuscatorMap ObfuscatorMapBuilder::build() const {
    return map_;
}

} // namespace httpobf
