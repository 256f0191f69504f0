#include "http/header_obfuscator.hpp"

#include <format>

namespace httpobf {

HeaderObfuscator::Builder HeaderObfuscator::builder() {
    return Builder();
}

std::string HeaderObfuscator::obfuscate_header(std::string_view name, std::string_view value) const {
    return obfuscator(name).obfuscate_text(value);
}

void HeaderObfuscator::obfuscate_header(std::string_view name, std::string_view value,
                                        std::string& destination) const {
    obfuscator(name).obfuscate_text(value, destination);
}

void HeaderObfuscator::obfuscate_header(std::string_view name, std::string_view value,
                                        CharSink& destination) const {
    obfuscator(name).obfuscate_text(value, destination);
}

Obfuscated<std::string> HeaderObfuscator::obfuscate_header_value(std::string_view name, std::string value) const {
    return obfuscator(name).obfuscate_object(std::move(value));
}

const Obfuscator& HeaderObfuscator::obfuscator(std::string_view name) const {
    return obfuscators_.get_or_none(name);
}

std::string HeaderObfuscator::describe() const {
    return std::format("HeaderObfuscator[obfuscators={}]", obfuscators_.describe());
}

HeaderObfuscator::Builder& HeaderObfuscator::Builder::with_header(std::string name, ObfuscatorPtr obfuscator) {
    obfuscators_.with_entry(std::move(name), std::move(obfuscator), CaseSensitivity::CASE_INSENSITIVE);
    return *this;
}

HeaderObfuscator HeaderObfuscator::Builder::build() const {
    return HeaderObfuscator(obfuscators_.build());
}

} // namespace httpobf
