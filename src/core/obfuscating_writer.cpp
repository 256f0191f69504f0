#include "core/obfuscating_writer.hpp"
#include "core/error.hpp"
#include "core/obfuscator.hpp"
#include "core/utils.hpp"

#include <format>

namespace httpobf {

namespace {

void check_offset_and_length(size_t size, std::ptrdiff_t offset, std::ptrdiff_t length) {
    if (offset < 0 || length < 0
        || static_cast<size_t>(offset) > size
        || static_cast<size_t>(length) > size - static_cast<size_t>(offset)) {
        throw IndexOutOfRangeError(std::format(
            "Invalid offset {} / length {} for {} chars", offset, length, size));
    }
}

void check_start_and_end(size_t size, std::ptrdiff_t start, std::ptrdiff_t end) {
    if (start < 0 || end < start || static_cast<size_t>(end) > size) {
        throw IndexOutOfRangeError(std::format(
            "Invalid range [{}, {}) for {} chars", start, end, size));
    }
}

} // anonymous namespace

ObfuscatingWriter::ObfuscatingWriter(const Obfuscator& obfuscator, CharSink& destination)
    : obfuscator_(obfuscator), destination_(destination) {}

ObfuscatingWriter::~ObfuscatingWriter() {
    if (closed_) return;
    try {
        close();
    } catch (const std::exception& e) {
        utils::log::error(std::format("Closing obfuscating writer failed: {}", e.what()));
    }
}

void ObfuscatingWriter::write(char c) {
    ensure_open();
    buffer_.push_back(c);
}

void ObfuscatingWriter::write(std::string_view text) {
    ensure_open();
    buffer_.append(text);
}

void ObfuscatingWriter::write(std::string_view text, std::ptrdiff_t offset, std::ptrdiff_t length) {
    check_offset_and_length(text.size(), offset, length);
    ensure_open();
    buffer_.append(text.substr(static_cast<size_t>(offset), static_cast<size_t>(length)));
}

void ObfuscatingWriter::write(const char* chars, size_t size, std::ptrdiff_t offset, std::ptrdiff_t length) {
    if (chars == nullptr) {
        throw NullArgumentError("Character array must not be null");
    }
    check_offset_and_length(size, offset, length);
    ensure_open();
    buffer_.append(chars + offset, static_cast<size_t>(length));
}

ObfuscatingWriter& ObfuscatingWriter::append(char c) {
    write(c);
    return *this;
}

ObfuscatingWriter& ObfuscatingWriter::append(std::string_view text) {
    write(text);
    return *this;
}

ObfuscatingWriter& ObfuscatingWriter::append(std::string_view text, std::ptrdiff_t start, std::ptrdiff_t end) {
    check_start_and_end(text.size(), start, end);
    ensure_open();
    buffer_.append(text.substr(static_cast<size_t>(start), static_cast<size_t>(end - start)));
    return *this;
}

void ObfuscatingWriter::flush() {
    ensure_open();
}

void ObfuscatingWriter::close() {
    if (closed_) return;
    // Marked first so a failing obfuscation is not retried by the destructor
    closed_ = true;
    obfuscator_.obfuscate_text(std::string_view(buffer_), destination_);
    buffer_.clear();
    buffer_.shrink_to_fit();
    destination_.close();
}

void ObfuscatingWriter::ensure_open() const {
    if (closed_) {
        throw IOError("Writer is closed");
    }
}

} // namespace httpobf
