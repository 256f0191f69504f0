#include "core/obfuscator.hpp"
#include "core/error.hpp"
#include "core/obfuscating_writer.hpp"

#include <openssl/sha.h>

#include <format>
#include <iterator>

namespace httpobf {

// ============================================================================
// Entry points
// ============================================================================

std::string Obfuscator::obfuscate_text(std::string_view text) const {
    std::string result;
    result.reserve(text.size());
    StringSink sink(result);
    obfuscate_range(text, sink);
    return result;
}

std::string Obfuscator::obfuscate_text(std::string_view text, size_t start, size_t end) const {
    check_range(text.size(), start, end);
    return obfuscate_text(text.substr(start, end - start));
}

void Obfuscator::obfuscate_text(std::string_view text, std::string& destination) const {
    StringSink sink(destination);
    obfuscate_range(text, sink);
}

void Obfuscator::obfuscate_text(std::string_view text, CharSink& destination) const {
    obfuscate_range(text, destination);
}

void Obfuscator::obfuscate_text(std::string_view text, size_t start, size_t end,
                                CharSink& destination) const {
    check_range(text.size(), start, end);
    obfuscate_range(text.substr(start, end - start), destination);
}

void Obfuscator::obfuscate_text(std::istream& input, CharSink& destination) const {
    obfuscate_stream(input, destination);
}

std::unique_ptr<ObfuscatingWriter> Obfuscator::stream_to(CharSink& destination) const {
    return std::make_unique<ObfuscatingWriter>(*this, destination);
}

void Obfuscator::obfuscate_stream(std::istream& input, CharSink& destination) const {
    std::string buffer((std::istreambuf_iterator<char>(input)),
                       std::istreambuf_iterator<char>());
    if (input.bad()) {
        throw IOError("Failed to read from input stream");
    }
    obfuscate_range(buffer, destination);
}

void Obfuscator::check_range(size_t length, size_t start, size_t end) {
    if (start > end || end > length) {
        throw IndexOutOfRangeError(
            std::format("Invalid range [{}, {}) for text of length {}", start, end, length));
    }
}

bool Obfuscator::read_char(std::istream& input, char& c) {
    if (input.get(c)) return true;
    if (input.bad()) {
        throw IOError("Failed to read from input stream");
    }
    return false;
}

// ============================================================================
// Strategies
// ============================================================================

namespace {

/// Length of the UTF-8 sequence at text[pos]; 1 for a stray or truncated byte.
size_t utf8_sequence_length(std::string_view text, size_t pos) {
    const auto b0 = static_cast<unsigned char>(text[pos]);
    size_t len = 1;
    if ((b0 & 0xE0) == 0xC0) len = 2;
    else if ((b0 & 0xF0) == 0xE0) len = 3;
    else if ((b0 & 0xF8) == 0xF0) len = 4;

    if (pos + len > text.size()) return 1;
    for (size_t k = 1; k < len; ++k) {
        if ((static_cast<unsigned char>(text[pos + k]) & 0xC0) != 0x80) return 1;
    }
    return len;
}

size_t count_chars(std::string_view text) {
    size_t count = 0;
    for (size_t pos = 0; pos < text.size(); pos += utf8_sequence_length(text, pos)) {
        ++count;
    }
    return count;
}

/// Byte offset just past the first n chars of text.
size_t char_offset(std::string_view text, size_t n) {
    size_t pos = 0;
    while (n > 0 && pos < text.size()) {
        pos += utf8_sequence_length(text, pos);
        --n;
    }
    return pos;
}

class NoneObfuscator final : public Obfuscator {
public:
    std::string describe() const override { return "none()"; }

protected:
    void obfuscate_range(std::string_view text, CharSink& destination) const override {
        destination.append(text);
    }
};

class AllObfuscator final : public Obfuscator {
public:
    explicit AllObfuscator(char mask) : mask_(mask) {}

    std::string describe() const override { return std::format("all('{}')", mask_); }

protected:
    void obfuscate_range(std::string_view text, CharSink& destination) const override {
        destination.append(std::string(count_chars(text), mask_));
    }

private:
    char mask_;
};

class FixedLengthObfuscator final : public Obfuscator {
public:
    FixedLengthObfuscator(size_t length, char mask) : masked_(length, mask), mask_(mask) {}

    std::string describe() const override {
        return std::format("fixed_length({}, '{}')", masked_.size(), mask_);
    }

protected:
    void obfuscate_range(std::string_view, CharSink& destination) const override {
        destination.append(masked_);
    }

    // The input is irrelevant, but must still be consumed.
    void obfuscate_stream(std::istream& input, CharSink& destination) const override {
        char c;
        while (read_char(input, c)) {}
        destination.append(masked_);
    }

private:
    std::string masked_;
    char mask_;
};

class FixedValueObfuscator final : public Obfuscator {
public:
    explicit FixedValueObfuscator(std::string value) : value_(std::move(value)) {}

    std::string describe() const override { return std::format("fixed_value(\"{}\")", value_); }

protected:
    void obfuscate_range(std::string_view, CharSink& destination) const override {
        destination.append(value_);
    }

    void obfuscate_stream(std::istream& input, CharSink& destination) const override {
        char c;
        while (read_char(input, c)) {}
        destination.append(value_);
    }

private:
    std::string value_;
};

class PortionObfuscator final : public Obfuscator {
public:
    PortionObfuscator(size_t keep_at_start, size_t keep_at_end, char mask)
        : keep_at_start_(keep_at_start), keep_at_end_(keep_at_end), mask_(mask) {}

    std::string describe() const override {
        return std::format("portion({}, {}, '{}')", keep_at_start_, keep_at_end_, mask_);
    }

protected:
    void obfuscate_range(std::string_view text, CharSink& destination) const override {
        // Counted in UTF-8 chars so a multi-byte char is never split
        const size_t chars = count_chars(text);

        // Too short to keep anything without revealing it all
        if (chars <= keep_at_start_ + keep_at_end_) {
            destination.append(std::string(chars, mask_));
            return;
        }

        const size_t prefix_end = char_offset(text, keep_at_start_);
        const size_t suffix_start = char_offset(text, chars - keep_at_end_);
        destination.append(text.substr(0, prefix_end));
        destination.append(std::string(chars - keep_at_start_ - keep_at_end_, mask_));
        destination.append(text.substr(suffix_start));
    }

private:
    size_t keep_at_start_;
    size_t keep_at_end_;
    char mask_;
};

class HashObfuscator final : public Obfuscator {
public:
    std::string describe() const override { return "hash()"; }

protected:
    void obfuscate_range(std::string_view text, CharSink& destination) const override {
        unsigned char digest[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(text.data()), text.size(), digest);

        // First 16 hex chars (8 bytes)
        std::string result;
        result.reserve(16);
        for (int i = 0; i < 8; ++i) {
            result += std::format("{:02x}", digest[i]);
        }
        destination.append(result);
    }
};

} // anonymous namespace

ObfuscatorPtr Obfuscator::none() {
    static const ObfuscatorPtr instance = std::make_shared<NoneObfuscator>();
    return instance;
}

ObfuscatorPtr Obfuscator::all(char mask) {
    return std::make_shared<AllObfuscator>(mask);
}

ObfuscatorPtr Obfuscator::fixed_length(size_t length, char mask) {
    return std::make_shared<FixedLengthObfuscator>(length, mask);
}

ObfuscatorPtr Obfuscator::fixed_value(std::string value) {
    return std::make_shared<FixedValueObfuscator>(std::move(value));
}

ObfuscatorPtr Obfuscator::portion(size_t keep_at_start, size_t keep_at_end, char mask) {
    return std::make_shared<PortionObfuscator>(keep_at_start, keep_at_end, mask);
}

ObfuscatorPtr Obfuscator::hash() {
    static const ObfuscatorPtr instance = std::make_shared<HashObfuscator>();
    return instance;
}

} // namespace httpobf
