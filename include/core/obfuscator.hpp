#pragma once

#include "core/char_sink.hpp"

#include <cstddef>
#include <format>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace httpobf {

class Obfuscator;
class ObfuscatingWriter;

using ObfuscatorPtr = std::shared_ptr<const Obfuscator>;

/**
 * @brief An original value paired with its obfuscated representation
 *
 * value() returns the original unchanged; to_string() and operator<< only
 * ever expose the obfuscated form, so an Obfuscated<T> can be passed to a
 * logger directly.
 */
template<typename T>
class Obfuscated {
public:
    Obfuscated(T value, std::string representation)
        : value_(std::move(value)), representation_(std::move(representation)) {}

    [[nodiscard]] const T& value() const { return value_; }
    [[nodiscard]] const std::string& to_string() const { return representation_; }

    friend std::ostream& operator<<(std::ostream& os, const Obfuscated& o) {
        return os << o.representation_;
    }

private:
    T value_;
    std::string representation_;
};

/**
 * @brief Capability that transforms a text value into a masked representation
 *
 * Strategies:
 * - none():         identity
 * - all():          every char replaced by a mask char
 * - fixed_length(): always n mask chars, hiding the original length
 * - fixed_value():  always the same replacement text
 * - portion():      keep a prefix and suffix, mask the middle
 * - hash():         SHA256 first 16 hex chars (deterministic pseudonymization)
 *
 * all() and portion() count UTF-8 chars, not bytes.
 *
 * Obfuscators are immutable and may be shared between threads and between
 * the engines that reference them.
 */
class Obfuscator {
public:
    virtual ~Obfuscator() = default;

    // ---- Text entry points -------------------------------------------------

    [[nodiscard]] std::string obfuscate_text(std::string_view text) const;

    /**
     * @brief Obfuscate the span [start, end) of text
     * @throws IndexOutOfRangeError if start > end or end > text.size()
     */
    [[nodiscard]] std::string obfuscate_text(std::string_view text, size_t start, size_t end) const;

    void obfuscate_text(std::string_view text, std::string& destination) const;
    void obfuscate_text(std::string_view text, CharSink& destination) const;
    void obfuscate_text(std::string_view text, size_t start, size_t end, CharSink& destination) const;

    /**
     * @brief Obfuscate the full contents of a character stream
     *
     * The input is always consumed to the end.
     * @throws IOError if reading from the input fails
     */
    void obfuscate_text(std::istream& input, CharSink& destination) const;

    /**
     * @brief Wrap a value; its string form is the obfuscated text
     */
    template<typename T>
    [[nodiscard]] Obfuscated<T> obfuscate_object(T value) const {
        std::string representation;
        if constexpr (std::is_convertible_v<const T&, std::string_view>) {
            representation = obfuscate_text(std::string_view(value));
        } else {
            representation = obfuscate_text(std::format("{}", value));
        }
        return Obfuscated<T>(std::move(value), std::move(representation));
    }

    /**
     * @brief Open a writer whose contents are obfuscated into destination
     *
     * Both this obfuscator and destination must outlive the writer.
     */
    [[nodiscard]] virtual std::unique_ptr<ObfuscatingWriter> stream_to(CharSink& destination) const;

    /// Human-readable description, e.g. "all('*')".
    [[nodiscard]] virtual std::string describe() const = 0;

    // ---- Strategies --------------------------------------------------------

    [[nodiscard]] static ObfuscatorPtr none();
    [[nodiscard]] static ObfuscatorPtr all(char mask = '*');
    [[nodiscard]] static ObfuscatorPtr fixed_length(size_t length, char mask = '*');
    [[nodiscard]] static ObfuscatorPtr fixed_value(std::string value);
    [[nodiscard]] static ObfuscatorPtr portion(size_t keep_at_start, size_t keep_at_end, char mask = '*');
    [[nodiscard]] static ObfuscatorPtr hash();

protected:
    /// Obfuscate an entire in-memory text.
    virtual void obfuscate_range(std::string_view text, CharSink& destination) const = 0;

    /// Obfuscate a stream. Default reads everything, then calls obfuscate_range.
    virtual void obfuscate_stream(std::istream& input, CharSink& destination) const;

    /**
     * @brief Validate a [start, end) span against a text length
     * @throws IndexOutOfRangeError
     */
    static void check_range(size_t length, size_t start, size_t end);

    /**
     * @brief Read one char; false at end of stream
     * @throws IOError if the stream reports a read error
     */
    static bool read_char(std::istream& input, char& c);
};

} // namespace httpobf
