#pragma once

#include "core/char_sink.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace httpobf {

class Obfuscator;

/**
 * @brief Writer that buffers everything and obfuscates it on close()
 *
 * Key/value boundaries are not known until the text is complete, so no
 * output is produced before close(). close() runs the obfuscator once over
 * the buffered text into the destination, then closes the destination sink.
 *
 * - A second close() is a no-op.
 * - write/append/flush after close() raise IOError.
 * - Sub-range arguments are validated before the buffer is modified.
 * - The destructor closes an open writer and logs (never throws) a failure.
 *
 * A writer is one session: not thread-safe.
 */
class ObfuscatingWriter {
public:
    ObfuscatingWriter(const Obfuscator& obfuscator, CharSink& destination);
    ~ObfuscatingWriter();

    ObfuscatingWriter(const ObfuscatingWriter&) = delete;
    ObfuscatingWriter& operator=(const ObfuscatingWriter&) = delete;

    void write(char c);
    void write(std::string_view text);

    /// Write text[offset, offset + length).
    void write(std::string_view text, std::ptrdiff_t offset, std::ptrdiff_t length);

    /// Write chars[offset, offset + length) of an array of `size` chars.
    void write(const char* chars, size_t size, std::ptrdiff_t offset, std::ptrdiff_t length);

    ObfuscatingWriter& append(char c);
    ObfuscatingWriter& append(std::string_view text);

    /// Append text[start, end).
    ObfuscatingWriter& append(std::string_view text, std::ptrdiff_t start, std::ptrdiff_t end);

    /// Emits nothing; the text is obfuscated as a whole on close().
    void flush();

    void close();

    [[nodiscard]] bool is_closed() const { return closed_; }
    [[nodiscard]] size_t buffered_size() const { return buffer_.size(); }

private:
    void ensure_open() const;

    const Obfuscator& obfuscator_;
    CharSink& destination_;
    std::string buffer_;
    bool closed_ = false;
};

} // namespace httpobf
