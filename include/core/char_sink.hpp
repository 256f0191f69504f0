#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

namespace httpobf {

/**
 * @brief Abstract interface for obfuscation output destinations
 *
 * Implementations are not required to be thread-safe; a sink is used by one
 * obfuscation call (or one ObfuscatingWriter session) at a time.
 */
class CharSink {
public:
    virtual ~CharSink() = default;

    /// Append text. Raises IOError if the underlying destination fails.
    virtual void append(std::string_view text) = 0;

    virtual void append(char c) {
        append(std::string_view(&c, 1));
    }

    /// Push buffered output to the underlying destination.
    virtual void flush() {}

    /// Called once by ObfuscatingWriter::close().
    virtual void close() { flush(); }
};

/**
 * @brief Appends to a caller-owned std::string
 */
class StringSink final : public CharSink {
public:
    explicit StringSink(std::string& out) : out_(out) {}

    void append(std::string_view text) override { out_.append(text); }
    void append(char c) override { out_.push_back(c); }

    [[nodiscard]] const std::string& str() const { return out_; }

private:
    std::string& out_;
};

/**
 * @brief Writes to a caller-owned std::ostream
 *
 * The stream is flushed on flush() and close() but never closed; the caller
 * owns it.
 */
class StreamSink final : public CharSink {
public:
    explicit StreamSink(std::ostream& out) : out_(out) {}

    void append(std::string_view text) override;
    void append(char c) override;
    void flush() override;

private:
    std::ostream& out_;
};

/**
 * @brief Forwards at most `limit` chars to another sink
 *
 * Anything beyond the limit is dropped and limit_exceeded() becomes true.
 * Writing exactly `limit` chars does not count as exceeding it.
 */
class LimitedSink final : public CharSink {
public:
    LimitedSink(CharSink& destination, size_t limit)
        : destination_(destination), remaining_(limit) {}

    void append(std::string_view text) override;
    void append(char c) override;
    void flush() override { destination_.flush(); }

    [[nodiscard]] bool limit_exceeded() const { return exceeded_; }

private:
    CharSink& destination_;
    size_t remaining_;
    bool exceeded_ = false;
};

} // namespace httpobf
