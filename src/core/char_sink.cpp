#include "core/char_sink.hpp"
#include "core/error.hpp"

#include <format>

namespace httpobf {

// ============================================================================
// StreamSink
// ============================================================================

void StreamSink::append(std::string_view text) {
    out_.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!out_) {
        throw IOError(std::format("Failed to write {} chars to output stream", text.size()));
    }
}

void StreamSink::append(char c) {
    out_.put(c);
    if (!out_) {
        throw IOError("Failed to write to output stream");
    }
}

void StreamSink::flush() {
    out_.flush();
    if (!out_) {
        throw IOError("Failed to flush output stream");
    }
}

// ============================================================================
// LimitedSink
// ============================================================================

void LimitedSink::append(std::string_view text) {
    if (text.size() <= remaining_) {
        destination_.append(text);
        remaining_ -= text.size();
        return;
    }
    if (remaining_ > 0) {
        destination_.append(text.substr(0, remaining_));
        remaining_ = 0;
    }
    exceeded_ = true;
}

void LimitedSink::append(char c) {
    if (remaining_ == 0) {
        exceeded_ = true;
        return;
    }
    destination_.append(c);
    --remaining_;
}

} // namespace httpobf
