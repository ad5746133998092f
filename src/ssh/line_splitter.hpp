#pragma once

#include <string>
#include <core/constants.hpp>

// Splits a byte stream arriving in arbitrary chunks into text lines.
//
// "\n" and "\r\n" both end a line; the terminator is not part of the line.
// Lines longer than max_line bytes are cut into max_line sized pieces so a
// remote process printing without newlines cannot grow the buffer unbounded.
class LineSplitter {
public:
    explicit LineSplitter(size_t max_line = MAX_LINE_BYTES);

    void feed(const char* data, size_t len);
    void feed(const std::string& data) { feed(data.data(), data.size()); }

    // Pop the next complete line. False if none is complete yet.
    bool next(std::string& line);

    // Pop the unterminated remainder (after the stream ended).
    // False if nothing is left.
    bool flush(std::string& line);

    bool empty() const { return buffer_.size() == pos_; }

private:
    std::string buffer_;
    size_t pos_ = 0;     // start of the unconsumed part of buffer_
    size_t max_line_;

    void compact();
};
