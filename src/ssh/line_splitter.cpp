#include "line_splitter.hpp"

LineSplitter::LineSplitter(size_t max_line)
    : max_line_(max_line == 0 ? MAX_LINE_BYTES : max_line) {
}

void LineSplitter::feed(const char* data, size_t len) {
    compact();
    buffer_.append(data, len);
}

bool LineSplitter::next(std::string& line) {
    auto nl = buffer_.find('\n', pos_);
    size_t available = (nl == std::string::npos) ? buffer_.size() - pos_ : nl - pos_;

    if (nl == std::string::npos || available > max_line_) {
        if (available < max_line_) {
            return false;
        }
        // Overlong line: hand out a max_line_ piece
        line.assign(buffer_, pos_, max_line_);
        pos_ += max_line_;
        return true;
    }

    line.assign(buffer_, pos_, available);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    pos_ = nl + 1;
    return true;
}

bool LineSplitter::flush(std::string& line) {
    if (next(line)) {
        return true;
    }
    if (empty()) {
        return false;
    }
    line.assign(buffer_, pos_, std::string::npos);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    buffer_.clear();
    pos_ = 0;
    return true;
}

void LineSplitter::compact() {
    // Drop consumed bytes once they make up most of the buffer
    if (pos_ > 0 && pos_ * 2 >= buffer_.size()) {
        buffer_.erase(0, pos_);
        pos_ = 0;
    }
}
