#include "readlines.hpp"

using namespace checkfiles;

bool
LineReader::next(Line& line) {
    if (pos_ >= source_.size()) {
        return false;
    }

    line.text.clear();
    line.eol.clear();
    line.line_number = ++line_number_;

    auto start = pos_;
    while (pos_ < source_.size()) {
        char c = source_[pos_];
        if (c == '\n') {
            line.text.assign(source_.substr(start, pos_ - start));
            line.eol = "\n";
            pos_++;
            return true;
        }
        if (c == '\r') {
            bool crlf = pos_ + 1 < source_.size() && source_[pos_ + 1] == '\n';
            if (crlf || breaks_ == LineBreaks::kAny) {
                line.text.assign(source_.substr(start, pos_ - start));
                line.eol = crlf ? "\r\n" : "\r";
                pos_ += crlf ? 2 : 1;
                return true;
            }
        }
        pos_++;
    }

    // Last line without a terminator
    line.text.assign(source_.substr(start));
    return true;
}
