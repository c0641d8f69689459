#pragma once

/*
    Split text into lines without losing the line terminators.

    A line ends at "\n", "\r\n" or a lone "\r". The terminator is kept next
    to the text so that content can be written back byte for byte. Diff text
    is read with LineBreaks::kNewline, where a lone "\r" is part of the
    line and only "\n" and "\r\n" end it. An empty
    input has zero lines, and "a\n" has a single line; there is no phantom
    empty line after a final terminator.
*/

#include <cstdint>
#include <string>
#include <string_view>

namespace checkfiles {

struct Line {
    uint32_t line_number = 0;

    std::string text;
    std::string eol;
};

enum class LineBreaks {
    kAny,
    kNewline,
};

// Streams lines out of a memory buffer one at a time. The buffer must
// outlive the reader.
class LineReader {
   public:
    explicit LineReader(std::string_view source, LineBreaks breaks = LineBreaks::kAny)
        : source_(source), breaks_(breaks) {
    }

    bool
    next(Line& line);

   private:
    std::string_view source_;
    LineBreaks breaks_;
    std::size_t pos_ = 0;
    uint32_t line_number_ = 0;
};

}  // namespace checkfiles
