// src/dictionary/dictionary_reader.hpp
#pragma once

#include <istream>
#include <string>
#include <vector>

#include "term/term.hpp"

namespace wac
{

    // Weighted word list, UTF-8 text:
    //
    //   # comment
    //   3                 <- optional entry count (first data line only)
    //   3.0<TAB>air
    //   2<TAB>bat
    //       4<TAB>bell    <- surrounding spaces are trimmed
    //
    // Throws DictionaryFormatError ("line N: ...") on malformed lines, a
    // negative weight, or a count that does not match. Duplicate words are
    // left for the engine to reject.
    class DictionaryReader
    {
    public:
        static std::vector<Term> readStream(std::istream &in);
        static std::vector<Term> readFile(const std::string &path);
    };

} // namespace wac
