// src/dictionary/dictionary_reader.cpp
#include "dictionary/dictionary_reader.hpp"

#include <charconv>
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include "common/errors.hpp"

namespace wac
{

    static std::string_view trim(std::string_view s)
    {
        while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
            s.remove_prefix(1);
        while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r'))
            s.remove_suffix(1);
        return s;
    }

    static DictionaryFormatError format_error(size_t lineNo, const std::string &msg)
    {
        return DictionaryFormatError("line " + std::to_string(lineNo) + ": " + msg);
    }

    static bool parse_count(std::string_view s, size_t &out)
    {
        const char *begin = s.data();
        const char *end = s.data() + s.size();
        auto [ptr, ec] = std::from_chars(begin, end, out);
        return ec == std::errc() && ptr == end;
    }

    // Decimal or exponent form only; no hex, no leading '+', not locale bound.
    static bool parse_weight(std::string_view s, double &out)
    {
        const char *begin = s.data();
        const char *end = s.data() + s.size();
        double v = 0.0;
        auto [ptr, ec] = std::from_chars(begin, end, v);
        if (ec != std::errc() || ptr != end || !std::isfinite(v))
            return false;
        out = v;
        return true;
    }

    std::vector<Term> DictionaryReader::readStream(std::istream &in)
    {
        std::vector<Term> terms;
        std::string line;
        size_t lineNo = 0;
        bool sawData = false;
        bool hasCount = false;
        size_t declared = 0;

        while (std::getline(in, line))
        {
            ++lineNo;
            const std::string_view sv = trim(line);
            if (sv.empty() || sv.front() == '#')
                continue;

            const size_t tab = sv.find('\t');
            if (tab == std::string_view::npos)
            {
                if (!sawData && parse_count(sv, declared))
                {
                    hasCount = true;
                    sawData = true;
                    continue;
                }
                throw format_error(lineNo, "expected <weight><TAB><word>: " + std::string(sv));
            }
            sawData = true;

            const std::string_view weightField = trim(sv.substr(0, tab));
            const std::string_view word = trim(sv.substr(tab + 1));

            double weight = 0.0;
            if (!parse_weight(weightField, weight))
                throw format_error(lineNo, "invalid weight: " + std::string(weightField));
            if (word.empty())
                throw format_error(lineNo, "empty word");

            try
            {
                terms.push_back(Term::validated(std::string(word), weight));
            }
            catch (const InvalidArgumentError &e)
            {
                throw format_error(lineNo, e.what());
            }
        }

        if (in.bad())
            throw std::runtime_error("I/O error while reading dictionary");

        if (hasCount && declared != terms.size())
            throw DictionaryFormatError("declared " + std::to_string(declared) +
                                        " entries but found " + std::to_string(terms.size()));
        return terms;
    }

    std::vector<Term> DictionaryReader::readFile(const std::string &path)
    {
        std::ifstream in(path);
        if (!in)
            throw std::runtime_error("Failed to open: " + path);
        return readStream(in);
    }

} // namespace wac
