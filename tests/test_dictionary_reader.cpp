#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "autocomplete/query_engine.hpp"
#include "common/errors.hpp"
#include "dictionary/dictionary_reader.hpp"

using wac::DictionaryReader;
using wac::Term;

static void assert_true(bool cond, const char *msg)
{
    if (!cond)
    {
        std::cerr << "[FAIL] " << msg << "\n";
        std::exit(1);
    }
}

template <typename E, typename F>
static void assert_throws(F &&f, const char *msg)
{
    try
    {
        f();
    }
    catch (const E &)
    {
        return;
    }
    catch (const std::exception &e)
    {
        std::cerr << "[FAIL] " << msg << " (wrong exception: " << e.what() << ")\n";
        std::exit(1);
    }
    std::cerr << "[FAIL] " << msg << " (no exception)\n";
    std::exit(1);
}

static std::vector<Term> parse(const std::string &text)
{
    std::istringstream in(text);
    return DictionaryReader::readStream(in);
}

int main()
{
    // =========================================================
    // 1) plain lines, comments, blanks, CRLF, padding
    // =========================================================
    {
        const auto terms = parse("# demo\n"
                                 "3\tair\n"
                                 "\n"
                                 "   2.5\tbat\r\n"
                                 "4\t bell \n"
                                 "1e0\tboy\n");
        assert_true(terms.size() == 4, "four entries");
        assert_true(terms[0] == Term("air", 3), "air:3");
        assert_true(terms[1] == Term("bat", 2.5), "bat:2.5 with leading spaces and CRLF");
        assert_true(terms[2] == Term("bell", 4), "word is trimmed");
        assert_true(terms[3] == Term("boy", 1), "exponent notation");
    }

    // =========================================================
    // 2) optional count header
    // =========================================================
    {
        const auto terms = parse("2\n10\tcat\n20\tcar\n");
        assert_true(terms.size() == 2 && terms[1] == Term("car", 20), "count header is consumed");

        assert_throws<wac::DictionaryFormatError>([] { parse("3\n10\tcat\n20\tcar\n"); },
                                                  "count mismatch should throw");
        assert_throws<wac::DictionaryFormatError>([] { parse("10\tcat\n2\n"); },
                                                  "count after data is a malformed line");
        assert_true(parse("0\n").empty(), "count 0 with no entries is fine");
        assert_true(parse("").empty(), "empty input is an empty dictionary");
    }

    // =========================================================
    // 3) words with spaces and UTF-8
    // =========================================================
    {
        const auto terms = parse("5\tnew york\n7\tすみれ\n");
        assert_true(terms[0].getWord() == "new york", "inner spaces are kept");
        assert_true(terms[1].getWord() == "すみれ", "UTF-8 word");
    }

    // =========================================================
    // 4) decimal and exponent weights
    // =========================================================
    {
        const auto terms = parse("2.5\tair\n1e3\tbat\n.25\tbell\n0\tboy\n");
        assert_true(terms.size() == 4, "four weights parsed");
        assert_true(terms[0].getWeight() == 2.5, "decimal weight");
        assert_true(terms[1].getWeight() == 1000.0, "exponent weight");
        assert_true(terms[2].getWeight() == 0.25, "leading dot weight");
        assert_true(terms[3].getWeight() == 0.0, "zero weight");
    }

    // =========================================================
    // 5) malformed input
    // =========================================================
    {
        assert_throws<wac::DictionaryFormatError>([] { parse("abc\tair\n"); }, "non-numeric weight");
        assert_throws<wac::DictionaryFormatError>([] { parse("3x\tair\n"); }, "trailing garbage in weight");
        assert_throws<wac::DictionaryFormatError>([] { parse("3\t\n"); }, "empty word");
        assert_throws<wac::DictionaryFormatError>([] { parse("-1\tair\n"); }, "negative weight");
        assert_throws<wac::DictionaryFormatError>([] { parse("nan\tair\n"); }, "NaN weight");
        assert_throws<wac::DictionaryFormatError>([] { parse("1\tair\nbat\n"); }, "missing tab");
        assert_throws<wac::DictionaryFormatError>([] { parse("0x10\tair\n"); }, "hex weight");
        assert_throws<wac::DictionaryFormatError>([] { parse("inf\tair\n"); }, "infinite weight");
        assert_throws<wac::DictionaryFormatError>([] { parse("1e400\tair\n"); }, "weight out of range");
        assert_throws<wac::DictionaryFormatError>([] { parse("3,5\tair\n"); }, "comma decimal separator");

        try
        {
            parse("1\tair\n\n2 bat\n");
            assert_true(false, "line without tab should throw");
        }
        catch (const wac::DictionaryFormatError &e)
        {
            assert_true(std::string(e.what()).find("line 3") != std::string::npos,
                        "error message should carry the line number");
        }
    }

    // =========================================================
    // 6) file round trip into an engine
    // =========================================================
    {
        const std::string path = "dictionary_reader_test.txt";
        {
            std::ofstream out(path);
            out << "4\n3\tair\n2\tbat\n4\tbell\n1\tboy\n";
        }

        const wac::QueryEngine engine(DictionaryReader::readFile(path));
        assert_true(engine.topMatches("b", 2) == (std::vector<std::string>{"bell", "bat"}),
                    "engine built from file answers topMatches(b, 2)");
        assert_true(engine.weightOf("boy") == 1.0, "engine built from file answers weightOf(boy)");

        assert_throws<std::runtime_error>([] { DictionaryReader::readFile("does/not/exist.txt"); },
                                          "missing file should throw");

        // duplicates pass the reader but not the engine
        const auto dup = parse("1\tair\n2\tair\n");
        assert_true(dup.size() == 2, "reader keeps duplicates");
        assert_throws<wac::DuplicateWordError>([&] { wac::QueryEngine e(dup); }, "engine rejects duplicates");
    }

    std::cout << "[OK] DictionaryReader tests passed\n";
    return 0;
}
