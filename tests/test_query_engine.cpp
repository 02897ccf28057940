#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "autocomplete/binary_search_autocomplete.hpp"
#include "autocomplete/brute_autocomplete.hpp"
#include "autocomplete/query_engine.hpp"
#include "common/errors.hpp"

using wac::Backend;
using wac::QueryEngine;
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

using Words = std::vector<std::string>;

int main()
{
    const std::vector<Term> example = {Term("air", 3), Term("bat", 2), Term("bell", 4), Term("boy", 1)};

    // =========================================================
    // 1) backend names
    // =========================================================
    {
        assert_true(wac::backendFromName("trie") == Backend::Trie, "trie name");
        assert_true(wac::backendFromName("sorted") == Backend::SortedArray, "sorted name");
        assert_true(wac::backendFromName("brute") == Backend::BruteForce, "brute name");
        assert_true(std::string(wac::backendName(Backend::SortedArray)) == "sorted", "backendName(SortedArray)");
        assert_true(std::string(wac::backendName(Backend::BruteForce)) == "brute", "backendName(BruteForce)");
        assert_true(std::string(wac::backendName(Backend::Trie)) == "trie", "backendName(Trie)");
        for (Backend b : {Backend::Trie, Backend::SortedArray, Backend::BruteForce})
            assert_true(wac::backendFromName(wac::backendName(b)) == b, "backend names round-trip");

        const auto brute = wac::makeAutocompletor(Backend::BruteForce, example);
        assert_true(dynamic_cast<const wac::BruteAutocomplete *>(brute.get()) != nullptr,
                    "BruteForce builds a brute-force backend");
        const auto sorted = wac::makeAutocompletor(Backend::SortedArray, example);
        assert_true(dynamic_cast<const wac::BinarySearchAutocomplete *>(sorted.get()) != nullptr,
                    "SortedArray builds a sorted-array backend");
        assert_throws<wac::InvalidArgumentError>([] { wac::backendFromName("tree"); }, "unknown backend name");
    }

    // =========================================================
    // 2) facade forwards the contract for each backend
    // =========================================================
    for (Backend b : {Backend::Trie, Backend::SortedArray, Backend::BruteForce})
    {
        const QueryEngine engine(example, b);
        assert_true(engine.backend() == b, "engine reports its backend");
        assert_true(!engine.hasReference(), "no reference backend by default");
        assert_true(engine.size() == 4, "engine size");
        assert_true(engine.topMatches("b", 2) == (Words{"bell", "bat"}), "engine topMatches(b, 2)");
        assert_true(engine.topMatches("a", 2) == (Words{"air"}), "engine topMatches(a, 2)");
        assert_true(engine.topMatch("b") == "bell", "engine topMatch(b)");
        assert_true(engine.weightOf("boy") == 1.0, "engine weightOf(boy)");
        assert_true(engine.weightOf("cat") == 0.0, "engine weightOf(cat)");
        assert_true(engine.topMatches("", 0).empty(), "engine k = 0");

        const auto ranked = engine.topMatchesWithWeights("", 4);
        assert_true(ranked.size() == 4 && ranked.front() == Term("bell", 4) && ranked.back() == Term("boy", 1),
                    "engine topMatchesWithWeights");

        assert_true(engine.crossCheck("b", 2), "crossCheck without reference is trivially true");

        assert_throws<wac::NullArgumentError>([&] { engine.topMatches(static_cast<const char *>(nullptr), 1); },
                                              "engine null prefix");
    }

    // =========================================================
    // 3) construction errors surface through the facade
    // =========================================================
    {
        assert_throws<wac::DuplicateWordError>(
            [] { QueryEngine e(Words{"a", "a"}, std::vector<double>{1, 2}); }, "engine duplicate word");
        assert_throws<wac::NegativeWeightError>(
            [] { QueryEngine e(Words{"a", "b"}, std::vector<double>{1, -2}); }, "engine negative weight");
        assert_throws<wac::InvalidArgumentError>(
            [] { QueryEngine e(Words{"a", "b"}, std::vector<double>{1}); }, "engine mismatched lengths");
        assert_throws<wac::DuplicateWordError>(
            [&] { QueryEngine e(std::vector<Term>{Term("x", 1), Term("x", 1)}, Backend::Trie, Backend::SortedArray); },
            "engine with reference rejects duplicates");
    }

    // =========================================================
    // 4) cross-checking against a reference backend
    // =========================================================
    {
        std::vector<Term> dict;
        const char *words[] = {"the", "then", "there", "these", "they", "this", "those", "thus",
                               "to", "too", "top", "toy", "a", "an", "and", "any"};
        for (size_t i = 0; i < sizeof(words) / sizeof(words[0]); ++i)
            dict.emplace_back(words[i], static_cast<double>((i * 7) % 5));

        const QueryEngine engine(dict, Backend::Trie, Backend::SortedArray);
        assert_true(engine.hasReference(), "reference backend present");

        const char *prefixes[] = {"", "t", "th", "the", "to", "a", "an", "x", "thesis"};
        for (const char *p : prefixes)
        {
            for (size_t k = 0; k <= 17; ++k)
                assert_true(engine.crossCheck(p, k), "trie and sorted backends agree");
        }

        // idempotent rebuild: same input, same answers
        const QueryEngine again(dict);
        for (const char *p : prefixes)
            assert_true(again.topMatches(p, 5) == engine.topMatches(p, 5), "rebuilding gives identical results");
    }

    // =========================================================
    // 5) backends that order ties differently still cross-check
    // =========================================================
    {
        const std::vector<Term> dict = {Term("z", 5), Term("zz", 10), Term("a", 5)};
        const QueryEngine engine(dict, Backend::Trie, Backend::SortedArray);
        const QueryEngine sortedOnly(dict, Backend::SortedArray);

        assert_true(engine.topMatches("", 2) == (Words{"zz", "z"}), "trie keeps its search order on the tie");
        assert_true(sortedOnly.topMatches("", 2) == (Words{"zz", "a"}), "sorted ranks the tie by word");
        for (size_t k = 0; k <= 4; ++k)
            assert_true(engine.crossCheck("", k), "tie order alone is not a disagreement");

        std::vector<Term> flat;
        for (int i = 0; i < 50; ++i)
            flat.emplace_back("k" + std::to_string(i), 2.0);
        const QueryEngine flatEngine(flat, Backend::Trie, Backend::BruteForce);
        for (const char *p : {"", "k", "k1", "k4", "k49"})
            for (size_t k : {1u, 5u, 60u})
                assert_true(flatEngine.crossCheck(p, k), "all-equal weights cross-check");
    }

    std::cout << "[OK] QueryEngine tests passed\n";
    return 0;
}
