// src/autocomplete/autocompletor.hpp
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "term/term.hpp"

namespace wac
{

    // Query contract shared by every backend.
    //
    // Results come weight descending. The sorted and brute backends break
    // ties by word ascending (Term::RankOrder); the trie keeps the order its
    // search reached them in. The const char* overloads throw NullArgumentError on
    // nullptr. Implementations are immutable after construction, so const
    // calls may run concurrently.
    class Autocompletor
    {
    public:
        virtual ~Autocompletor() = default;

        std::vector<std::string> topMatches(std::string_view prefix, size_t k) const;
        std::vector<std::string> topMatches(const char *prefix, size_t k) const;

        std::vector<Term> topTerms(std::string_view prefix, size_t k) const;
        std::vector<Term> topTerms(const char *prefix, size_t k) const;

        std::string topMatch(std::string_view prefix) const;
        std::string topMatch(const char *prefix) const;

        double weightOf(std::string_view word) const;
        double weightOf(const char *word) const;

        size_t size() const { return doSize(); }

        // Pairs words[i] with weights[i]. InvalidArgumentError if the
        // lengths differ.
        static std::vector<Term> termsFrom(const std::vector<std::string> &words,
                                           const std::vector<double> &weights);

        // Raw-array form; NullArgumentError if either array is null while
        // n > 0, or if any words[i] is null.
        static std::vector<Term> termsFrom(const char *const *words,
                                           const double *weights,
                                           size_t n);

        // DuplicateWordError, NegativeWeightError, InvalidArgumentError
        // (NaN weight, empty word).
        static void validateTerms(const std::vector<Term> &terms);

    protected:
        virtual std::vector<Term> doTopTerms(std::string_view prefix, size_t k) const = 0;
        virtual std::string doTopMatch(std::string_view prefix) const = 0;
        virtual double doWeightOf(std::string_view word) const = 0;
        virtual size_t doSize() const = 0;
    };

} // namespace wac
