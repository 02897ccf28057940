// src/autocomplete/autocompletor.cpp
#include "autocomplete/autocompletor.hpp"

#include <cmath>
#include <unordered_set>

#include "common/errors.hpp"

namespace wac
{

    static std::string_view require(const char *s, const char *what)
    {
        if (s == nullptr)
            throw NullArgumentError(std::string("null ") + what);
        return std::string_view(s);
    }

    std::vector<std::string> Autocompletor::topMatches(std::string_view prefix, size_t k) const
    {
        std::vector<std::string> out;
        if (k == 0)
            return out;

        const auto terms = doTopTerms(prefix, k);
        out.reserve(terms.size());
        for (const auto &t : terms)
            out.push_back(t.getWord());
        return out;
    }

    std::vector<std::string> Autocompletor::topMatches(const char *prefix, size_t k) const
    {
        return topMatches(require(prefix, "prefix"), k);
    }

    std::vector<Term> Autocompletor::topTerms(std::string_view prefix, size_t k) const
    {
        if (k == 0)
            return {};
        return doTopTerms(prefix, k);
    }

    std::vector<Term> Autocompletor::topTerms(const char *prefix, size_t k) const
    {
        return topTerms(require(prefix, "prefix"), k);
    }

    std::string Autocompletor::topMatch(std::string_view prefix) const
    {
        return doTopMatch(prefix);
    }

    std::string Autocompletor::topMatch(const char *prefix) const
    {
        return doTopMatch(require(prefix, "prefix"));
    }

    double Autocompletor::weightOf(std::string_view word) const
    {
        return doWeightOf(word);
    }

    double Autocompletor::weightOf(const char *word) const
    {
        return doWeightOf(require(word, "word"));
    }

    std::vector<Term> Autocompletor::termsFrom(const std::vector<std::string> &words,
                                               const std::vector<double> &weights)
    {
        if (words.size() != weights.size())
            throw InvalidArgumentError("words and weights are not the same length (" +
                                       std::to_string(words.size()) + " vs " +
                                       std::to_string(weights.size()) + ")");

        std::vector<Term> terms;
        terms.reserve(words.size());
        for (size_t i = 0; i < words.size(); ++i)
            terms.emplace_back(words[i], weights[i]);
        return terms;
    }

    std::vector<Term> Autocompletor::termsFrom(const char *const *words,
                                               const double *weights,
                                               size_t n)
    {
        if (n > 0 && (words == nullptr || weights == nullptr))
            throw NullArgumentError("One or more arguments null");

        std::vector<Term> terms;
        terms.reserve(n);
        for (size_t i = 0; i < n; ++i)
        {
            if (words[i] == nullptr)
                throw NullArgumentError("null word at index " + std::to_string(i));
            terms.emplace_back(words[i], weights[i]);
        }
        return terms;
    }

    void Autocompletor::validateTerms(const std::vector<Term> &terms)
    {
        std::unordered_set<std::string> seen;
        seen.reserve(terms.size());

        for (const auto &t : terms)
        {
            if (t.getWord().empty())
                throw InvalidArgumentError("empty word");
            if (std::isnan(t.getWeight()))
                throw InvalidArgumentError("NaN weight for \"" + t.getWord() + "\"");
            if (t.getWeight() < 0)
                throw NegativeWeightError("Negative weight " + std::to_string(t.getWeight()) +
                                          " for \"" + t.getWord() + "\"");
            if (!seen.insert(t.getWord()).second)
                throw DuplicateWordError("Duplicate input term \"" + t.getWord() + "\"");
        }
    }

} // namespace wac
