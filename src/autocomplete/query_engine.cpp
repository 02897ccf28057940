// src/autocomplete/query_engine.cpp
#include "autocomplete/query_engine.hpp"

#include "autocomplete/binary_search_autocomplete.hpp"
#include "autocomplete/brute_autocomplete.hpp"
#include "autocomplete/trie_autocomplete.hpp"
#include "common/errors.hpp"

#include <string>

namespace wac
{

    Backend backendFromName(const std::string &name)
    {
        if (name == "trie")
            return Backend::Trie;
        if (name == "sorted")
            return Backend::SortedArray;
        if (name == "brute")
            return Backend::BruteForce;
        throw InvalidArgumentError("unknown backend: " + name + " (expected trie|sorted|brute)");
    }

    const char *backendName(Backend b)
    {
        switch (b)
        {
        case Backend::Trie:
            return "trie";
        case Backend::SortedArray:
            return "sorted";
        case Backend::BruteForce:
            return "brute";
        }
        throw InvalidArgumentError("unknown backend id " + std::to_string(static_cast<int>(b)));
    }

    std::unique_ptr<Autocompletor> makeAutocompletor(Backend b, const std::vector<Term> &terms)
    {
        switch (b)
        {
        case Backend::Trie:
            return std::make_unique<TrieAutocomplete>(terms);
        case Backend::SortedArray:
            return std::make_unique<BinarySearchAutocomplete>(terms);
        case Backend::BruteForce:
            return std::make_unique<BruteAutocomplete>(terms);
        }
        throw InvalidArgumentError("unknown backend id " + std::to_string(static_cast<int>(b)));
    }

    QueryEngine::QueryEngine(const std::vector<Term> &terms, Backend backend)
        : backend_(backend), primary_(makeAutocompletor(backend, terms))
    {
    }

    QueryEngine::QueryEngine(const std::vector<Term> &terms, Backend backend, Backend reference)
        : backend_(backend),
          primary_(makeAutocompletor(backend, terms)),
          reference_(makeAutocompletor(reference, terms))
    {
    }

    QueryEngine::QueryEngine(const std::vector<std::string> &words,
                             const std::vector<double> &weights,
                             Backend backend)
        : QueryEngine(Autocompletor::termsFrom(words, weights), backend)
    {
    }

    bool QueryEngine::crossCheck(std::string_view prefix, size_t k) const
    {
        if (!reference_)
            return true;

        // tie order differs between backends, so compare weights and membership
        const auto got = primary_->topTerms(prefix, k);
        const auto want = reference_->topTerms(prefix, k);
        if (got.size() != want.size())
            return false;
        for (size_t i = 0; i < got.size(); ++i)
        {
            const std::string &w = got[i].getWord();
            if (got[i].getWeight() != want[i].getWeight())
                return false;
            if (w.compare(0, prefix.size(), prefix) != 0 || reference_->weightOf(w) != got[i].getWeight())
                return false;
        }

        const std::string a = primary_->topMatch(prefix);
        const std::string b = reference_->topMatch(prefix);
        return a.empty() == b.empty() && reference_->weightOf(a) == reference_->weightOf(b);
    }

} // namespace wac
