// src/autocomplete/query_engine.hpp
#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "autocomplete/autocompletor.hpp"

namespace wac
{

    enum class Backend
    {
        Trie,
        SortedArray,
        BruteForce,
    };

    // "trie", "sorted", "brute". Unknown names throw InvalidArgumentError.
    Backend backendFromName(const std::string &name);
    const char *backendName(Backend b);

    std::unique_ptr<Autocompletor> makeAutocompletor(Backend b, const std::vector<Term> &terms);

    // Facade over one backend, optionally shadowed by a second (reference)
    // backend built from the same terms for cross-checking results.
    class QueryEngine
    {
    public:
        explicit QueryEngine(const std::vector<Term> &terms, Backend backend = Backend::Trie);
        QueryEngine(const std::vector<Term> &terms, Backend backend, Backend reference);
        QueryEngine(const std::vector<std::string> &words,
                    const std::vector<double> &weights,
                    Backend backend = Backend::Trie);

        std::vector<std::string> topMatches(std::string_view prefix, size_t k) const { return primary_->topMatches(prefix, k); }
        std::vector<std::string> topMatches(const char *prefix, size_t k) const { return primary_->topMatches(prefix, k); }

        std::vector<Term> topMatchesWithWeights(std::string_view prefix, size_t k) const { return primary_->topTerms(prefix, k); }
        std::vector<Term> topMatchesWithWeights(const char *prefix, size_t k) const { return primary_->topTerms(prefix, k); }

        std::string topMatch(std::string_view prefix) const { return primary_->topMatch(prefix); }
        std::string topMatch(const char *prefix) const { return primary_->topMatch(prefix); }

        double weightOf(std::string_view word) const { return primary_->weightOf(word); }
        double weightOf(const char *word) const { return primary_->weightOf(word); }

        size_t size() const { return primary_->size(); }
        Backend backend() const { return backend_; }

        bool hasReference() const { return reference_ != nullptr; }

        // True when the reference backend returns the same weight sequence
        // and a topMatch of equal weight, and every returned word lies under
        // prefix with its own weight. Always true without a reference.
        bool crossCheck(std::string_view prefix, size_t k) const;

    private:
        Backend backend_;
        std::unique_ptr<Autocompletor> primary_;
        std::unique_ptr<Autocompletor> reference_;
    };

} // namespace wac
