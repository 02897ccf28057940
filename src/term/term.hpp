// src/term/term.hpp
#pragma once

#include <cstddef>
#include <string>

namespace wac
{

    // A dictionary entry. Weight is never negative once it has passed
    // validation (see Term::validated).
    class Term
    {
    public:
        Term() : weight_(0.0) {}
        Term(std::string word, double weight);

        // Throws NegativeWeightError / InvalidArgumentError.
        static Term validated(std::string word, double weight);

        const std::string &getWord() const { return word_; }
        double getWeight() const { return weight_; }

        // natural order: lexicographic by word (byte-wise)
        bool operator<(const Term &other) const { return word_ < other.word_; }
        bool operator==(const Term &other) const
        {
            return word_ == other.word_ && weight_ == other.weight_;
        }

        // weight ascending
        struct WeightOrder
        {
            bool operator()(const Term &a, const Term &b) const
            {
                return a.weight_ < b.weight_;
            }
        };

        // weight descending
        struct ReverseWeightOrder
        {
            bool operator()(const Term &a, const Term &b) const
            {
                return a.weight_ > b.weight_;
            }
        };

        // Result order shared by every backend: weight desc, then word asc.
        struct RankOrder
        {
            bool operator()(const Term &a, const Term &b) const
            {
                if (a.weight_ != b.weight_)
                    return a.weight_ > b.weight_;
                return a.word_ < b.word_;
            }
        };

        // Compares only the first prefixLength bytes of the two words.
        // Terms sharing those bytes are equivalent (compare() == 0).
        class PrefixOrder
        {
        public:
            explicit PrefixOrder(size_t prefixLength) : prefixLength_(prefixLength) {}

            int compare(const Term &a, const Term &b) const;
            bool operator()(const Term &a, const Term &b) const { return compare(a, b) < 0; }

            size_t prefixLength() const { return prefixLength_; }

        private:
            size_t prefixLength_;
        };

    private:
        std::string word_;
        double weight_;
    };

} // namespace wac
