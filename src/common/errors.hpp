// src/common/errors.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace wac
{

    class AutocompleteError : public std::runtime_error
    {
    public:
        explicit AutocompleteError(const std::string &what) : std::runtime_error(what) {}
    };

    // A required string or sequence argument was null.
    class NullArgumentError : public AutocompleteError
    {
    public:
        explicit NullArgumentError(const std::string &what) : AutocompleteError(what) {}
    };

    // Negative or NaN weight, empty word, mismatched input lengths.
    class InvalidArgumentError : public AutocompleteError
    {
    public:
        explicit InvalidArgumentError(const std::string &what) : AutocompleteError(what) {}
    };

    class NegativeWeightError : public InvalidArgumentError
    {
    public:
        explicit NegativeWeightError(const std::string &what) : InvalidArgumentError(what) {}
    };

    class DuplicateWordError : public AutocompleteError
    {
    public:
        explicit DuplicateWordError(const std::string &what) : AutocompleteError(what) {}
    };

    // Malformed dictionary text (message carries the line number).
    class DictionaryFormatError : public std::runtime_error
    {
    public:
        explicit DictionaryFormatError(const std::string &what) : std::runtime_error(what) {}
    };

} // namespace wac
