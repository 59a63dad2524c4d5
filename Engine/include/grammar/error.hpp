/**
 * @file error.hpp
 * @brief Typed exceptions for parsing, rendering and hypervector grounding
 *
 * Every failure in the translation layer is a GrammarError subclass, so callers
 * can catch the whole family or one specific kind. Fields that describe the
 * failure are kept on the exception object, not only in what().
 */

#pragma once

#include <grammar/category.hpp>
#include <stdexcept>
#include <string>
#include <cstddef>
#include <utility>

namespace Glossa {

class GrammarError : public std::runtime_error {
public:
    enum class Kind {
        ParseFailed,
        LinearizationFailed,
        TypeMismatch,
        UnresolvedEntity,
        UnknownGrammar,
        InvalidCustomGrammar,
        VsaError,
        Ambiguous,
        Incomplete,
        GroundingIncomplete,
        UnsupportedLanguage
    };

    GrammarError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

/// No pattern matched the input.
class ParseFailed : public GrammarError {
public:
    explicit ParseFailed(std::string input)
        : GrammarError(Kind::ParseFailed, "parse failed for input: \"" + input + "\""),
          input_(std::move(input)) {}

    const std::string& input() const { return input_; }

private:
    std::string input_;
};

/// A renderer cannot handle the node it was given.
class LinearizationFailed : public GrammarError {
public:
    LinearizationFailed(Category cat, std::string grammar, std::string message)
        : GrammarError(Kind::LinearizationFailed,
                       std::string("linearization failed for category ") + category_name(cat) +
                           " in grammar \"" + grammar + "\": " + message),
          cat_(cat), grammar_(std::move(grammar)), detail_(std::move(message)) {}

    Category category() const { return cat_; }
    const std::string& grammar() const { return grammar_; }
    const std::string& detail() const { return detail_; }

private:
    Category cat_;
    std::string grammar_;
    std::string detail_;
};

/// Interlingua validation: a child has the wrong category for its slot.
class TypeMismatch : public GrammarError {
public:
    TypeMismatch(Category expected, Category actual)
        : GrammarError(Kind::TypeMismatch,
                       std::string("type mismatch: expected ") + category_name(expected) +
                           ", got " + category_name(actual)),
          expected_(expected), actual_(actual) {}

    Category expected() const { return expected_; }
    Category actual() const { return actual_; }

private:
    Category expected_;
    Category actual_;
};

class UnresolvedEntity : public GrammarError {
public:
    explicit UnresolvedEntity(std::string label)
        : GrammarError(Kind::UnresolvedEntity, "unresolved entity: \"" + label + "\""),
          label_(std::move(label)) {}

    const std::string& label() const { return label_; }

private:
    std::string label_;
};

class UnknownGrammar : public GrammarError {
public:
    explicit UnknownGrammar(std::string name)
        : GrammarError(Kind::UnknownGrammar, "unknown grammar: \"" + name + "\""),
          name_(std::move(name)) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

class InvalidCustomGrammar : public GrammarError {
public:
    explicit InvalidCustomGrammar(const std::string& message)
        : GrammarError(Kind::InvalidCustomGrammar, "invalid custom grammar: " + message) {}
};

/// Encoding or grounding failure in the hypervector layer.
class VsaError : public GrammarError {
public:
    enum class Reason {
        DimensionMismatch,
        EmptyBundle,
        EmptyCollection,
        IndexFailure
    };

    VsaError(Reason reason, const std::string& message)
        : GrammarError(Kind::VsaError, "VSA grounding error: " + message), reason_(reason) {}

    static VsaError dimension_mismatch(size_t expected, size_t actual) {
        return VsaError(Reason::DimensionMismatch,
                        "dimension mismatch: expected " + std::to_string(expected) +
                            ", got " + std::to_string(actual));
    }

    Reason reason() const { return reason_; }

private:
    Reason reason_;
};

/// Several readings matched; the highest-confidence one was taken.
class Ambiguous : public GrammarError {
public:
    Ambiguous(std::string fragment, size_t candidate_count)
        : GrammarError(Kind::Ambiguous,
                       "ambiguous parse: " + std::to_string(candidate_count) +
                           " possible interpretations for \"" + fragment + "\""),
          fragment_(std::move(fragment)), candidate_count_(candidate_count) {}

    const std::string& fragment() const { return fragment_; }
    size_t candidate_count() const { return candidate_count_; }

private:
    std::string fragment_;
    size_t candidate_count_;
};

/// Input stops before a required constituent.
class Incomplete : public GrammarError {
public:
    Incomplete(std::string fragment, std::string expected)
        : GrammarError(Kind::Incomplete,
                       "incomplete sentence: expected " + expected + " after \"" + fragment + "\""),
          fragment_(std::move(fragment)), expected_(std::move(expected)) {}

    const std::string& fragment() const { return fragment_; }
    const std::string& expected() const { return expected_; }

private:
    std::string fragment_;
    std::string expected_;
};

class GroundingIncomplete : public GrammarError {
public:
    GroundingIncomplete(size_t unresolved_count, std::string first_unresolved)
        : GrammarError(Kind::GroundingIncomplete,
                       "grounding incomplete: " + std::to_string(unresolved_count) +
                           " label(s) unresolved, first: \"" + first_unresolved + "\""),
          unresolved_count_(unresolved_count), first_unresolved_(std::move(first_unresolved)) {}

    size_t unresolved_count() const { return unresolved_count_; }
    const std::string& first_unresolved() const { return first_unresolved_; }

private:
    size_t unresolved_count_;
    std::string first_unresolved_;
};

class UnsupportedLanguage : public GrammarError {
public:
    explicit UnsupportedLanguage(std::string language)
        : GrammarError(Kind::UnsupportedLanguage, "unsupported language: \"" + language + "\""),
          language_(std::move(language)) {}

    const std::string& language() const { return language_; }

private:
    std::string language_;
};

} // namespace Glossa
