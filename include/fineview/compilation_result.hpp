#pragma once

/**
 * @file compilation_result.hpp
 * @brief Output of compiling one view: the compiled type or the failures
 */

#include <optional>
#include <stdexcept>
#include <string>
#include <typeindex>
#include <vector>

namespace fineview {

// One diagnostic reported by the compiler
struct CompilationFailure {
    std::string sourcePath;
    std::string message;
    int line = 0;  // 1-based, 0 if unknown
};

// ============================================================================
// CompilationResult - the artifact produced by a compile callback
// ============================================================================
//
// The cache hands out results as std::shared_ptr<const CompilationResult>
// and never copies them, so callers can compare pointers to see whether two
// lookups produced the same artifact.
//
class CompilationResult {
public:
    [[nodiscard]] static CompilationResult successful(std::type_index compiledType,
                                                      std::string compiledContent = {});
    [[nodiscard]] static CompilationResult failed(std::vector<CompilationFailure> failures);

    // Type the view compiled to. nullopt for failed results.
    [[nodiscard]] const std::optional<std::type_index>& compiledType() const { return compiledType_; }

    // Generated source, empty when the compiler does not report it
    [[nodiscard]] const std::string& compiledContent() const { return compiledContent_; }

    [[nodiscard]] const std::vector<CompilationFailure>& failures() const { return failures_; }

    [[nodiscard]] bool isSuccessful() const { return failures_.empty() && compiledType_.has_value(); }

    // Throws CompilationFailedException if this result is not successful
    const CompilationResult& ensureSuccessful() const;

private:
    CompilationResult() = default;

    std::optional<std::type_index> compiledType_;
    std::string compiledContent_;
    std::vector<CompilationFailure> failures_;
};

// Thrown by CompilationResult::ensureSuccessful()
class CompilationFailedException : public std::runtime_error {
public:
    explicit CompilationFailedException(std::vector<CompilationFailure> failures);

    [[nodiscard]] const std::vector<CompilationFailure>& failures() const { return failures_; }

private:
    static std::string describe(const std::vector<CompilationFailure>& failures);

    std::vector<CompilationFailure> failures_;
};

}  // namespace fineview
