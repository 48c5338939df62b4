#include "fineview/compilation_result.hpp"
#include <sstream>

namespace fineview {

CompilationResult CompilationResult::successful(std::type_index compiledType,
                                                std::string compiledContent) {
    CompilationResult result;
    result.compiledType_ = compiledType;
    result.compiledContent_ = std::move(compiledContent);
    return result;
}

CompilationResult CompilationResult::failed(std::vector<CompilationFailure> failures) {
    if (failures.empty()) {
        failures.push_back({"", "Compilation failed without diagnostics", 0});
    }
    CompilationResult result;
    result.failures_ = std::move(failures);
    return result;
}

const CompilationResult& CompilationResult::ensureSuccessful() const {
    if (!isSuccessful()) {
        throw CompilationFailedException(failures_);
    }
    return *this;
}

CompilationFailedException::CompilationFailedException(std::vector<CompilationFailure> failures)
    : std::runtime_error(describe(failures)), failures_(std::move(failures)) {}

std::string CompilationFailedException::describe(const std::vector<CompilationFailure>& failures) {
    std::ostringstream oss;
    oss << "One or more compilation failures occurred:";
    for (const auto& failure : failures) {
        oss << "\n  ";
        if (!failure.sourcePath.empty()) {
            oss << failure.sourcePath;
            if (failure.line > 0) {
                oss << "(" << failure.line << ")";
            }
            oss << ": ";
        }
        oss << failure.message;
    }
    return oss.str();
}

}  // namespace fineview
