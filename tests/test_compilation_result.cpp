#include <gtest/gtest.h>
#include "fineview/compilation_result.hpp"
#include "fineview/compiler_cache_entry.hpp"
#include "fineview/compiler_cache_result.hpp"
#include <memory>
#include <string>

using namespace fineview;

namespace {
struct SomeView {};
}  // namespace

TEST(CompilationResultTest, Successful) {
    auto result = CompilationResult::successful(typeid(SomeView), "generated");

    EXPECT_TRUE(result.isSuccessful());
    ASSERT_TRUE(result.compiledType().has_value());
    EXPECT_EQ(*result.compiledType(), std::type_index(typeid(SomeView)));
    EXPECT_EQ(result.compiledContent(), "generated");
    EXPECT_TRUE(result.failures().empty());
    EXPECT_NO_THROW(result.ensureSuccessful());
}

TEST(CompilationResultTest, FailedThrowsOnEnsureSuccessful) {
    auto result = CompilationResult::failed({
        {"Views/Index.cshtml", "The name 'Modle' does not exist", 4},
        {"", "Build aborted", 0},
    });

    EXPECT_FALSE(result.isSuccessful());
    EXPECT_FALSE(result.compiledType().has_value());

    try {
        result.ensureSuccessful();
        FAIL() << "Expected CompilationFailedException";
    } catch (const CompilationFailedException& e) {
        EXPECT_EQ(e.failures().size(), 2u);
        std::string message = e.what();
        EXPECT_NE(message.find("Views/Index.cshtml(4): The name 'Modle' does not exist"), std::string::npos);
        EXPECT_NE(message.find("Build aborted"), std::string::npos);
    }
}

TEST(CompilationResultTest, FailedWithoutDiagnosticsStillFails) {
    auto result = CompilationResult::failed({});
    EXPECT_FALSE(result.isSuccessful());
    EXPECT_EQ(result.failures().size(), 1u);
    EXPECT_THROW(result.ensureSuccessful(), CompilationFailedException);
}

// ============================================================================
// CompilerCacheResult
// ============================================================================

TEST(CompilerCacheResultTest, FileNotFoundIsShared) {
    const auto& a = CompilerCacheResult::fileNotFound();
    const auto& b = CompilerCacheResult::fileNotFound();

    EXPECT_EQ(&a, &b);
    EXPECT_FALSE(a.isFound());
    EXPECT_EQ(a.compilationResult(), nullptr);
}

TEST(CompilerCacheResultTest, FoundCarriesResultAndOrigin) {
    auto artifact = std::make_shared<const CompilationResult>(CompilationResult::successful(typeid(SomeView)));

    auto fresh = CompilerCacheResult::found(artifact, false);
    auto cached = CompilerCacheResult::found(artifact, true);

    EXPECT_TRUE(fresh.isFound());
    EXPECT_FALSE(fresh.isFromCache());
    EXPECT_TRUE(cached.isFromCache());
    EXPECT_EQ(fresh.compilationResult(), artifact);

    // Equality is by artifact identity
    EXPECT_EQ(fresh, cached);
    EXPECT_NE(fresh, CompilerCacheResult::fileNotFound());

    auto other = std::make_shared<const CompilationResult>(CompilationResult::successful(typeid(SomeView)));
    EXPECT_NE(fresh, CompilerCacheResult::found(other, false));
}

// ============================================================================
// CompilerCacheEntry
// ============================================================================

TEST(CompilerCacheEntryTest, RuntimeCompiledGoesStaleWithTrigger) {
    auto artifact = std::make_shared<const CompilationResult>(CompilationResult::successful(typeid(SomeView)));
    auto trigger = std::make_shared<FlagChangeTrigger>();
    auto entry = CompilerCacheEntry::runtimeCompiled(artifact, trigger);

    EXPECT_EQ(entry->result(), artifact);
    EXPECT_FALSE(entry->isPrecompiled());
    EXPECT_FALSE(entry->isNotFound());
    EXPECT_TRUE(entry->answers("views/anything.cshtml"));
    EXPECT_FALSE(entry->isStale());

    trigger->expire();
    EXPECT_TRUE(entry->isStale());
}

TEST(CompilerCacheEntryTest, PrecompiledNeverGoesStale) {
    auto artifact = std::make_shared<const CompilationResult>(CompilationResult::successful(typeid(SomeView)));
    auto entry = CompilerCacheEntry::precompiled(artifact);

    EXPECT_TRUE(entry->isPrecompiled());
    EXPECT_EQ(entry->trigger(), nullptr);
    EXPECT_FALSE(entry->isStale());
}

TEST(CompilerCacheEntryTest, NotFoundAnswersOnlyCheckedSpelling) {
    auto trigger = std::make_shared<FlagChangeTrigger>();
    auto entry = CompilerCacheEntry::notFound("Views/Index.cshtml", trigger);

    EXPECT_TRUE(entry->isNotFound());
    EXPECT_EQ(entry->checkedPath(), "Views/Index.cshtml");
    EXPECT_TRUE(entry->answers("Views/Index.cshtml"));
    EXPECT_FALSE(entry->answers("views/index.cshtml"));
}
