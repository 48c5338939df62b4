// View cache demo - compiles views from a directory and shows cache behavior
//
// Usage: view_cache_demo <root-dir> <view-path> [config-file]
//
// The "compiler" here just wraps the view source in a render function; the
// point is to watch the cache decide when to compile. Edit the view or any
// _ViewImports.cshtml above it while the demo waits, and the next lookup
// recompiles.

#include <fineview/compiler_cache.hpp>
#include <fineview/physical_file_provider.hpp>

#include <iostream>
#include <sstream>
#include <string>

namespace {

struct GeneratedView {};

fineview::CompilerCache::ResultPtr compileView(const fineview::RelativeFileInfo& file) {
    auto source = file.readContent();
    if (!source) {
        return std::make_shared<const fineview::CompilationResult>(fineview::CompilationResult::failed(
            {{file.relativePath(), "File could not be read", 0}}));
    }

    std::ostringstream generated;
    generated << "// generated from " << file.relativePath() << "\n";
    generated << "void render(std::ostream& out) {\n";
    std::istringstream lines(*source);
    std::string line;
    int lineNum = 0;
    while (std::getline(lines, line)) {
        ++lineNum;
        if (line.find("@error") != std::string::npos) {
            return std::make_shared<const fineview::CompilationResult>(fineview::CompilationResult::failed(
                {{file.relativePath(), "Unexpected @error directive", lineNum}}));
        }
        generated << "    out << R\"(" << line << ")\" << '\\n';\n";
    }
    generated << "}\n";

    return std::make_shared<const fineview::CompilationResult>(
        fineview::CompilationResult::successful(typeid(GeneratedView), generated.str()));
}

void lookup(fineview::CompilerCache& cache, const std::string& path) {
    auto result = cache.getOrAdd(path, compileView);
    if (result == fineview::CompilerCacheResult::fileNotFound()) {
        std::cout << path << ": not found\n";
        return;
    }
    std::cout << path << ": " << (result.isFromCache() ? "cached" : "compiled") << "\n";
    if (!result.isFromCache()) {
        std::cout << result.compilationResult()->compiledContent();
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <root-dir> <view-path> [config-file]\n";
        return 1;
    }

    fineview::CompilerCacheOptions options;
    if (argc > 3) {
        options = fineview::CompilerCacheOptions::load(argv[3]);
    }

    try {
        fineview::PhysicalFileProvider provider(argv[1]);
        fineview::CompilerCache cache(provider, {}, options);

        const std::string path = argv[2];
        lookup(cache, path);
        lookup(cache, path);

        std::cout << "Press Enter to look up again (Ctrl-D to quit)...\n";
        std::string line;
        while (std::getline(std::cin, line)) {
            try {
                lookup(cache, path);
            } catch (const fineview::CompilationFailedException& e) {
                std::cerr << e.what() << "\n";
            }
        }

        auto stats = cache.stats();
        std::cout << "hits: " << stats.hits << ", misses: " << stats.misses
                  << ", compilations: " << stats.compilations << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
