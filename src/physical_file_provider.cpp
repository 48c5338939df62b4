#include "fineview/physical_file_provider.hpp"
#include "fineview/path_utils.hpp"
#include <atomic>
#include <chrono>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fineview {

namespace {

struct FileState {
    bool exists = false;
    uint64_t size = 0;
    std::filesystem::file_time_type mtime{};

    bool operator==(const FileState&) const = default;
};

FileState statFile(const std::filesystem::path& path) {
    std::error_code ec;
    FileState state;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return state;
    }

    auto size = std::filesystem::file_size(path, ec);
    if (ec) return state;
    auto mtime = std::filesystem::last_write_time(path, ec);
    if (ec) return state;

    state.exists = true;
    state.size = size;
    state.mtime = mtime;
    return state;
}

using PollClock = std::chrono::steady_clock;

// Compares the current state of each watched file to the state captured
// when the trigger was issued
class PollingChangeTrigger : public ChangeTrigger {
public:
    PollingChangeTrigger(std::vector<std::filesystem::path> paths, std::chrono::milliseconds pollInterval)
        : paths_(std::move(paths)),
          pollInterval_(pollInterval),
          lastPoll_(PollClock::now().time_since_epoch().count()) {
        snapshot_.reserve(paths_.size());
        for (const auto& path : paths_) {
            snapshot_.push_back(statFile(path));
        }
    }

    [[nodiscard]] bool isExpired() const override {
        if (expired_.load(std::memory_order_acquire)) {
            return true;
        }

        if (pollInterval_.count() > 0) {
            auto now = PollClock::now().time_since_epoch().count();
            auto last = lastPoll_.load(std::memory_order_relaxed);
            auto interval = std::chrono::duration_cast<PollClock::duration>(pollInterval_).count();
            // One caller per interval does the stat calls
            if (now - last < interval ||
                !lastPoll_.compare_exchange_strong(last, now, std::memory_order_relaxed)) {
                return false;
            }
        }

        for (size_t i = 0; i < paths_.size(); ++i) {
            if (!(statFile(paths_[i]) == snapshot_[i])) {
                expired_.store(true, std::memory_order_release);
                return true;
            }
        }
        return false;
    }

private:
    std::vector<std::filesystem::path> paths_;
    std::vector<FileState> snapshot_;
    std::chrono::milliseconds pollInterval_;
    mutable std::atomic<PollClock::rep> lastPoll_;
    mutable std::atomic<bool> expired_{false};
};

}  // namespace

PhysicalFileProvider::PhysicalFileProvider(std::filesystem::path root,
                                           std::chrono::milliseconds pollInterval)
    : root_(std::move(root)), pollInterval_(pollInterval) {
    if (root_.empty()) {
        throw std::invalid_argument("PhysicalFileProvider: root directory must not be empty");
    }
    if (pollInterval_.count() < 0) {
        throw std::invalid_argument("PhysicalFileProvider: poll interval must not be negative");
    }
}

std::filesystem::path PhysicalFileProvider::resolve(const std::string& path) const {
    try {
        return root_ / normalizePath(path);
    } catch (const std::invalid_argument&) {
        return {};
    }
}

std::optional<FileInfo> PhysicalFileProvider::getFileInfo(const std::string& path) const {
    auto physical = resolve(path);
    if (physical.empty()) {
        return std::nullopt;
    }

    auto state = statFile(physical);
    if (!state.exists) {
        return std::nullopt;
    }

    FileInfo info;
    info.name = physical.filename().string();
    info.physicalPath = physical;
    info.length = state.size;
    info.lastModified = state.mtime;
    return info;
}

std::optional<std::string> PhysicalFileProvider::readFile(const std::string& path) const {
    auto physical = resolve(path);
    if (physical.empty()) {
        return std::nullopt;
    }

    std::ifstream file(physical, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

ChangeTriggerPtr PhysicalFileProvider::watch(const std::vector<std::string>& paths) {
    std::vector<std::filesystem::path> physical;
    physical.reserve(paths.size());
    for (const auto& path : paths) {
        auto resolved = resolve(path);
        if (!resolved.empty()) {
            physical.push_back(std::move(resolved));
        }
    }
    return std::make_shared<PollingChangeTrigger>(std::move(physical), pollInterval_);
}

}  // namespace fineview
