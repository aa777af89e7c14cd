#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

namespace fconv::test_support {

// Owns a unique temporary directory and removes it on destruction.
class TempDirScope {
public:
    explicit TempDirScope(std::filesystem::path root) : root_(std::move(root)) {}
    TempDirScope(const TempDirScope&) = delete;
    TempDirScope& operator=(const TempDirScope&) = delete;
    TempDirScope(TempDirScope&& other) noexcept : root_(std::move(other.root_)) {
        other.root_.clear();
    }
    TempDirScope& operator=(TempDirScope&&) = delete;

    ~TempDirScope() {
        if (root_.empty())
            return;
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& path() const { return root_; }

    std::filesystem::path write(const std::string& name, const std::vector<uint8_t>& bytes) const {
        auto p = root_ / name;
        std::ofstream out(p, std::ios::binary);
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        return p;
    }

    // Regular files directly under the directory, sorted by name
    std::vector<std::filesystem::path> files() const {
        std::vector<std::filesystem::path> out;
        std::error_code ec;
        for (const auto& entry : std::filesystem::directory_iterator(root_, ec)) {
            if (entry.is_regular_file())
                out.push_back(entry.path());
        }
        std::sort(out.begin(), out.end());
        return out;
    }

    static TempDirScope unique_under(const std::string& base_name) {
        auto root = std::filesystem::temp_directory_path() / make_unique_component(base_name);
        std::error_code ec;
        std::filesystem::create_directories(root, ec);
        return TempDirScope(root);
    }

private:
    static std::string make_unique_component(const std::string& base_name) {
        // base + timestamp + thread id + counter stays unique across parallel shards
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
        auto counter = counter_.fetch_add(1, std::memory_order_relaxed);
        return base_name + "-" + std::to_string(now) + "-" + std::to_string(tid) + "-" +
               std::to_string(counter);
    }

    std::filesystem::path root_;
    static inline std::atomic<uint64_t> counter_{0};
};

} // namespace fconv::test_support
