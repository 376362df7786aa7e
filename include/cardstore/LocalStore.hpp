#pragma once

#include <atomic>
#include <filesystem>
#include <mutex>
#include <string>
#include "cardstore/Config.hpp"
#include "cardstore/Store.hpp"

namespace cardstore {

// JSON document on the local filesystem, with timestamped history files
// under <dir>/history. Falls back to cfg.fallbackFile when the primary
// location cannot be prepared; throws StartupError if neither works.
class LocalStore : public Store {
public:
    explicit LocalStore(const Config& cfg);

    Document read() override;
    bool write(const Document& doc) override;
    bool appendHistory(const Document& doc) override;
    std::string describe() const override;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path historyDir() const;
    bool usingFallback() const { return usingFallback_; }

private:
    std::filesystem::path path_;
    bool usingFallback_ = false;
    bool compressHistory_ = false;
    std::atomic<uint64_t> tmpCounter_{0};
    std::mutex historyMutex_;

    bool prepare(const std::filesystem::path& path);
    bool atomicWrite(const std::filesystem::path& path, const std::string& bytes);
};

} // namespace cardstore
