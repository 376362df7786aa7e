#include "cardstore/LocalStore.hpp"

#include <chrono>
#include <fstream>
#include <functional>
#include <iostream>
#include <system_error>
#include <thread>
#include <zstd.h>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

bool compressZstd(const std::string& in, std::string& out, int level = 3) {
    size_t maxSize = ZSTD_compressBound(in.size());
    out.resize(maxSize);
    size_t written = ZSTD_compress(out.data(), maxSize, in.data(), in.size(), level);
    if (ZSTD_isError(written)) {
        std::cerr << "LocalStore: zstd compress failed: " << ZSTD_getErrorName(written) << "\n";
        return false;
    }
    out.resize(written);
    return true;
}

int64_t nowMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace

namespace cardstore {

LocalStore::LocalStore(const Config& cfg) : compressHistory_(cfg.compressHistory) {
    fs::path primary(cfg.dataFile);
    if (prepare(primary)) {
        path_ = primary;
        std::cout << "LocalStore: using " << path_.string() << std::endl;
        return;
    }

    fs::path fallback(cfg.fallbackFile);
    std::cerr << "LocalStore: cannot use " << primary.string()
              << ", falling back to " << fallback.string() << "\n";
    if (prepare(fallback)) {
        path_ = fallback;
        usingFallback_ = true;
        std::cerr << "LocalStore: using fallback " << path_.string() << " (NOT persistent)\n";
        return;
    }

    throw StartupError("no writable data file at " + primary.string() + " or " + fallback.string());
}

bool LocalStore::prepare(const fs::path& path) {
    std::error_code ec;
    if (!path.parent_path().empty()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            std::cerr << "LocalStore: failed to create dir " << path.parent_path().string()
                      << ": " << ec.message() << "\n";
            return false;
        }
    }
    bool present = fs::exists(path, ec);
    if (ec) {
        std::cerr << "LocalStore: cannot stat " << path.string() << ": " << ec.message() << "\n";
        return false;
    }
    if (present) return true;
    return atomicWrite(path, Document{}.toJson().dump(2));
}

bool LocalStore::atomicWrite(const fs::path& path, const std::string& bytes) {
    auto tmp = path;
    tmp += ".tmp." + std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id()))
         + "." + std::to_string(tmpCounter_.fetch_add(1));

    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            std::cerr << "LocalStore: cannot open temp file " << tmp.string() << "\n";
            return false;
        }
        ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        ofs.close();
        if (!ofs) {
            std::cerr << "LocalStore: write failed for " << tmp.string() << "\n";
            std::error_code ignored;
            fs::remove(tmp, ignored);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::cerr << "LocalStore: rename to " << path.string() << " failed: " << ec.message() << "\n";
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return false;
    }
    return true;
}

Document LocalStore::read() {
    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        std::cerr << "LocalStore: cannot open " << path_.string() << ", serving default document\n";
        return Document{};
    }
    auto j = json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        std::cerr << "LocalStore: " << path_.string() << " is not valid JSON, serving default document\n";
        return Document{};
    }
    return Document::fromJson(j);
}

bool LocalStore::write(const Document& doc) {
    if (!atomicWrite(path_, doc.toJson().dump(2))) {
        std::cerr << "LocalStore: write failed for " << path_.string() << "\n";
        return false;
    }
    return true;
}

fs::path LocalStore::historyDir() const {
    return path_.parent_path() / "history";
}

bool LocalStore::appendHistory(const Document& doc) {
    std::lock_guard<std::mutex> lk(historyMutex_);

    std::error_code ec;
    auto dir = historyDir();
    fs::create_directories(dir, ec);
    if (ec) {
        std::cerr << "LocalStore: failed to create history dir " << dir.string() << ": " << ec.message() << "\n";
        return false;
    }

    std::string payload = doc.toJson().dump(2);
    std::string ext = ".json";
    if (compressHistory_) {
        std::string compressed;
        if (!compressZstd(payload, compressed)) return false;
        payload.swap(compressed);
        ext = ".json.zst";
    }

    // Never overwrite an existing snapshot taken in the same millisecond.
    const std::string stem = "cards_" + std::to_string(nowMillis());
    fs::path target = dir / (stem + ext);
    for (int n = 1; fs::exists(target, ec); ++n) {
        target = dir / (stem + "_" + std::to_string(n) + ext);
    }
    return atomicWrite(target, payload);
}

std::string LocalStore::describe() const {
    return "file:" + path_.string() + (usingFallback_ ? " (fallback, not persistent)" : "");
}

} // namespace cardstore
