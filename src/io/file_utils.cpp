#include <prompter/io/file_utils.h>

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <fstream>
#include <random>
#include <sstream>

namespace prompter::io {

namespace {

std::filesystem::path getTempPath(const std::filesystem::path& target) {
    static std::atomic<uint64_t> counter{0};
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream name;
    name << '.' << target.filename().string() << ".tmp-" << counter.fetch_add(1) << '-'
         << std::hex << rng();
    return target.parent_path() / name.str();
}

ErrorCode classify(const std::error_code& ec) {
    if (ec == std::errc::no_such_file_or_directory) {
        return ErrorCode::FileNotFound;
    }
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        return ErrorCode::PermissionDenied;
    }
    return ErrorCode::IOError;
}

} // namespace

Result<std::string> readFileContents(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        if (ec && ec != std::errc::no_such_file_or_directory) {
            return Error{classify(ec), "Cannot stat " + path.string() + ": " + ec.message()};
        }
        return Error{ErrorCode::FileNotFound, "File not found: " + path.string()};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error{ErrorCode::IOError, "Failed to open " + path.string()};
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return Error{ErrorCode::IOError, "Failed to read " + path.string()};
    }
    return buffer.str();
}

Result<void> atomicWrite(const std::filesystem::path& path, const std::string& content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{classify(ec), "Failed to create directory " +
                                           path.parent_path().string() + ": " + ec.message()};
        }
    }

    auto tempPath = getTempPath(path);
    {
        std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
        if (!file) {
            spdlog::error("[atomicWrite] Failed to create temp file: {}", tempPath.string());
            return Error{ErrorCode::PermissionDenied,
                         "Failed to create temp file " + tempPath.string()};
        }
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.flush();
        if (!file) {
            file.close();
            std::filesystem::remove(tempPath, ec);
            return Error{ErrorCode::WriteError, "Failed to write " + tempPath.string()};
        }
    }

    std::filesystem::rename(tempPath, path, ec);
    if (ec) {
        std::error_code removeEc;
        std::filesystem::remove(tempPath, removeEc);
        spdlog::error("[atomicWrite] Failed to rename {} to {}: {}", tempPath.string(),
                      path.string(), ec.message());
        return Error{ErrorCode::WriteError, "Failed to replace " + path.string() + ": " +
                                                ec.message()};
    }
    return Result<void>();
}

Result<TimePoint> fileModificationTime(const std::filesystem::path& path) {
    std::error_code ec;
    auto ftime = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return Error{classify(ec), "Cannot stat " + path.string() + ": " + ec.message()};
    }
    return std::chrono::time_point_cast<TimePoint::duration>(
        std::chrono::file_clock::to_sys(ftime));
}

Result<uint64_t> fileSize(const std::filesystem::path& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return Error{classify(ec), "Cannot stat " + path.string() + ": " + ec.message()};
    }
    return static_cast<uint64_t>(size);
}

} // namespace prompter::io
