#include "persistence/FileUtils.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace DJ::FileUtils {

namespace {

auto fsyncFileDescriptor(int fd) -> Expected<void> {
    if (::fsync(fd) != 0) {
        return std::unexpected(Error{Error::Code::IoError, "fsync failed"});
    }
    return {};
}

auto fsyncDirectory(std::filesystem::path const& dir) -> Expected<void> {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return std::unexpected(Error{Error::Code::IoError, "open directory failed"});
    }
    auto result = fsyncFileDescriptor(fd);
    ::close(fd);
    return result;
}

} // namespace

auto writeTextFileAtomic(std::filesystem::path const& path, std::string_view text, bool fsyncData) -> Expected<void> {
    std::error_code ec;
    auto            parent = path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return std::unexpected(Error{Error::Code::IoError, "Failed to create directories: " + ec.message()});
        }
    }

    auto tmpPath = path;
    tmpPath += ".tmp";

    int fd = ::open(tmpPath.c_str(), O_CREAT | O_TRUNC | O_WRONLY, 0644);
    if (fd < 0) {
        return std::unexpected(Error{Error::Code::IoError, "Failed to open temp file " + tmpPath.string()});
    }

    std::size_t totalWritten = 0;
    while (totalWritten < text.size()) {
        auto const remaining = text.size() - totalWritten;
        auto       written   = ::write(fd, text.data() + totalWritten, remaining);
        if (written <= 0) {
            ::close(fd);
            removePathIfExists(tmpPath);
            return std::unexpected(Error{Error::Code::IoError, "Failed to write temp file"});
        }
        totalWritten += static_cast<std::size_t>(written);
    }

    if (fsyncData) {
        if (auto sync = fsyncFileDescriptor(fd); !sync) {
            ::close(fd);
            return sync;
        }
    }

    if (::close(fd) != 0) {
        return std::unexpected(Error{Error::Code::IoError, "Failed to close temp file"});
    }

    std::filesystem::rename(tmpPath, path, ec);
    if (ec) {
        removePathIfExists(tmpPath);
        return std::unexpected(Error{Error::Code::IoError, "Failed to rename temp file: " + ec.message()});
    }

    if (fsyncData && !parent.empty()) {
        return fsyncDirectory(parent);
    }
    return {};
}

auto readTextFile(std::filesystem::path const& path) -> Expected<std::string> {
    std::ifstream stream(path);
    if (!stream) {
        return std::unexpected(Error{Error::Code::NotFound, "File not found: " + path.string()});
    }
    std::ostringstream oss;
    oss << stream.rdbuf();
    if (!stream.good() && !stream.eof()) {
        return std::unexpected(Error{Error::Code::IoError, "Failed to read file: " + path.string()});
    }
    return oss.str();
}

void removePathIfExists(std::filesystem::path const& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

} // namespace DJ::FileUtils
