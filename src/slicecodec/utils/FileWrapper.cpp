#include "FileWrapper.hpp"
#include "slicecodec/core/Exception.hpp"
#include "slicecodec/utils/ModuleLoggers.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>

namespace slicecodec {
namespace utils {

namespace {

std::string describeErrno(int err) {
    return err ? std::strerror(err) : "unknown error";
}

} // namespace

FileWrapper::FileWrapper(const std::string& filename, const char* mode)
    : path_(filename) {
    errno = 0;
    FILE* raw_file = std::fopen(filename.c_str(), mode);
    if (!raw_file) {
        int err = errno;
        bool for_write = std::strchr(mode, 'w') != nullptr || std::strchr(mode, 'a') != nullptr;
        core::ErrorCode code = core::ErrorCode::FileNotFound;
        if (err == EACCES || err == EPERM) {
            code = core::ErrorCode::FileAccessDenied;
        } else if (for_write && err != ENOENT) {
            code = core::ErrorCode::FileWriteError;
        }
        UTILS_ERROR("Failed to open file '{}' (mode {}): {}", filename, mode, describeErrno(err));
        SLICECODEC_THROW_FILE(fmt::format("Failed to open file: {}: {}", filename, describeErrno(err)),
                              filename, code);
    }
    file_.reset(raw_file);
}

size_t FileWrapper::read(void* buffer, size_t size) {
    if (!file_) {
        SLICECODEC_THROW_FILE("Read from closed file", path_, core::ErrorCode::FileReadError);
    }
    size_t got = std::fread(buffer, 1, size, file_.get());
    if (got < size && std::ferror(file_.get())) {
        SLICECODEC_THROW_FILE(fmt::format("Read error on {}: {}", path_, describeErrno(errno)),
                              path_, core::ErrorCode::FileReadError);
    }
    return got;
}

void FileWrapper::write(const void* data, size_t size) {
    if (!file_) {
        SLICECODEC_THROW_FILE("Write to closed file", path_, core::ErrorCode::FileWriteError);
    }
    if (size == 0) {
        return;
    }
    if (std::fwrite(data, 1, size, file_.get()) != size) {
        SLICECODEC_THROW_FILE(fmt::format("Write error on {}: {}", path_, describeErrno(errno)),
                              path_, core::ErrorCode::FileWriteError);
    }
}

void FileWrapper::seek(uint64_t offset) {
    if (!file_) {
        SLICECODEC_THROW_FILE("Seek on closed file", path_, core::ErrorCode::FileReadError);
    }
    if (std::fseek(file_.get(), static_cast<long>(offset), SEEK_SET) != 0) {
        SLICECODEC_THROW_FILE(fmt::format("Cannot seek to {} in {}", offset, path_),
                              path_, core::ErrorCode::FileReadError);
    }
}

void FileWrapper::flush() {
    if (file_ && std::fflush(file_.get()) != 0) {
        SLICECODEC_THROW_FILE(fmt::format("Flush failed on {}: {}", path_, describeErrno(errno)),
                              path_, core::ErrorCode::FileWriteError);
    }
}

void FileWrapper::close() {
    if (!file_) {
        return;
    }
    FILE* raw_file = file_.release();
    if (std::fclose(raw_file) != 0) {
        SLICECODEC_THROW_FILE(fmt::format("Close failed on {}: {}", path_, describeErrno(errno)),
                              path_, core::ErrorCode::FileWriteError);
    }
}

void FileWrapper::discard() {
    if (file_) {
        FILE* raw_file = file_.release();
        if (std::fclose(raw_file) != 0) {
            UTILS_WARN("Close failed while discarding {}: {}", path_, describeErrno(errno));
        }
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path_, ec)) {
        return;
    }
    if (!std::filesystem::remove(path_, ec) && ec) {
        UTILS_WARN("Cannot remove incomplete file {}: {}", path_, ec.message());
        return;
    }
    UTILS_WARN("Removed incomplete file {}", path_);
}

} // namespace utils
} // namespace slicecodec
