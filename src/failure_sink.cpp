#include "keyprobe/failure_sink.hpp"
#include "keyprobe/error.hpp"
#include "keyprobe/logging.hpp"
#include <filesystem>

namespace fs = std::filesystem;

namespace keyprobe {

std::string failure_log_path(const std::string& report_path, const std::string& file_name) {
    return (fs::path(report_path).parent_path() / file_name).string();
}

FileFailureSink::FileFailureSink(const std::string& path)
    : path_(path),
      file_(path, std::ios::out | std::ios::app),
      recorded_(0) {
    if (!file_.is_open()) {
        throw IOError(ErrorCode::WRITE_FAILED, "Cannot open failure log: " + path_, "FileFailureSink");
    }
    LOG_DEBUG("Failure log opened: " + path_);
}

FileFailureSink::~FileFailureSink() {
    if (file_.is_open()) {
        file_.close();
        if (file_.fail()) {
            LOG_ERROR("Failed to flush failure log " + path_);
        }
    }
}

void FileFailureSink::record(const std::string& checksum) {
    if (!file_.is_open()) {
        throw IOError(ErrorCode::WRITE_FAILED, "Failure log already closed: " + path_, "record");
    }

    file_ << checksum << '\n';
    if (!file_) {
        throw IOError(ErrorCode::WRITE_FAILED, "Cannot write to failure log: " + path_, "record");
    }
    ++recorded_;
}

void FileFailureSink::close() {
    if (!file_.is_open()) {
        return;
    }

    file_.close();
    if (file_.fail()) {
        throw IOError(ErrorCode::WRITE_FAILED, "Cannot flush failure log: " + path_, "close");
    }
    LOG_DEBUG("Failure log closed after " + std::to_string(recorded_) + " entries");
}

} // namespace keyprobe
