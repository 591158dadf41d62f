#ifndef KEYPROBE_FAILURE_SINK_HPP
#define KEYPROBE_FAILURE_SINK_HPP

#include <fstream>
#include <string>

namespace keyprobe {

// Append-only record of checksums whose lookup failed at the transport or
// server level.
class FailureSink {
public:
    virtual ~FailureSink() = default;

    virtual void record(const std::string& checksum) = 0;
};

// <directory of report_path>/<file_name>
std::string failure_log_path(const std::string& report_path, const std::string& file_name);

// One checksum per line, opened in append mode. Closed exactly once, either
// by close() or by the destructor.
class FileFailureSink : public FailureSink {
public:
    explicit FileFailureSink(const std::string& path);
    ~FileFailureSink() override;

    FileFailureSink(const FileFailureSink&) = delete;
    FileFailureSink& operator=(const FileFailureSink&) = delete;

    // Throws IOError on write failure or after close()
    void record(const std::string& checksum) override;

    // Flushes and closes; later calls do nothing. Throws IOError if the
    // final flush fails.
    void close();

    bool is_open() const { return file_.is_open(); }
    const std::string& path() const { return path_; }
    std::size_t recorded() const { return recorded_; }

private:
    std::string path_;
    std::ofstream file_;
    std::size_t recorded_;
};

} // namespace keyprobe

#endif // KEYPROBE_FAILURE_SINK_HPP
