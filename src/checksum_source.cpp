#include "keyprobe/checksum_source.hpp"
#include "keyprobe/error.hpp"
#include "keyprobe/logging.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace keyprobe {

std::string trim(const std::string& s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto begin = std::find_if(s.begin(), s.end(), not_space);
    auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::optional<std::string> parse_checksum_line(const std::string& line) {
    std::string record = line;
    if (!record.empty() && record.back() == '\r') {
        record.pop_back();
    }

    auto comma = record.find(',');
    if (comma == std::string::npos || record.find(',', comma + 1) != std::string::npos) {
        return std::nullopt;
    }

    std::string checksum = trim(record.substr(comma + 1));
    if (checksum.empty()) {
        return std::nullopt;
    }
    return checksum;
}

std::vector<std::string> read_checksums(std::istream& in) {
    std::vector<std::string> checksums;
    std::string line;
    std::size_t line_number = 0;
    std::size_t skipped = 0;

    while (std::getline(in, line)) {
        ++line_number;
        if (auto checksum = parse_checksum_line(line)) {
            checksums.push_back(std::move(*checksum));
        } else {
            ++skipped;
        }
    }

    if (in.bad()) {
        throw IOError(ErrorCode::READ_FAILED,
                      "Read error after line " + std::to_string(line_number), "read_checksums");
    }

    LOG_DEBUG("Parsed " + std::to_string(checksums.size()) + " checksums, skipped " +
              std::to_string(skipped) + " lines");
    return checksums;
}

std::vector<std::string> load_checksums(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        throw FileNotFoundError(path, "load_checksums");
    }
    if (fs::is_directory(path, ec)) {
        throw IOError(ErrorCode::READ_FAILED, "Not a regular file: " + path, "load_checksums");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IOError(ErrorCode::READ_FAILED, "Cannot open: " + path, "load_checksums");
    }

    return read_checksums(file);
}

} // namespace keyprobe
