#ifndef KEYPROBE_CHECKSUM_SOURCE_HPP
#define KEYPROBE_CHECKSUM_SOURCE_HPP

#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace keyprobe {

// Token from one "<path>,<checksum>" record. Returns nothing unless the line
// splits into exactly two comma-separated fields and the second one is
// non-empty after trimming. A trailing '\r' is ignored.
std::optional<std::string> parse_checksum_line(const std::string& line);

// All tokens from a stream, in order, duplicates kept.
// Throws IOError if the stream goes bad while reading.
std::vector<std::string> read_checksums(std::istream& in);

// Throws FileNotFoundError when path does not exist, IOError when it cannot
// be read.
std::vector<std::string> load_checksums(const std::string& path);

std::string trim(const std::string& s);

} // namespace keyprobe

#endif // KEYPROBE_CHECKSUM_SOURCE_HPP
