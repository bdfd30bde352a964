#ifndef SHPKIT_FILE_IO_HPP_
#define SHPKIT_FILE_IO_HPP_

#include <shpkit/shpkit_export.h>
#include <shpkit/types.hpp>

#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace shpkit {

/**
 * Read a whole file into memory.
 * @param path File to read
 * @param out Receives the file contents, untouched on failure
 * @return io_error if the file cannot be opened or read
 */
[[nodiscard]] SHPKIT_EXPORT codec_result read_file(const std::filesystem::path& path,
                                                    std::vector<std::uint8_t>& out);

/**
 * Write a byte buffer to a file, replacing any existing contents.
 * @return io_error if the file cannot be created or written
 */
[[nodiscard]] SHPKIT_EXPORT codec_result write_file(const std::filesystem::path& path,
                                                     std::span<const std::uint8_t> data);

} // namespace shpkit

#endif // SHPKIT_FILE_IO_HPP_
