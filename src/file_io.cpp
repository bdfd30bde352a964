#include <shpkit/file_io.hpp>

#include <fstream>
#include <new>
#include <utility>

namespace shpkit {

codec_result read_file(const std::filesystem::path& path, std::vector<std::uint8_t>& out) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return codec_result::failure(codec_error::io_error,
            "Cannot open file: " + path.string());
    }

    const auto size = file.tellg();
    if (size < 0) {
        return codec_result::failure(codec_error::io_error,
            "Cannot determine file size: " + path.string());
    }
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> data;
    try {
        data.resize(static_cast<std::size_t>(size));
    } catch (const std::bad_alloc&) {
        return codec_result::failure(codec_error::internal_error,
            "File too large to load: " + path.string());
    }

    file.read(reinterpret_cast<char*>(data.data()), size);
    if (!file) {
        return codec_result::failure(codec_error::io_error,
            "Failed to read file: " + path.string());
    }

    out = std::move(data);
    return codec_result::success();
}

codec_result write_file(const std::filesystem::path& path, std::span<const std::uint8_t> data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return codec_result::failure(codec_error::io_error,
            "Cannot create file: " + path.string());
    }

    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    if (!file.good()) {
        return codec_result::failure(codec_error::io_error,
            "Failed to write file: " + path.string());
    }

    return codec_result::success();
}

} // namespace shpkit
