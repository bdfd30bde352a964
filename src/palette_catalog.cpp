#include <shpkit/palette_catalog.hpp>
#include <shpkit/file_io.hpp>

#include <algorithm>
#include <cctype>
#include <system_error>

namespace shpkit {

namespace {

bool has_pal_extension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".pal";
}

} // namespace

palette_catalog palette_catalog::from_directory(const std::filesystem::path& root) {
    palette_catalog catalog;

    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(
        root, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        return catalog;
    }

    for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        const auto& entry = *it;
        if (!entry.is_regular_file(ec) || !has_pal_extension(entry.path())) {
            continue;
        }

        std::vector<std::uint8_t> data;
        if (!read_file(entry.path(), data)) {
            continue;
        }
        palette pal;
        if (!palette::parse(data, pal)) {
            continue;
        }

        auto folder = entry.path().parent_path().lexically_relative(root).generic_string();
        if (folder == ".") {
            folder.clear();
        }
        catalog.add(std::move(folder), entry.path().stem().string(), pal);
    }

    return catalog;
}

void palette_catalog::add(std::string group, std::string name, const palette& pal) {
    auto& entries = groups_[std::move(group)];
    named_palette item{std::move(name), pal};
    auto pos = std::upper_bound(entries.begin(), entries.end(), item,
                                [](const named_palette& a, const named_palette& b) {
                                    return a.name < b.name;
                                });
    entries.insert(pos, std::move(item));
}

std::size_t palette_catalog::size() const noexcept {
    std::size_t total = 0;
    for (const auto& [group, entries] : groups_) {
        total += entries.size();
    }
    return total;
}

std::vector<named_palette> palette_catalog::flatten() const {
    std::vector<named_palette> out;
    out.reserve(size());
    for (const auto& [group, entries] : groups_) {
        out.insert(out.end(), entries.begin(), entries.end());
    }
    return out;
}

const named_palette* palette_catalog::find(std::string_view name) const noexcept {
    for (const auto& [group, entries] : groups_) {
        for (const auto& entry : entries) {
            if (entry.name == name) {
                return &entry;
            }
        }
    }
    return nullptr;
}

} // namespace shpkit
