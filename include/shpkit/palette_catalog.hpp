#ifndef SHPKIT_PALETTE_CATALOG_HPP_
#define SHPKIT_PALETTE_CATALOG_HPP_

#include <shpkit/shpkit_export.h>
#include <shpkit/palette.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace shpkit {

// ============================================================================
// Palette Catalog
// ============================================================================

struct named_palette {
    std::string name;
    palette colors;
};

/**
 * Named palettes grouped by folder (e.g. "RA2", "YR/units").
 * Groups iterate in lexicographic order; entries within a group by name.
 */
class SHPKIT_EXPORT palette_catalog {
public:
    using group_map = std::map<std::string, std::vector<named_palette>, std::less<>>;

    /**
     * Scan a directory tree for *.pal files.
     * Each palette is grouped by its parent folder relative to root ("" for
     * files directly in root) and named by its file stem. Files that cannot
     * be read or are shorter than 768 bytes are skipped.
     */
    [[nodiscard]] static palette_catalog from_directory(const std::filesystem::path& root);

    void add(std::string group, std::string name, const palette& pal);

    [[nodiscard]] const group_map& groups() const noexcept { return groups_; }
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept { return groups_.empty(); }

    /**
     * All palettes in group order.
     */
    [[nodiscard]] std::vector<named_palette> flatten() const;

    /**
     * First palette with the given name, or nullptr.
     */
    [[nodiscard]] const named_palette* find(std::string_view name) const noexcept;

private:
    group_map groups_;
};

} // namespace shpkit

#endif // SHPKIT_PALETTE_CATALOG_HPP_
