#include <shpkit/shpkit.hpp>

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <command> [arguments]\n";
    std::cerr << "Inspects and edits TS/RA2 SHP sprites.\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  info <shp>                                 Show sprite and frame headers\n";
    std::cerr << "  new <w> <h> <frames> <out.shp>             Create a blank sprite\n";
    std::cerr << "  export <shp> <pal> <frame> <out.png>       Export one frame as PNG\n";
    std::cerr << "         [-b brightness]\n";
    std::cerr << "  import <shp> <pal> <image> <frame> <x> <y> <out.shp>\n";
    std::cerr << "         [-s scale]                          Paste an image into a frame\n";
    std::cerr << "  palettes <dir>                             List .pal files by folder\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  -h, --help    Show this help\n";
}

template <typename T>
bool parse_number(const char* text, T& out) {
    const std::string_view sv(text);
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    return ec == std::errc() && ptr == sv.data() + sv.size();
}

bool parse_float(const char* text, float& out) {
    char* end = nullptr;
    out = std::strtof(text, &end);
    return end != text && *end == '\0';
}

int fail(const std::string& what, const shpkit::codec_result& result) {
    std::cerr << "Error: " << what << ": " << result.message
              << " (" << shpkit::to_string(result.error) << ")\n";
    return 1;
}

int cmd_info(const std::filesystem::path& path) {
    std::vector<std::uint8_t> data;
    auto result = shpkit::read_file(path, data);
    if (!result) {
        return fail("Failed to read file", result);
    }

    shpkit::shp_decoder::header_info info;
    std::vector<shpkit::shp_decoder::frame_header> frames;
    result = shpkit::shp_decoder::parse_header(data, info, frames);
    if (!result) {
        return fail("Not a readable SHP", result);
    }

    std::cout << "Canvas: " << info.width << "x" << info.height << "\n";
    std::cout << "Frames: " << info.frame_count << "\n";
    for (std::size_t i = 0; i < frames.size(); ++i) {
        const auto& fh = frames[i];
        std::cout << "  #" << i << ": ";
        if (fh.is_empty()) {
            std::cout << "empty\n";
            continue;
        }
        std::cout << fh.w << "x" << fh.h << " at (" << fh.x << ", " << fh.y << "), "
                  << shpkit::to_string(fh.compression())
                  << ", offset " << fh.data_offset << "\n";
    }
    return 0;
}

int cmd_new(int argc, char* argv[]) {
    int width = 0;
    int height = 0;
    std::size_t frames = 0;
    if (argc < 6 || !parse_number(argv[2], width) || !parse_number(argv[3], height) ||
        !parse_number(argv[4], frames)) {
        print_usage(argv[0]);
        return 1;
    }

    shpkit::editor_session session;
    auto result = session.new_sprite(width, height, frames);
    if (!result) {
        return fail("Cannot create sprite", result);
    }
    result = session.save_sprite(argv[5]);
    if (!result) {
        return fail("Failed to save", result);
    }
    std::cout << session.status() << "\n";
    return 0;
}

int cmd_export(int argc, char* argv[]) {
    std::size_t frame_index = 0;
    if (argc < 6 || !parse_number(argv[4], frame_index)) {
        print_usage(argv[0]);
        return 1;
    }

    float brightness = 1.0f;
    for (int i = 6; i < argc; ++i) {
        if (std::strcmp(argv[i], "-b") == 0 && i + 1 < argc && parse_float(argv[i + 1], brightness)) {
            ++i;
            continue;
        }
        std::cerr << "Error: Unknown option: " << argv[i] << "\n";
        return 1;
    }

    shpkit::sprite spr;
    auto result = shpkit::load_shp(argv[2], spr);
    if (!result) {
        return fail("Failed to load sprite", result);
    }
    shpkit::palette pal;
    result = shpkit::load_palette(argv[3], pal);
    if (!result) {
        return fail("Failed to load palette", result);
    }
    if (frame_index >= spr.frame_count()) {
        std::cerr << "Error: Frame " << frame_index << " out of range (0.."
                  << spr.frame_count() - 1 << ")\n";
        return 1;
    }

    shpkit::render_options options;
    options.brightness = brightness;
    shpkit::memory_surface image;
    if (!shpkit::render_frame(spr, pal, frame_index, image, options)) {
        std::cerr << "Error: Sprite too large to render\n";
        return 1;
    }
    result = shpkit::save_png(image, argv[5]);
    if (!result) {
        return fail("Failed to save", result);
    }
    std::cout << "Saved: " << argv[5] << "\n";
    return 0;
}

int cmd_import(int argc, char* argv[]) {
    std::size_t frame_index = 0;
    int x = 0;
    int y = 0;
    if (argc < 9 || !parse_number(argv[5], frame_index) ||
        !parse_number(argv[6], x) || !parse_number(argv[7], y)) {
        print_usage(argv[0]);
        return 1;
    }

    float scale = 1.0f;
    for (int i = 9; i < argc; ++i) {
        if (std::strcmp(argv[i], "-s") == 0 && i + 1 < argc && parse_float(argv[i + 1], scale)) {
            ++i;
            continue;
        }
        std::cerr << "Error: Unknown option: " << argv[i] << "\n";
        return 1;
    }

    shpkit::editor_session session;
    auto result = session.open_sprite(std::filesystem::path(argv[2]));
    if (!result) {
        return fail("Failed to load sprite", result);
    }
    result = session.open_palette(argv[3]);
    if (!result) {
        return fail("Failed to load palette", result);
    }
    if (frame_index >= session.current_sprite()->frame_count()) {
        std::cerr << "Error: Frame " << frame_index << " out of range\n";
        return 1;
    }
    session.set_active_frame(frame_index);

    result = session.import_image(std::filesystem::path(argv[4]));
    if (!result) {
        return fail("Failed to import image", result);
    }
    result = session.place_import(x, y, scale);
    if (!result) {
        return fail("Failed to place image", result);
    }
    result = session.save_sprite(argv[8]);
    if (!result) {
        return fail("Failed to save", result);
    }
    std::cout << session.status() << "\n";
    return 0;
}

int cmd_palettes(const std::filesystem::path& root) {
    if (!std::filesystem::is_directory(root)) {
        std::cerr << "Error: Not a directory: " << root << "\n";
        return 1;
    }

    const auto catalog = shpkit::palette_catalog::from_directory(root);
    if (catalog.empty()) {
        std::cout << "No palettes found\n";
        return 0;
    }
    for (const auto& [group, entries] : catalog.groups()) {
        std::cout << (group.empty() ? std::string("(root)") : group) << ":\n";
        for (const auto& entry : entries) {
            std::cout << "  " << entry.name << "\n";
        }
    }
    std::cout << catalog.size() << " palettes\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    if (std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_usage(argv[0]);
        return 0;
    }

    const std::string_view command(argv[1]);
    if (command == "info" && argc >= 3) {
        return cmd_info(argv[2]);
    }
    if (command == "new") {
        return cmd_new(argc, argv);
    }
    if (command == "export") {
        return cmd_export(argc, argv);
    }
    if (command == "import") {
        return cmd_import(argc, argv);
    }
    if (command == "palettes" && argc >= 3) {
        return cmd_palettes(argv[2]);
    }

    print_usage(argv[0]);
    return 1;
}
