#ifndef SHPKIT_SHPKIT_HPP_
#define SHPKIT_SHPKIT_HPP_

#include <shpkit/shpkit_export.h>
#include <shpkit/types.hpp>
#include <shpkit/surface.hpp>
#include <shpkit/file_io.hpp>
#include <shpkit/sprite.hpp>
#include <shpkit/palette.hpp>
#include <shpkit/palette_catalog.hpp>
#include <shpkit/quantize.hpp>
#include <shpkit/raster.hpp>
#include <shpkit/history.hpp>
#include <shpkit/playback.hpp>
#include <shpkit/render.hpp>
#include <shpkit/import.hpp>
#include <shpkit/session.hpp>
#include <shpkit/codecs/shp.hpp>
#include <shpkit/codecs/png.hpp>
#include <shpkit/codecs/stb_formats.hpp>

namespace shpkit {

// All public API is included via the headers above.
// See:
//   - types.hpp:           rgb8, codec_error, codec_result, option structs
//   - sprite.hpp:          sprite, frame
//   - palette.hpp:         palette, 768-byte palette files
//   - palette_catalog.hpp: palettes grouped by folder
//   - codecs/shp.hpp:      SHP decoder and encoder
//   - codecs/png.hpp:      PNG import and export
//   - codecs/stb_formats.hpp: JPEG, GIF and TGA import
//   - raster.hpp:          drawing operations on a frame
//   - history.hpp:         per-frame undo/redo
//   - playback.hpp:        animation timing
//   - render.hpp:          indexed frame to RGBA, PNG export
//   - import.hpp:          true-color image import
//   - session.hpp:         editor_session

} // namespace shpkit

#endif // SHPKIT_SHPKIT_HPP_
