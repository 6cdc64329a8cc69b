// raster.hpp - RGBA pixel buffer shared by ThorVG and the FreeType text path
//
// Pixels are straight (non-premultiplied) RGBA, 4 bytes per pixel, rows top
// to bottom. The buffer is 32-bit aligned so ThorVG can target it directly.

#ifndef DECK_RASTER_HPP
#define DECK_RASTER_HPP

#include "color.hpp"
#include "surface.hpp"
#include <cstdint>
#include <string>
#include <ft2build.h>
#include FT_FREETYPE_H

namespace deck {

struct RasterImage {
    uint32_t* pixels;
    int width;
    int height;
    int stride;     // bytes per row
};

// zero filled (transparent) image, nullptr on allocation failure
RasterImage* raster_create(int width, int height);
void raster_destroy(RasterImage* image);

void raster_clear(RasterImage* image, Rgba color);

// Porter-Duff source-over of one pixel, ignored outside the image
void raster_blend_pixel(RasterImage* image, int x, int y, Rgba color);

// blend an 8-bit coverage bitmap with its top-left at x, y; coverage scales color.a
void raster_render_bitmap(RasterImage* image, const FT_Bitmap* bitmap, int x, int y, Rgba color);

// draw src scaled to w x h with its top-left at x, y; box filtered when shrinking
void raster_blit_scaled(RasterImage* image, const ImageData& src, int x, int y, int w, int h);

// encode as an 8-bit RGBA PNG, false on libpng failure
bool raster_encode_png(const RasterImage* image, std::string* out);

} // namespace deck

#endif // DECK_RASTER_HPP
