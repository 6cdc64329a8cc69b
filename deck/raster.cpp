// raster.cpp - RGBA buffer operations and PNG encoding

#include "raster.hpp"
#include "../lib/log.h"
#include "../lib/strbuf.h"
#include <cstdlib>
#include <cstring>
#include <png.h>

namespace deck {

// ============================================================================
// Image Buffer Management
// ============================================================================

RasterImage* raster_create(int width, int height) {
    if (width <= 0 || height <= 0) return nullptr;
    RasterImage* image = (RasterImage*)calloc(1, sizeof(RasterImage));
    if (!image) return nullptr;
    image->width = width;
    image->height = height;
    image->stride = width * 4;
    image->pixels = (uint32_t*)calloc((size_t)width * height, sizeof(uint32_t));
    if (!image->pixels) {
        free(image);
        return nullptr;
    }
    return image;
}

void raster_destroy(RasterImage* image) {
    if (!image) return;
    free(image->pixels);
    free(image);
}

static inline uint8_t* pixel_at(const RasterImage* image, int x, int y) {
    return (uint8_t*)image->pixels + (size_t)y * image->stride + x * 4;
}

void raster_clear(RasterImage* image, Rgba color) {
    if (!image || !image->pixels) return;
    for (int y = 0; y < image->height; y++) {
        for (int x = 0; x < image->width; x++) {
            uint8_t* px = pixel_at(image, x, y);
            px[0] = color.r;  px[1] = color.g;  px[2] = color.b;  px[3] = color.a;
        }
    }
}

// ============================================================================
// Pixel Operations
// ============================================================================

void raster_blend_pixel(RasterImage* image, int x, int y, Rgba color) {
    if (!image || !image->pixels) return;
    if (x < 0 || x >= image->width || y < 0 || y >= image->height) return;
    if (color.a == 0) return;

    uint8_t* dst = pixel_at(image, x, y);
    if (color.a == 255) {
        dst[0] = color.r;  dst[1] = color.g;  dst[2] = color.b;  dst[3] = 255;
        return;
    }

    // Porter-Duff over
    float sa = color.a / 255.0f;
    float da = dst[3] / 255.0f;
    float out_a = sa + da * (1.0f - sa);
    if (out_a <= 0) return;
    dst[0] = (uint8_t)((color.r * sa + dst[0] * da * (1.0f - sa)) / out_a + 0.5f);
    dst[1] = (uint8_t)((color.g * sa + dst[1] * da * (1.0f - sa)) / out_a + 0.5f);
    dst[2] = (uint8_t)((color.b * sa + dst[2] * da * (1.0f - sa)) / out_a + 0.5f);
    dst[3] = (uint8_t)(out_a * 255.0f + 0.5f);
}

void raster_render_bitmap(RasterImage* image, const FT_Bitmap* bitmap, int x, int y, Rgba color) {
    if (!image || !bitmap || !bitmap->buffer) return;
    // only 8-bit gray coverage is produced by FT_RENDER_MODE_NORMAL
    if (bitmap->pixel_mode != FT_PIXEL_MODE_GRAY) return;

    for (unsigned int row = 0; row < bitmap->rows; row++) {
        int dst_y = y + (int)row;
        if (dst_y < 0 || dst_y >= image->height) continue;
        for (unsigned int col = 0; col < bitmap->width; col++) {
            int dst_x = x + (int)col;
            if (dst_x < 0 || dst_x >= image->width) continue;
            uint8_t coverage = bitmap->buffer[row * bitmap->pitch + col];
            if (coverage == 0) continue;
            Rgba px = color;
            px.a = (uint8_t)((coverage * color.a + 127) / 255);
            raster_blend_pixel(image, dst_x, dst_y, px);
        }
    }
}

// ============================================================================
// Image Scaling
// ============================================================================

void raster_blit_scaled(RasterImage* image, const ImageData& src, int x, int y, int w, int h) {
    if (!image || !src.pixels || src.width <= 0 || src.height <= 0 || w <= 0 || h <= 0) return;

    for (int dy = 0; dy < h; dy++) {
        int py = y + dy;
        if (py < 0 || py >= image->height) continue;
        // source rows covered by this destination row, at least one
        int sy0 = (int)((long long)dy * src.height / h);
        int sy1 = (int)((long long)(dy + 1) * src.height / h);
        if (sy1 <= sy0) sy1 = sy0 + 1;

        for (int dx = 0; dx < w; dx++) {
            int px = x + dx;
            if (px < 0 || px >= image->width) continue;
            int sx0 = (int)((long long)dx * src.width / w);
            int sx1 = (int)((long long)(dx + 1) * src.width / w);
            if (sx1 <= sx0) sx1 = sx0 + 1;

            // alpha weighted box average
            unsigned long r = 0, g = 0, b = 0, a = 0, count = 0;
            for (int sy = sy0; sy < sy1; sy++) {
                const unsigned char* row = src.pixels + (size_t)sy * src.width * 4;
                for (int sx = sx0; sx < sx1; sx++) {
                    const unsigned char* s = row + sx * 4;
                    r += s[0] * s[3];
                    g += s[1] * s[3];
                    b += s[2] * s[3];
                    a += s[3];
                    count++;
                }
            }
            if (a == 0) continue;
            Rgba color;
            color.r = (uint8_t)(r / a);
            color.g = (uint8_t)(g / a);
            color.b = (uint8_t)(b / a);
            color.a = (uint8_t)(a / count);
            raster_blend_pixel(image, px, py, color);
        }
    }
}

// ============================================================================
// Memory Encoding (using libpng)
// ============================================================================

static void png_memory_write_callback(png_structp png_ptr, png_bytep data, png_size_t length) {
    StrBuf* mem = (StrBuf*)png_get_io_ptr(png_ptr);
    strbuf_append_str_n(mem, (const char*)data, length);
}

static void png_memory_flush_callback(png_structp png_ptr) {
    (void)png_ptr;  // no-op for memory writes
}

bool raster_encode_png(const RasterImage* image, std::string* out) {
    if (!image || !image->pixels || !out) return false;

    png_structp png_ptr = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png_ptr) {
        log_error("raster: png_create_write_struct failed");
        return false;
    }
    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (!info_ptr) {
        png_destroy_write_struct(&png_ptr, nullptr);
        log_error("raster: png_create_info_struct failed");
        return false;
    }

    StrBuf* mem = strbuf_new_cap(64 * 1024);
    if (setjmp(png_jmpbuf(png_ptr))) {
        png_destroy_write_struct(&png_ptr, &info_ptr);
        strbuf_free(mem);
        log_error("raster: PNG encoding failed");
        return false;
    }

    png_set_write_fn(png_ptr, mem, png_memory_write_callback, png_memory_flush_callback);
    png_set_IHDR(png_ptr, info_ptr,
        image->width, image->height,
        8,
        PNG_COLOR_TYPE_RGBA,
        PNG_INTERLACE_NONE,
        PNG_COMPRESSION_TYPE_DEFAULT,
        PNG_FILTER_TYPE_DEFAULT
    );
    png_write_info(png_ptr, info_ptr);
    for (int y = 0; y < image->height; y++) {
        png_write_row(png_ptr, (png_bytep)pixel_at(image, 0, y));
    }
    png_write_end(png_ptr, nullptr);
    png_destroy_write_struct(&png_ptr, &info_ptr);

    out->assign(mem->str, mem->length);
    strbuf_free(mem);
    return true;
}

} // namespace deck
