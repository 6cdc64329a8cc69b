#ifndef IMAGE_H
#define IMAGE_H

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// Load a PNG image through libpng.
// Returns RGBA data with 4 bytes per pixel, rows packed without padding.
// *channels receives the channel count of the source file.
// Call image_free() to free the returned data
unsigned char* image_load(const char* filename, int* width, int* height, int* channels);

// same as image_load, from an in-memory PNG
unsigned char* image_load_from_memory(const unsigned char* data, size_t size, int* width, int* height, int* channels);

// Free image data returned by image_load
void image_free(unsigned char* data);

#ifdef __cplusplus
}
#endif

#endif // IMAGE_H
