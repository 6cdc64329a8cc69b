/**
 * slidedeck PDF writer
 *
 * A small PDF 1.4 generator covering what the paginated slide backend needs:
 * pages of arbitrary size, filled/stroked paths, the standard Type1 fonts,
 * RGBA images and deflate-compressed streams. Output carries no timestamps,
 * so identical drawing calls produce identical bytes.
 */

#ifndef PDF_WRITER_H
#define PDF_WRITER_H

#include <stdlib.h>
#include <stdio.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/*---------------------------------------------------------------------------*/
/*  Types                                                                    */
/*---------------------------------------------------------------------------*/

typedef struct PdfDoc PdfDoc;
typedef struct PdfPage PdfPage;

// Status codes
#define PDF_OK                      0
#define PDF_ERROR_INVALID_PARAM     0x1001
#define PDF_ERROR_OUT_OF_MEMORY     0x1002
#define PDF_ERROR_FILE_IO           0x1003
#define PDF_ERROR_INVALID_STATE     0x1004
#define PDF_ERROR_COMPRESS          0x1005

typedef enum {
    PDF_INFO_CREATOR = 0,
    PDF_INFO_PRODUCER,
    PDF_INFO_TITLE,
    PDF_INFO_COUNT
} PdfInfoType;

typedef enum {
    PDF_LINE_CAP_BUTT = 0,
    PDF_LINE_CAP_ROUND = 1,
    PDF_LINE_CAP_SQUARE = 2
} PdfLineCap;

/*---------------------------------------------------------------------------*/
/*  Document                                                                 */
/*---------------------------------------------------------------------------*/

PdfDoc* pdf_new(void);
void pdf_free(PdfDoc* doc);

// enable or disable deflate compression of content and image streams
int pdf_set_compression(PdfDoc* doc, bool enabled);
int pdf_set_info(PdfDoc* doc, PdfInfoType type, const char* value);

// page size in points, origin bottom-left
PdfPage* pdf_add_page(PdfDoc* doc, float width, float height);
int pdf_page_count(const PdfDoc* doc);

// serialize the document; *out is malloc'ed and owned by the caller
int pdf_save_to_buffer(PdfDoc* doc, unsigned char** out, size_t* length);
int pdf_save_to_file(PdfDoc* doc, const char* filename);

/*---------------------------------------------------------------------------*/
/*  Graphics state and paths                                                 */
/*---------------------------------------------------------------------------*/

// color components in [0, 1]
int pdf_page_set_rgb_fill(PdfPage* page, float r, float g, float b);
int pdf_page_set_rgb_stroke(PdfPage* page, float r, float g, float b);
int pdf_page_set_line_width(PdfPage* page, float width);
int pdf_page_set_line_cap(PdfPage* page, PdfLineCap cap);

int pdf_page_rectangle(PdfPage* page, float x, float y, float width, float height);
int pdf_page_move_to(PdfPage* page, float x, float y);
int pdf_page_line_to(PdfPage* page, float x, float y);
int pdf_page_curve_to(PdfPage* page, float x1, float y1, float x2, float y2, float x3, float y3);
int pdf_page_close_path(PdfPage* page);
// closed ellipse path built from four cubic segments
int pdf_page_ellipse(PdfPage* page, float cx, float cy, float rx, float ry);

int pdf_page_fill(PdfPage* page);
int pdf_page_stroke(PdfPage* page);

int pdf_page_gsave(PdfPage* page);
int pdf_page_grestore(PdfPage* page);
// concatenate [a b c d e f] to the current transformation matrix
int pdf_page_concat(PdfPage* page, float a, float b, float c, float d, float e, float f);

/*---------------------------------------------------------------------------*/
/*  Text                                                                     */
/*---------------------------------------------------------------------------*/

// base_font is one of the standard 14 names, e.g. "Helvetica", "Times-Roman"
int pdf_page_set_font_and_size(PdfPage* page, const char* base_font, float size);
// UTF-8 text, converted to WinAnsi; unsupported characters become '?'
int pdf_page_text_out(PdfPage* page, float x, float y, const char* text);

/*---------------------------------------------------------------------------*/
/*  Images                                                                   */
/*---------------------------------------------------------------------------*/

// draw RGBA pixels (4 bytes per pixel, packed rows) into the box whose
// lower-left corner is (x, y); alpha becomes a soft mask when not opaque
int pdf_page_draw_image_rgba(PdfPage* page, const unsigned char* rgba, int width, int height,
    float x, float y, float draw_width, float draw_height);

#ifdef __cplusplus
}
#endif

#endif // PDF_WRITER_H
