#ifndef FILE_H
#define FILE_H

#include <stdbool.h>
#include <stddef.h>
#include <time.h>

#ifdef __cplusplus
extern "C" {
#endif

// read a whole text file; caller frees. NULL if it cannot be read
char* read_text_file(const char *filename);

// read a whole file as bytes; caller frees. NULL if it cannot be read
unsigned char* read_binary_file(const char *filename, size_t *size);

// write content to a text file, false on failure
bool write_text_file(const char *filename, const char *content);

// write size bytes to a file, false on failure
bool write_binary_file(const char *filename, const void *data, size_t size);

// create directory recursively if it doesn't exist
bool create_dir(const char* dir_path);

// remove a directory tree, false if anything could not be removed
bool remove_dir(const char* dir_path);

bool file_exists(const char *filename);
bool dir_exists(const char *dir_path);

// visit every regular file under root whose name ends with ext (NULL for all),
// recursing into subdirectories; returns the number of files visited or -1
// when root cannot be opened
typedef void (*FileVisitor)(const char* path, void* udata);
int walk_files(const char* root, const char* ext, FileVisitor visit, void* udata);

// last modification time, 0 when the file is missing
time_t file_mtime(const char *filename);

#ifdef __cplusplus
}
#endif

#endif // FILE_H
