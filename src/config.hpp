#pragma once

/*compile-time knobs for the byte rope, file writer and hex view*/

#ifndef HXV_LEAF_MAX_BYTES
#define HXV_LEAF_MAX_BYTES 1024
#endif

/* initial loads larger than this are built on two async halves */
#ifndef HXV_PARALLEL_BUILD_BYTES
#define HXV_PARALLEL_BUILD_BYTES (1u << 22)
#endif

#ifndef HXV_WRITE_CHUNK_SIZE
#define HXV_WRITE_CHUNK_SIZE (1u << 16)
#endif

#ifndef HXV_DEFAULT_BYTES_PER_LINE
#define HXV_DEFAULT_BYTES_PER_LINE 16
#endif

/* one paste may add at most this many bytes */
#ifndef HXV_MAX_PASTE_BYTES
#define HXV_MAX_PASTE_BYTES (size_t{1} << 30)
#endif

/* :set width accepts 1 .. this */
#ifndef HXV_MAX_BYTES_PER_LINE
#define HXV_MAX_BYTES_PER_LINE 4096
#endif

#define HXV_RC_FILE_NAME ".hxvimrc"
#define HXV_DEFAULT_REGISTER '"'

/* how long ESC waits for a following key before it counts as a lone ESC */
#ifndef HXV_ESC_DELAY_MS
#define HXV_ESC_DELAY_MS 25
#endif
