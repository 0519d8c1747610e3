#ifndef PARLEY_FFI_H
#define PARLEY_FFI_H

#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ── Status codes ──────────────────────────────────────────────── */

/* Return values of pl_generate / pl_render. */
#define PL_OK                            0
#define PL_STRUCTURE_FORMAT_ERROR        1
#define PL_DURATION_CONFLICT_ERROR       2
#define PL_INSUFFICIENT_SOURCE_ERROR     3
#define PL_RENDER_TARGET_ERROR           4
#define PL_IO_ERROR                      5

/* ── String ownership ──────────────────────────────────────────── */

/// Free a string returned by any pl_* function.
/// Passing NULL is safe (no-op).
void pl_free_string(char* s);

/// Library version. Caller must pl_free_string() the result.
char* pl_version(void);

/* ── Logging ───────────────────────────────────────────────────── */

/// Set log level globally. 0=off, 1=warn, 2=info, 3=debug, 4=trace.
void pl_set_log_level(int level);

/// Set a callback to receive log messages. Pass NULL to revert to stderr.
/// May be invoked from render worker threads; calls are serialised.
void pl_set_log_callback(void (*callback)(int level, const char* message, void* user_data),
                         void* user_data);

/* ── Structure ─────────────────────────────────────────────────── */

/// Build the parallel-tables structure document. duration and half_life
/// must be positive; segments seat every speaker at a 2 s minimum turn.
/// Returns NULL on failure (sets *error). Caller must pl_free_string().
char* pl_build_structure(const int* table_sizes, int num_tables, int duration,
                         bool segment, double half_life, int min_duration,
                         int64_t seed, char** error);

/* ── Generation ────────────────────────────────────────────────── */

/// Generate a scene from a structure document and a clip index CSV
/// (speaker,file_name,length). config_json may be NULL for defaults.
/// A logLevel in config_json replaces the level set by pl_set_log_level.
/// On PL_OK, *scene_json receives the scene document (pl_free_string).
/// Otherwise *error receives a description (pl_free_string).
int pl_generate(const char* structure_json, const char* clip_index_csv,
                const char* config_json, char** scene_json, char** error);

/* ── Rendering ─────────────────────────────────────────────────── */

typedef struct {
    float*  data;           /* channel-major: channel c starts at data[c * num_samples] */
    int     num_channels;
    int     num_samples;
    double  sample_rate;
} PlSampleBuffer;

/// Render a scene document into *out. config_json may be NULL for
/// defaults (16 kHz, inline, clip paths relative to the working directory).
/// On PL_OK the caller owns out->data; free with pl_free_sample_buffer().
int pl_render(const char* scene_json, int channel_count, const char* config_json,
              PlSampleBuffer* out, char** error);

/// Free the samples of a rendered buffer and reset it. NULL is safe.
void pl_free_sample_buffer(PlSampleBuffer* buffer);

#ifdef __cplusplus
}
#endif

#endif /* PARLEY_FFI_H */
