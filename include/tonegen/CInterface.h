/**
 * @file CInterface.h
 * @brief C-compatible API over the tone engine for foreign control surfaces.
 *
 * Every function tolerates a NULL handle. Functions returning int report 0 on
 * success and -1 on an invalid handle, invalid arguments or failure.
 */

#ifndef TONEGEN_C_INTERFACE_H
#define TONEGEN_C_INTERFACE_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// Opaque handle type
typedef void* ToneEngineHandle;

// Lifecycle
ToneEngineHandle tonegen_engine_create(unsigned int sample_rate);
ToneEngineHandle tonegen_engine_create_from_config(const char* config_path);
void tonegen_engine_destroy(ToneEngineHandle handle);
int tonegen_engine_close(ToneEngineHandle handle);

// Note / control surface
int tonegen_engine_note_on(ToneEngineHandle handle, int note, int velocity, const char* instrument_id);
int tonegen_engine_note_off(ToneEngineHandle handle, int note, const char* instrument_id);
int tonegen_engine_all_notes_off(ToneEngineHandle handle);
int tonegen_engine_set_genre(ToneEngineHandle handle, const char* key);
int tonegen_engine_set_volume(ToneEngineHandle handle, double value);
int tonegen_engine_set_expression(ToneEngineHandle handle, double level);
int tonegen_engine_set_vibrato_scale(ToneEngineHandle handle, double scale);

// Genre listing (definition order). Strings are truncated to fit and NUL-terminated.
int tonegen_engine_genre_count(ToneEngineHandle handle);
int tonegen_engine_genre_info(ToneEngineHandle handle, int index,
                              char* key, size_t key_size,
                              char* name, size_t name_size,
                              char* description, size_t description_size);
int tonegen_engine_active_genre(ToneEngineHandle handle, char* key, size_t key_size);
int tonegen_engine_voice_count(ToneEngineHandle handle);

// Offline rendering: fills frames mono samples in [-1, 1]
int tonegen_engine_process(ToneEngineHandle handle, float* output, size_t frames);

// Device playback (ALSA). start returns -1 if the device is unavailable; the engine
// keeps accepting control calls either way.
int tonegen_engine_start(ToneEngineHandle handle);
int tonegen_engine_stop(ToneEngineHandle handle);

// Drain pending telemetry lines ("[tag] text\n") into buffer. Returns entries written.
int tonegen_drain_log(char* buffer, size_t buffer_size);

#ifdef __cplusplus
}
#endif

#endif // TONEGEN_C_INTERFACE_H
