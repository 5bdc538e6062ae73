#ifndef VOXKEY_H
#define VOXKEY_H

#include <stdbool.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/*
 * Blocking C interface to the dictation core. Calls into the same operation
 * must be serialized by the caller.
 */

/* Resolve and load the speech model. model_path may be NULL to use the
 * config file's model_path, or failing that to search the default locations
 * and download as a last resort. Returns 0 on success,
 * -1 on failure. A failed engine stays failed until voxkey_cleanup(). */
int32_t voxkey_init(const char* model_path);

/* Transcribe 16kHz mono float samples. Always returns a string that must be
 * released with voxkey_free_string(); it is empty on bad input, when the
 * engine is not ready, or when inference fails. */
char* voxkey_transcribe(const float* samples, int32_t sample_count);

/* NULL is ignored */
void voxkey_free_string(char* str);

/* Unload the model. The engine can be initialized again afterwards. */
void voxkey_cleanup(void);

bool voxkey_is_ready(void);

typedef void (*voxkey_push_to_talk_callback)(bool pressed);

/* Start watching the push-to-talk key. Returns false if no hotkey backend
 * could start, usually for lack of permission. */
bool voxkey_init_keyboard_monitor(void);
void voxkey_shutdown_keyboard_monitor(void);

/* Replaces any previously registered callback; NULL unregisters. Called once
 * per press and once per release, always from the same dispatch thread. */
void voxkey_register_push_to_talk_callback(voxkey_push_to_talk_callback callback);

#ifdef __cplusplus
}
#endif

#endif /* VOXKEY_H */
