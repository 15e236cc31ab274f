// C API for WASM and FFI bindings.

#ifndef MORSE_C_H
#define MORSE_C_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Handle and Error Definitions
// ============================================================================

/// @brief Opaque handle to a Morse MIDI converter instance.
typedef void* MorseHandle;

/// @brief Error codes returned by API functions.
typedef enum {
  MORSE_OK = 0,
  MORSE_ERROR_INVALID_PARAM = 1,
  MORSE_ERROR_EMPTY_TEXT = 2,
  MORSE_ERROR_INVALID_BPM = 3,
  MORSE_ERROR_WRITE_FAILED = 4,
} MorseError;

// ============================================================================
// Output Data Structures
// ============================================================================

/// @brief MIDI binary output.
typedef struct {
  uint8_t* data;  ///< MIDI binary data
  size_t size;    ///< Size in bytes
} MorseMidiData;

/// @brief Conversion info.
typedef struct {
  uint32_t note_count;   ///< Note-on/note-off pairs
  uint32_t total_ticks;  ///< Track duration in ticks
  uint32_t tempo_usec;   ///< Microseconds per quarter note
  uint32_t bpm;          ///< BPM used
} MorseInfo;

// ============================================================================
// Lifecycle
// ============================================================================

/// @brief Create a new converter instance.
/// @return Handle (must be freed with morse_destroy)
MorseHandle morse_create(void);

/// @brief Destroy a converter instance.
/// @param handle Handle to destroy
void morse_destroy(MorseHandle handle);

// ============================================================================
// Conversion
// ============================================================================

/// @brief Convert text to Morse code and encode it as MIDI.
/// @param handle Converter handle
/// @param text NUL-terminated input text
/// @param bpm Tempo (4 to 60000000; 0 = default 120)
/// @return MORSE_OK on success
MorseError morse_generate(MorseHandle handle, const char* text, uint32_t bpm);

/// @brief Write the last generated MIDI data to a file.
/// @param handle Converter handle
/// @param path Output path (NULL = name derived from the text)
/// @return MORSE_OK on success, MORSE_ERROR_WRITE_FAILED on I/O failure
MorseError morse_write_file(MorseHandle handle, const char* path);

// ============================================================================
// Output Retrieval
// ============================================================================

/// @brief Get generated MIDI data.
/// @param handle Converter handle
/// @return MidiData (must be freed with morse_free_midi), NULL if none
MorseMidiData* morse_get_midi(MorseHandle handle);

/// @brief Free MIDI data.
/// @param data Pointer returned by morse_get_midi
void morse_free_midi(MorseMidiData* data);

/// @brief Get the Morse symbol stream of the last conversion.
/// @param handle Converter handle
/// @return Stream (owned by the handle, valid until the next call), or NULL
const char* morse_get_code(MorseHandle handle);

/// @brief Get conversion info.
/// @param handle Converter handle
/// @return Pointer owned by the handle (zeroed if no result)
const MorseInfo* morse_get_info(MorseHandle handle);

/// @brief Get the detailed message of the last failure.
/// @param handle Converter handle
/// @return Message owned by the handle ("" if none)
const char* morse_last_error(MorseHandle handle);

// ============================================================================
// Error Handling
// ============================================================================

/// @brief Get error message for error code.
/// @param error Error code
/// @return Error message (static, do not free)
const char* morse_error_string(MorseError error);

// ============================================================================
// Utilities
// ============================================================================

/// @brief Get library version string.
/// @return Version (e.g., "0.1.0")
const char* morse_version(void);

#ifdef __cplusplus
}
#endif

#endif  // MORSE_C_H
