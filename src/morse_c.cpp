// Implementation of C API for WASM and FFI bindings.

#include "morse_c.h"

#include <cstdlib>
#include <cstring>
#include <string>

#include "core/version_info.h"
#include "generator.h"

namespace {

/// @brief Internal state held per MorseHandle.
struct MorseInstance {
  morse::GeneratorConfig config;
  morse::GeneratorResult result;
  MorseInfo info = {};
  bool has_result = false;
};

/// @brief Map a pipeline failure to a C error code.
MorseError errorFromKind(morse::ErrorKind kind) {
  switch (kind) {
    case morse::ErrorKind::None:        return MORSE_OK;
    case morse::ErrorKind::Input:       return MORSE_ERROR_EMPTY_TEXT;
    case morse::ErrorKind::Config:      return MORSE_ERROR_INVALID_BPM;
    case morse::ErrorKind::Persistence: return MORSE_ERROR_WRITE_FAILED;
  }
  return MORSE_ERROR_INVALID_PARAM;
}

}  // namespace

extern "C" {

// ============================================================================
// Lifecycle
// ============================================================================

MorseHandle morse_create(void) {
  return new MorseInstance();
}

void morse_destroy(MorseHandle handle) {
  delete static_cast<MorseInstance*>(handle);
}

// ============================================================================
// Conversion
// ============================================================================

MorseError morse_generate(MorseHandle handle, const char* text, uint32_t bpm) {
  if (!handle || !text) {
    return MORSE_ERROR_INVALID_PARAM;
  }

  auto* instance = static_cast<MorseInstance*>(handle);
  instance->config = morse::GeneratorConfig{};
  instance->config.text = text;
  if (bpm > 0) {
    instance->config.bpm = bpm;
  }

  instance->result = morse::generate(instance->config);
  instance->info = {};
  instance->has_result = instance->result.success;
  if (!instance->result.success) {
    return errorFromKind(instance->result.error);
  }

  instance->info.note_count = instance->result.note_count;
  instance->info.total_ticks = instance->result.total_duration_ticks;
  instance->info.tempo_usec = instance->result.tempo_usec;
  instance->info.bpm = instance->config.bpm;
  return MORSE_OK;
}

MorseError morse_write_file(MorseHandle handle, const char* path) {
  if (!handle) return MORSE_ERROR_INVALID_PARAM;

  auto* instance = static_cast<MorseInstance*>(handle);
  if (!instance->has_result) return MORSE_ERROR_INVALID_PARAM;

  if (path) {
    instance->result.output_path = path;
  }
  if (!morse::writeResult(instance->result)) {
    // The MIDI data is still valid; only persistence failed.
    instance->result.success = true;
    return MORSE_ERROR_WRITE_FAILED;
  }
  instance->result.error_message.clear();
  return MORSE_OK;
}

// ============================================================================
// Output Retrieval
// ============================================================================

MorseMidiData* morse_get_midi(MorseHandle handle) {
  if (!handle) return nullptr;

  auto* instance = static_cast<MorseInstance*>(handle);
  if (!instance->has_result || instance->result.midi_bytes.empty()) return nullptr;

  auto* result = static_cast<MorseMidiData*>(malloc(sizeof(MorseMidiData)));
  if (!result) return nullptr;

  result->size = instance->result.midi_bytes.size();
  result->data = static_cast<uint8_t*>(malloc(result->size));
  if (!result->data) {
    free(result);
    return nullptr;
  }
  memcpy(result->data, instance->result.midi_bytes.data(), result->size);
  return result;
}

void morse_free_midi(MorseMidiData* data) {
  if (data) {
    free(data->data);
    free(data);
  }
}

const char* morse_get_code(MorseHandle handle) {
  if (!handle) return nullptr;

  auto* instance = static_cast<MorseInstance*>(handle);
  if (!instance->has_result) return nullptr;
  return instance->result.morse.c_str();
}

const MorseInfo* morse_get_info(MorseHandle handle) {
  if (!handle) return nullptr;
  return &static_cast<MorseInstance*>(handle)->info;
}

const char* morse_last_error(MorseHandle handle) {
  if (!handle) return "";
  return static_cast<MorseInstance*>(handle)->result.error_message.c_str();
}

// ============================================================================
// Error Handling
// ============================================================================

const char* morse_error_string(MorseError error) {
  switch (error) {
    case MORSE_OK: return "No error";
    case MORSE_ERROR_INVALID_PARAM: return "Invalid parameter";
    case MORSE_ERROR_EMPTY_TEXT: return "No text provided";
    case MORSE_ERROR_INVALID_BPM: return "Invalid BPM (must be 4-60000000)";
    case MORSE_ERROR_WRITE_FAILED: return "Failed to write MIDI file";
  }
  return "Unknown error";
}

// ============================================================================
// Utilities
// ============================================================================

const char* morse_version(void) {
  return MORSE_VERSION;
}

}  // extern "C"
