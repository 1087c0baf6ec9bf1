// FILE: include/module_api.hpp
#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @brief The export table every nativebridge module must publish.
 *
 * When the host loads a module (a .so, .dylib or .dll file) it searches for a
 * function named "nb_get_module_manifest". The returned manifest lists the
 * host processes allowed to call the module and the entry points it
 * implements. A null entry point means the mode is not implemented;
 * `execute` and `free_string` are mandatory.
 *
 * Payloads cross the boundary as NUL-terminated UTF-8 JSON text. `execute`
 * and `execute_external` return a string allocated by the module holding
 * {"ok":true,"result":...} or {"ok":false,"error":"..."}; the host releases
 * it through `free_string`.
 *
 * Use extern "C" to prevent C++ name mangling, which ensures that the host
 * can find the function by its exact name.
 */
#ifdef _WIN32
#define NB_MODULE_EXPORT __declspec(dllexport)
#else
#define NB_MODULE_EXPORT __attribute__((visibility("default")))
#endif

#define NB_MODULE_ABI_VERSION 1u
#define NB_MODULE_MANIFEST_SYMBOL "nb_get_module_manifest"

enum NbEventKind {
    NB_EVENT_PROGRESS = 0,
    NB_EVENT_ERROR = 1,
};

// Progress sink handed to execute_streaming. `message` is borrowed for the
// duration of the call. Returns non-zero once the stream was cancelled;
// modules should stop producing work at that point.
typedef int (*nb_emit_fn)(void* ctx, int kind, const char* message);

typedef char* (*nb_execute_fn)(const char* json_payload);
typedef void (*nb_execute_streaming_fn)(const char* json_payload, nb_emit_fn emit, void* ctx);
typedef char* (*nb_execute_external_fn)(const char* json_payload);
typedef void (*nb_free_string_fn)(char* str);

struct NbModuleManifest {
    uint32_t abi_version;
    const char* const* allowed_hosts;
    size_t allowed_host_count;
    nb_execute_fn execute;
    nb_execute_streaming_fn execute_streaming;
    nb_execute_external_fn execute_external;
    nb_free_string_fn free_string;
};

typedef const NbModuleManifest* (*nb_get_module_manifest_fn)();

extern "C" NB_MODULE_EXPORT const NbModuleManifest* nb_get_module_manifest();
