#pragma once

/*
 * C ABI between the DeepSeek chat plugin and its host.
 *
 * The host dlopen()s the plugin library and calls create_plugin() to obtain
 * a DeepseekPluginInterface. Every lifecycle call receives a
 * DeepseekHostContext describing the plugin instance and the callbacks the
 * plugin uses to stream its reply back to the host.
 *
 * Text results are written into caller-provided buffers; they are always
 * NUL-terminated and truncated when the buffer is too small.
 */

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#if defined(_WIN32)
#define DEEPSEEK_PLUGIN_EXPORT __declspec(dllexport)
#else
#define DEEPSEEK_PLUGIN_EXPORT __attribute__((visibility("default")))
#endif

#define DEEPSEEK_PLUGIN_ABI_VERSION 1u

/* Status codes returned across the ABI. */
#define DEEPSEEK_OK 0
#define DEEPSEEK_ERROR 1
#define DEEPSEEK_STREAM_CANCELLED 2

/* Log levels passed to DeepseekHostContext::log. */
#define DEEPSEEK_LOG_TRACE 0
#define DEEPSEEK_LOG_DEBUG 1
#define DEEPSEEK_LOG_INFO 2
#define DEEPSEEK_LOG_WARN 3
#define DEEPSEEK_LOG_ERROR 4
#define DEEPSEEK_LOG_CRITICAL 5

typedef struct DeepseekPluginMetadata {
    const char* id;
    const char* name;
    const char* version;
    const char* instance_id; /* may be NULL */
} DeepseekPluginMetadata;

typedef struct DeepseekHistoryMessage {
    const char* id;
    const char* role;    /* "user", "plugin", "system" */
    const char* content;
    const char* status;  /* only "completed" entries are sent upstream */
    int64_t created_at;  /* epoch milliseconds */
} DeepseekHistoryMessage;

/*
 * The plugin copies metadata and history before an ABI call returns. The
 * callbacks and host_data must stay valid until the stream they open is
 * ended (or, for `log`, until on_dispose). Stream callbacks are invoked from
 * a plugin background thread.
 */
typedef struct DeepseekHostContext {
    void* host_data;
    DeepseekPluginMetadata metadata;

    const DeepseekHistoryMessage* history;
    size_t history_len;
    int has_history; /* 0 = host keeps no history for this instance */

    /* Opens a reply stream and writes its id into id_buf. */
    int (*stream_start)(void* host_data, char* id_buf, size_t id_buf_len);
    /* Returns DEEPSEEK_STREAM_CANCELLED when the user stopped the reply. */
    int (*stream_chunk)(void* host_data, const char* stream_id,
                        const char* content, int is_final);
    /* error_message is NULL on success. */
    int (*stream_end)(void* host_data, const char* stream_id, int success,
                      const char* error_message);
    void (*log)(void* host_data, int level, const char* message);
} DeepseekHostContext;

typedef struct DeepseekPluginInterface {
    uint32_t abi_version;
    void* plugin_ptr;

    int (*on_mount)(void* plugin, const DeepseekHostContext* ctx,
                    char* err_buf, size_t err_len);
    int (*on_dispose)(void* plugin, const DeepseekHostContext* ctx,
                      char* err_buf, size_t err_len);
    int (*on_connect)(void* plugin, const DeepseekHostContext* ctx,
                      char* err_buf, size_t err_len);
    int (*on_disconnect)(void* plugin, const DeepseekHostContext* ctx,
                         char* err_buf, size_t err_len);

    /* On success out_buf holds the immediate reply, on failure the error. */
    int (*handle_message)(void* plugin, const char* message,
                          const DeepseekHostContext* ctx,
                          char* out_buf, size_t out_len);

    /* Settings keys: "api_key", "api_url". */
    int (*update_setting)(void* plugin, const char* key, const char* value,
                          char* err_buf, size_t err_len);
    int (*get_setting)(void* plugin, const char* key,
                       char* out_buf, size_t out_len);

    /* Writes a one-line status; returns the untruncated length. */
    size_t (*get_status)(void* plugin, char* out_buf, size_t out_len);

    void (*destroy)(void* plugin);
} DeepseekPluginInterface;

typedef DeepseekPluginInterface* (*DeepseekCreatePluginFn)(void);
typedef void (*DeepseekDestroyPluginFn)(DeepseekPluginInterface*);

DEEPSEEK_PLUGIN_EXPORT DeepseekPluginInterface* create_plugin(void);
DEEPSEEK_PLUGIN_EXPORT void destroy_plugin(DeepseekPluginInterface* iface);

#ifdef __cplusplus
} /* extern "C" */
#endif
