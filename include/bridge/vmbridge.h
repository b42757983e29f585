#ifndef VMBRIDGE_H
#define VMBRIDGE_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#define VMBRIDGE_DEFAULT_CHUNK_SIZE (4ULL * 1024 * 1024)

#define VMBRIDGE_INDEX_FIXED 0
#define VMBRIDGE_INDEX_DYNAMIC 1

typedef struct VmBridgeHandle VmBridgeHandle;

/*
 * Completion callback of the *_async calls. `*result` and `*error` are
 * filled in before it runs; it always runs on the bridge's completion
 * thread. Error strings must be released with vmbridge_free_error().
 */
typedef void (*VmBridgeCallback)(void *callback_data);

/*
 * Starts the process wide runtime. Optional: vmbridge_new() starts it on
 * demand. threads == 0 uses the configured or hardware thread count.
 * The JSON file named by VMBRIDGE_CONFIG, if set, is read once here.
 * Returns 0 on success, -1 on error.
 */
int vmbridge_runtime_start(unsigned threads, char **error);

/*
 * Aborts all jobs and stops the runtime. Returns 0 when all work drained
 * within grace_ms, -1 otherwise. The runtime cannot be started again.
 */
int vmbridge_runtime_shutdown(unsigned grace_ms);

/*
 * repo: "[[user@]host[:port]:]datastore". chunk_size 0 selects the
 * default. keyfile, key_password and fingerprint may be NULL.
 */
VmBridgeHandle *vmbridge_new(const char *repo,
                             const char *backup_id,
                             uint64_t backup_time,
                             uint64_t chunk_size,
                             const char *password,
                             const char *keyfile,
                             const char *key_password,
                             const char *fingerprint,
                             char **error);

/* 1: previous backup found, 0: no previous backup, -1: error */
int vmbridge_connect(VmBridgeHandle *handle, char **error);
void vmbridge_connect_async(VmBridgeHandle *handle,
                            VmBridgeCallback callback, void *callback_data,
                            int *result, char **error);

void vmbridge_abort(VmBridgeHandle *handle, const char *reason);

/* Returns the device id (0..255) or -1. kind: VMBRIDGE_INDEX_* */
int vmbridge_register_image(VmBridgeHandle *handle,
                            const char *device_name, uint64_t size,
                            int incremental, int kind,
                            char **error);
void vmbridge_register_image_async(VmBridgeHandle *handle,
                                   const char *device_name, uint64_t size,
                                   int incremental, int kind,
                                   VmBridgeCallback callback, void *callback_data,
                                   int *result, char **error);

int vmbridge_add_config(VmBridgeHandle *handle,
                        const char *name, const uint8_t *data, uint64_t size,
                        char **error);
void vmbridge_add_config_async(VmBridgeHandle *handle,
                               const char *name, const uint8_t *data, uint64_t size,
                               VmBridgeCallback callback, void *callback_data,
                               int *result, char **error);

/*
 * data == NULL writes a block of zeros. Returns the number of bytes
 * written or -1. size must not exceed INT_MAX.
 */
int vmbridge_write_data(VmBridgeHandle *handle,
                        uint8_t dev_id, const uint8_t *data,
                        uint64_t offset, uint64_t size,
                        char **error);
void vmbridge_write_data_async(VmBridgeHandle *handle,
                               uint8_t dev_id, const uint8_t *data,
                               uint64_t offset, uint64_t size,
                               VmBridgeCallback callback, void *callback_data,
                               int *result, char **error);

/*
 * Queues a write and returns its token (never 0), or 0 on error. The
 * data is copied before the call returns.
 */
uint64_t vmbridge_write_data_submit(VmBridgeHandle *handle,
                                    uint8_t dev_id, const uint8_t *data,
                                    uint64_t offset, uint64_t size,
                                    char **error);

/*
 * 1: finished, *bytes holds the bytes written; 0: still running, *bytes
 * holds the progress so far; -1: failed.
 */
int vmbridge_poll(VmBridgeHandle *handle, uint64_t token, uint64_t *bytes, char **error);

int vmbridge_close_image(VmBridgeHandle *handle, uint8_t dev_id, char **error);
void vmbridge_close_image_async(VmBridgeHandle *handle, uint8_t dev_id,
                                VmBridgeCallback callback, void *callback_data,
                                int *result, char **error);

int vmbridge_finish(VmBridgeHandle *handle, char **error);
void vmbridge_finish_async(VmBridgeHandle *handle,
                           VmBridgeCallback callback, void *callback_data,
                           int *result, char **error);

/* Last error of the job, or NULL. Release with vmbridge_free_error(). */
char *vmbridge_last_error(VmBridgeHandle *handle);

void vmbridge_free_error(char *ptr);

/* Aborts an unfinished backup and releases the handle. */
void vmbridge_disconnect(VmBridgeHandle *handle);

#ifdef __cplusplus
}
#endif

#endif /* VMBRIDGE_H */
