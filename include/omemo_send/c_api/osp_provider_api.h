#pragma once

#include "omemo_send/c_api/osp_export.h"

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>

/*
 * Contract between omemo-send and an OMEMO provider plugin.
 *
 * Requests and responses are serialized omemo_send.proto.provider messages
 * (proto/provider/encryption_exchange.proto). Buffers and error messages
 * returned by the plugin are released with osp_buffer_free and
 * osp_error_free of the same plugin.
 */

#define OSP_PLUGIN_ABI_VERSION 1

typedef enum {
    OSP_SUCCESS = 0,
    OSP_ERROR_GENERIC = 1,
    OSP_ERROR_INVALID_INPUT = 2,
    OSP_ERROR_NULL_POINTER = 3,
    OSP_ERROR_DECODE = 4,
    OSP_ERROR_ENCODE = 5,
    OSP_ERROR_OUT_OF_MEMORY = 6,
    OSP_ERROR_STORAGE = 7,
    OSP_ERROR_INVALID_STATE = 8
} OspErrorCode;

typedef struct OspProviderHandle OspProviderHandle;

typedef struct OspBuffer {
    uint8_t* data;
    size_t length;
} OspBuffer;

typedef struct OspError {
    OspErrorCode code;
    char* message;
} OspError;

typedef enum {
    OSP_IQ_RESULT = 0,
    OSP_IQ_ERROR = 1,
    OSP_IQ_TIMEOUT = 2,
    OSP_IQ_DISCONNECTED = 3,
    OSP_IQ_INVALID_REQUEST = 4
} OspIqStatus;

// Receives the serialized response stanza for OSP_IQ_RESULT, the error
// condition or a description otherwise. The data is only valid during the call.
typedef void (*OspIqResponseSink)(const char* data, size_t length, void* sink_data);

typedef OspIqStatus (*OspIqRoundTrip)(
    void* host_data,
    const char* iq_xml,
    size_t iq_xml_length,
    uint32_t timeout_ms,
    OspIqResponseSink sink,
    void* sink_data);

// Services the host lends to the provider for its lifetime. The plugin copies
// own_jid if it keeps it.
typedef struct OspHostServices {
    OspIqRoundTrip iq_round_trip;
    void* host_data;
    const char* own_jid;
} OspHostServices;

OSP_API uint32_t osp_plugin_abi_version(void);

// Namespace of the encrypted payload element, e.g. "eu.siacs.conversations.axolotl"
OSP_API const char* osp_plugin_encryption_namespace(void);

// Opens or creates the key/session/trust store under data_dir.
OSP_API OspErrorCode osp_provider_create(
    const char* data_dir,
    const OspHostServices* host,
    OspProviderHandle** out_handle,
    OspError* out_error);

OSP_API void osp_provider_destroy(OspProviderHandle* handle);

// request: EncryptRequest, out_response: EncryptResponse.
// A non-success code means the call itself failed; classified encryption
// failures are reported inside the response.
OSP_API OspErrorCode osp_provider_encrypt(
    OspProviderHandle* handle,
    const uint8_t* request,
    size_t request_length,
    OspBuffer* out_response,
    OspError* out_error);

// request: TrustRequest
OSP_API OspErrorCode osp_provider_set_trust(
    OspProviderHandle* handle,
    const uint8_t* request,
    size_t request_length,
    OspError* out_error);

OSP_API void osp_buffer_free(OspBuffer* buffer);

OSP_API void osp_error_free(OspError* error);

typedef uint32_t (*osp_plugin_abi_version_fn)(void);
typedef const char* (*osp_plugin_encryption_namespace_fn)(void);
typedef OspErrorCode (*osp_provider_create_fn)(
    const char*, const OspHostServices*, OspProviderHandle**, OspError*);
typedef void (*osp_provider_destroy_fn)(OspProviderHandle*);
typedef OspErrorCode (*osp_provider_encrypt_fn)(
    OspProviderHandle*, const uint8_t*, size_t, OspBuffer*, OspError*);
typedef OspErrorCode (*osp_provider_set_trust_fn)(
    OspProviderHandle*, const uint8_t*, size_t, OspError*);
typedef void (*osp_buffer_free_fn)(OspBuffer*);
typedef void (*osp_error_free_fn)(OspError*);

#ifdef __cplusplus
}
#endif
