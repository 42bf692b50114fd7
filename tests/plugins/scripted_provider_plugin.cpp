// Provider plugin driven by a script file, for exercising the plugin loader
// and the C ABI without an OMEMO library.
//
// <data_dir>/script     one encrypt response per line, consumed in order:
//   envelope                          encrypted payload
//   undecided <jid> <device> <hex>    trust undecided
//   missing <jid> <device>...         prepare failed, missing bundles
//   no-session <jid> <device>         prepare failed, no session
//   fetch-error [timeout]             fetch error
//   error <text>                      encryption error
//   iq <xml>                          round trip through the host; the response
//                                     becomes the payload, a failure a fetch error
//   fail-call                         the call itself fails
//   garbage                           undecodable response
// <data_dir>/fail-create  makes osp_provider_create fail
// <data_dir>/fail-trust   makes osp_provider_set_trust fail
//
// Requests are appended to <data_dir>/requests.log, trust records to
// <data_dir>/trust.log, provider teardown to <data_dir>/lifecycle.log.

#include "omemo_send/c_api/osp_provider_api.h"
#include "provider/encryption_exchange.pb.h"

#include <cstdlib>
#include <cstring>
#include <deque>
#include <filesystem>
#include <fstream>
#include <new>
#include <sstream>
#include <string>

using namespace omemo_send::proto::provider;

struct OspProviderHandle {
    std::filesystem::path data_dir;
    OspHostServices host{};
    std::string own_jid;
    std::deque<std::string> script;
};

namespace {

constexpr const char* kNamespace = "eu.siacs.conversations.axolotl";

void FillError(OspError* out_error, const OspErrorCode code, const std::string& message) {
    if (out_error) {
        out_error->code = code;
        out_error->message = strdup(message.c_str());
    }
}

std::string ToHex(const std::string& bytes) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string hex;
    for (const unsigned char c : bytes) {
        hex.push_back(digits[c >> 4]);
        hex.push_back(digits[c & 0x0F]);
    }
    return hex;
}

std::string FromHex(const std::string& hex) {
    std::string bytes;
    for (size_t i = 0; i + 1 < hex.size(); i += 2) {
        bytes.push_back(static_cast<char>(std::strtoul(hex.substr(i, 2).c_str(), nullptr, 16)));
    }
    return bytes;
}

void AppendLine(const std::filesystem::path& file, const std::string& line) {
    std::ofstream out(file, std::ios::app);
    out << line << "\n";
}

void Collect(const char* data, const size_t length, void* sink_data) {
    static_cast<std::string*>(sink_data)->assign(data, length);
}

void AddProblem(PrepareFailed* failed, const DeviceProblemKind kind,
                const std::string& jid, const uint32_t device) {
    auto* problem = failed->add_problems();
    problem->set_kind(kind);
    problem->mutable_address()->set_jid(jid);
    problem->mutable_address()->set_device_id(device);
    problem->set_detail("scripted");
}

std::string DescribeRequest(const EncryptRequest& request) {
    std::ostringstream line;
    line << "plaintext=" << request.plaintext() << " recipients=";
    for (int i = 0; i < request.recipients_size(); ++i) {
        line << (i > 0 ? "," : "") << request.recipients(i);
    }
    line << " expected=";
    for (int i = 0; i < request.expected_problems_size(); ++i) {
        const auto& expected = request.expected_problems(i);
        line << (i > 0 ? ";" : "") << expected.jid() << ":";
        for (int j = 0; j < expected.device_ids_size(); ++j) {
            line << (j > 0 ? "," : "") << expected.device_ids(j);
        }
    }
    return line.str();
}

void Respond(OspProviderHandle* handle, const std::string& step, EncryptResponse& response) {
    std::istringstream words(step);
    std::string command;
    words >> command;

    if (command == "envelope") {
        response.mutable_encrypted()->set_xml("<encrypted xmlns='eu.siacs.conversations.axolotl'/>");
    } else if (command == "undecided") {
        std::string jid;
        uint32_t device = 0;
        std::string key;
        words >> jid >> device >> key;
        auto* undecided = response.mutable_trust_undecided();
        undecided->mutable_address()->set_jid(jid);
        undecided->mutable_address()->set_device_id(device);
        undecided->set_identity_key(FromHex(key));
    } else if (command == "missing" || command == "no-session") {
        std::string jid;
        words >> jid;
        auto* failed = response.mutable_prepare_failed();
        const auto kind = command == "missing" ? DEVICE_PROBLEM_KIND_MISSING_BUNDLE : DEVICE_PROBLEM_KIND_NO_SESSION;
        uint32_t device = 0;
        while (words >> device) {
            AddProblem(failed, kind, jid, device);
        }
    } else if (command == "fetch-error") {
        std::string qualifier;
        words >> qualifier;
        response.mutable_fetch_error()->set_timed_out(qualifier == "timeout");
        response.mutable_fetch_error()->set_detail("devicelist unavailable");
    } else if (command == "iq") {
        std::string xml;
        std::getline(words >> std::ws, xml);
        std::string answer;
        const auto status = handle->host.iq_round_trip(
            handle->host.host_data, xml.data(), xml.size(), 0, &Collect, &answer);
        if (status == OSP_IQ_RESULT) {
            response.mutable_encrypted()->set_xml(answer);
        } else {
            response.mutable_fetch_error()->set_timed_out(status == OSP_IQ_TIMEOUT);
            response.mutable_fetch_error()->set_detail(answer);
        }
    } else {
        std::string detail;
        std::getline(words >> std::ws, detail);
        response.mutable_encryption_error()->set_detail(command == "error" ? detail : "script exhausted");
    }
}

}

extern "C" {

OSP_API uint32_t osp_plugin_abi_version(void) {
    return OSP_PLUGIN_ABI_VERSION;
}

OSP_API const char* osp_plugin_encryption_namespace(void) {
    return kNamespace;
}

OSP_API OspErrorCode osp_provider_create(
    const char* data_dir,
    const OspHostServices* host,
    OspProviderHandle** out_handle,
    OspError* out_error) {
    if (!data_dir || !host || !out_handle) {
        FillError(out_error, OSP_ERROR_NULL_POINTER, "null argument");
        return OSP_ERROR_NULL_POINTER;
    }
    const std::filesystem::path dir(data_dir);
    if (std::filesystem::exists(dir / "fail-create")) {
        FillError(out_error, OSP_ERROR_STORAGE, "store is locked");
        return OSP_ERROR_STORAGE;
    }

    auto* handle = new (std::nothrow) OspProviderHandle{};
    if (!handle) {
        FillError(out_error, OSP_ERROR_OUT_OF_MEMORY, "could not allocate provider");
        return OSP_ERROR_OUT_OF_MEMORY;
    }
    handle->data_dir = dir;
    handle->host = *host;
    handle->own_jid = host->own_jid ? host->own_jid : "";

    std::ifstream script(dir / "script");
    std::string line;
    while (std::getline(script, line)) {
        if (!line.empty()) {
            handle->script.push_back(line);
        }
    }
    *out_handle = handle;
    return OSP_SUCCESS;
}

OSP_API void osp_provider_destroy(OspProviderHandle* handle) {
    if (handle) {
        AppendLine(handle->data_dir / "lifecycle.log", "destroyed");
    }
    delete handle;
}

OSP_API OspErrorCode osp_provider_encrypt(
    OspProviderHandle* handle,
    const uint8_t* request,
    const size_t request_length,
    OspBuffer* out_response,
    OspError* out_error) {
    if (!handle || !out_response || (!request && request_length > 0)) {
        FillError(out_error, OSP_ERROR_NULL_POINTER, "null argument");
        return OSP_ERROR_NULL_POINTER;
    }
    EncryptRequest decoded;
    if (!decoded.ParseFromArray(request, static_cast<int>(request_length))) {
        FillError(out_error, OSP_ERROR_DECODE, "could not decode request");
        return OSP_ERROR_DECODE;
    }
    AppendLine(handle->data_dir / "requests.log", handle->own_jid + " " + DescribeRequest(decoded));

    std::string step;
    if (!handle->script.empty()) {
        step = handle->script.front();
        handle->script.pop_front();
    }
    if (step == "fail-call") {
        FillError(out_error, OSP_ERROR_INVALID_STATE, "scripted call failure");
        return OSP_ERROR_INVALID_STATE;
    }

    std::string serialized;
    if (step == "garbage") {
        serialized = "\xFF\xFF\xFF";
    } else {
        EncryptResponse response;
        Respond(handle, step, response);
        if (!response.SerializeToString(&serialized)) {
            FillError(out_error, OSP_ERROR_ENCODE, "could not encode response");
            return OSP_ERROR_ENCODE;
        }
    }

    auto* data = new (std::nothrow) uint8_t[serialized.size()];
    if (!data) {
        FillError(out_error, OSP_ERROR_OUT_OF_MEMORY, "could not allocate response");
        return OSP_ERROR_OUT_OF_MEMORY;
    }
    std::memcpy(data, serialized.data(), serialized.size());
    out_response->data = data;
    out_response->length = serialized.size();
    return OSP_SUCCESS;
}

OSP_API OspErrorCode osp_provider_set_trust(
    OspProviderHandle* handle,
    const uint8_t* request,
    const size_t request_length,
    OspError* out_error) {
    if (!handle || (!request && request_length > 0)) {
        FillError(out_error, OSP_ERROR_NULL_POINTER, "null argument");
        return OSP_ERROR_NULL_POINTER;
    }
    if (std::filesystem::exists(handle->data_dir / "fail-trust")) {
        FillError(out_error, OSP_ERROR_STORAGE, "trust store is read-only");
        return OSP_ERROR_STORAGE;
    }
    TrustRequest decoded;
    if (!decoded.ParseFromArray(request, static_cast<int>(request_length))) {
        FillError(out_error, OSP_ERROR_DECODE, "could not decode trust request");
        return OSP_ERROR_DECODE;
    }
    AppendLine(handle->data_dir / "trust.log",
               decoded.address().jid() + " " + std::to_string(decoded.address().device_id()) + " " +
               ToHex(decoded.identity_key()) + " " +
               (decoded.level() == TRUST_LEVEL_TRUSTED ? "trusted" : "distrusted"));
    return OSP_SUCCESS;
}

OSP_API void osp_buffer_free(OspBuffer* buffer) {
    if (buffer) {
        delete[] buffer->data;
        buffer->data = nullptr;
        buffer->length = 0;
    }
}

OSP_API void osp_error_free(OspError* error) {
    if (error) {
        free(error->message);
        error->message = nullptr;
    }
}

}
