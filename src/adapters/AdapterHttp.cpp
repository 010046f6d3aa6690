#include "AdapterHttp.hpp"
#include "../model/Errors.hpp"

namespace Cadenza {
namespace AdapterHttp {

void CheckResponse(const FetchResult& result, const std::string& backend) {
    if (result.timed_out) {
        throw BackendTimeout(backend + ": request timed out", {backend});
    }
    if (!result.error.empty()) {
        throw BackendUnavailable(backend + ": " + result.error, {backend});
    }
    const long code = result.status_code;
    if (code == 429 || code >= 500) {
        throw BackendUnavailable(backend + ": HTTP " + std::to_string(code), {backend});
    }
    if (code < 200 || code >= 300) {
        throw BackendProtocolError(backend + ": unexpected HTTP " + std::to_string(code), {backend});
    }
}

nlohmann::json ParseJson(const FetchResult& result, const std::string& backend) {
    CheckResponse(result, backend);
    if (result.truncated) {
        throw BackendProtocolError(backend + ": response body exceeded the size limit", {backend});
    }
    auto data = nlohmann::json::parse(result.content, nullptr, false);
    if (data.is_discarded()) {
        throw BackendProtocolError(backend + ": response is not valid JSON", {backend});
    }
    return data;
}

}
}
