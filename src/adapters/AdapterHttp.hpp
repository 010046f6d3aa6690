#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "../interfaces/IHttpFetcher.hpp"

namespace Cadenza {
namespace AdapterHttp {

// Maps transport and status failures onto the backend error kinds:
// timeout -> BackendTimeout; connection failure, 429 and 5xx -> BackendUnavailable;
// any other non-2xx -> BackendProtocolError.
void CheckResponse(const FetchResult& result, const std::string& backend);

// CheckResponse, then parse the body. Unparsable bodies are protocol errors.
nlohmann::json ParseJson(const FetchResult& result, const std::string& backend);

}
}
