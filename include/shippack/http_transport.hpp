#pragma once

#include "shippack/rate_quote.hpp"

namespace shippack {

// libcurl-backed RateTransport: POSTs the JSON body to `base_url + path` with
// "Authorization: <auth_scheme> <token>". Non-2xx replies and transfer errors throw
// std::runtime_error. Safe to call from the quoting thread.
RateTransport make_curl_transport(const RateServiceConfig& config);

}  // namespace shippack
