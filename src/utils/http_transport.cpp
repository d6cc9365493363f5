#include "../include/http_transport.h"
#include "../include/constants.h"

#include <cpr/cpr.h>  // Using a library for HTTP requests simplifies the logic.

static HttpResponse toHttpResponse(const cpr::Response& response) {
    HttpResponse result{response.status_code, response.text, {}};
    if (response.error.code != cpr::ErrorCode::OK) {
        result.error = response.error.message;
    }
    return result;
}

HttpResponse CprTransport::get(const std::string& url) {
    cpr::Response response = cpr::Get(cpr::Url{url},
                                      cpr::Header{{"User-Agent", std::string(constants::USER_AGENT)}});
    return toHttpResponse(response);
}

HttpResponse CprTransport::post(const std::string& url, const std::string& contentType,
                                const std::string& accept, const std::string& body) {
    cpr::Response response = cpr::Post(cpr::Url{url},
                                       cpr::Header{{"Content-Type", contentType},
                                                   {"Accept", accept},
                                                   {"User-Agent", std::string(constants::USER_AGENT)}},
                                       cpr::Body{body});
    return toHttpResponse(response);
}
