#pragma once

#include <string>

/** @struct HttpResponse
 *  @brief The parts of an HTTP response the smart protocol needs.
 */
struct HttpResponse {
    long status_code;  ///< 0 when the request never reached the server.
    std::string body;  ///< Raw response bytes.
    std::string error; ///< Transport-level error description, empty on success.
};

/**
 * @class HttpTransport
 * @brief Blocking HTTP client used by the smart protocol.
 *
 * Lets clone run against a real server (CprTransport) or an in-memory fixture.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse get(const std::string& url) = 0;

    virtual HttpResponse post(const std::string& url, const std::string& contentType,
                              const std::string& accept, const std::string& body) = 0;
};

/**
 * @class CprTransport
 * @brief HttpTransport backed by the cpr library.
 */
class CprTransport : public HttpTransport {
public:
    HttpResponse get(const std::string& url) override;

    HttpResponse post(const std::string& url, const std::string& contentType,
                      const std::string& accept, const std::string& body) override;
};
