/**
 * @file itransport.hpp
 * @brief Interface for the HTTP transport used by flagsync.
 *
 * The core never talks to sockets: the host injects an ITransport that knows
 * how to reach the settings CDN and the ingestion API. Every call is
 * synchronous and may block; the core only calls it from pool threads or
 * from explicit flush/check calls.
 */
#pragma once
#include <optional>
#include <string>
#include "flagsync/core/util/error_types.hpp"

namespace flagsync {

    /**
     * @struct HttpMetadata
     * @brief Validators returned by the settings endpoint (ETag / Last-Modified).
     */
    struct HttpMetadata {
        std::optional<std::string> etag;          ///< ETag header
        std::optional<std::string> lastModified;  ///< Last-Modified header

        bool empty() const { return !etag && !lastModified; }
        bool operator==(const HttpMetadata&) const = default;
    };

    /**
     * @struct HttpResponse
     * @brief Status, body and validators of a completed request.
     */
    struct HttpResponse {
        int          status{ 200 };  ///< HTTP status code
        std::string  body;           ///< Response body
        HttpMetadata metadata;       ///< Response validators

        bool notModified() const { return status == 304; }
    };

    /**
     * @class ITransport
     * @brief Transport collaborator.
     *
     * Implementations report transport failures, timeouts and non-2xx
     * statuses (other than 304 on fetchFull) as ErrorKind::Network.
     */
    class ITransport {
    public:
        virtual ~ITransport() = default;

        /**
         * @brief POST a JSON body.
         * @param url Target URL
         * @param body Serialized JSON body
         */
        virtual Result<HttpResponse> post(const std::string& url, const std::string& body) = 0;

        /**
         * @brief Lightweight probe (HEAD or equivalent) returning only validators.
         * @param url Target URL
         */
        virtual Result<HttpMetadata> fetchMetadata(const std::string& url) = 0;

        /**
         * @brief Conditional GET of a full document.
         * @param url Target URL
         * @param etag Sent as If-None-Match when present
         * @param lastModified Sent as If-Modified-Since when present
         * @return Response; status 304 means the cached copy is current
         */
        virtual Result<HttpResponse> fetchFull(const std::string& url,
                                               const std::optional<std::string>& etag,
                                               const std::optional<std::string>& lastModified) = 0;
    };

}
