#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "http_transport.h"
#include "object_id.h"

/** @struct RemoteRef
 *  @brief One "<id> <refname>" line of a reference advertisement.
 */
struct RemoteRef {
    ObjectId id;
    std::string name;
};

/** @struct RefAdvertisement
 *  @brief What the remote advertised in response to info/refs.
 */
struct RefAdvertisement {
    std::optional<ObjectId> head_id;         ///< The id HEAD resolves to, if advertised.
    std::optional<std::string> head_symref;  ///< Target of the symref=HEAD:<ref> capability.
    std::vector<RemoteRef> refs;             ///< Every ref except HEAD and peeled tag lines.
    std::vector<std::string> capabilities;
};

/**
 * @brief Parses the body of `GET info/refs?service=git-upload-pack`.
 *
 * Expects the service announcement pkt-line, a flush, the ref lines (the first
 * carrying the NUL-separated capability list) and a terminating flush.
 *
 * @throws ProtocolError if the framing is wrong or a ref line is malformed.
 */
RefAdvertisement parseRefAdvertisement(std::span<const std::byte> body);

/**
 * @brief The branch HEAD should point at after clone.
 *
 * Uses the symref capability when present; otherwise the branch whose id
 * matches HEAD, preferring refs/heads/main then refs/heads/master.
 * std::nullopt means HEAD should be detached (or the remote is empty).
 */
std::optional<std::string> resolveHeadRef(const RefAdvertisement& advertisement);

/**
 * @brief The distinct ids to request in a clone, in advertisement order.
 */
std::vector<ObjectId> collectWants(const RefAdvertisement& advertisement);

/**
 * @brief Builds the pkt-line body of an upload-pack request: one want line
 * per id, a flush, then "done".
 */
std::string buildUploadPackRequest(const std::vector<ObjectId>& wants);

/**
 * @brief Extracts the packfile from an upload-pack response.
 *
 * The response is a "NAK" pkt-line followed by the packfile. The last 20
 * bytes are the SHA-1 of the packfile bytes before them and are verified here.
 *
 * @return The packfile without its trailing checksum.
 * @throws ProtocolError if the NAK line is missing or the checksum does not match.
 */
std::vector<std::byte> extractPackfileData(std::span<const std::byte> response);

/**
 * @brief Strips trailing slashes from a remote URL.
 */
std::string normalizeRemoteUrl(std::string url);

/**
 * @class SmartHttpClient
 * @brief Client side of Git's smart HTTP protocol for one clone round-trip.
 */
class SmartHttpClient {
public:
    SmartHttpClient(std::string url, HttpTransport& transport);

    /**
     * @brief Step 1: fetches and parses the reference advertisement.
     * @throws ProtocolError on transport failure, non-200 status or bad framing.
     */
    RefAdvertisement discoverRefs();

    /**
     * @brief Step 2: requests the given ids and returns the verified packfile.
     * @throws ProtocolError on transport failure, non-200 status, bad framing or checksum mismatch.
     */
    std::vector<std::byte> fetchPack(const std::vector<ObjectId>& wants);

    const std::string& url() const { return m_url; }

private:
    std::string m_url;
    HttpTransport& m_transport;
};
