#include "../include/smart_http_client.h"
#include "../include/pkt_line_utils.h"
#include "../include/sha1_utils.h"
#include "../include/repository_utils.h"
#include "../include/constants.h"
#include "../include/errors.h"

#include <algorithm>
#include <set>
#include <sstream>

RefAdvertisement parseRefAdvertisement(std::span<const std::byte> body) {
    PktLineReader reader(body);
    RefAdvertisement advertisement;

    // "# service=git-upload-pack" followed by a flush-pkt.
    auto announcement = reader.readNextPacket();
    if (!announcement || announcement->is_flush || !announcement->payload.starts_with("# service=")) {
        throw ProtocolError("reference advertisement does not start with a service announcement");
    }
    auto flush = reader.readNextPacket();
    if (!flush || !flush->is_flush) {
        throw ProtocolError("expected flush-pkt after the service announcement");
    }

    bool firstLine = true;
    while (true) {
        auto packet = reader.readNextPacket();
        if (!packet) {
            throw ProtocolError("reference advertisement ended without a flush-pkt");
        }
        if (packet->is_flush) {
            break;
        }

        std::string line = chompLine(packet->payload);
        if (line.starts_with("ERR ")) {
            throw ProtocolError("remote error: " + line.substr(4));
        }

        // The first ref line carries the capability list after a NUL byte.
        if (firstLine) {
            firstLine = false;
            const size_t nulPos = line.find('\0');
            if (nulPos != std::string::npos) {
                std::istringstream caps(line.substr(nulPos + 1));
                std::string capability;
                while (caps >> capability) {
                    advertisement.capabilities.push_back(capability);
                }
                line.resize(nulPos);
            }
        }

        if (line.size() <= OBJECT_ID_HEX_SIZE + 1 || line[OBJECT_ID_HEX_SIZE] != ' ' ||
            !ObjectId::isValidHex(std::string_view(line).substr(0, OBJECT_ID_HEX_SIZE))) {
            throw ProtocolError("malformed ref advertisement line '" + line + "'");
        }
        const ObjectId id = ObjectId::fromHex(std::string_view(line).substr(0, OBJECT_ID_HEX_SIZE));
        const std::string refName = line.substr(OBJECT_ID_HEX_SIZE + 1);

        if (refName == "capabilities^{}") {
            continue; // An empty repository advertises only its capabilities.
        }
        if (refName.ends_with("^{}")) {
            continue; // Peeled tag: the commit an annotated tag points at, not a ref.
        }
        if (refName == constants::HEAD_FILE_NAME) {
            advertisement.head_id = id;
            continue;
        }
        // Ref names become paths under .git, so they must stay inside refs/.
        if (!isValidRefName(refName)) {
            throw ProtocolError("remote advertised an invalid ref name '" + refName + "'");
        }
        advertisement.refs.push_back({id, refName});
    }

    constexpr std::string_view symrefPrefix = "symref=HEAD:";
    for (const auto& capability : advertisement.capabilities) {
        if (capability.starts_with(symrefPrefix)) {
            advertisement.head_symref = capability.substr(symrefPrefix.size());
        }
    }
    return advertisement;
}

std::optional<std::string> resolveHeadRef(const RefAdvertisement& advertisement) {
    if (advertisement.head_symref) {
        return advertisement.head_symref;
    }
    if (!advertisement.head_id) {
        return std::nullopt;
    }

    std::vector<std::string> candidates;
    for (const auto& ref : advertisement.refs) {
        if (ref.id == *advertisement.head_id && ref.name.starts_with("refs/heads/")) {
            candidates.push_back(ref.name);
        }
    }
    for (std::string_view preferred : {constants::DEFAULT_BRANCH_REF, std::string_view("refs/heads/master")}) {
        if (std::find(candidates.begin(), candidates.end(), preferred) != candidates.end()) {
            return std::string(preferred);
        }
    }
    if (!candidates.empty()) {
        return candidates.front();
    }
    return std::nullopt;
}

std::vector<ObjectId> collectWants(const RefAdvertisement& advertisement) {
    std::vector<ObjectId> wants;
    std::set<ObjectId> seen;
    for (const auto& ref : advertisement.refs) {
        if (seen.insert(ref.id).second) {
            wants.push_back(ref.id);
        }
    }
    // A detached HEAD may name a commit no ref points at.
    if (advertisement.head_id && seen.insert(*advertisement.head_id).second) {
        wants.push_back(*advertisement.head_id);
    }
    return wants;
}

std::string buildUploadPackRequest(const std::vector<ObjectId>& wants) {
    std::stringstream requestBodyStream;
    for (const auto& id : wants) {
        requestBodyStream << createPktLine("want " + id.hex() + "\n");
    }
    requestBodyStream << createPktLine("");       // Flush packet
    requestBodyStream << createPktLine("done\n"); // We are done specifying what we want.
    return requestBodyStream.str();
}

std::vector<std::byte> extractPackfileData(std::span<const std::byte> response) {
    PktLineReader reader(response);

    auto nak = reader.readNextPacket();
    if (nak && !nak->is_flush && nak->payload.starts_with("ERR ")) {
        throw ProtocolError("remote error: " + chompLine(nak->payload.substr(4)));
    }
    if (!nak || nak->is_flush || chompLine(nak->payload) != "NAK") {
        throw ProtocolError("expected NAK at the start of the upload-pack response");
    }

    const auto pack = reader.remaining();
    if (pack.size() < constants::PACK_CHECKSUM_SIZE) {
        throw ProtocolError("upload-pack response is too short to contain a packfile");
    }

    // The trailer is the SHA-1 of every packfile byte before it.
    const auto packBody = pack.first(pack.size() - constants::PACK_CHECKSUM_SIZE);
    const ObjectId expected = ObjectId::fromBytes(pack.last(constants::PACK_CHECKSUM_SIZE));
    const ObjectId actual = calculateSha1(packBody);
    if (expected != actual) {
        throw ProtocolError("packfile checksum mismatch: trailer says " + expected.hex() +
                            ", content hashes to " + actual.hex());
    }
    return {packBody.begin(), packBody.end()};
}

std::string normalizeRemoteUrl(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

static void checkResponse(const HttpResponse& response, const std::string& url) {
    if (!response.error.empty()) {
        throw ProtocolError("unable to access '" + url + "': " + response.error);
    }
    if (response.status_code != 200) {
        throw ProtocolError("unable to access '" + url + "': HTTP status " + std::to_string(response.status_code));
    }
}

SmartHttpClient::SmartHttpClient(std::string url, HttpTransport& transport)
    : m_url(normalizeRemoteUrl(std::move(url))), m_transport(transport) {}

RefAdvertisement SmartHttpClient::discoverRefs() {
    const std::string discoveryUrl = m_url + "/info/refs?service=" + std::string(constants::UPLOAD_PACK_SERVICE);
    HttpResponse response = m_transport.get(discoveryUrl);
    checkResponse(response, discoveryUrl);
    return parseRefAdvertisement(std::as_bytes(std::span{response.body}));
}

std::vector<std::byte> SmartHttpClient::fetchPack(const std::vector<ObjectId>& wants) {
    const std::string uploadPackUrl = m_url + "/" + std::string(constants::UPLOAD_PACK_SERVICE);
    HttpResponse response = m_transport.post(uploadPackUrl,
                                             std::string(constants::UPLOAD_PACK_REQUEST_TYPE),
                                             std::string(constants::UPLOAD_PACK_RESULT_TYPE),
                                             buildUploadPackRequest(wants));
    checkResponse(response, uploadPackUrl);
    return extractPackfileData(std::as_bytes(std::span{response.body}));
}
