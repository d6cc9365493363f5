#include "../include/zlib_utils.h"
#include <zlib.h>
#include <algorithm>
#include <climits>
#include <stdexcept>
#include <span>

namespace {

// Owns a z_stream's inflate state so inflateEnd runs on every exit path.
class Inflater {
public:
    Inflater() {
        if (inflateInit(&m_stream) != Z_OK) {
            throw std::runtime_error("zlib inflateInit failed.");
        }
    }
    ~Inflater() { inflateEnd(&m_stream); }

    Inflater(const Inflater&) = delete;
    Inflater& operator=(const Inflater&) = delete;

    z_stream* get() { return &m_stream; }

private:
    z_stream m_stream = {};
};

// Inflates a single zlib stream from the front of `input`, growing `output` as needed.
// Returns the last zlib status; Z_STREAM_END means the stream ended cleanly.
int inflateInto(std::span<const std::byte> input, size_t size_hint,
                std::vector<std::byte>& output, size_t& bytes_consumed) {
    Inflater inflater;
    z_stream* strm = inflater.get();
    strm->next_in = reinterpret_cast<Bytef*>(const_cast<std::byte*>(input.data()));
    strm->avail_in = static_cast<uInt>(std::min<size_t>(input.size(), UINT_MAX));

    // The hint comes from untrusted headers, so it only seeds the buffer up to a cap.
    constexpr size_t MAX_INITIAL_BUFFER = size_t{1} << 26;
    output.assign(std::max<size_t>(std::min(size_hint, MAX_INITIAL_BUFFER) + 1, 64), std::byte{0});

    int ret = Z_OK;
    while (ret == Z_OK) {
        size_t produced = strm->total_out;
        if (produced == output.size()) {
            output.resize(output.size() * 2);
        }
        strm->next_out = reinterpret_cast<Bytef*>(output.data() + produced);
        strm->avail_out = static_cast<uInt>(std::min<size_t>(output.size() - produced, UINT_MAX));
        ret = inflate(strm, Z_NO_FLUSH);
    }

    output.resize(strm->total_out);
    bytes_consumed = strm->total_in;
    return ret;
}

} // namespace

bool decompressZlib(std::span<const std::byte> input, std::vector<std::byte>& output) {
    size_t bytes_consumed = 0;
    // Git objects often have good compression, so 3x is a safe starting point.
    return inflateInto(input, input.size() * 3, output, bytes_consumed) == Z_STREAM_END;
}

bool compressZlib(std::span<const std::byte> input, std::vector<std::byte>& output) {
    uLong sourceLen = input.size();
    uLong destLen = compressBound(sourceLen);
    output.resize(destLen);

    int result = compress(
        reinterpret_cast<Bytef*>(output.data()), &destLen,
        reinterpret_cast<const Bytef*>(input.data()), sourceLen
    );

    if (result != Z_OK) {
        return false;
    }

    output.resize(destLen); // Shrink buffer to actual compressed size
    return true;
}

std::optional<InflateResult> inflateStream(std::span<const std::byte> input, size_t size_hint) {
    InflateResult result;
    if (inflateInto(input, size_hint, result.data, result.bytes_consumed) != Z_STREAM_END) {
        return std::nullopt;
    }
    return result;
}
