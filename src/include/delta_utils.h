#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "object_id.h"
#include "object_store.h"

// A ref-delta read from a packfile whose base has not been applied yet.
struct PendingDelta {
    ObjectId base_id;                  // The object the instructions are replayed against.
    std::vector<std::byte> instructions; // The inflated delta stream.
    size_t offset_in_packfile;         // Where the record started, for diagnostics.
};

/**
 * @brief Reads one of the size varints at the start of a delta stream.
 *
 * Each byte contributes its low 7 bits, least-significant group first; the
 * high bit marks that another byte follows.
 *
 * @param cursor Position in `data`; advanced past the integer.
 * @throws DeltaRangeError if the integer is truncated or too long.
 */
uint64_t readDeltaSize(std::span<const std::byte> data, size_t& cursor);

/**
 * @brief Applies delta instructions to a base object to reconstruct a target object.
 *
 * @param base The content of the base object.
 * @param delta The delta stream: source size, target size, then copy/insert instructions.
 * @return The reconstructed content, exactly the declared target size.
 * @throws DeltaSizeMismatchError if the declared source size differs from the base
 *         or the output size differs from the declared target size.
 * @throws DeltaRangeError if a copy leaves the base or an instruction runs past the stream.
 */
std::vector<std::byte> applyDelta(std::span<const std::byte> base, std::span<const std::byte> delta);

/**
 * @class DeltaResolver
 * @brief Turns queued ref-deltas into stored objects.
 *
 * Bases are read from the object store, so a delta resolves once its base is
 * either a literal from the same pack, an earlier resolved delta, or an
 * object that was already present.
 */
class DeltaResolver {
public:
    explicit DeltaResolver(const ObjectStore& store);

    /**
     * @brief Resolves one delta and stores the result with its base's type.
     * @throws MissingBaseError if the base is not in the store.
     */
    ObjectId resolve(const PendingDelta& delta) const;

    /**
     * @brief Resolves every delta, in as many passes as the base chains need.
     *
     * Deltas whose base is not yet stored are deferred to the next pass; a
     * pass that resolves nothing means a base is genuinely missing.
     *
     * @return The ids of the resolved objects, in resolution order.
     * @throws MissingBaseError naming the first base that never became available.
     */
    std::vector<ObjectId> resolveAll(std::vector<PendingDelta> pending) const;

private:
    const ObjectStore& m_store;
};
