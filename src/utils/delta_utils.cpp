#include "../include/delta_utils.h"
#include "../include/constants.h"
#include "../include/errors.h"

#include <algorithm>
#include <string>

uint64_t readDeltaSize(std::span<const std::byte> data, size_t& cursor) {
    uint64_t value = 0;
    int shift = 0;
    uint8_t current_byte = 0;
    do {
        if (cursor >= data.size()) {
            throw DeltaRangeError("delta stream ends inside a size header");
        }
        if (shift > 63) {
            throw DeltaRangeError("delta size header is too long");
        }
        current_byte = std::to_integer<uint8_t>(data[cursor++]);
        value |= static_cast<uint64_t>(current_byte & 0x7F) << shift;
        shift += 7;
    } while ((current_byte & 0x80) != 0); // Continue if MSB is set.
    return value;
}

std::vector<std::byte> applyDelta(std::span<const std::byte> base, std::span<const std::byte> delta) {
    size_t cursor = 0;

    // 1. Header: expected base size, then the size of the object being rebuilt.
    const uint64_t source_size = readDeltaSize(delta, cursor);
    if (source_size != base.size()) {
        throw DeltaSizeMismatchError("delta expects a base of " + std::to_string(source_size) +
                                     " bytes but the base has " + std::to_string(base.size()));
    }
    const uint64_t target_size = readDeltaSize(delta, cursor);

    std::vector<std::byte> result_data;
    result_data.reserve(std::min<uint64_t>(target_size, base.size() + delta.size()));

    auto next_byte = [&]() -> uint64_t {
        if (cursor >= delta.size()) {
            throw DeltaRangeError("delta stream ends inside a copy instruction");
        }
        return std::to_integer<uint64_t>(delta[cursor++]);
    };

    auto check_room = [&](uint64_t size) {
        if (size > target_size - result_data.size()) {
            throw DeltaSizeMismatchError("delta produces more than the declared " +
                                         std::to_string(target_size) + " bytes");
        }
    };

    // 2. Replay the instructions until the end of the stream.
    while (cursor < delta.size()) {
        const uint8_t opcode = std::to_integer<uint8_t>(delta[cursor++]);

        if ((opcode & 0x80) != 0) {
            // Copy: bits 0-3 flag which offset bytes follow, bits 4-6 which size bytes.
            uint64_t offset = 0;
            uint64_t size = 0;
            for (int i = 0; i < 4; ++i) {
                if ((opcode & (0x01 << i)) != 0) offset |= next_byte() << (8 * i);
            }
            for (int i = 0; i < 3; ++i) {
                if ((opcode & (0x10 << i)) != 0) size |= next_byte() << (8 * i);
            }
            if (size == 0) {
                size = constants::DELTA_DEFAULT_COPY_SIZE;
            }

            if (offset > base.size() || size > base.size() - offset) {
                throw DeltaRangeError("delta copies " + std::to_string(size) + " bytes at offset " +
                                      std::to_string(offset) + " from a base of " +
                                      std::to_string(base.size()) + " bytes");
            }
            check_room(size);
            auto source = base.subspan(offset, size);
            result_data.insert(result_data.end(), source.begin(), source.end());

        } else if (opcode != 0) {
            // Insert: the opcode itself is the number of literal bytes that follow.
            if (opcode > delta.size() - cursor) {
                throw DeltaRangeError("delta insert of " + std::to_string(opcode) +
                                      " bytes runs past the end of the stream");
            }
            check_room(opcode);
            auto literal = delta.subspan(cursor, opcode);
            result_data.insert(result_data.end(), literal.begin(), literal.end());
            cursor += opcode;

        } else {
            throw DeltaRangeError("reserved delta opcode 0x00");
        }
    }

    if (result_data.size() != target_size) {
        throw DeltaSizeMismatchError("delta produced " + std::to_string(result_data.size()) +
                                     " bytes but declared " + std::to_string(target_size));
    }

    return result_data;
}

DeltaResolver::DeltaResolver(const ObjectStore& store) : m_store(store) {}

ObjectId DeltaResolver::resolve(const PendingDelta& delta) const {
    if (!m_store.contains(delta.base_id)) {
        throw MissingBaseError(delta.base_id);
    }
    const GitObject base = m_store.get(delta.base_id);
    const std::vector<std::byte> content = applyDelta(base.content, delta.instructions);
    // The resolved object has the same type as its base.
    return m_store.put(base.type, content);
}

std::vector<ObjectId> DeltaResolver::resolveAll(std::vector<PendingDelta> pending) const {
    std::vector<ObjectId> resolved;

    while (!pending.empty()) {
        std::vector<PendingDelta> deferred;
        const size_t resolved_before = resolved.size();

        for (auto& delta : pending) {
            if (!m_store.contains(delta.base_id)) {
                deferred.push_back(std::move(delta)); // Base not ready, try again next pass.
                continue;
            }
            resolved.push_back(resolve(delta));
        }

        if (resolved.size() == resolved_before) {
            throw MissingBaseError(deferred.front().base_id);
        }
        pending = std::move(deferred);
    }
    return resolved;
}
