#pragma once

#include <stdexcept>
#include <string>

#include "object_id.h"

/**
 * @file
 * @brief Exception types raised by the object store, codecs and fetch pipeline.
 *
 * Every error derives from GitError so the command layer can report any of
 * them uniformly as a fatal failure.
 */

class GitError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Stored bytes don't match their declared framing, or the object is missing.
class CorruptObjectError : public GitError {
public:
    using GitError::GitError;
};

// Packfile header, record framing or object count is invalid.
class CorruptPackError : public GitError {
public:
    using GitError::GitError;
};

// HTTP failure, bad pkt-line framing or pack checksum mismatch.
class ProtocolError : public GitError {
public:
    using GitError::GitError;
};

// A ref-delta names a base object that is not in the store.
class MissingBaseError : public GitError {
public:
    MissingBaseError(const ObjectId& baseId)
        : GitError("missing delta base " + baseId.hex()), m_baseId(baseId) {}

    const ObjectId& baseId() const { return m_baseId; }

private:
    ObjectId m_baseId;
};

// Delta declared sizes disagree with the base or with the produced output.
class DeltaSizeMismatchError : public GitError {
public:
    using GitError::GitError;
};

// A delta instruction reads outside the base object or the instruction stream.
class DeltaRangeError : public GitError {
public:
    using GitError::GitError;
};

// Writing to the repository on disk failed.
class StorageError : public GitError {
public:
    using GitError::GitError;
};
