/**
 * @file Errors.hpp
 * @brief Exception types raised by the casegraph core.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace casegraph::domain {

/** @brief Loaded snapshot carries an incompatible schema-version tag. */
class SnapshotSchemaMismatch : public std::runtime_error {
public:
    SnapshotSchemaMismatch(const std::string& expected, const std::string& found)
        : std::runtime_error("snapshot schema mismatch: expected '" + expected + "', found '" + found + "'"),
          m_expected(expected), m_found(found) {}

    const std::string& expected() const { return m_expected; }
    const std::string& found() const { return m_found; }

private:
    std::string m_expected;
    std::string m_found;
};

/** @brief Snapshot bytes are structurally damaged (missing tables, bad rows). */
class SnapshotFormatError : public std::runtime_error {
public:
    explicit SnapshotFormatError(const std::string& what) : std::runtime_error("snapshot format error: " + what) {}
};

/** @brief An event or question references an entity id that does not exist after apply. */
class ReferenceIntegrityViolation : public std::runtime_error {
public:
    ReferenceIntegrityViolation(const std::string& ownerId, const std::string& missingRef)
        : std::runtime_error("'" + ownerId + "' references unknown entity '" + missingRef + "'"),
          m_missingRef(missingRef) {}

    const std::string& missingReference() const { return m_missingRef; }

private:
    std::string m_missingRef;
};

/** @brief A batch was cancelled before it reached the apply phase. */
class BatchAborted : public std::runtime_error {
public:
    explicit BatchAborted(const std::string& what) : std::runtime_error(what) {}
};

/** @brief A second AppendBatch was started while one is still in flight. */
class ConcurrentBatchError : public std::runtime_error {
public:
    explicit ConcurrentBatchError(const std::string& domain)
        : std::runtime_error("a batch is already in flight for domain '" + domain + "'") {}
};

} // namespace casegraph::domain
