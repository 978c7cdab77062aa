// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#ifndef PROVCHAIN_CORE_ERRORS_H
#define PROVCHAIN_CORE_ERRORS_H

#include <cstdint>
#include <stdexcept>
#include <string>

/**
 * Error kinds surfaced by the ledger core.
 *
 * Pure computations (term serialization, canonicalization) throw the
 * exception types below. Store, chain and ledger entry points return bool
 * and fill a CCoreError.
 */

/** A term could not be rendered in canonical lexical form */
class SerializationError : public std::runtime_error {
public:
    explicit SerializationError(const std::string& what)
        : std::runtime_error(what) {}
};

/** The standards canonicalization exceeded its permutation or time budget */
class CanonicalizationTimeout : public std::runtime_error {
public:
    CanonicalizationTimeout(const std::string& what, uint64_t steps)
        : std::runtime_error(what), m_steps(steps) {}

    /** Budget units consumed when the search was aborted */
    uint64_t GetSteps() const { return m_steps; }

private:
    uint64_t m_steps;
};

enum class CoreErrorKind {
    NONE,
    SERIALIZATION,
    CANONICALIZATION_TIMEOUT,
    CHAIN_LINK,
    INTEGRITY,
    STORE
};

const char* GetCoreErrorKindName(CoreErrorKind kind);

struct CCoreError {
    CoreErrorKind kind;
    std::string message;
    uint64_t index;          // Offending block index, when one applies

    CCoreError() : kind(CoreErrorKind::NONE), index(0) {}
    CCoreError(CoreErrorKind k, const std::string& msg, uint64_t idx = 0)
        : kind(k), message(msg), index(idx) {}

    bool IsNull() const { return kind == CoreErrorKind::NONE; }

    /** "<Kind>: message" */
    std::string ToString() const;
};

#endif // PROVCHAIN_CORE_ERRORS_H
