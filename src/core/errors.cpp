// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#include <core/errors.h>

const char* GetCoreErrorKindName(CoreErrorKind kind) {
    switch (kind) {
        case CoreErrorKind::NONE: return "None";
        case CoreErrorKind::SERIALIZATION: return "SerializationError";
        case CoreErrorKind::CANONICALIZATION_TIMEOUT: return "CanonicalizationTimeout";
        case CoreErrorKind::CHAIN_LINK: return "ChainLinkError";
        case CoreErrorKind::INTEGRITY: return "IntegrityError";
        case CoreErrorKind::STORE: return "StoreError";
    }
    return "Unknown";
}

std::string CCoreError::ToString() const {
    return std::string(GetCoreErrorKindName(kind)) + ": " + message;
}
