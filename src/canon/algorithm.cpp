// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#include <canon/algorithm.h>

const char* GetAlgorithmName(CanonicalizationAlgorithm algorithm) {
    switch (algorithm) {
        case CanonicalizationAlgorithm::CUSTOM: return "custom";
        case CanonicalizationAlgorithm::RDFC10: return "rdfc-1.0";
    }
    return "unknown";
}

bool ParseAlgorithmName(const std::string& name, CanonicalizationAlgorithm& algorithm) {
    if (name == "custom") {
        algorithm = CanonicalizationAlgorithm::CUSTOM;
        return true;
    }
    if (name == "rdfc-1.0") {
        algorithm = CanonicalizationAlgorithm::RDFC10;
        return true;
    }
    return false;
}

bool AlgorithmFromByte(uint8_t value, CanonicalizationAlgorithm& algorithm) {
    switch (value) {
        case static_cast<uint8_t>(CanonicalizationAlgorithm::CUSTOM):
            algorithm = CanonicalizationAlgorithm::CUSTOM;
            return true;
        case static_cast<uint8_t>(CanonicalizationAlgorithm::RDFC10):
            algorithm = CanonicalizationAlgorithm::RDFC10;
            return true;
    }
    return false;
}
