// Copyright (c) 2025 The ProvChain Core developers
// Distributed under the MIT software license

#include <uint256.h>
#include <util/strencodings.h>

#include <ostream>
#include <vector>

std::string uint256::GetHex() const {
    return HexStr(data, WIDTH);
}

bool uint256::SetHex(const std::string& str) {
    if (str.size() != WIDTH * 2) {
        return false;
    }
    std::vector<uint8_t> bytes = ParseHex(str);
    if (bytes.size() != WIDTH) {
        return false;
    }
    memcpy(data, bytes.data(), WIDTH);
    return true;
}

uint256 uint256::FromHex(const std::string& str, bool& ok) {
    uint256 result;
    ok = result.SetHex(str);
    return result;
}

std::ostream& operator<<(std::ostream& os, const uint256& h) {
    return os << h.GetHex();
}
