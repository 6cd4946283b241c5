#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

#include "misc.h"

namespace pwgen::detail {

inline void SecureWipeString(std::string& value) {
    if (!value.empty()) {
        CryptoPP::memset_z(value.data(), 0, value.size());
    }
    value.clear();
}

template <std::size_t N>
void SecureWipeArray(std::array<std::uint8_t, N>& bytes) {
    CryptoPP::memset_z(bytes.data(), 0, bytes.size());
}

}  // namespace pwgen::detail
