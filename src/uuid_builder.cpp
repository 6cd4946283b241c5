#include "pwgen/uuid_builder.hpp"

#include "secure_wipe.hpp"

namespace pwgen {

PwgenStatus UuidBuilder::Generate(IEntropySource& rng, std::string& out_uuid) {
    out_uuid.clear();
    std::array<std::uint8_t, kUuidByteCount> bytes{};
    const PwgenStatus status = rng.RandomBytes(bytes.data(), bytes.size());
    if (status != PwgenStatus::Ok) {
        detail::SecureWipeArray(bytes);
        return status;
    }
    out_uuid = Render(bytes);
    detail::SecureWipeArray(bytes);
    return PwgenStatus::Ok;
}

std::string UuidBuilder::Render(std::array<std::uint8_t, kUuidByteCount> bytes) {
    static constexpr char kHex[] = "0123456789abcdef";

    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0FU) | 0x40U);
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3FU) | 0x80U);

    std::string out;
    out.reserve(kUuidTextLength);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        out.push_back(kHex[(bytes[i] >> 4U) & 0x0FU]);
        out.push_back(kHex[bytes[i] & 0x0FU]);
        if (i == 3 || i == 5 || i == 7 || i == 9) {
            out.push_back('-');
        }
    }
    detail::SecureWipeArray(bytes);
    return out;
}

}  // namespace pwgen
