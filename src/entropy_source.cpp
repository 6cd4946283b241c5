#include "pwgen/entropy_source.hpp"

#include <memory>
#include <utility>

#include "cryptlib.h"
#include "osrng.h"

namespace pwgen {

namespace {

class SystemEntropySource final : public IEntropySource {
public:
    explicit SystemEntropySource(std::unique_ptr<CryptoPP::AutoSeededRandomPool> pool)
        : pool_(std::move(pool)) {}

    PwgenStatus UniformInt(const std::uint32_t bound, std::uint32_t& out_value) override {
        if (bound == 0) {
            return PwgenStatus::InvalidLength;
        }
        try {
            out_value = static_cast<std::uint32_t>(pool_->GenerateWord32(0, bound - 1U));
            return PwgenStatus::Ok;
        } catch (const CryptoPP::Exception&) {
            return PwgenStatus::EntropySourceFailure;
        }
    }

    PwgenStatus RandomBytes(std::uint8_t* out, const std::size_t length) override {
        if (length == 0) {
            return PwgenStatus::Ok;
        }
        if (out == nullptr) {
            return PwgenStatus::InvalidLength;
        }
        try {
            pool_->GenerateBlock(out, length);
            return PwgenStatus::Ok;
        } catch (const CryptoPP::Exception&) {
            return PwgenStatus::EntropySourceFailure;
        }
    }

    std::string_view Name() const override {
        return "os";
    }

private:
    std::unique_ptr<CryptoPP::AutoSeededRandomPool> pool_;
};

}  // namespace

std::unique_ptr<IEntropySource> EntropyFactory::CreateSystem(PwgenStatus& out_status) {
    std::unique_ptr<CryptoPP::AutoSeededRandomPool> pool;
    try {
        // Seeding pulls from the OS generator and throws OS_RNG_Err when it is unavailable.
        pool = std::make_unique<CryptoPP::AutoSeededRandomPool>();
    } catch (const CryptoPP::Exception&) {
        out_status = PwgenStatus::EntropySourceFailure;
        return nullptr;
    }
    out_status = PwgenStatus::Ok;
    return std::make_unique<SystemEntropySource>(std::move(pool));
}

}  // namespace pwgen
