#pragma once

#include "common/types.hpp"
#include <nettle/sha3.h>
#include <array>
#include <span>
#include <string_view>

namespace canonical {

/// Keccak-256 as used for Ethereum-style hashing: the original Keccak
/// multi-rate padding (0x01 ... 0x80), not the FIPS-202 SHA3 domain byte.
/// The Keccak-f[1600] permutation comes from nettle; this class only runs the
/// sponge (absorb in 136-byte blocks, pad, squeeze 32 bytes).
class Keccak256 {
public:
    static constexpr size_t RATE = 136;

    Keccak256() noexcept;

    void update(std::span<const uint8_t> data) noexcept;
    void update(std::string_view text) noexcept;

    /// Pads, squeezes and resets the sponge for reuse.
    Bytes32 finalize() noexcept;

    void reset() noexcept;

private:
    void absorb_block(const uint8_t* block) noexcept;

    sha3_state state_;
    std::array<uint8_t, RATE> buffer_{};
    size_t buffered_ = 0;
};

Bytes32 keccak256(std::span<const uint8_t> data) noexcept;
Bytes32 keccak256(std::string_view text) noexcept;

} // namespace canonical
