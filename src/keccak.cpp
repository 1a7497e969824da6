#include "crypto/keccak.hpp"
#include <algorithm>
#include <cstring>

namespace canonical {

Keccak256::Keccak256() noexcept {
    reset();
}

void Keccak256::reset() noexcept {
    std::memset(&state_, 0, sizeof(state_));
    buffer_.fill(0);
    buffered_ = 0;
}

void Keccak256::absorb_block(const uint8_t* block) noexcept {
    // 17 little-endian lanes per block
    for (size_t i = 0; i < RATE / 8; ++i) {
        uint64_t lane = 0;
        for (size_t j = 0; j < 8; ++j) {
            lane |= static_cast<uint64_t>(block[i * 8 + j]) << (8 * j);
        }
        state_.a[i] ^= lane;
    }
    sha3_permute(&state_);
}

void Keccak256::update(std::span<const uint8_t> data) noexcept {
    const uint8_t* in = data.data();
    size_t remaining = data.size();
    if (remaining == 0) return;

    if (buffered_ > 0) {
        size_t take = std::min(RATE - buffered_, remaining);
        std::memcpy(buffer_.data() + buffered_, in, take);
        buffered_ += take;
        in += take;
        remaining -= take;
        if (buffered_ < RATE) return;
        absorb_block(buffer_.data());
        buffered_ = 0;
    }

    while (remaining >= RATE) {
        absorb_block(in);
        in += RATE;
        remaining -= RATE;
    }

    if (remaining > 0) {
        std::memcpy(buffer_.data(), in, remaining);
        buffered_ = remaining;
    }
}

void Keccak256::update(std::string_view text) noexcept {
    update(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size()));
}

Bytes32 Keccak256::finalize() noexcept {
    std::memset(buffer_.data() + buffered_, 0, RATE - buffered_);
    buffer_[buffered_] |= 0x01;
    buffer_[RATE - 1] |= 0x80;
    absorb_block(buffer_.data());

    Bytes32 digest;
    for (size_t i = 0; i < digest.size(); ++i) {
        digest[i] = static_cast<uint8_t>(state_.a[i / 8] >> (8 * (i % 8)));
    }

    reset();
    return digest;
}

Bytes32 keccak256(std::span<const uint8_t> data) noexcept {
    Keccak256 hasher;
    hasher.update(data);
    return hasher.finalize();
}

Bytes32 keccak256(std::string_view text) noexcept {
    Keccak256 hasher;
    hasher.update(text);
    return hasher.finalize();
}

} // namespace canonical
