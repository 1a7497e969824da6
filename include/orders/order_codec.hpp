#pragma once

#include "common/types.hpp"
#include "crypto/typed_signature.hpp"
#include <optional>
#include <span>
#include <variant>
#include <vector>

namespace canonical {

/// Fill payload: 14 ABI words (11 order + 3 trade args), optionally followed by
/// a 66-byte typed signature.
struct FillPayload {
    Order order;
    TradeArgs trade_args;
    std::optional<SignatureBytes> signature;
};

/// Delegated call discriminant (leading word of the payload).
enum class DelegatedCallType : uint8_t {
    Approve = 0,
    Cancel = 1,
    SetTradeArgs = 2
};

struct ApproveCall { Order order; };
struct CancelCall { Order order; };
struct SetTradeArgsCall { TradeArgs trade_args; };

using DelegatedCall = std::variant<ApproveCall, CancelCall, SetTradeArgsCall>;

constexpr size_t DELEGATED_ORDER_CALL_BYTES = WORD_BYTES + ORDER_STRUCT_BYTES;                  // 384
constexpr size_t DELEGATED_TRADE_ARGS_CALL_BYTES = WORD_BYTES + TRADE_ARGS_WORDS * WORD_BYTES;  // 128

// Flags word: bit 0 buy, bit 1 decrease-only, bit 2 negative fee, salt above.
constexpr unsigned SALT_BITS = 253;

/// False when the salt needs more than SALT_BITS bits. Such an order has no
/// wire form, and encode_flags would drop its high salt bits.
bool flags_encodable(const OrderFlags& flags);

Uint256 encode_flags(const OrderFlags& flags);
OrderFlags decode_flags(const Uint256& word);

// Fixed-layout word blocks. Decoders are strict: address words must have their
// upper 12 bytes clear and bool words must be 0 or 1.
void encode_order_words(const Order& order, uint8_t* out);
bool decode_order_words(const uint8_t* in, Order& out);
void encode_trade_args_words(const TradeArgs& args, uint8_t* out);
bool decode_trade_args_words(const uint8_t* in, TradeArgs& out);

/// Accepts exactly ORDER_BYTES or ORDER_BYTES + SIGNATURE_BYTES.
bool decode_fill_payload(std::span<const uint8_t> data, FillPayload& out);
std::vector<uint8_t> encode_fill_payload(const Order& order, const TradeArgs& args,
                                         const std::optional<SignatureBytes>& signature = std::nullopt);

bool decode_delegated_call(std::span<const uint8_t> data, DelegatedCall& out);
std::vector<uint8_t> encode_delegated_call(const DelegatedCall& call);

} // namespace canonical
