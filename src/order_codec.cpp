#include "orders/order_codec.hpp"
#include "common/utils.hpp"
#include <algorithm>

namespace canonical {

namespace {

constexpr unsigned IS_BUY_BIT = 0;
constexpr unsigned IS_DECREASE_ONLY_BIT = 1;
constexpr unsigned IS_NEGATIVE_FEE_BIT = 2;
constexpr unsigned SALT_SHIFT = 3;
static_assert(SALT_SHIFT + SALT_BITS == 256, "salt fills the flags word");

constexpr size_t ADDRESS_PADDING = WORD_BYTES - sizeof(Address);  // 12

// Order word indices
enum OrderWord : size_t {
    FLAGS = 0,
    BASE_MARKET,
    QUOTE_MARKET,
    AMOUNT,
    LIMIT_PRICE,
    TRIGGER_PRICE,
    LIMIT_FEE,
    MAKER_ACCOUNT_OWNER,
    MAKER_ACCOUNT_NUMBER,
    TAKER,
    EXPIRATION
};

inline uint8_t* word_at(uint8_t* base, size_t index) { return base + index * WORD_BYTES; }
inline const uint8_t* word_at(const uint8_t* base, size_t index) { return base + index * WORD_BYTES; }

void store_address(const Address& address, uint8_t* out) {
    std::fill(out, out + ADDRESS_PADDING, 0);
    std::copy(address.begin(), address.end(), out + ADDRESS_PADDING);
}

bool load_address(const uint8_t* in, Address& out) {
    for (size_t i = 0; i < ADDRESS_PADDING; ++i) {
        if (in[i] != 0) return false;
    }
    std::copy(in + ADDRESS_PADDING, in + WORD_BYTES, out.begin());
    return true;
}

void store_bool(bool value, uint8_t* out) {
    std::fill(out, out + WORD_BYTES, 0);
    out[WORD_BYTES - 1] = value ? 1 : 0;
}

bool load_bool(const uint8_t* in, bool& out) {
    for (size_t i = 0; i < WORD_BYTES - 1; ++i) {
        if (in[i] != 0) return false;
    }
    if (in[WORD_BYTES - 1] > 1) return false;
    out = in[WORD_BYTES - 1] == 1;
    return true;
}

bool load_call_type(const uint8_t* in, DelegatedCallType& out) {
    Uint256 tag = load_word(in);
    if (tag > static_cast<unsigned>(DelegatedCallType::SetTradeArgs)) return false;
    out = static_cast<DelegatedCallType>(static_cast<uint8_t>(tag));
    return true;
}

} // anonymous namespace

bool flags_encodable(const OrderFlags& flags) {
    return (flags.salt >> SALT_BITS) == 0;
}

Uint256 encode_flags(const OrderFlags& flags) {
    Uint256 word = flags.salt << SALT_SHIFT;
    if (flags.is_buy) word |= Uint256(1) << IS_BUY_BIT;
    if (flags.is_decrease_only) word |= Uint256(1) << IS_DECREASE_ONLY_BIT;
    if (flags.is_negative_fee) word |= Uint256(1) << IS_NEGATIVE_FEE_BIT;
    return word;
}

OrderFlags decode_flags(const Uint256& word) {
    OrderFlags flags;
    flags.salt = word >> SALT_SHIFT;
    flags.is_buy = bit_test(word, IS_BUY_BIT);
    flags.is_decrease_only = bit_test(word, IS_DECREASE_ONLY_BIT);
    flags.is_negative_fee = bit_test(word, IS_NEGATIVE_FEE_BIT);
    return flags;
}

void encode_order_words(const Order& order, uint8_t* out) {
    store_word(encode_flags(order.flags), word_at(out, FLAGS));
    store_word(order.base_market, word_at(out, BASE_MARKET));
    store_word(order.quote_market, word_at(out, QUOTE_MARKET));
    store_word(order.amount, word_at(out, AMOUNT));
    store_word(order.limit_price, word_at(out, LIMIT_PRICE));
    store_word(order.trigger_price, word_at(out, TRIGGER_PRICE));
    store_word(order.limit_fee, word_at(out, LIMIT_FEE));
    store_address(order.maker_account_owner, word_at(out, MAKER_ACCOUNT_OWNER));
    store_word(order.maker_account_number, word_at(out, MAKER_ACCOUNT_NUMBER));
    store_address(order.taker, word_at(out, TAKER));
    store_word(order.expiration, word_at(out, EXPIRATION));
}

bool decode_order_words(const uint8_t* in, Order& out) {
    Order order;
    order.flags = decode_flags(load_word(word_at(in, FLAGS)));
    order.base_market = load_word(word_at(in, BASE_MARKET));
    order.quote_market = load_word(word_at(in, QUOTE_MARKET));
    order.amount = load_word(word_at(in, AMOUNT));
    order.limit_price = load_word(word_at(in, LIMIT_PRICE));
    order.trigger_price = load_word(word_at(in, TRIGGER_PRICE));
    order.limit_fee = load_word(word_at(in, LIMIT_FEE));
    if (!load_address(word_at(in, MAKER_ACCOUNT_OWNER), order.maker_account_owner)) return false;
    order.maker_account_number = load_word(word_at(in, MAKER_ACCOUNT_NUMBER));
    if (!load_address(word_at(in, TAKER), order.taker)) return false;
    order.expiration = load_word(word_at(in, EXPIRATION));

    out = order;
    return true;
}

void encode_trade_args_words(const TradeArgs& args, uint8_t* out) {
    store_word(args.price, word_at(out, 0));
    store_word(args.fee, word_at(out, 1));
    store_bool(args.is_negative_fee, word_at(out, 2));
}

bool decode_trade_args_words(const uint8_t* in, TradeArgs& out) {
    TradeArgs args;
    args.price = load_word(word_at(in, 0));
    args.fee = load_word(word_at(in, 1));
    if (!load_bool(word_at(in, 2), args.is_negative_fee)) return false;

    out = args;
    return true;
}

bool decode_fill_payload(std::span<const uint8_t> data, FillPayload& out) {
    if (data.size() != ORDER_BYTES && data.size() != ORDER_BYTES + SIGNATURE_BYTES) {
        return false;
    }

    FillPayload payload;
    if (!decode_order_words(data.data(), payload.order)) return false;
    if (!decode_trade_args_words(data.data() + ORDER_STRUCT_BYTES, payload.trade_args)) return false;

    if (data.size() == ORDER_BYTES + SIGNATURE_BYTES) {
        SignatureBytes sig;
        std::copy(data.begin() + ORDER_BYTES, data.end(), sig.begin());
        payload.signature = sig;
    }

    out = payload;
    return true;
}

std::vector<uint8_t> encode_fill_payload(const Order& order, const TradeArgs& args,
                                         const std::optional<SignatureBytes>& signature) {
    std::vector<uint8_t> out(ORDER_BYTES + (signature ? SIGNATURE_BYTES : 0), 0);
    encode_order_words(order, out.data());
    encode_trade_args_words(args, out.data() + ORDER_STRUCT_BYTES);
    if (signature) {
        std::copy(signature->begin(), signature->end(), out.begin() + ORDER_BYTES);
    }
    return out;
}

bool decode_delegated_call(std::span<const uint8_t> data, DelegatedCall& out) {
    if (data.size() < WORD_BYTES) return false;

    DelegatedCallType type;
    if (!load_call_type(data.data(), type)) return false;
    const uint8_t* body = data.data() + WORD_BYTES;

    switch (type) {
        case DelegatedCallType::Approve:
        case DelegatedCallType::Cancel: {
            if (data.size() != DELEGATED_ORDER_CALL_BYTES) return false;
            Order order;
            if (!decode_order_words(body, order)) return false;
            if (type == DelegatedCallType::Approve) {
                out = ApproveCall{order};
            } else {
                out = CancelCall{order};
            }
            return true;
        }
        case DelegatedCallType::SetTradeArgs: {
            if (data.size() != DELEGATED_TRADE_ARGS_CALL_BYTES) return false;
            TradeArgs args;
            if (!decode_trade_args_words(body, args)) return false;
            out = SetTradeArgsCall{args};
            return true;
        }
    }
    return false;
}

std::vector<uint8_t> encode_delegated_call(const DelegatedCall& call) {
    std::vector<uint8_t> out;
    if (const auto* approve = std::get_if<ApproveCall>(&call)) {
        out.assign(DELEGATED_ORDER_CALL_BYTES, 0);
        store_word(static_cast<unsigned>(DelegatedCallType::Approve), out.data());
        encode_order_words(approve->order, out.data() + WORD_BYTES);
    } else if (const auto* cancel = std::get_if<CancelCall>(&call)) {
        out.assign(DELEGATED_ORDER_CALL_BYTES, 0);
        store_word(static_cast<unsigned>(DelegatedCallType::Cancel), out.data());
        encode_order_words(cancel->order, out.data() + WORD_BYTES);
    } else {
        const auto& set_args = std::get<SetTradeArgsCall>(call);
        out.assign(DELEGATED_TRADE_ARGS_CALL_BYTES, 0);
        store_word(static_cast<unsigned>(DelegatedCallType::SetTradeArgs), out.data());
        encode_trade_args_words(set_args.trade_args, out.data() + WORD_BYTES);
    }
    return out;
}

} // namespace canonical
