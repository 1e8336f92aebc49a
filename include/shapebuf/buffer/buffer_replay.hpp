//! # Replay Path
//!
//! Turns a token sequence back into calls against a consumer.
//!
//! ## Modes
//!
//! | Entry point | Consumer | Behavior |
//! |-------------|----------|----------|
//! | `Replayer::deserialize_any` | `Visitor` | Self-describing: the recorded shape picks the visit |
//! | `Replayer::deserialize_*` | `Visitor` | Hinted: the recorded shape must belong to the hint's family |
//! | `replay_events` | `Serializer` | Push: re-emits the recorded event sequence |
//!
//! ## Shape Families
//!
//! | Hint | Accepted tokens |
//! |------|-----------------|
//! | any numeric hint | every integer and float kind, visited with its recorded width |
//! | str, identifier | `Str` |
//! | bytes | `Bytes` |
//! | option | `None`, `Some` |
//! | unit, unit_struct | `Unit`, `UnitStruct` |
//! | newtype_struct | `NewtypeStruct` |
//! | seq, tuple, tuple_struct | `Seq`, `Tuple`, `TupleStruct` (tuple hints check the length) |
//! | map, struct | `Map`, `Struct` |
//! | enum | any variant kind |
//! | ignored_any | anything |
//!
//! Elements, entries and fields a visitor leaves unread are skipped when the
//! enclosing container is finished, so the cursor stays aligned.

#pragma once

#include "shapebuf/buffer/buffer_payload.hpp"
#include "shapebuf/buffer/buffer_token.hpp"
#include "shapebuf/model/model_de.hpp"
#include "shapebuf/model/model_ser.hpp"

#include <optional>
#include <span>
#include <vector>

namespace shapebuf::detail {

// ============================================================================
// Cursor
// ============================================================================

/// A read position in a token sequence.
///
/// Tracks, for every container entered, how many child values remain. At the
/// top level exactly one value is available.
class Cursor {
public:
    explicit Cursor(std::span<const Token> tokens) : tokens_(tokens) {}

    /// True when the innermost container (or the top level) has no values left.
    [[nodiscard]] auto at_end() const -> bool;

    /// The next token, or nullptr when `at_end()`.
    [[nodiscard]] auto peek() const -> const Token*;

    /// Consumes the next token as one value of the innermost container.
    ///
    /// The token's children are not consumed; callers `enter` them.
    auto take() -> const Token&;

    /// Consumes the next value including all of its children.
    void skip_value();

    /// Opens a container whose `groups` child values follow.
    void enter(size_t groups);

    /// Skips whatever the innermost container has left and closes it.
    ///
    /// # Returns
    ///
    /// The number of child values that were skipped.
    auto leave() -> size_t;

    /// Child values left in the innermost container.
    [[nodiscard]] auto remaining() const -> size_t;

    /// Number of containers entered.
    [[nodiscard]] auto depth() const -> size_t {
        return remaining_.size();
    }

    /// Index of the next token.
    [[nodiscard]] auto position() const -> size_t {
        return pos_;
    }

private:
    std::span<const Token> tokens_;
    size_t pos_ = 0;
    bool top_taken_ = false;
    std::vector<size_t> remaining_;
};

// ============================================================================
// Replayer
// ============================================================================

/// A `Deserializer` reading one captured value.
///
/// Every element handed out by the access objects is this same replayer: the
/// tokens are read strictly in order.
class Replayer : public Deserializer {
public:
    explicit Replayer(Rc<const BufferData> data);

    auto deserialize_any(Visitor& visitor) -> Status override;

    auto deserialize_bool(Visitor& visitor) -> Status override;
    auto deserialize_i8(Visitor& visitor) -> Status override;
    auto deserialize_i16(Visitor& visitor) -> Status override;
    auto deserialize_i32(Visitor& visitor) -> Status override;
    auto deserialize_i64(Visitor& visitor) -> Status override;
    auto deserialize_u8(Visitor& visitor) -> Status override;
    auto deserialize_u16(Visitor& visitor) -> Status override;
    auto deserialize_u32(Visitor& visitor) -> Status override;
    auto deserialize_u64(Visitor& visitor) -> Status override;
    auto deserialize_f32(Visitor& visitor) -> Status override;
    auto deserialize_f64(Visitor& visitor) -> Status override;
    auto deserialize_char(Visitor& visitor) -> Status override;
    auto deserialize_str(Visitor& visitor) -> Status override;
    auto deserialize_bytes(Visitor& visitor) -> Status override;
    auto deserialize_option(Visitor& visitor) -> Status override;
    auto deserialize_unit(Visitor& visitor) -> Status override;
    auto deserialize_unit_struct(std::string_view name, Visitor& visitor) -> Status override;
    auto deserialize_newtype_struct(std::string_view name, Visitor& visitor) -> Status override;
    auto deserialize_seq(Visitor& visitor) -> Status override;
    auto deserialize_tuple(size_t len, Visitor& visitor) -> Status override;
    auto deserialize_tuple_struct(std::string_view name, size_t len, Visitor& visitor)
        -> Status override;
    auto deserialize_map(Visitor& visitor) -> Status override;
    auto deserialize_struct(std::string_view name, std::span<const std::string_view> fields,
                            Visitor& visitor) -> Status override;
    auto deserialize_enum(std::string_view name, std::span<const std::string_view> variants,
                          Visitor& visitor) -> Status override;
    auto deserialize_identifier(Visitor& visitor) -> Status override;
    auto deserialize_ignored_any(Visitor& visitor) -> Status override;

    /// True once the captured value has been read completely.
    [[nodiscard]] auto finished() const -> bool {
        return cursor_.depth() == 0 && cursor_.at_end();
    }

private:
    friend class SeqReplay;
    friend class MapReplay;
    friend class StructReplay;
    friend class EnumReplay;

    /// The next token, or an error at the end of the current container.
    auto peek_value() -> Result<const Token*, Error>;

    auto mismatch(const Token& token, std::string_view expected) const -> Error;
    auto numeric(Visitor& visitor, const char* hint) -> Status;
    auto tuple_like(size_t len, Visitor& visitor, const char* hint) -> Status;

    /// Visits `token`'s children through `visit`, then realigns the cursor.
    template <typename Fn> auto visit_container(const Token& token, Fn&& visit) -> Status;

    auto visit_enum_token(const Token& token, uint32_t index, std::string_view name,
                          Visitor& visitor) -> Status;

    auto visit_str(PayloadRef ref, Visitor& visitor) -> Status;
    auto visit_bytes(PayloadRef ref, Visitor& visitor) -> Status;

    /// The anchor to hand out with a payload entry.
    [[nodiscard]] auto anchor_for(PayloadRef ref) const -> const Anchor&;

    Rc<const BufferData> data_;
    Anchor self_anchor_;
    Cursor cursor_;
};

// ============================================================================
// Variant Resolution
// ============================================================================

/// Resolves a recorded variant against a consumer's variant list.
///
/// 1. If `index` is in range and its name equals `name` (or `name` is empty),
///    the variant at `index` is chosen.
/// 2. Otherwise, if `name` occurs in `variants`, that position is chosen.
/// 3. Otherwise, if `index` is in range, the variant at `index` is chosen.
/// 4. Otherwise there is no match.
///
/// An empty `variants` list leaves resolution to the consumer: the recorded
/// index is returned unchanged.
[[nodiscard]] auto resolve_variant(uint32_t index, std::string_view name,
                                   std::span<const std::string_view> variants)
    -> std::optional<uint32_t>;

// ============================================================================
// Push Replay
// ============================================================================

/// Re-emits the recorded events of `data` into `serializer`.
///
/// Borrowed entries are handed out with their own anchor, owned entries with
/// `data` as the anchor.
auto replay_events(const Rc<const BufferData>& data, Serializer& serializer) -> Status;

} // namespace shapebuf::detail
