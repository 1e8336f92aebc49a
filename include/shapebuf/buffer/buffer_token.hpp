//! # Token Model
//!
//! The internal representation of a captured value: a flat sequence of
//! fixed-size tokens, one per structured-data event.
//!
//! ## Layout
//!
//! Containers are written as an opener token followed by their children;
//! there are no closer tokens. The opener's kind and count determine how many
//! child values follow:
//!
//! | Kind | Child values |
//! |------|--------------|
//! | `Some`, `NewtypeStruct`, `NewtypeVariant` | 1 |
//! | `Seq`, `Tuple`, `TupleStruct`, `TupleVariant` | `count` |
//! | `Struct`, `StructVariant` | `count` (names in the field table) |
//! | `Map` | `2 * count` (key, value, key, value, ...) |
//! | everything else | 0 |
//!
//! Text, bytes and names are stored in the payload store and referenced by
//! `PayloadRef`. Struct field names are stored in a side table of
//! `PayloadRef`s addressed by `NameListRef`, so every token has the same size.
//!
//! ## Example
//!
//! `{"a": 1, "b": [true, null]}` captured as a map:
//!
//! ```text
//! Map(2) Str("a") I32(1) Str("b") Seq(2) Bool(true) None
//! ```
//!
//! These types are an implementation detail of `Buffer`.

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace shapebuf::detail {

// ============================================================================
// Token Kinds
// ============================================================================

/// The closed set of token kinds.
enum class TokenKind : uint8_t {
    // Scalars
    Unit,
    Bool,
    I8,
    I16,
    I32,
    I64,
    U8,
    U16,
    U32,
    U64,
    F32,
    F64,
    Char,

    // Text and bytes
    Str,
    Bytes,

    // Optional
    None,
    Some,

    // Structs and containers
    UnitStruct,
    NewtypeStruct,
    Seq,
    Tuple,
    TupleStruct,
    Map,
    Struct,

    // Enum variants
    UnitVariant,
    NewtypeVariant,
    TupleVariant,
    StructVariant
};

/// Shape name of a token kind as used in error messages (e.g. "i32", "string").
[[nodiscard]] auto token_kind_name(TokenKind kind) -> const char*;

/// Returns true for the integer and float kinds.
[[nodiscard]] auto is_numeric(TokenKind kind) -> bool;

/// Returns true for the four variant kinds.
[[nodiscard]] auto is_variant(TokenKind kind) -> bool;

// ============================================================================
// References
// ============================================================================

/// Reference to one payload store entry.
struct PayloadRef {
    uint32_t index = 0;  ///< Entry index in the payload store
    uint32_t length = 0; ///< Entry length in bytes
};

/// Reference to a run of names in the field-name table.
struct NameListRef {
    uint32_t offset = 0; ///< First name in the table
    uint32_t length = 0; ///< Number of names
};

// ============================================================================
// Token
// ============================================================================

/// One structured-data event.
///
/// All tokens have the same size. Fields a kind does not use stay zero.
struct Token {
    TokenKind kind = TokenKind::Unit;

    /// Child count of a container (entries for maps, fields for structs).
    uint32_t count = 0;

    /// Variant index (variant kinds only).
    uint32_t index = 0;

    /// Type name (structs, tuple structs, variants: the enum name).
    PayloadRef name;

    /// Variant name (variant kinds only).
    PayloadRef variant;

    /// Content of a `Str` or `Bytes` token.
    PayloadRef data;

    /// Field names of a `Struct` or `StructVariant` token.
    NameListRef fields;

    /// Scalar content; the active member is selected by `kind`.
    union Scalar {
        bool b;
        int64_t i;
        uint64_t u;
        float f32;
        double f64;
        char32_t c;
    } scalar{};
};

/// Number of child values that follow `token`.
[[nodiscard]] auto child_groups(const Token& token) -> size_t;

/// Checks that `tokens` encode exactly one complete value.
///
/// Walks the sequence while tracking remaining child counts on a stack; the
/// walk must end at depth zero on the last token.
[[nodiscard]] auto is_well_formed(std::span<const Token> tokens) -> bool;

} // namespace shapebuf::detail
