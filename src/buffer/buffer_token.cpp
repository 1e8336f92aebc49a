//! # Token Model Implementation

#include "shapebuf/buffer/buffer_token.hpp"

namespace shapebuf::detail {

auto token_kind_name(TokenKind kind) -> const char* {
    switch (kind) {
    case TokenKind::Unit:
        return "unit";
    case TokenKind::Bool:
        return "bool";
    case TokenKind::I8:
        return "i8";
    case TokenKind::I16:
        return "i16";
    case TokenKind::I32:
        return "i32";
    case TokenKind::I64:
        return "i64";
    case TokenKind::U8:
        return "u8";
    case TokenKind::U16:
        return "u16";
    case TokenKind::U32:
        return "u32";
    case TokenKind::U64:
        return "u64";
    case TokenKind::F32:
        return "f32";
    case TokenKind::F64:
        return "f64";
    case TokenKind::Char:
        return "char";
    case TokenKind::Str:
        return "string";
    case TokenKind::Bytes:
        return "bytes";
    case TokenKind::None:
        return "none";
    case TokenKind::Some:
        return "some";
    case TokenKind::UnitStruct:
        return "unit struct";
    case TokenKind::NewtypeStruct:
        return "newtype struct";
    case TokenKind::Seq:
        return "sequence";
    case TokenKind::Tuple:
        return "tuple";
    case TokenKind::TupleStruct:
        return "tuple struct";
    case TokenKind::Map:
        return "map";
    case TokenKind::Struct:
        return "struct";
    case TokenKind::UnitVariant:
        return "unit variant";
    case TokenKind::NewtypeVariant:
        return "newtype variant";
    case TokenKind::TupleVariant:
        return "tuple variant";
    case TokenKind::StructVariant:
        return "struct variant";
    }
    return "unknown";
}

auto is_numeric(TokenKind kind) -> bool {
    switch (kind) {
    case TokenKind::I8:
    case TokenKind::I16:
    case TokenKind::I32:
    case TokenKind::I64:
    case TokenKind::U8:
    case TokenKind::U16:
    case TokenKind::U32:
    case TokenKind::U64:
    case TokenKind::F32:
    case TokenKind::F64:
        return true;
    default:
        return false;
    }
}

auto is_variant(TokenKind kind) -> bool {
    return kind == TokenKind::UnitVariant || kind == TokenKind::NewtypeVariant ||
           kind == TokenKind::TupleVariant || kind == TokenKind::StructVariant;
}

auto child_groups(const Token& token) -> size_t {
    switch (token.kind) {
    case TokenKind::Some:
    case TokenKind::NewtypeStruct:
    case TokenKind::NewtypeVariant:
        return 1;
    case TokenKind::Seq:
    case TokenKind::Tuple:
    case TokenKind::TupleStruct:
    case TokenKind::TupleVariant:
    case TokenKind::Struct:
    case TokenKind::StructVariant:
        return token.count;
    case TokenKind::Map:
        return 2 * static_cast<size_t>(token.count);
    default:
        return 0;
    }
}

auto is_well_formed(std::span<const Token> tokens) -> bool {
    if (tokens.empty()) {
        return false;
    }

    // Remaining child values of each open container; the bottom entry is the
    // single top-level value.
    std::vector<size_t> remaining{1};
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (remaining.empty()) {
            return false; // tokens after the top-level value
        }
        --remaining.back();

        size_t children = child_groups(tokens[i]);
        if (children > 0) {
            remaining.push_back(children);
        }
        while (!remaining.empty() && remaining.back() == 0) {
            remaining.pop_back();
        }
    }
    return remaining.empty();
}

} // namespace shapebuf::detail
