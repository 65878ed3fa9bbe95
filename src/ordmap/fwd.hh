#pragma once

#include <cstddef>
#include <cstdint>


namespace om
{

//
// Primitives
//

// Explicitly-sized primitive types
// "int" stays the default for small counts and loop counters.

// signed integers
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// unsigned integers
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// floating point
using f32 = float;
using f64 = double;

// signed size type
// Sizes and positions are signed: "count() - 1" on an empty map must not wrap around.
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Callables
//

template <class Signature>
struct function_ref;

//
// Container
//

struct nullopt_t;
template <class T>
struct optional;

struct identity;
struct map_key;

template <class V>
struct ordered_map;
template <class V>
struct map_traits;

enum class merge_mode
{
    shallow,   // incoming values replace colliding ones
    recursive, // colliding nested maps are merged, everything else is replaced
};

//
// Dynamic values
//

struct value;

//
// Errors
//

struct map_error;
struct invalid_key_error;
struct key_not_found_error;

} // namespace om
