#pragma once

#include <cstddef>
#include <cstdint>


namespace rc
{

//
// Primitives
//

// Explicitly-sized primitive types
// Slot indices and counts use the signed isize, so "capacity - used" and the -1 sentinel never wrap.

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

// generic bytes
using byte = std::byte;

// signed size type
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Errors
//

template <class T, class E>
struct result;
template <class E>
struct as_error_t;

template <class T>
struct capacity_exceeded;

//
// Storage
//

template <class T, isize N>
struct slot_storage;

template <class T, isize N>
struct rack;
template <class T>
struct unit;

template <class T>
struct slot_ref;
template <class T>
struct slot_mut;

namespace impl
{
template <class T>
struct slot;
template <class T>
struct rack_core;
} // namespace impl

} // namespace rc
