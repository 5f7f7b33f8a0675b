/**
 * @file Types.hpp
 * @brief Primitive type aliases shared by every axiom module.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef AXIOM_CORE_TYPES_HPP
    #define AXIOM_CORE_TYPES_HPP

    #include <cstddef>
    #include <cstdint>

namespace axiom::core {

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i8  = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using f32 = float;
using f64 = double;

using usize = std::size_t;
using isize = std::ptrdiff_t;

} // namespace axiom::core

#endif // AXIOM_CORE_TYPES_HPP
