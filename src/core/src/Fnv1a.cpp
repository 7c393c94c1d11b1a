/**
 * @file Fnv1a.cpp
 * @brief FNV-1a byte mixing.
 *
 * @author siiir
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "pts/core/Fnv1a.hpp"

namespace pts::core {

Fnv1a &Fnv1a::hashBytes(std::span<const byte> data) noexcept
{
    for (const byte b : data)
    {
        _hash ^= static_cast<u64>(b);
        _hash *= kPrime;
    }
    return *this;
}

} // namespace pts::core
