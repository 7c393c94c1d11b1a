/**
 * @file Fnv1a.hpp
 * @brief Incremental FNV-1a hasher used to mix coordinate hashes.
 *
 * @author siiir
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PTS_CORE_FNV1A_HPP
    #define PTS_CORE_FNV1A_HPP

    #include "Concepts.hpp"
    #include "Types.hpp"

    #include <span>

namespace pts::core {

/**
 * @brief 64-bit FNV-1a accumulator.
 *
 * Feeding the same values in the same order always yields the same digest.
 */
class Fnv1a final {
public:
    static constexpr u64 kOffsetBasis = 14695981039346656037ULL;
    static constexpr u64 kPrime       = 1099511628211ULL;

    constexpr Fnv1a() = default;

    /**
     * @brief Feed a span of raw bytes into the hash.
     * @param data Byte span.
     * @return Reference to this hasher (for chaining).
     */
    Fnv1a &hashBytes(std::span<const byte> data) noexcept;

    /**
     * @brief Feed a trivially-copyable value into the hash.
     * @tparam T Blittable type.
     * @param value Value to hash.
     * @return Reference to this hasher (for chaining).
     */
    template <Blittable T>
    Fnv1a &combine(const T &value) noexcept
    {
        const auto *ptr = reinterpret_cast<const byte *>(&value);
        return hashBytes({ptr, sizeof(T)});
    }

    [[nodiscard]] constexpr u64 digest() const noexcept { return _hash; }

private:
    u64 _hash = kOffsetBasis;
};

} // namespace pts::core

#endif // PTS_CORE_FNV1A_HPP
