#ifndef GIF_DEF_H
#define GIF_DEF_H

#ifdef _MSC_VER

#define PACKED

#else  // _MSC_VER

#define PACKED __attribute__((packed))

#endif  // _MSC_VER

#include <cstddef>
#include <cstdint>
#include <functional>
#include <tuple>

inline constexpr uint8_t
TOU8(const uint32_t x) {
    return static_cast<uint8_t>(x & 0xFF);
}

#ifdef _MSC_VER
#pragma pack(push, 1)
#endif  // _MSC_VER

struct PixelBGRA {
    uint8_t b, g, r, a;

    inline bool
    operator==(const PixelBGRA& other) const {
        return b == other.b && g == other.g && r == other.r && a == other.a;
    }

    inline bool
    operator!=(const PixelBGRA& other) const {
        return !(*this == other);
    }

    [[nodiscard]] inline uint32_t
    toU32() const {
        return (static_cast<uint32_t>(a) << 24) | (static_cast<uint32_t>(r) << 16) | (static_cast<uint32_t>(g) << 8) |
               static_cast<uint32_t>(b);
    }
} PACKED;

static_assert(sizeof(PixelBGRA) == 4, "PixelBGRA size is not 4 bytes!");

#ifdef _MSC_VER
#pragma pack(pop)
#endif  // _MSC_VER

struct PixelBGRAHash {
    std::size_t
    operator()(const PixelBGRA& pixel) const {
        return std::hash<uint32_t>()(pixel.toU32());
    }
};

inline constexpr PixelBGRA
makeRGBA(const uint8_t r, const uint8_t g, const uint8_t b, const uint8_t a = 0xff) {
    return {b, g, r, a};
}

/**
 * @brief Fixed ordering of colors by their (r, g, b, a) channel tuple.
 */
inline bool
channelLess(const PixelBGRA& e1, const PixelBGRA& e2) {
    return std::tie(e1.r, e1.g, e1.b, e1.a) < std::tie(e2.r, e2.g, e2.b, e2.a);
}

/**
 * @return square of the euclidean distance over all four channels, in [0, 260100]
 */
inline uint32_t
colorDistance(const PixelBGRA& e1, const PixelBGRA& e2) {
    const int32_t r = static_cast<int32_t>(e1.r) - static_cast<int32_t>(e2.r);
    const int32_t g = static_cast<int32_t>(e1.g) - static_cast<int32_t>(e2.g);
    const int32_t b = static_cast<int32_t>(e1.b) - static_cast<int32_t>(e2.b);
    const int32_t a = static_cast<int32_t>(e1.a) - static_cast<int32_t>(e2.a);
    return static_cast<uint32_t>(r * r + g * g + b * b + a * a);
}

#endif  // GIF_DEF_H
