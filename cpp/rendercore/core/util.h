#ifndef RENDERCORE_CORE_UTIL_H
#define RENDERCORE_CORE_UTIL_H

#include <cstdint>
#include <cstddef>
#include <cstring>

#ifdef EMSCRIPTEN
#include <emscripten/emscripten.h>
#else
#include <chrono>
// Polyfill for native builds
inline double emscripten_get_now() {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(steady_clock::now().time_since_epoch()).count();
}
#endif

namespace rendercore {

inline double nowMs() {
    return emscripten_get_now();
}

static inline std::uint32_t readU32(const std::uint8_t* src, std::size_t offset) noexcept {
    std::uint32_t v;
    std::memcpy(&v, src + offset, sizeof(v));
    return v;
}

} // namespace rendercore

#endif // RENDERCORE_CORE_UTIL_H
