/**
 * Tessera - Version Information
 *
 * Version Format: MAJOR.MINOR.PATCH[-PRERELEASE]
 */

#ifndef TESSERA_VERSION_H
#define TESSERA_VERSION_H

#define TESSERA_VERSION_MAJOR 0
#define TESSERA_VERSION_MINOR 3
#define TESSERA_VERSION_PATCH 0

// Set to 0 for stable releases
#define TESSERA_HAS_PRERELEASE 1
#define TESSERA_VERSION_PRERELEASE "dev"

#define TESSERA_STRINGIFY_(x) #x
#define TESSERA_STRINGIFY(x) TESSERA_STRINGIFY_(x)

#define TESSERA_VERSION_CORE \
    TESSERA_STRINGIFY(TESSERA_VERSION_MAJOR) "." \
    TESSERA_STRINGIFY(TESSERA_VERSION_MINOR) "." \
    TESSERA_STRINGIFY(TESSERA_VERSION_PATCH)

#if TESSERA_HAS_PRERELEASE
    #define TESSERA_VERSION TESSERA_VERSION_CORE "-" TESSERA_VERSION_PRERELEASE
#else
    #define TESSERA_VERSION TESSERA_VERSION_CORE
#endif

#if defined(__linux__)
    #define TESSERA_PLATFORM "Linux"
#elif defined(__APPLE__)
    #define TESSERA_PLATFORM "macOS"
#elif defined(_WIN32)
    #define TESSERA_PLATFORM "Windows"
#else
    #define TESSERA_PLATFORM "Unknown"
#endif

#ifdef NDEBUG
    #define TESSERA_BUILD_TYPE "Release"
#else
    #define TESSERA_BUILD_TYPE "Debug"
#endif

#define TESSERA_NAME "Tessera"
#define TESSERA_DESCRIPTION "GUI renderer with Vulkan and software backends"

#ifdef __cplusplus
#include <sstream>
#include <string>

namespace tessera {

inline const char* versionString() { return TESSERA_VERSION; }

// Multi-line banner for --version output
inline std::string versionBanner(const char* backend) {
    std::ostringstream oss;
    oss << TESSERA_NAME << " v" << TESSERA_VERSION << "\n"
        << TESSERA_DESCRIPTION << "\n"
        << "Build:    " << TESSERA_BUILD_TYPE << " (" << __DATE__ << ")\n"
        << "Platform: " << TESSERA_PLATFORM;
    if (backend) {
        oss << "\nBackend:  " << backend;
    }
    return oss.str();
}

}  // namespace tessera
#endif  // __cplusplus

#endif  // TESSERA_VERSION_H
