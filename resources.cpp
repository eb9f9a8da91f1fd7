#include "resources.hpp"
#include "logger.hpp"

#include <filesystem>

#if defined(_WIN32)
    #define WIN32_LEAN_AND_MEAN
    #include <windows.h>
#elif defined(__APPLE__)
    #include <mach-o/dyld.h>
#elif defined(__linux__)
    #include <unistd.h>
    #include <climits>
#endif

namespace fs = std::filesystem;

// -------------------------------------------------------------
// Global state definitions
// -------------------------------------------------------------
nlohmann::json g_widgetConfig;
WidgetSettings g_settings;

// -------------------------------------------------------------
// Locate resource root (prefer repo/resources over build/resources)
// -------------------------------------------------------------
std::string getResourcePath() {
#if defined(NEKOTOKI_PORTABLE_ONLY)
    fs::path exePath;
  #if defined(_WIN32)
    char buffer[MAX_PATH];
    if (GetModuleFileNameA(nullptr, buffer, MAX_PATH)) {
        exePath = fs::path(buffer).parent_path();
    } else {
        exePath = fs::current_path();
    }
  #elif defined(__APPLE__)
    char buffer[1024];
    uint32_t size = sizeof(buffer);
    if (_NSGetExecutablePath(buffer, &size) == 0) {
        exePath = fs::path(buffer).parent_path();
    } else {
        exePath = fs::current_path();
    }
  #elif defined(__linux__)
    char buffer[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
    if (len > 0) {
        buffer[len] = '\0';
        exePath = fs::path(buffer).parent_path();
    } else {
        exePath = fs::current_path();
    }
  #else
    exePath = fs::current_path();
  #endif

    fs::path portablePath = exePath / "resources";
    if (fs::exists(portablePath)) {
        LOG_DEBUG("Resources", "Using portable resource path: " + portablePath.string());
        return portablePath.string();
    }
    return exePath.string();
#else
    fs::path buildPath   = fs::current_path() / "resources";
    fs::path projectPath = fs::current_path().parent_path() / "resources";

    // 🔹 Prefer project resources first
    if (fs::exists(projectPath)) {
        LOG_TRACE("Resources", "Using resource path: " + projectPath.string());
        return projectPath.string();
    }
    if (fs::exists(buildPath)) {
        LOG_TRACE("Resources", "Using fallback resource path: " + buildPath.string());
        return buildPath.string();
    }

    // Last resort: current working directory
    LOG_TRACE("Resources", "Falling back to cwd: " + fs::current_path().string());
    return fs::current_path().string();
#endif
}

// -------------------------------------------------------------
// Find a usable font (configured, resources/, then system)
// -------------------------------------------------------------
static const char* const kSystemFonts[] = {
#if defined(_WIN32)
    "C:/Windows/Fonts/arialbd.ttf",
    "C:/Windows/Fonts/segoeuib.ttf",
    "C:/Windows/Fonts/arial.ttf",
#elif defined(__APPLE__)
    "/System/Library/Fonts/Supplemental/Arial Bold.ttf",
    "/Library/Fonts/Arial Bold.ttf",
    "/System/Library/Fonts/Helvetica.ttc",
#else
    "/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf",
    "/usr/share/fonts/TTF/DejaVuSans-Bold.ttf",
    "/usr/share/fonts/dejavu/DejaVuSans-Bold.ttf",
    "/usr/share/fonts/truetype/liberation/LiberationSans-Bold.ttf",
    "/usr/share/fonts/truetype/freefont/FreeSansBold.ttf",
#endif
};

std::string findAnyFontInResources(const std::string& preferred) {
    std::error_code ec;

    if (!preferred.empty()) {
        if (fs::is_regular_file(preferred, ec)) {
            LOG_DEBUG("Resources", "Using configured font: " + preferred);
            return preferred;
        }
        LOG_ERROR("Resources", "Configured font not found: " + preferred);
    }

    fs::path resDir = fs::path(getResourcePath());
    if (fs::is_directory(resDir, ec)) {
        for (auto& p : fs::directory_iterator(resDir, ec)) {
            if (p.is_regular_file()) {
                auto ext = p.path().extension().string();
                if (ext == ".ttf" || ext == ".otf") {
                    LOG_DEBUG("Resources", "Found font: " + p.path().string());
                    return p.path().string();
                }
            }
        }
    } else {
        LOG_DEBUG("Resources", "Resource directory missing: " + resDir.string());
    }

    for (const char* candidate : kSystemFonts) {
        if (fs::is_regular_file(candidate, ec)) {
            LOG_DEBUG("Resources", std::string("Using system font: ") + candidate);
            return candidate;
        }
    }

    LOG_ERROR("Resources", "No font found in resources/ or system fonts.");
    return {};
}
