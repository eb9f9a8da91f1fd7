#include "overlay_window.hpp"
#include "logger.hpp"

#include <SFML/Graphics/Image.hpp>
#include <SFML/Graphics/Sprite.hpp>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

#ifdef _WIN32
    #define WIN32_LEAN_AND_MEAN
    #include <windows.h>
    #include <commdlg.h>
#elif defined(__linux__)
    // Last: Xlib defines macros (None, Status, Bool) that clash with later headers
    #include <X11/Xlib.h>
#endif

// ===========================================================
// Shared helpers
// ===========================================================
#ifndef _WIN32
static bool commandExists(const char* cmd) {
    std::string check = "which " + std::string(cmd) + " > /dev/null 2>&1";
    return (std::system(check.c_str()) == 0);
}

// Run a dialog command, return its first output line ("" on cancel)
static std::string readDialogOutput(const std::string& command) {
    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        LOG_ERROR("Overlay", "popen failed for: " + command);
        return {};
    }

    std::string out;
    char buf[512];
    while (fgets(buf, sizeof(buf), pipe)) {
        out += buf;
    }
    int rc = pclose(pipe);
    LOG_TRACE("Overlay", "Dialog exited with " + std::to_string(rc));

    while (!out.empty() && (out.back() == '\n' || out.back() == '\r')) {
        out.pop_back();
    }
    return out;
}
#endif

// ===========================================================
// Win32: layered window + UpdateLayeredWindow
// ===========================================================
#ifdef _WIN32
static void updateOverlay(HWND hwnd, const sf::Image& image) {
    const sf::Vector2u size = image.getSize();
    if (size.x == 0 || size.y == 0) return;

    HDC screenDC = GetDC(nullptr);
    HDC memDC = CreateCompatibleDC(screenDC);

    BITMAPINFO bmi{};
    bmi.bmiHeader.biSize        = sizeof(BITMAPINFOHEADER);
    bmi.bmiHeader.biWidth       = static_cast<LONG>(size.x);
    bmi.bmiHeader.biHeight      = -static_cast<LONG>(size.y); // top-down rows
    bmi.bmiHeader.biPlanes      = 1;
    bmi.bmiHeader.biBitCount    = 32;
    bmi.bmiHeader.biCompression = BI_RGB;

    void* bits = nullptr;
    HBITMAP dib = CreateDIBSection(screenDC, &bmi, DIB_RGB_COLORS, &bits, nullptr, 0);
    if (!dib || !bits) {
        LOG_ERROR("Overlay", "CreateDIBSection failed, code=" + std::to_string(GetLastError()));
        DeleteDC(memDC);
        ReleaseDC(nullptr, screenDC);
        return;
    }

    // RGBA -> premultiplied BGRA
    const std::uint8_t* src = image.getPixelsPtr();
    auto* dst = static_cast<std::uint8_t*>(bits);
    const std::size_t count = static_cast<std::size_t>(size.x) * size.y;
    for (std::size_t i = 0; i < count; ++i) {
        const std::uint8_t a = src[i * 4 + 3];
        dst[i * 4 + 0] = static_cast<std::uint8_t>(src[i * 4 + 2] * a / 255);
        dst[i * 4 + 1] = static_cast<std::uint8_t>(src[i * 4 + 1] * a / 255);
        dst[i * 4 + 2] = static_cast<std::uint8_t>(src[i * 4 + 0] * a / 255);
        dst[i * 4 + 3] = a;
    }

    HGDIOBJ old = SelectObject(memDC, dib);

    RECT wr{};
    GetWindowRect(hwnd, &wr);
    POINT dstPos{ wr.left, wr.top };
    SIZE  dstSize{ static_cast<LONG>(size.x), static_cast<LONG>(size.y) };
    POINT srcPos{ 0, 0 };
    BLENDFUNCTION blend{ AC_SRC_OVER, 0, 255, AC_SRC_ALPHA };

    if (!UpdateLayeredWindow(hwnd, screenDC, &dstPos, &dstSize, memDC, &srcPos, 0, &blend, ULW_ALPHA)) {
        static bool reported = false;
        if (!reported) {
            LOG_ERROR("Overlay", "UpdateLayeredWindow failed, code=" + std::to_string(GetLastError()));
            reported = true;
        }
    }

    SelectObject(memDC, old);
    DeleteObject(dib);
    DeleteDC(memDC);
    ReleaseDC(nullptr, screenDC);
}
#endif

// ===========================================================
// Public API
// ===========================================================
bool makeOverlayWindow(sf::RenderWindow& window) {
#ifdef _WIN32
    HWND hwnd = window.getNativeHandle();
    LONG_PTR ex = GetWindowLongPtrW(hwnd, GWL_EXSTYLE);
    SetWindowLongPtrW(hwnd, GWL_EXSTYLE, ex | WS_EX_LAYERED);

    if (!SetWindowPos(hwnd, HWND_TOPMOST, 0, 0, 0, 0,
                      SWP_NOMOVE | SWP_NOSIZE | SWP_FRAMECHANGED)) {
        LOG_ERROR("Overlay", "SetWindowPos(HWND_TOPMOST) failed, code=" + std::to_string(GetLastError()));
        return false;
    }
    LOG_PHASE("Overlay window (layered, topmost)", true);
    return true;
#elif defined(__linux__)
    Display* display = XOpenDisplay(nullptr);
    if (!display) {
        LOG_ERROR("Overlay", "XOpenDisplay failed");
        return false;
    }

    const ::Window xwin = static_cast<::Window>(window.getNativeHandle());
    Atom wmState = XInternAtom(display, "_NET_WM_STATE", False);
    Atom above   = XInternAtom(display, "_NET_WM_STATE_ABOVE", False);

    XEvent ev{};
    ev.xclient.type         = ClientMessage;
    ev.xclient.window       = xwin;
    ev.xclient.message_type = wmState;
    ev.xclient.format       = 32;
    ev.xclient.data.l[0]    = 1; // _NET_WM_STATE_ADD
    ev.xclient.data.l[1]    = static_cast<long>(above);
    ev.xclient.data.l[2]    = 0;
    ev.xclient.data.l[3]    = 1; // source: application

    const int sent = XSendEvent(display, DefaultRootWindow(display), False,
                                SubstructureRedirectMask | SubstructureNotifyMask, &ev);
    XFlush(display);
    XCloseDisplay(display);

    if (!sent) {
        LOG_ERROR("Overlay", "XSendEvent(_NET_WM_STATE_ABOVE) failed");
        return false;
    }
    LOG_PHASE("Overlay window (_NET_WM_STATE_ABOVE)", true);
    return true;
#else
    (void)window;
    LOG_DEBUG("Overlay", "Always-on-top not implemented on this platform");
    return false;
#endif
}

bool overlaySupportsAlpha() {
#ifdef _WIN32
    return true;
#else
    return false;
#endif
}

void presentFrame(sf::RenderWindow& window, const sf::Texture& frame) {
#ifdef _WIN32
    updateOverlay(window.getNativeHandle(), frame.copyToImage());
#else
    // No per-pixel alpha: composite over an opaque backdrop
    window.clear(sf::Color(38, 38, 52));
    window.draw(sf::Sprite(frame));
    window.display();
#endif
}

std::optional<std::string> pickImageFile(sf::RenderWindow& window, std::string* err) {
#ifdef _WIN32
    char file[MAX_PATH] = "";

    OPENFILENAMEA ofn{};
    ofn.lStructSize = sizeof(ofn);
    ofn.hwndOwner   = window.getNativeHandle();
    ofn.lpstrFilter = "Images (*.png;*.jpg;*.jpeg;*.bmp)\0*.png;*.jpg;*.jpeg;*.bmp\0\0";
    ofn.lpstrFile   = file;
    ofn.nMaxFile    = MAX_PATH;
    ofn.lpstrTitle  = "Select Background Image";
    ofn.Flags       = OFN_FILEMUSTEXIST | OFN_PATHMUSTEXIST | OFN_NOCHANGEDIR;

    if (GetOpenFileNameA(&ofn)) {
        return std::string(file);
    }

    DWORD code = CommDlgExtendedError();
    if (code != 0 && err) {
        *err = "GetOpenFileNameA failed, code=" + std::to_string(code);
    }
    return std::nullopt;
#else
    (void)window;
    std::string command;
  #if defined(__APPLE__)
    command = "osascript -e 'POSIX path of (choose file of type {\"public.image\"} "
              "with prompt \"Select Background Image\")' 2>/dev/null";
  #else
    if (commandExists("zenity")) {
        command = "zenity --file-selection --title='Select Background Image' "
                  "--file-filter='Images | *.png *.jpg *.jpeg *.bmp' 2>/dev/null";
    } else if (commandExists("kdialog")) {
        command = "kdialog --getopenfilename . 'Images (*.png *.jpg *.jpeg *.bmp)' "
                  "--title 'Select Background Image' 2>/dev/null";
    } else {
        if (err) *err = "neither zenity nor kdialog is installed";
        return std::nullopt;
    }
  #endif

    std::string path = readDialogOutput(command);
    if (path.empty()) {
        return std::nullopt;
    }
    return path;
#endif
}
