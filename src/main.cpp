#include "common.hpp"
#include "overlay.hpp"
#include "systemstate.hpp"

int main() {
    SetProcessDPIAware();

    if (!SystemState::Initialize()) {
        return 0;
    }

    Gdiplus::GdiplusStartupInput gdiplusStartupInput;
    ULONG_PTR gdiplusToken;
    if (Gdiplus::GdiplusStartup(&gdiplusToken, &gdiplusStartupInput, NULL) != Gdiplus::Ok) {
        std::cerr << "failed to start gdi+" << std::endl;
        SystemState::CleanUp();
        return 1;
    }

    if (!CreateOverlay()) {
        Gdiplus::GdiplusShutdown(gdiplusToken);
        SystemState::CleanUp();
        return 1;
    }

    MSG msg;
    while (GetMessage(&msg, NULL, 0, 0)) {
        TranslateMessage(&msg);
        DispatchMessage(&msg);
    }

    Gdiplus::GdiplusShutdown(gdiplusToken);

    SystemState::CleanUp();

    return (int)msg.wParam;
}
