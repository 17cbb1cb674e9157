#include "common.hpp"
#include "overlay.hpp"
#include "overlaymenu.hpp"
#include "systemstate.hpp"

struct AlphaPreset {
    UINT id;
    double alpha;
    const char* label;
};

static const AlphaPreset alphaPresets[] = {
    { ID_ALPHA_100, 1.00, "Opacity 100%" },
    { ID_ALPHA_90,  0.90, "Opacity 90%"  },
    { ID_ALPHA_75,  0.75, "Opacity 75%"  },
    { ID_ALPHA_50,  0.50, "Opacity 50%"  }
};

void ShowOverlayMenu(HWND hOverlayWnd, double workAlpha) {
    HMENU hMenu = CreatePopupMenu();
    if (!hMenu) return;

    bool isOnStartup = SystemState::IsOnStartupEnabled();

    for (const auto& preset : alphaPresets) {
        bool selected = (int)(preset.alpha*100 + 0.5) == (int)(workAlpha*100 + 0.5);
        AppendMenuA(hMenu, MF_STRING | (selected ? MF_CHECKED : MF_UNCHECKED), preset.id, preset.label);
    }
    AppendMenuA(hMenu, MF_SEPARATOR, 0, NULL);
    AppendMenuA(hMenu, MF_STRING, ID_RESET_POSITION, "Reset Position");
    AppendMenuA(hMenu, MF_STRING | (isOnStartup ? MF_CHECKED : MF_UNCHECKED), ID_STARTUP_TOGGLE, "Start With Windows");
    AppendMenuA(hMenu, MF_SEPARATOR, 0, NULL);
    AppendMenuA(hMenu, MF_STRING, ID_EDIT_CONFIG,   "Edit Configuration");
    AppendMenuA(hMenu, MF_STRING, ID_RELOAD_CONFIG, "Reload Configuration");
    AppendMenuA(hMenu, MF_SEPARATOR, 0, NULL);
    AppendMenuA(hMenu, MF_STRING, ID_EXIT, "Quit " APP_NAME);

    POINT curPoint;
    GetCursorPos(&curPoint);
    HWND hPrevForeground = GetForegroundWindow();
    SetForegroundWindow(hOverlayWnd);

    int clicked = TrackPopupMenu(hMenu, TPM_RETURNCMD | TPM_RIGHTBUTTON, curPoint.x, curPoint.y, 0, hOverlayWnd, NULL);
    DestroyMenu(hMenu);

    // the menu needs the foreground to dismiss, hand it back to the app being worked in
    if (hPrevForeground && hPrevForeground != hOverlayWnd && IsWindow(hPrevForeground)) {
        SetForegroundWindow(hPrevForeground);
    }

    for (const auto& preset : alphaPresets) {
        if ((UINT)clicked == preset.id) {
            SetOverlayAlpha(preset.alpha);
            return;
        }
    }

    switch (clicked) {
        case ID_RESET_POSITION:
            ResetOverlayPosition();
            break;
        case ID_STARTUP_TOGGLE:
            SystemState::SetOnStartup(!isOnStartup);
            break;
        case ID_EDIT_CONFIG:
            OpenOverlayConfig();
            break;
        case ID_RELOAD_CONFIG:
            ReloadOverlayConfig();
            break;
        case ID_EXIT:
            CloseOverlay();
            break;
    }
}
