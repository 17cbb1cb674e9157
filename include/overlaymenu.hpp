#pragma once

enum OverlayMenuIDs {
    ID_ALPHA_100 = 100,
    ID_ALPHA_90,
    ID_ALPHA_75,
    ID_ALPHA_50,
    ID_RESET_POSITION,
    ID_STARTUP_TOGGLE,
    ID_EDIT_CONFIG,
    ID_RELOAD_CONFIG,
    ID_EXIT
};

void ShowOverlayMenu(HWND hOverlayWnd, double workAlpha);
