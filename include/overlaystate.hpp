#pragma once

enum class OverlayMode {
    Work,
    InQuit
};

enum class CloseAction {
    EnterQuit,
    Quit
};

struct DragDelta {
    int dx;
    int dy;
};

const double DEFAULT_ALPHA = 0.9;
const double QUIT_MODE_ALPHA = 1.0;

struct OverlayState {
    OverlayMode mode = OverlayMode::Work;
    double alpha = DEFAULT_ALPHA;
    double savedAlpha = DEFAULT_ALPHA;

    int desktopCount = 1;
    int currentDesktop = 0;

    bool dragging = false;
    int dragSteps = 0;
    int grabX = 0;
    int grabY = 0;
};

namespace Overlay {
    void EnterQuitMode(OverlayState& state);
    void ExitQuitMode(OverlayState& state);

    CloseAction OnCloseClicked(OverlayState& state);
    void OnDesktopClicked(OverlayState& state);
    void SetWorkAlpha(OverlayState& state, double alpha);

    void BeginDrag(OverlayState& state, int x, int y);
    DragDelta DragTo(OverlayState& state, int x, int y);
    bool EndDrag(OverlayState& state);

    bool ApplyDesktopCount(OverlayState& state, int count);
    bool ApplyCurrentDesktop(OverlayState& state, int index);
}
