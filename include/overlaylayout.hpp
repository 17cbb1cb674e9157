#pragma once

#include <cstddef>
#include <vector>

const int NO_BUTTON_HIT    = -1;
const int CLOSE_BUTTON_HIT = -2;

struct OverlayRect {
    int left;
    int top;
    int right;
    int bottom;
};

struct OverlayPoint {
    int x;
    int y;
};

struct OverlayLayout {
    int winW;
    int winH;

    int margin;
    int slotW;
    int inset;
    int closeW;

    std::vector<OverlayRect> desktopButtons;
    OverlayRect closeButton;
};

OverlayLayout CalculateOverlayLayout(int desktopCount);
OverlayPoint DefaultOverlayPosition(int screenW, int winW);
int HitTestOverlay(const OverlayLayout& layout, int x, int y);

// screen points that must lie on a monitor for the overlay to stay grabbable
std::vector<OverlayPoint> GrabPoints(const OverlayLayout& layout, int x, int y);
OverlayPoint ChooseOverlayPosition(bool hasSaved, OverlayPoint saved, bool savedVisible, OverlayPoint fallback);
