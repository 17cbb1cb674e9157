#include "overlaylayout.hpp"

#include <cstddef>

static const int OVERLAY_HEIGHT = 50;
static const int OVERLAY_MARGIN = 10;
static const int DESKTOP_SLOT_WIDTH = 43;
static const int DESKTOP_BUTTON_INSET = 3;
static const int CLOSE_SLOT_WIDTH = 20;
static const int SCREEN_EDGE_OFFSET = 20;

static bool Contains(const OverlayRect& r, int x, int y) {
    return x >= r.left && x < r.right && y >= r.top && y < r.bottom;
}

OverlayLayout CalculateOverlayLayout(int desktopCount) {
    if (desktopCount < 1) desktopCount = 1;

    OverlayLayout layout;
    layout.margin = OVERLAY_MARGIN;
    layout.slotW  = DESKTOP_SLOT_WIDTH;
    layout.inset  = DESKTOP_BUTTON_INSET;
    layout.closeW = CLOSE_SLOT_WIDTH;

    layout.winW = 2*layout.margin + desktopCount*layout.slotW + layout.closeW;
    layout.winH = OVERLAY_HEIGHT;

    int top    = layout.margin;
    int bottom = layout.winH - layout.margin;

    for (int i = 0; i < desktopCount; ++i) {
        OverlayRect r;
        r.left   = layout.margin + i*layout.slotW + layout.inset;
        r.right  = layout.margin + (i + 1)*layout.slotW - layout.inset;
        r.top    = top;
        r.bottom = bottom;
        layout.desktopButtons.push_back(r);
    }

    layout.closeButton.left   = layout.margin + desktopCount*layout.slotW;
    layout.closeButton.right  = layout.closeButton.left + layout.closeW;
    layout.closeButton.top    = top;
    layout.closeButton.bottom = bottom;

    return layout;
}

OverlayPoint DefaultOverlayPosition(int screenW, int winW) {
    OverlayPoint pt;
    pt.x = screenW - winW - SCREEN_EDGE_OFFSET;
    pt.y = SCREEN_EDGE_OFFSET;
    return pt;
}

int HitTestOverlay(const OverlayLayout& layout, int x, int y) {
    for (size_t i = 0; i < layout.desktopButtons.size(); ++i) {
        if (Contains(layout.desktopButtons[i], x, y)) return (int)i;
    }
    if (Contains(layout.closeButton, x, y)) return CLOSE_BUTTON_HIT;
    return NO_BUTTON_HIT;
}

std::vector<OverlayPoint> GrabPoints(const OverlayLayout& layout, int x, int y) {
    std::vector<OverlayPoint> points;

    OverlayPoint dragArea;
    dragArea.x = x + layout.margin/2;
    dragArea.y = y + layout.winH/2;
    points.push_back(dragArea);

    OverlayPoint closeCenter;
    closeCenter.x = x + (layout.closeButton.left + layout.closeButton.right)/2;
    closeCenter.y = y + (layout.closeButton.top + layout.closeButton.bottom)/2;
    points.push_back(closeCenter);

    return points;
}

OverlayPoint ChooseOverlayPosition(bool hasSaved, OverlayPoint saved, bool savedVisible, OverlayPoint fallback) {
    return (hasSaved && savedVisible) ? saved : fallback;
}
