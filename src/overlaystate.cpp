#include "overlaystate.hpp"

#include <iostream>

namespace Overlay {
    void EnterQuitMode(OverlayState& state) {
        if (state.mode == OverlayMode::InQuit) return;
        std::cout << "entering quit mode" << std::endl;
        state.mode = OverlayMode::InQuit;
        state.savedAlpha = state.alpha;
        state.alpha = QUIT_MODE_ALPHA;
    }

    void ExitQuitMode(OverlayState& state) {
        if (state.mode == OverlayMode::Work) return;
        std::cout << "returning to work mode" << std::endl;
        state.mode = OverlayMode::Work;
        state.alpha = state.savedAlpha;
    }

    CloseAction OnCloseClicked(OverlayState& state) {
        if (state.mode == OverlayMode::Work) {
            EnterQuitMode(state);
            return CloseAction::EnterQuit;
        }
        return CloseAction::Quit;
    }

    void OnDesktopClicked(OverlayState& state) {
        if (state.mode == OverlayMode::InQuit) {
            ExitQuitMode(state);
        }
    }

    // in quit mode the window stays opaque, the new value applies on return to work
    void SetWorkAlpha(OverlayState& state, double alpha) {
        state.savedAlpha = alpha;
        if (state.mode == OverlayMode::Work) {
            state.alpha = alpha;
        }
    }

    void BeginDrag(OverlayState& state, int x, int y) {
        state.dragging = true;
        state.dragSteps = 0;
        state.grabX = x;
        state.grabY = y;

        if (state.mode == OverlayMode::InQuit) {
            ExitQuitMode(state);
        }
    }

    DragDelta DragTo(OverlayState& state, int x, int y) {
        DragDelta delta = { 0, 0 };
        if (!state.dragging) return delta;

        state.dragSteps++;
        delta.dx = x - state.grabX;
        delta.dy = y - state.grabY;
        return delta;
    }

    bool EndDrag(OverlayState& state) {
        bool wasDragging = state.dragging;
        state.dragging = false;
        return wasDragging && state.mode == OverlayMode::Work && state.dragSteps > 1;
    }

    bool ApplyDesktopCount(OverlayState& state, int count) {
        if (count < 1) count = 1;
        if (count == state.desktopCount) return false;

        std::cout << "desktop count changed: " << state.desktopCount << " -> " << count << std::endl;
        state.desktopCount = count;
        if (state.currentDesktop >= count) {
            state.currentDesktop = count - 1;
        }
        return true;
    }

    bool ApplyCurrentDesktop(OverlayState& state, int index) {
        if (index < 0 || index >= state.desktopCount) index = 0;
        if (index == state.currentDesktop) return false;

        std::cout << "desktop change detected: " << state.currentDesktop << " -> " << index << std::endl;
        state.currentDesktop = index;
        return true;
    }
}
