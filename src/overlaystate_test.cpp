/*---------------------------------------------------------*/
/*   overlaystate_test.cpp - ctest for overlay modes/drag  */
/*---------------------------------------------------------*/

#include "overlaystate.hpp"

#include <iostream>

static int failures = 0;

static void check(const char* name, bool cond) {
    if (cond) {
        std::cout << "  PASS: " << name << "\n";
    } else {
        std::cerr << "  FAIL: " << name << "\n";
        failures++;
    }
}

int main() {
    std::cout << "=== OverlayState Tests ===\n\n";

    std::cout << "[close control]\n";
    {
        OverlayState state;
        state.alpha = 0.6;
        state.savedAlpha = 0.6;

        check("first click asks for confirmation", Overlay::OnCloseClicked(state) == CloseAction::EnterQuit);
        check("now in quit mode", state.mode == OverlayMode::InQuit);
        check("quit mode is opaque", state.alpha == QUIT_MODE_ALPHA);
        check("work opacity remembered", state.savedAlpha == 0.6);
        check("second click quits", Overlay::OnCloseClicked(state) == CloseAction::Quit);
    }

    std::cout << "\n[desktop click leaves quit mode]\n";
    {
        OverlayState state;
        state.alpha = 0.75;
        Overlay::EnterQuitMode(state);
        Overlay::OnDesktopClicked(state);
        check("back to work", state.mode == OverlayMode::Work);
        check("opacity restored", state.alpha == 0.75);

        Overlay::OnDesktopClicked(state);
        check("click in work mode keeps opacity", state.alpha == 0.75);
    }

    std::cout << "\n[repeated mode changes]\n";
    {
        OverlayState state;
        state.alpha = 0.5;
        Overlay::EnterQuitMode(state);
        Overlay::EnterQuitMode(state);
        check("entering twice keeps work opacity", state.savedAlpha == 0.5);
        Overlay::ExitQuitMode(state);
        check("restored after double enter", state.alpha == 0.5);
    }

    std::cout << "\n[SetWorkAlpha]\n";
    {
        OverlayState state;
        Overlay::SetWorkAlpha(state, 0.5);
        check("applies in work mode", state.alpha == 0.5);

        Overlay::EnterQuitMode(state);
        Overlay::SetWorkAlpha(state, 0.75);
        check("quit mode stays opaque", state.alpha == QUIT_MODE_ALPHA);
        Overlay::ExitQuitMode(state);
        check("new value applied on return", state.alpha == 0.75);
    }

    std::cout << "\n[drag]\n";
    {
        OverlayState state;
        Overlay::BeginDrag(state, 30, 20);
        DragDelta d = Overlay::DragTo(state, 35, 12);
        check("delta x from grab point", d.dx == 5);
        check("delta y from grab point", d.dy == -8);
        Overlay::DragTo(state, 30, 20);
        check("two steps counted", state.dragSteps == 2);
        check("persist after real drag", Overlay::EndDrag(state));
        check("drag ended", !state.dragging);
    }
    {
        OverlayState state;
        Overlay::BeginDrag(state, 10, 10);
        Overlay::DragTo(state, 11, 10);
        check("single step is a click, not saved", !Overlay::EndDrag(state));
    }
    {
        OverlayState state;
        Overlay::BeginDrag(state, 10, 10);
        Overlay::DragTo(state, 20, 10);
        Overlay::DragTo(state, 30, 10);
        Overlay::EndDrag(state);

        Overlay::BeginDrag(state, 40, 40);
        check("new drag resets step count", state.dragSteps == 0);
        check("new drag resets grab point", state.grabX == 40 && state.grabY == 40);
        DragDelta d = Overlay::DragTo(state, 40, 40);
        check("no jump on first move", d.dx == 0 && d.dy == 0);
    }
    {
        OverlayState state;
        DragDelta d = Overlay::DragTo(state, 50, 50);
        check("move without drag is ignored", d.dx == 0 && d.dy == 0 && state.dragSteps == 0);
        check("release without drag does not save", !Overlay::EndDrag(state));
    }
    {
        OverlayState state;
        state.alpha = 0.8;
        Overlay::EnterQuitMode(state);
        Overlay::BeginDrag(state, 5, 5);
        check("drag leaves quit mode", state.mode == OverlayMode::Work);
        check("drag restores opacity", state.alpha == 0.8);
    }

    std::cout << "\n[desktop tracking]\n";
    {
        OverlayState state;
        check("initial count change", Overlay::ApplyDesktopCount(state, 4));
        check("same count is no change", !Overlay::ApplyDesktopCount(state, 4));
        check("index change", Overlay::ApplyCurrentDesktop(state, 3));
        check("same index is no change", !Overlay::ApplyCurrentDesktop(state, 3));

        Overlay::ApplyDesktopCount(state, 2);
        check("current clamped when desktops removed", state.currentDesktop == 1);

        check("zero count treated as one", Overlay::ApplyDesktopCount(state, 0) && state.desktopCount == 1);
        check("index clamped to first desktop", state.currentDesktop == 0);

        Overlay::ApplyDesktopCount(state, 3);
        Overlay::ApplyCurrentDesktop(state, 7);
        check("out of range index falls back to first", state.currentDesktop == 0);
    }

    std::cout << "\n=== " << (failures == 0 ? "ALL PASSED" : "FAILURES") << " ===\n";
    return failures == 0 ? 0 : 1;
}
