#include "common.hpp"
#include "config.hpp"
#include "desktopstate.hpp"
#include "desktopswitcher.hpp"
#include "overlay.hpp"
#include "overlaylayout.hpp"
#include "overlaymenu.hpp"
#include "overlaystate.hpp"

static OverlayState state;
static OverlayConfig config;
static OverlayLayout layout;
static std::string configPath;

static bool classRegistered = false;
static HWND hOverlayWnd = NULL;
static int pressedButton = NO_BUTTON_HIT;

static const UINT_PTR REFRESH_TIMER_ID = 1;

static const Gdiplus::Color BACKGROUND_COLOR(30, 30, 30);
static const Gdiplus::Color DESKTOP_COLOR(60, 60, 60);
static const Gdiplus::Color ACTIVE_DESKTOP_COLOR(0, 120, 215);
static const Gdiplus::Color CLOSE_COLOR(180, 52, 52);
static const Gdiplus::Color CONFIRM_QUIT_COLOR(52, 180, 52);
static const Gdiplus::Color TEXT_COLOR(255, 255, 255);
static const Gdiplus::Color LIGHT_EDGE_COLOR(120, 255, 255, 255);
static const Gdiplus::Color DARK_EDGE_COLOR(140, 0, 0, 0);

static void ApplyAlpha() {
    BYTE alpha = (BYTE)(state.alpha*255 + 0.5);
    if (!SetLayeredWindowAttributes(hOverlayWnd, 0, alpha, LWA_ALPHA)) {
        std::cerr << "failed to set overlay opacity (error " << GetLastError() << ")" << std::endl;
    }
}

static bool IsPositionVisible(int x, int y) {
    for (const auto& pt : GrabPoints(layout, x, y)) {
        POINT screenPt = { pt.x, pt.y };
        if (MonitorFromPoint(screenPt, MONITOR_DEFAULTTONULL) == NULL) return false;
    }
    return true;
}

static OverlayPoint DefaultPosition() {
    return DefaultOverlayPosition(GetSystemMetrics(SM_CXSCREEN), layout.winW);
}

// moves without touching the saved position, which may become visible again later
static void MoveOverlayToDefault() {
    OverlayPoint pt = DefaultPosition();
    SetWindowPos(hOverlayWnd, NULL, pt.x, pt.y, 0, 0, SWP_NOSIZE | SWP_NOZORDER | SWP_NOACTIVATE);
}

static void ResizeOverlay() {
    layout = CalculateOverlayLayout(state.desktopCount);
    SetWindowPos(hOverlayWnd, NULL, 0, 0, layout.winW, layout.winH, SWP_NOMOVE | SWP_NOZORDER | SWP_NOACTIVATE);
    InvalidateRect(hOverlayWnd, NULL, FALSE);
}

static void PersistConfig() {
    RECT rc;
    if (!GetWindowRect(hOverlayWnd, &rc)) return;

    config.hasPosition = true;
    config.x = rc.left;
    config.y = rc.top;
    config.hasAlpha = true;
    config.alpha = (state.mode == OverlayMode::Work) ? state.alpha : state.savedAlpha;
    Config::SaveConfig(configPath, config);
}

static void RefreshCurrentDesktop() {
    int index = DesktopState::GetCurrentDesktopIndex(state.currentDesktop);
    if (Overlay::ApplyCurrentDesktop(state, index)) {
        InvalidateRect(hOverlayWnd, NULL, FALSE);
    }
}

static void RefreshDesktopState() {
    // count first so a freshly added desktop is in range when the index is read
    if (Overlay::ApplyDesktopCount(state, DesktopState::GetDesktopCount())) {
        ResizeOverlay();
    }
    RefreshCurrentDesktop();
}

static void OnDesktopButton(int index) {
    Overlay::OnDesktopClicked(state);
    ApplyAlpha();
    InvalidateRect(hOverlayWnd, NULL, FALSE);

    if (index >= state.desktopCount) return;

    if (SwitchDesktop(state.currentDesktop, index)) {
        state.currentDesktop = index;
    }
    RefreshCurrentDesktop();
}

static void OnCloseButton() {
    if (Overlay::OnCloseClicked(state) == CloseAction::Quit) {
        std::cout << "exiting" << std::endl;
        CloseOverlay();
        return;
    }
    ApplyAlpha();
    InvalidateRect(hOverlayWnd, NULL, FALSE);
}

static void DrawButton(Gdiplus::Graphics& g, const OverlayRect& r, const Gdiplus::Color& fill,
                       bool sunken, const std::wstring& label, const Gdiplus::Font& font) {
    int w = r.right - r.left;
    int h = r.bottom - r.top;

    Gdiplus::SolidBrush fillBrush(fill);
    g.FillRectangle(&fillBrush, r.left, r.top, w, h);

    Gdiplus::Pen lightPen(LIGHT_EDGE_COLOR, 2);
    Gdiplus::Pen darkPen(DARK_EDGE_COLOR, 2);
    Gdiplus::Pen* topLeft     = sunken ? &darkPen  : &lightPen;
    Gdiplus::Pen* bottomRight = sunken ? &lightPen : &darkPen;
    g.DrawLine(topLeft,     r.left + 1,  r.top + 1,    r.right - 1, r.top + 1);
    g.DrawLine(topLeft,     r.left + 1,  r.top + 1,    r.left + 1,  r.bottom - 1);
    g.DrawLine(bottomRight, r.left + 1,  r.bottom - 1, r.right - 1, r.bottom - 1);
    g.DrawLine(bottomRight, r.right - 1, r.top + 1,    r.right - 1, r.bottom - 1);

    Gdiplus::StringFormat format;
    format.SetAlignment(Gdiplus::StringAlignmentCenter);
    format.SetLineAlignment(Gdiplus::StringAlignmentCenter);

    int offset = sunken ? 1 : 0;
    Gdiplus::RectF textRect((Gdiplus::REAL)(r.left + offset), (Gdiplus::REAL)(r.top + offset),
                            (Gdiplus::REAL)w, (Gdiplus::REAL)h);
    Gdiplus::SolidBrush textBrush(TEXT_COLOR);
    g.DrawString(label.c_str(), -1, &font, textRect, &format, &textBrush);
}

static void PaintOverlay(HWND hwnd) {
    PAINTSTRUCT ps;
    HDC hdc = BeginPaint(hwnd, &ps);

    RECT rc;
    GetClientRect(hwnd, &rc);

    HDC memDC = CreateCompatibleDC(hdc);
    HBITMAP memBmp = CreateCompatibleBitmap(hdc, rc.right, rc.bottom);
    HGDIOBJ oldBmp = SelectObject(memDC, memBmp);

    {
        Gdiplus::Graphics graphics(memDC);
        graphics.SetTextRenderingHint(Gdiplus::TextRenderingHintClearTypeGridFit);
        graphics.Clear(BACKGROUND_COLOR);

        Gdiplus::Font font(L"Segoe UI", 10, Gdiplus::FontStyleBold, Gdiplus::UnitPoint);

        for (size_t i = 0; i < layout.desktopButtons.size(); ++i) {
            bool active = ((int)i == state.currentDesktop);
            DrawButton(graphics, layout.desktopButtons[i], active ? ACTIVE_DESKTOP_COLOR : DESKTOP_COLOR,
                       active, std::to_wstring(i + 1), font);
        }

        bool inQuit = (state.mode == OverlayMode::InQuit);
        DrawButton(graphics, layout.closeButton, inQuit ? CONFIRM_QUIT_COLOR : CLOSE_COLOR,
                   false, inQuit ? L"?" : L"\u2715", font);
    }

    BitBlt(hdc, 0, 0, rc.right, rc.bottom, memDC, 0, 0, SRCCOPY);

    SelectObject(memDC, oldBmp);
    DeleteObject(memBmp);
    DeleteDC(memDC);
    EndPaint(hwnd, &ps);
}

static LRESULT CALLBACK OverlayWndProc(HWND hwnd, UINT msg, WPARAM wParam, LPARAM lParam) {
    switch (msg) {
        case WM_PAINT: {
            PaintOverlay(hwnd);
            return 0;
        }
        case WM_ERASEBKGND: {
            return 1;
        }
        case WM_MOUSEACTIVATE: {
            return MA_NOACTIVATE;
        }
        case WM_TIMER: {
            if (wParam == REFRESH_TIMER_ID) {
                RefreshDesktopState();
            }
            return 0;
        }
        case WM_SETCURSOR: {
            if (LOWORD(lParam) == HTCLIENT) {
                POINT pt;
                GetCursorPos(&pt);
                ScreenToClient(hwnd, &pt);
                bool overButton = HitTestOverlay(layout, pt.x, pt.y) != NO_BUTTON_HIT;
                SetCursor(LoadCursor(NULL, overButton ? IDC_HAND : IDC_ARROW));
                return TRUE;
            }
            break;
        }
        case WM_LBUTTONDOWN: {
            int x = GET_X_LPARAM(lParam);
            int y = GET_Y_LPARAM(lParam);
            pressedButton = HitTestOverlay(layout, x, y);
            if (pressedButton == NO_BUTTON_HIT) {
                Overlay::BeginDrag(state, x, y);
                ApplyAlpha();
                InvalidateRect(hwnd, NULL, FALSE);
            }
            SetCapture(hwnd);
            return 0;
        }
        case WM_MOUSEMOVE: {
            if (state.dragging) {
                DragDelta delta = Overlay::DragTo(state, GET_X_LPARAM(lParam), GET_Y_LPARAM(lParam));
                if (delta.dx != 0 || delta.dy != 0) {
                    RECT rc;
                    GetWindowRect(hwnd, &rc);
                    SetWindowPos(hwnd, NULL, rc.left + delta.dx, rc.top + delta.dy, 0, 0,
                                 SWP_NOSIZE | SWP_NOZORDER | SWP_NOACTIVATE);
                }
            }
            return 0;
        }
        case WM_LBUTTONUP: {
            if (state.dragging) {
                bool persist = Overlay::EndDrag(state);
                ReleaseCapture();
                if (persist) PersistConfig();
                return 0;
            }

            int released = HitTestOverlay(layout, GET_X_LPARAM(lParam), GET_Y_LPARAM(lParam));
            int pressed = pressedButton;
            pressedButton = NO_BUTTON_HIT;
            ReleaseCapture();

            if (pressed != NO_BUTTON_HIT && released == pressed) {
                if (pressed == CLOSE_BUTTON_HIT) {
                    OnCloseButton();
                } else {
                    OnDesktopButton(pressed);
                }
            }
            return 0;
        }
        case WM_CAPTURECHANGED: {
            if (state.dragging) {
                Overlay::EndDrag(state);
            }
            pressedButton = NO_BUTTON_HIT;
            return 0;
        }
        case WM_RBUTTONUP: {
            double workAlpha = (state.mode == OverlayMode::Work) ? state.alpha : state.savedAlpha;
            ShowOverlayMenu(hwnd, workAlpha);
            return 0;
        }
        case WM_DISPLAYCHANGE: {
            RECT rc;
            GetWindowRect(hwnd, &rc);
            if (config.hasPosition) {
                OverlayPoint saved = { config.x, config.y };
                OverlayPoint pos = ChooseOverlayPosition(true, saved, IsPositionVisible(config.x, config.y), DefaultPosition());
                if (pos.x != rc.left || pos.y != rc.top) {
                    SetWindowPos(hwnd, NULL, pos.x, pos.y, 0, 0, SWP_NOSIZE | SWP_NOZORDER | SWP_NOACTIVATE);
                }
            } else if (!IsPositionVisible(rc.left, rc.top)) {
                MoveOverlayToDefault();
            }
            return 0;
        }
        case WM_DESTROY: {
            KillTimer(hwnd, REFRESH_TIMER_ID);
            hOverlayWnd = NULL;
            PostQuitMessage(0);
            return 0;
        }
    }
    return DefWindowProc(hwnd, msg, wParam, lParam);
}

void SetOverlayAlpha(double alpha) {
    Overlay::SetWorkAlpha(state, Config::ClampAlpha(alpha));
    ApplyAlpha();
    PersistConfig();
}

void ResetOverlayPosition() {
    MoveOverlayToDefault();

    config.hasPosition = false;
    config.hasAlpha = true;
    config.alpha = (state.mode == OverlayMode::Work) ? state.alpha : state.savedAlpha;
    Config::SaveConfig(configPath, config);
}

void OpenOverlayConfig() {
    if (GetFileAttributesA(configPath.c_str()) == INVALID_FILE_ATTRIBUTES) {
        if (!Config::SaveConfig(configPath, config)) return;
    }

    HINSTANCE hInst = ShellExecuteA(NULL, "open", "notepad.exe", configPath.c_str(), NULL, SW_SHOWNORMAL);
    if ((INT_PTR)hInst <= 32) {
        std::cerr << "failed to open " << configPath << " (error " << (INT_PTR)hInst << ")" << std::endl;
    }
}

void ReloadOverlayConfig() {
    OverlayConfig loaded;
    if (!Config::LoadConfig(configPath, loaded)) {
        std::cerr << "config not found, keeping current settings: " << configPath << std::endl;
        return;
    }
    config = loaded;

    if (config.hasAlpha) {
        Overlay::SetWorkAlpha(state, config.alpha);
        ApplyAlpha();
    }
    if (config.hasPosition) {
        OverlayPoint saved = { config.x, config.y };
        OverlayPoint pos = ChooseOverlayPosition(true, saved, IsPositionVisible(config.x, config.y), DefaultPosition());
        SetWindowPos(hOverlayWnd, NULL, pos.x, pos.y, 0, 0, SWP_NOSIZE | SWP_NOZORDER | SWP_NOACTIVATE);
    }
    SetTimer(hOverlayWnd, REFRESH_TIMER_ID, config.refreshIntervalMs, NULL);
    std::cout << "reloaded configuration" << std::endl;
}

void CloseOverlay() {
    if (hOverlayWnd) {
        DestroyWindow(hOverlayWnd);
    }
}

bool CreateOverlay() {
    if (hOverlayWnd) return true;

    configPath = GetConfigPath();
    if (Config::LoadConfig(configPath, config)) {
        if (config.hasAlpha) std::cout << "loaded saved opacity: " << config.alpha << std::endl;
        if (config.hasPosition) std::cout << "loaded saved position: " << config.x << ", " << config.y << std::endl;
    }

    state.alpha = config.alpha;
    state.savedAlpha = config.alpha;
    state.desktopCount = DesktopState::GetDesktopCount();
    state.currentDesktop = DesktopState::GetCurrentDesktopIndex(0);
    std::cout << "detected desktops: " << state.desktopCount << std::endl;

    layout = CalculateOverlayLayout(state.desktopCount);

    OverlayPoint saved = { config.x, config.y };
    OverlayPoint pos = ChooseOverlayPosition(config.hasPosition, saved, IsPositionVisible(config.x, config.y), DefaultPosition());

    if (!classRegistered) {
        WNDCLASSA wndClass {};
        wndClass.lpfnWndProc   = OverlayWndProc;
        wndClass.hInstance     = GetModuleHandle(NULL);
        wndClass.lpszClassName = APP_NAME "Overlay";
        wndClass.hCursor       = LoadCursor(NULL, IDC_ARROW);

        if (!RegisterClassA(&wndClass)) {
            std::cerr << "failed to register overlay class (error " << GetLastError() << ")" << std::endl;
            return false;
        }
        classRegistered = true;
    }

    hOverlayWnd = CreateWindowExA(
        WS_EX_TOPMOST | WS_EX_LAYERED | WS_EX_TOOLWINDOW | WS_EX_NOACTIVATE,
        APP_NAME "Overlay",
        "Virtual Desktops",
        WS_POPUP,
        pos.x, pos.y, layout.winW, layout.winH,
        NULL, NULL,
        GetModuleHandle(NULL),
        NULL
    );
    if (!hOverlayWnd) {
        std::cerr << "failed to create overlay window (error " << GetLastError() << ")" << std::endl;
        return false;
    }

    ApplyAlpha();
    ShowWindow(hOverlayWnd, SW_SHOWNOACTIVATE);

    if (!SetTimer(hOverlayWnd, REFRESH_TIMER_ID, config.refreshIntervalMs, NULL)) {
        std::cerr << "failed to start refresh timer (error " << GetLastError() << ")" << std::endl;
    }
    return true;
}
