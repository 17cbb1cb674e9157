#pragma once

namespace DesktopState {
    int GetDesktopCount();
    int GetCurrentDesktopIndex(int fallback);
}
