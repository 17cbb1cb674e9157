#pragma once

namespace SystemState {
    extern HANDLE hMutex;

    bool IsOnStartupEnabled();
    bool SetOnStartup(bool enable);

    bool Initialize();
    void CleanUp();
}
