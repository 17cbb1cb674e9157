#include "common.hpp"
#include "systemstate.hpp"

namespace SystemState {
    HANDLE hMutex = NULL;

    const char* RUN_KEY = "Software\\Microsoft\\Windows\\CurrentVersion\\Run";

    std::string GetCurrentProcessPath() {
        char szPath[MAX_PATH];
        DWORD length = GetModuleFileNameA(NULL, szPath, MAX_PATH);
        if (length == 0 || length == MAX_PATH) return "";
        return std::string(szPath, length);
    }

    bool IsOnStartupEnabled() {
        HKEY hKey;
        LONG result = RegOpenKeyExA(HKEY_CURRENT_USER, RUN_KEY, 0, KEY_READ, &hKey);
        if (result == ERROR_SUCCESS) {
            result = RegQueryValueExA(hKey, APP_NAME, NULL, NULL, NULL, NULL);
            RegCloseKey(hKey);
            return (result == ERROR_SUCCESS);
        }
        return false;
    }

    bool SetOnStartup(bool enable) {
        HKEY hKey;
        LONG result = RegOpenKeyExA(HKEY_CURRENT_USER, RUN_KEY, 0, KEY_SET_VALUE, &hKey);
        if (result != ERROR_SUCCESS) {
            std::cerr << "failed to open run key (error " << result << ")" << std::endl;
            return false;
        }

        if (enable) {
            std::string path = GetCurrentProcessPath();
            if (path.empty()) {
                RegCloseKey(hKey);
                std::cerr << "failed to resolve executable path" << std::endl;
                return false;
            }
            std::string command = "\"" + path + "\"";
            result = RegSetValueExA(hKey, APP_NAME, 0, REG_SZ, (const BYTE*)command.c_str(), (DWORD)command.length() + 1);
        } else {
            result = RegDeleteValueA(hKey, APP_NAME);
            if (result == ERROR_FILE_NOT_FOUND) result = ERROR_SUCCESS;
        }
        RegCloseKey(hKey);

        if (result != ERROR_SUCCESS) {
            std::cerr << "failed to update startup entry (error " << result << ")" << std::endl;
            return false;
        }
        std::cout << "start with windows: " << (enable ? "on" : "off") << std::endl;
        return true;
    }

    bool Initialize() {
        CoInitializeEx(NULL, COINIT_APARTMENTTHREADED | COINIT_DISABLE_OLE1DDE);

        hMutex = CreateMutexA(NULL, TRUE, "Local\\" APP_NAME "_SingleInstance_Mutex");
        if (GetLastError() == ERROR_ALREADY_EXISTS) {
            CleanUp();
            return false;
        }
        if (!hMutex) {
            std::cerr << "failed to create instance mutex (error " << GetLastError() << ")" << std::endl;
        }
        return true;
    }

    void CleanUp() {
        if (hMutex) {
            ReleaseMutex(hMutex);
            CloseHandle(hMutex);
            hMutex = NULL;
        }
        CoUninitialize();
    }
}
