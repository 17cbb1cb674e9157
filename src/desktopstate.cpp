#include "common.hpp"
#include "desktopids.hpp"
#include "desktopstate.hpp"

namespace DesktopState {
    const char* REG_PATH = "SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Explorer\\VirtualDesktops";

    bool OpenDesktopsKey(HKEY& hKey) {
        LONG result = RegOpenKeyExA(HKEY_CURRENT_USER, REG_PATH, 0, KEY_READ, &hKey);
        if (result != ERROR_SUCCESS) {
            if (result != ERROR_FILE_NOT_FOUND) {
                std::cerr << "failed to open virtual desktops key (error " << result << ")" << std::endl;
            }
            return false;
        }
        return true;
    }

    bool ReadBinaryValue(HKEY hKey, const char* valueName, std::vector<uint8_t>& data) {
        DWORD type = 0;
        DWORD size = 0;
        LONG result = RegQueryValueExA(hKey, valueName, NULL, &type, NULL, &size);

        // the value can grow between the size query and the read when a desktop is added
        for (int attempt = 0; attempt < 3 && result == ERROR_SUCCESS; ++attempt) {
            if (type != REG_BINARY) return false;
            data.resize(size);
            if (size == 0) return true;

            result = RegQueryValueExA(hKey, valueName, NULL, &type, data.data(), &size);
            if (result == ERROR_SUCCESS) {
                data.resize(size);
                return true;
            }
            if (result == ERROR_MORE_DATA) {
                result = ERROR_SUCCESS;
            }
        }

        if (result != ERROR_SUCCESS && result != ERROR_FILE_NOT_FOUND) {
            std::cerr << "failed to read " << valueName << " (error " << result << ")" << std::endl;
        }
        return false;
    }

    int GetDesktopCount() {
        HKEY hKey;
        if (!OpenDesktopsKey(hKey)) return 1;

        std::vector<uint8_t> ids;
        bool found = ReadBinaryValue(hKey, "VirtualDesktopIDs", ids);
        RegCloseKey(hKey);

        return found ? DesktopIds::CountDesktops(ids) : 1;
    }

    int GetCurrentDesktopIndex(int fallback) {
        HKEY hKey;
        if (!OpenDesktopsKey(hKey)) {
            return DesktopIds::ResolveDesktopIndex(false, NULL, NULL, fallback);
        }

        std::vector<uint8_t> current;
        std::vector<uint8_t> ids;
        bool hasCurrent = ReadBinaryValue(hKey, "CurrentVirtualDesktop", current);
        bool hasIds = hasCurrent && ReadBinaryValue(hKey, "VirtualDesktopIDs", ids);
        RegCloseKey(hKey);

        return DesktopIds::ResolveDesktopIndex(true, hasCurrent ? &current : NULL,
                                               hasIds ? &ids : NULL, fallback);
    }
}
