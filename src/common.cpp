#include "common.hpp"

std::string GetKnownFolderPath(REFKNOWNFOLDERID rfid) {
    PWSTR pszPath = NULL;
    std::string path = "";
    if (SUCCEEDED(SHGetKnownFolderPath(rfid, 0, NULL, &pszPath))) {
        int size = WideCharToMultiByte(CP_UTF8, 0, pszPath, -1, NULL, 0, NULL, NULL);
        if (size > 0) {
            std::vector<char> buf(size);
            WideCharToMultiByte(CP_UTF8, 0, pszPath, -1, buf.data(), size, NULL, NULL);
            path = buf.data();
        }
        CoTaskMemFree(pszPath);
    }
    return path;
}

std::string GetConfigPath() {
    std::string baseAppPath = GetKnownFolderPath(FOLDERID_LocalAppData);
    if (!baseAppPath.empty()) {
        std::string appPath = baseAppPath + "\\" APP_NAME;
        if (CreateDirectoryA(appPath.c_str(), NULL) || GetLastError() == ERROR_ALREADY_EXISTS) {
            return appPath + "\\config.json";
        }
        std::cerr << "failed to create " << appPath << " (error " << GetLastError() << ")" << std::endl;
    }
    return "desktop_switch_config.json";
}
