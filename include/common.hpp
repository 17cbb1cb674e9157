#pragma once

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif

#include <windows.h>
#include <windowsx.h>
#include <shellapi.h>
#include <shlobj.h>
#include <objbase.h>
#include <gdiplus.h>

#include <iostream>
#include <vector>
#include <string>
#include <cstdint>

#define APP_NAME "DeskSwitch"

std::string GetKnownFolderPath(REFKNOWNFOLDERID rfid);
std::string GetConfigPath();
