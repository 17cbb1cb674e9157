#pragma once

#include <iosfwd>
#include <string>

struct OverlayConfig {
    bool hasPosition = false;
    int x = 0;
    int y = 0;

    bool hasAlpha = false;
    double alpha = 0.9;

    int refreshIntervalMs = 500;
};

namespace Config {
    const double MIN_ALPHA = 0.2;
    const double MAX_ALPHA = 1.0;
    const int MIN_REFRESH_INTERVAL_MS = 100;
    const int MAX_REFRESH_INTERVAL_MS = 5000;

    double ClampAlpha(double alpha);

    void ParseConfig(std::istream& in, OverlayConfig& config);
    void WriteConfig(std::ostream& out, const OverlayConfig& config);

    bool LoadConfig(const std::string& path, OverlayConfig& config);
    bool SaveConfig(const std::string& path, const OverlayConfig& config);
}
