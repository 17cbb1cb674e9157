#include "config.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>

namespace Config {
    std::string CleanValue(std::string s) {
        s.erase(std::remove(s.begin(), s.end(), '\"'), s.end());
        s.erase(std::remove(s.begin(), s.end(), ' '), s.end());
        s.erase(std::remove(s.begin(), s.end(), '\t'), s.end());
        s.erase(std::remove(s.begin(), s.end(), '\r'), s.end());
        return s;
    }

    template <typename T>
    bool ParseNumber(const std::string& text, T& out) {
        std::istringstream ss(text);
        T value;
        if (!(ss >> value)) return false;
        char trailing;
        if (ss >> trailing) return false;
        out = value;
        return true;
    }

    double ClampAlpha(double alpha) {
        return std::min(MAX_ALPHA, std::max(MIN_ALPHA, alpha));
    }

    // strips // comments line by line, then splits the object body on commas so
    // both the pretty-printed and the single-line form are accepted
    std::vector<std::string> SplitEntries(std::istream& in) {
        std::string body;
        std::string line;
        while (std::getline(in, line)) {
            size_t comment = line.find("//");
            if (comment != std::string::npos) line.erase(comment);
            body += line;
            body += ',';
        }
        body.erase(std::remove(body.begin(), body.end(), '{'), body.end());
        body.erase(std::remove(body.begin(), body.end(), '}'), body.end());

        std::vector<std::string> entries;
        std::stringstream ss(body);
        std::string item;
        while (std::getline(ss, item, ',')) {
            if (item.find(':') != std::string::npos) entries.push_back(item);
        }
        return entries;
    }

    void ParseConfig(std::istream& in, OverlayConfig& config) {
        bool hasX = false;
        bool hasY = false;
        int x = 0;
        int y = 0;

        for (const auto& entry : SplitEntries(in)) {
            size_t delim = entry.find(':');
            std::string key = CleanValue(entry.substr(0, delim));
            std::string val = CleanValue(entry.substr(delim + 1));

            if (key == "x") {
                hasX = ParseNumber(val, x);
            } else if (key == "y") {
                hasY = ParseNumber(val, y);
            } else if (key == "alpha") {
                double alpha;
                if (ParseNumber(val, alpha)) {
                    config.alpha = ClampAlpha(alpha);
                    config.hasAlpha = true;
                }
            } else if (key == "refreshIntervalMs") {
                int interval;
                if (ParseNumber(val, interval)) {
                    config.refreshIntervalMs = std::min(MAX_REFRESH_INTERVAL_MS, std::max(MIN_REFRESH_INTERVAL_MS, interval));
                }
            }
        }

        if (hasX && hasY) {
            config.x = x;
            config.y = y;
            config.hasPosition = true;
        }
    }

    void WriteConfig(std::ostream& out, const OverlayConfig& config) {
        out << "{\n";
        if (config.hasPosition) {
            out << "  // Overlay position in screen coordinates, updated when the overlay is dragged\n"
                << "  \"x\": " << config.x << ",\n"
                << "  \"y\": " << config.y << ",\n\n";
        }
        out << "  // Overlay opacity in work mode (" << MIN_ALPHA << " - " << MAX_ALPHA << ")\n"
            << "  \"alpha\": " << config.alpha << ",\n\n";
        out << "  // How often the virtual desktop state is polled, in milliseconds\n"
            << "  \"refreshIntervalMs\": " << config.refreshIntervalMs << "\n";
        out << "}\n";
    }

    bool LoadConfig(const std::string& path, OverlayConfig& config) {
        std::ifstream file(path);
        if (!file.is_open()) return false;

        ParseConfig(file, config);
        return true;
    }

    bool SaveConfig(const std::string& path, const OverlayConfig& config) {
        std::ofstream file(path, std::ios::trunc);
        if (!file.is_open()) {
            std::cerr << "failed to open config for writing: " << path << std::endl;
            return false;
        }

        WriteConfig(file, config);
        file.close();
        if (file.fail()) {
            std::cerr << "failed to write config: " << path << std::endl;
            return false;
        }

        std::cout << "saved position and opacity: x=" << config.x << ", y=" << config.y
                  << ", alpha=" << config.alpha << std::endl;
        return true;
    }
}
