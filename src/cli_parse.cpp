#include "cli_parse.h"

#include <limits>
#include <sstream>
#include <stdexcept>

std::vector<std::string> splitByChar(const std::string& text, char delimiter) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream in(text);
    while (std::getline(in, current, delimiter)) {
        parts.push_back(current);
    }
    return parts;
}

int parseIntStrict(const std::string& text, const std::string& fieldName) {
    std::size_t parsed = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &parsed, 10);
    } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid integer for " + fieldName + ": '" + text + "'");
    }
    if (parsed != text.size()) {
        throw std::runtime_error("Invalid integer for " + fieldName + ": '" + text + "'");
    }
    if (value < static_cast<long long>(std::numeric_limits<int>::min()) ||
        value > static_cast<long long>(std::numeric_limits<int>::max())) {
        throw std::runtime_error("Integer out of range for " + fieldName + ": " + text);
    }
    return static_cast<int>(value);
}

int parseIntInRange(const std::string& text, const std::string& fieldName, int minValue, int maxValue) {
    const int value = parseIntStrict(text, fieldName);
    if (value < minValue || value > maxValue) {
        throw std::runtime_error("Value out of range for " + fieldName + ": " + text +
                                 " (expected " + std::to_string(minValue) + ".." + std::to_string(maxValue) + ")");
    }
    return value;
}

double parseDoubleStrict(const std::string& text, const std::string& fieldName) {
    std::size_t parsed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &parsed);
    } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid number for " + fieldName + ": '" + text + "'");
    }
    if (parsed != text.size()) {
        throw std::runtime_error("Invalid number for " + fieldName + ": '" + text + "'");
    }
    return value;
}

std::vector<double> parseThresholds(const std::string& text) {
    if (text.empty()) {
        return {0.0};
    }
    std::vector<double> thresholds;
    for (const std::string& part : splitByChar(text, ',')) {
        thresholds.push_back(parseDoubleStrict(part, "threshold"));
    }
    if (thresholds.empty()) {
        throw std::runtime_error("Invalid threshold list: '" + text + "'");
    }
    return thresholds;
}
