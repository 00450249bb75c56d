#ifndef CLI_PARSE_H
#define CLI_PARSE_H

#include <string>
#include <vector>

std::vector<std::string> splitByChar(const std::string& text, char delimiter);
int parseIntStrict(const std::string& text, const std::string& fieldName);
int parseIntInRange(const std::string& text, const std::string& fieldName, int minValue, int maxValue);
double parseDoubleStrict(const std::string& text, const std::string& fieldName);
// Comma separated list; an empty string yields {0.0}.
std::vector<double> parseThresholds(const std::string& text);

#endif
