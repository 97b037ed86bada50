#include "utils/SubtitleText.hpp"
#include "utils/UrlUtils.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <vector>

namespace MediaBot {

namespace {

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// "00:01" prefix of a cue timing line
bool isTimestampLine(const std::string& line) {
    return line.size() >= 5 && isDigit(line[0]) && isDigit(line[1]) && line[2] == ':' &&
           isDigit(line[3]) && isDigit(line[4]);
}

bool isCueIndexLine(const std::string& line) {
    return !line.empty() && std::all_of(line.begin(), line.end(), isDigit);
}

std::string stripTags(const std::string& line) {
    std::string result;
    result.reserve(line.size());
    size_t pos = 0;
    while (pos < line.size()) {
        const size_t open = line.find('<', pos);
        if (open == std::string::npos) {
            break;
        }
        const size_t close = line.find('>', open + 1);
        if (close == std::string::npos) {
            break;
        }
        // "<>" is kept as text
        if (close == open + 1) {
            result.append(line, pos, open + 1 - pos);
            pos = open + 1;
            continue;
        }
        result.append(line, pos, open - pos);
        pos = close + 1;
    }
    result.append(line, std::min(pos, line.size()), std::string::npos);
    return result;
}

} // namespace

std::string SubtitleText::toPlainText(const std::string& content) {
    std::istringstream stream(content);
    std::vector<std::string> lines;
    std::string line;
    std::string lastLine;

    while (std::getline(stream, line)) {
        const std::string trimmed = UrlUtils::trim(line);
        if (trimmed.empty()) continue;
        if (trimmed == "WEBVTT" || trimmed.rfind("WEBVTT ", 0) == 0) continue;
        if (trimmed.rfind("Kind:", 0) == 0 || trimmed.rfind("Language:", 0) == 0) continue;
        if (isTimestampLine(trimmed)) continue;
        if (isCueIndexLine(trimmed)) continue;

        const std::string clean = UrlUtils::trim(stripTags(trimmed));
        if (clean.empty()) continue;

        // Auto captions repeat the previous line in rolling cues
        if (clean != lastLine) {
            lines.push_back(clean);
            lastLine = clean;
        }
    }

    std::string result;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) result += '\n';
        result += lines[i];
    }
    return result;
}

std::string SubtitleText::fileToPlainText(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return "";
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return toPlainText(buffer.str());
}

} // namespace MediaBot
