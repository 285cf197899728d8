#include "utils/SourceList.hpp"

namespace RedditDash {

std::string trimSourceName(const std::string& name) {
    size_t start = name.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = name.find_last_not_of(" \t\r\n");
    return name.substr(start, end - start + 1);
}

std::vector<std::string> normalizeSources(const std::vector<std::string>& names) {
    std::vector<std::string> result;
    for (const auto& n : names) {
        std::string trimmed = trimSourceName(n);
        if (!trimmed.empty()) result.push_back(trimmed);
    }
    return result;
}

std::vector<std::string> parseSourceList(const std::string& raw) {
    std::vector<std::string> parts;
    std::string part;
    for (char c : raw) {
        if (c == ',') { parts.push_back(part); part.clear(); }
        else part += c;
    }
    parts.push_back(part);
    return normalizeSources(parts);
}

std::string joinSourceList(const std::vector<std::string>& names) {
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += ", ";
        out += names[i];
    }
    return out;
}

}
