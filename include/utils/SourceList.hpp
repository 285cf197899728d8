#pragma once
#include <string>
#include <vector>

namespace RedditDash {

// Splits "a, b ,,c" into {"a", "b", "c"}: comma separated, trimmed, blanks dropped.
std::vector<std::string> parseSourceList(const std::string& raw);

std::string trimSourceName(const std::string& name);
std::vector<std::string> normalizeSources(const std::vector<std::string>& names);
std::string joinSourceList(const std::vector<std::string>& names);

}
