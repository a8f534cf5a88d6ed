#pragma once

#include <filesystem>
#include <regex>
#include <string>
#include <vector>

#include "Errors.hpp"

namespace fs = std::filesystem;

/**
* Decides whether a file is left out of the mirror. A path is excluded
* when any pattern is found anywhere in it (search, not full match).
*/
class ExclusionFilter
{
public:
	ExclusionFilter() = default;

	// Compiles all patterns; on an invalid one error is set and false returned.
	bool compile(const std::vector<std::string>& patterns, MirrorError& error);

	bool isExcluded(const std::string& path) const;
	bool empty() const { return m_regexes.empty(); }
	const std::vector<std::string>& patterns() const { return m_patterns; }

private:
	std::vector<std::string> m_patterns;
	std::vector<std::regex> m_regexes;
};

bool isExcluded(const std::string& path, const std::vector<std::regex>& patterns);
