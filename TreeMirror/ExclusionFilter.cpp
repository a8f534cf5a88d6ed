#include "ExclusionFilter.hpp"
#include "Logger.hpp"

bool isExcluded(const std::string& path, const std::vector<std::regex>& patterns)
{
	for (const auto& regex : patterns)
	{
		if (std::regex_search(path, regex))
		{
			return true;
		}
	}
	return false;
}

/**
* Name: ExclusionFilter::compile
* Description: Compile exclusion patterns (ECMAScript grammar)
* @Param patterns - regular expressions in command line order
* @Param error - configuration error for the first invalid pattern
*/
bool ExclusionFilter::compile(const std::vector<std::string>& patterns, MirrorError& error)
{
	std::vector<std::regex> regexes;
	regexes.reserve(patterns.size());

	for (const auto& pattern : patterns)
	{
		try
		{
			regexes.emplace_back(pattern, std::regex::ECMAScript);
		}
		catch (const std::regex_error& e)
		{
			error = MirrorError(ErrorKind::Configuration,
				"invalid exclude pattern '" + pattern + "': " + e.what());
			LOG(Error, "Invalid exclude pattern %s.", pattern.c_str());
			return false;
		}
	}

	m_patterns = patterns;
	m_regexes = std::move(regexes);
	return true;
}

bool ExclusionFilter::isExcluded(const std::string& path) const
{
	return ::isExcluded(path, m_regexes);
}
