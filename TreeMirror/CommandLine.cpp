#include "CommandLine.hpp"

#include <stdexcept>

namespace
{
	const char* ALGORITHM_OPTION = "--algorithm";
	const char* BLOCK_SIZE_OPTION = "--block-size";
	const char* LOG_LEVEL_OPTION = "--log-level";
	const char* LOG_FILE_OPTION = "--log-file";
	const char* MATCH_ABSOLUTE_OPTION = "--match-absolute";
	const char* EXCLUDE_OPTION = "--exclude";
	const char* DEFAULT_PROGRAM_NAME = "treemirror";

	ParseResult configurationError(const std::string& message)
	{
		ParseResult result;
		result.status = ParseResult::Status::Error;
		result.error = MirrorError(ErrorKind::Configuration, message);
		return result;
	}

	bool parseBlockSize(const std::string& text, long long& blockSize)
	{
		try
		{
			std::size_t consumed = 0;
			blockSize = std::stoll(text, &consumed);
			return consumed == text.size() && 0 < blockSize;
		}
		catch (const std::invalid_argument&)
		{
			return false;
		}
		catch (const std::out_of_range&)
		{
			return false;
		}
	}
} //anonymous namespace

std::string stripQuotes(const std::string& value)
{
	std::size_t first = value.find_first_not_of('"');
	if (std::string::npos == first)
	{
		return std::string();
	}
	std::size_t last = value.find_last_not_of('"');
	return value.substr(first, last - first + 1);
}

std::string usageText(const std::string& program)
{
	return "Usage: " + program + " <source> <destination> [--algorithm sha256|blake3] [--block-size bytes]\n"
		"       [--log-level debug|info|warn|error] [--log-file path] [--match-absolute]\n"
		"       [--exclude regex_pattern ...]\n"
		"--exclude takes all remaining arguments and must come last.\n";
}

std::string programName(int argc, char** argv)
{
	if (0 >= argc || nullptr == argv || nullptr == argv[0])
	{
		return DEFAULT_PROGRAM_NAME;
	}
	return argv[0];
}

/**
* Name: parseCommandLine
* Description: Parse program arguments into mirror options
* @Param args - program name followed by its arguments
*/
ParseResult parseCommandLine(const std::vector<std::string>& args)
{
	for (std::size_t i = 1; i < args.size(); ++i)
	{
		if ("--help" == args[i] || "-h" == args[i])
		{
			ParseResult help;
			help.status = ParseResult::Status::Help;
			return help;
		}
		if (EXCLUDE_OPTION == args[i])
		{
			break;
		}
	}

	if (3 > args.size())
	{
		ParseResult usage;
		usage.status = ParseResult::Status::Usage;
		return usage;
	}

	ParseResult result;
	MirrorOptions& options = result.options;
	options.source = stripQuotes(args[1]);
	options.dest = stripQuotes(args[2]);

	for (std::size_t i = 3; i < args.size(); ++i)
	{
		const std::string& arg = args[i];

		if (EXCLUDE_OPTION == arg)
		{
			options.settings.excludePatterns.assign(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());
			break;
		}

		if (MATCH_ABSOLUTE_OPTION == arg)
		{
			options.settings.matchAbsolute = true;
			continue;
		}

		if (ALGORITHM_OPTION != arg && BLOCK_SIZE_OPTION != arg && LOG_LEVEL_OPTION != arg && LOG_FILE_OPTION != arg)
		{
			return configurationError("unknown argument: " + arg);
		}

		if (i + 1 >= args.size())
		{
			return configurationError("missing value for " + arg);
		}
		const std::string& value = args[++i];

		if (ALGORITHM_OPTION == arg)
		{
			auto algorithm = parseHashAlgorithm(value);
			if (!algorithm)
			{
				return configurationError("unsupported algorithm: " + value);
			}
			options.settings.algorithm = *algorithm;
		}
		else if (BLOCK_SIZE_OPTION == arg)
		{
			if (!parseBlockSize(value, options.settings.blockSize))
			{
				return configurationError("block size must be a positive integer: " + value);
			}
		}
		else if (LOG_LEVEL_OPTION == arg)
		{
			auto level = Logger::levelFromString(value);
			if (!level)
			{
				return configurationError("unknown log level: " + value);
			}
			options.logLevel = *level;
		}
		else
		{
			options.logFile = value;
		}
	}

	return result;
}

ParseResult parseCommandLine(int argc, char** argv)
{
	return parseCommandLine(std::vector<std::string>(argv, argv + argc));
}

int exitCodeFor(ParseResult::Status status)
{
	switch (status)
	{
	case ParseResult::Status::Usage:
		return EXIT_USAGE;
	case ParseResult::Status::Error:
		return EXIT_CONFIGURATION;
	default:
		return 0;
	}
}

/**
* Name: exitCodeFor
* Description: Map a run result to the process exit status.
* An error in the result means the run stopped before copying anything,
* so only a completed run with failed entries gives EXIT_PARTIAL.
* @Param result - result of MirrorManager::Mirror
*/
int exitCodeFor(const RunResult& result)
{
	switch (result.error.kind)
	{
	case ErrorKind::None:
		return result.ok() ? 0 : EXIT_PARTIAL;
	case ErrorKind::SourceNotFound:
		return EXIT_SOURCE_NOT_FOUND;
	default:
		return EXIT_CONFIGURATION;
	}
}
