#pragma once

#include <string>
#include <vector>

#include "Errors.hpp"
#include "Logger.hpp"
#include "MirrorManager.hpp"

struct MirrorOptions
{
	std::string source;
	std::string dest;
	MirrorSettings settings;
	LogLevel logLevel = LogLevel::Info;
	std::string logFile;
};

struct ParseResult
{
	enum class Status { Run = 0, Help, Usage, Error };

	Status status = Status::Run;
	MirrorOptions options;
	MirrorError error;
};

constexpr int EXIT_USAGE = 1;
constexpr int EXIT_CONFIGURATION = 2;
constexpr int EXIT_SOURCE_NOT_FOUND = 3;
constexpr int EXIT_PARTIAL = 4;

ParseResult parseCommandLine(const std::vector<std::string>& args);
ParseResult parseCommandLine(int argc, char** argv);

std::string stripQuotes(const std::string& value);
std::string usageText(const std::string& program);
// argv[0], or "treemirror" when the program was started without one.
std::string programName(int argc, char** argv);

// Process exit status for a finished parse (Help, Usage, Error) or a run.
int exitCodeFor(ParseResult::Status status);
int exitCodeFor(const RunResult& result);
