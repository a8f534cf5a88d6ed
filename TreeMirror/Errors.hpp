#pragma once

#include <string>
#include <utility>

enum class ErrorKind
{
	None = 0,
	Configuration,
	SourceNotFound,
	UnsupportedAlgorithm,
	Io
};

inline const char* toString(ErrorKind kind)
{
	switch (kind)
	{
	case ErrorKind::None: return "none";
	case ErrorKind::Configuration: return "configuration error";
	case ErrorKind::SourceNotFound: return "source not found";
	case ErrorKind::UnsupportedAlgorithm: return "unsupported algorithm";
	case ErrorKind::Io: return "I/O error";
	default: return "unknown error";
	}
}

struct MirrorError
{
	ErrorKind kind = ErrorKind::None;
	std::string message;

	MirrorError() = default;
	MirrorError(ErrorKind k, std::string msg) :
		kind(k), message(std::move(msg)) {}

	explicit operator bool() const { return ErrorKind::None != kind; }

	std::string describe() const
	{
		return std::string(toString(kind)) + ": " + message;
	}
};
