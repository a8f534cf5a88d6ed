#pragma once

#include <filesystem>

#include "Errors.hpp"

namespace fs = std::filesystem;

class MetadataCopier
{
public:
	enum class CreationTime { Applied = 0, Unsupported };

	/**
	* Copies access and modification time from source to dest (file or directory),
	* then creation time where the platform can set it.
	* Returns false and sets error when access/modification time cannot be copied.
	* Creation time outcome is reported through creationTime, never as an error.
	*/
	bool copyMetadata(const fs::path& source, const fs::path& dest, MirrorError& error,
		CreationTime* creationTime = nullptr) const;
};
