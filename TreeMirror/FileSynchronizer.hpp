#pragma once

#include <filesystem>
#include <fstream>
#include <vector>

#include "Errors.hpp"
#include "MetadataCopier.hpp"

namespace fs = std::filesystem;

class FileSynchronizer
{
public:
	static constexpr std::size_t DEFAULT_BLOCK_SIZE = 4096;
	// Upper bound for the copy buffer, larger values are a configuration error.
	static constexpr std::size_t MAX_BLOCK_SIZE = 256 * 1024 * 1024;

	explicit FileSynchronizer(const MetadataCopier& metadataCopier, std::size_t blockSize = DEFAULT_BLOCK_SIZE);
	bool copyFile(const fs::path& source, const fs::path& dest, MirrorError& error);

	std::size_t blockSize() const { return m_BLOCK; }

private:
	const std::size_t m_BLOCK;
	std::vector<char> m_buffer;
	const MetadataCopier& m_metadataCopier;
};
