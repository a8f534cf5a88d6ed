#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "Digest.hpp"
#include "ExclusionFilter.hpp"
#include "MetadataCopier.hpp"

namespace fs = std::filesystem;

enum class FileAction { Copy = 0, Unchanged, Excluded, Failed };

struct PlannedFile
{
	fs::path source;
	fs::path dest;
	FileAction action;
	std::string reason;
};

struct CreatedDirectory
{
	fs::path source;
	fs::path dest;
};

struct ScanPlan
{
	std::vector<PlannedFile> files;
	// in creation order, parents before children
	std::vector<CreatedDirectory> createdDirectories;
	std::size_t failedDirectories = 0;
};

class TreeScanner
{
public:
	TreeScanner(const DigestProvider& digest, const ExclusionFilter& filter,
		const MetadataCopier& metadataCopier, bool matchAbsolute = false);

	// Walks sourceRoot depth first, creates the matching destination directories
	// and decides for every file whether it has to be copied.
	ScanPlan scan(const fs::path& sourceRoot, const fs::path& destRoot);

private:
	void scanDirectory(const fs::path& sourceDir, ScanPlan& plan);
	bool ensureDirectory(const fs::path& sourceDir, const fs::path& destDir, ScanPlan& plan);
	PlannedFile planFile(const fs::directory_entry& entry);
	fs::path destinationFor(const fs::path& source) const;
	std::string exclusionSubject(const fs::path& source) const;

	const DigestProvider& m_digest;
	const ExclusionFilter& m_filter;
	const MetadataCopier& m_metadataCopier;
	bool m_matchAbsolute;

	fs::path m_sourceRoot;
	fs::path m_destRoot;
};
