#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "Digest.hpp"
#include "Errors.hpp"
#include "FileSynchronizer.hpp"
#include "MetadataCopier.hpp"
#include "TreeScanner.hpp"

namespace fs = std::filesystem;

struct MirrorSettings
{
	HashAlgorithm algorithm = HashAlgorithm::Sha256;
	long long blockSize = static_cast<long long>(FileSynchronizer::DEFAULT_BLOCK_SIZE);
	std::vector<std::string> excludePatterns;
	bool matchAbsolute = false;
};

struct RunStatistics
{
	std::size_t totalFiles = 0;
	std::size_t copiedFiles = 0;
	std::size_t unchangedFiles = 0;
	std::size_t excludedFiles = 0;
	std::size_t failedFiles = 0;
	std::size_t failedDirectories = 0;
	std::chrono::duration<double> elapsed{};
};

struct RunResult
{
	MirrorError error;
	RunStatistics statistics;

	bool ok() const { return !error && 0 == statistics.failedFiles && 0 == statistics.failedDirectories; }
};

class IMirrorManager
{
public:
	virtual ~IMirrorManager() = default;
	virtual RunResult Mirror(const fs::path& source, const fs::path& dest) = 0;
};

class MirrorManager : public IMirrorManager
{
public:
	explicit MirrorManager(const MirrorSettings& settings);
	RunResult Mirror(const fs::path& source, const fs::path& dest) override;

private:
	MirrorError resolveRoots(const fs::path& source, const fs::path& dest, fs::path& sourceRoot, fs::path& destRoot);
	MirrorError bootstrapDestination(const fs::path& sourceRoot, const fs::path& destRoot,
		std::vector<CreatedDirectory>& created);
	void execute(const ScanPlan& plan, FileSynchronizer& synchronizer, RunStatistics& statistics);
	void restoreDirectoryTimes(const std::vector<CreatedDirectory>& created);

private:
	MirrorSettings m_settings;
	MetadataCopier m_metadataCopier;
};
