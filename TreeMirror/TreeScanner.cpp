#include "TreeScanner.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <system_error>

TreeScanner::TreeScanner(const DigestProvider& digest, const ExclusionFilter& filter,
	const MetadataCopier& metadataCopier, bool matchAbsolute) :
	m_digest(digest), m_filter(filter), m_metadataCopier(metadataCopier), m_matchAbsolute(matchAbsolute) {}

/**
* Name: TreeScanner::scan
* Description: Build the mirror plan for the whole source tree
* @Param sourceRoot - canonical absolute source directory
* @Param destRoot - absolute destination directory, must already exist
*/
ScanPlan TreeScanner::scan(const fs::path& sourceRoot, const fs::path& destRoot)
{
	LOG(Debug, "Entry.");

	m_sourceRoot = sourceRoot;
	m_destRoot = destRoot;

	ScanPlan plan;
	scanDirectory(m_sourceRoot, plan);

	LOG(Debug, "Exit, %zu files planned.", plan.files.size());
	return plan;
}

/**
* Name: TreeScanner::scanDirectory
* Description: Plan the files of one directory, then descend into its subdirectories.
* Entries are visited sorted by name so the order is the same on every run.
* @Param sourceDir - directory below (or equal to) the source root
* @Param plan - receives planned files and created directories
*/
void TreeScanner::scanDirectory(const fs::path& sourceDir, ScanPlan& plan)
{
	if (!ensureDirectory(sourceDir, destinationFor(sourceDir), plan))
	{
		++plan.failedDirectories;
		return;
	}

	std::error_code ec;
	fs::directory_iterator it(sourceDir, ec);
	if (ec)
	{
		LOG(Error, "Cannot list directory %s: %s.", sourceDir.string().c_str(), ec.message().c_str());
		++plan.failedDirectories;
		return;
	}

	std::vector<fs::directory_entry> files;
	std::vector<fs::path> subdirs;
	fs::directory_iterator end;
	while (it != end)
	{
		const fs::directory_entry& entry = *it;
		std::error_code typeEc;
		if (entry.is_directory(typeEc))
		{
			if (entry.is_symlink(typeEc))
			{
				LOG(Debug, "Not following directory link %s.", entry.path().string().c_str());
			}
			else
			{
				subdirs.push_back(entry.path());
			}
		}
		else
		{
			files.push_back(entry);
		}

		it.increment(ec);
		if (ec)
		{
			break;
		}
	}

	if (ec)
	{
		LOG(Error, "Listing of %s aborted: %s.", sourceDir.string().c_str(), ec.message().c_str());
		++plan.failedDirectories;
	}

	std::sort(files.begin(), files.end(),
		[](const fs::directory_entry& lhs, const fs::directory_entry& rhs) { return lhs.path().filename() < rhs.path().filename(); });
	std::sort(subdirs.begin(), subdirs.end(),
		[](const fs::path& lhs, const fs::path& rhs) { return lhs.filename() < rhs.filename(); });

	for (const auto& entry : files)
	{
		plan.files.push_back(planFile(entry));
	}

	for (const auto& subdir : subdirs)
	{
		scanDirectory(subdir, plan);
	}
}

/**
* Name: TreeScanner::ensureDirectory
* Description: Create the destination directory if absent and copy the source directory times onto it
*/
bool TreeScanner::ensureDirectory(const fs::path& sourceDir, const fs::path& destDir, ScanPlan& plan)
{
	std::error_code ec;
	if (fs::exists(destDir, ec))
	{
		if (!fs::is_directory(destDir, ec))
		{
			LOG(Error, "Destination %s exists and is not a directory.", destDir.string().c_str());
			return false;
		}
		return true;
	}

	LOG(Info, "Creating directory %s.", destDir.string().c_str());
	fs::create_directories(destDir, ec);
	if (ec)
	{
		LOG(Error, "Cannot create directory %s: %s.", destDir.string().c_str(), ec.message().c_str());
		return false;
	}

	MirrorError error;
	if (!m_metadataCopier.copyMetadata(sourceDir, destDir, error))
	{
		LOG(Warn, "Directory times not copied: %s.", error.describe().c_str());
	}

	plan.createdDirectories.push_back({ sourceDir, destDir });
	return true;
}

fs::path TreeScanner::destinationFor(const fs::path& source) const
{
	fs::path relative = source.lexically_relative(m_sourceRoot);
	if (relative.empty() || fs::path(".") == relative)
	{
		return m_destRoot;
	}
	return m_destRoot / relative;
}

std::string TreeScanner::exclusionSubject(const fs::path& source) const
{
	if (m_matchAbsolute)
	{
		return source.string();
	}
	return source.lexically_relative(m_sourceRoot).generic_string();
}

/**
* Name: TreeScanner::planFile
* Description: Decide the action for one non-directory entry.
* Copy when the destination is missing, unreadable or its digest differs from the source digest.
*/
PlannedFile TreeScanner::planFile(const fs::directory_entry& entry)
{
	const fs::path& source = entry.path();
	PlannedFile planned{ source, destinationFor(source), FileAction::Copy, std::string() };

	if (m_filter.isExcluded(exclusionSubject(source)))
	{
		LOG(Info, "Skipping file: %s (excluded).", source.string().c_str());
		planned.action = FileAction::Excluded;
		return planned;
	}

	std::error_code ec;
	if (!entry.is_regular_file(ec))
	{
		LOG(Warn, "Skipping %s: not a regular file.", source.string().c_str());
		planned.action = FileAction::Failed;
		planned.reason = "not a regular file";
		return planned;
	}

	if (!fs::exists(planned.dest, ec))
	{
		planned.reason = "new";
		return planned;
	}

	if (!fs::is_regular_file(planned.dest, ec))
	{
		LOG(Error, "Destination %s exists and is not a regular file.", planned.dest.string().c_str());
		planned.action = FileAction::Failed;
		planned.reason = "destination is not a regular file";
		return planned;
	}

	MirrorError error;
	std::string sourceDigest = m_digest.digestFile(source, error);
	if (error)
	{
		LOG(Error, "Cannot hash %s: %s.", source.string().c_str(), error.describe().c_str());
		planned.action = FileAction::Failed;
		planned.reason = error.describe();
		return planned;
	}

	// an unreadable destination is overwritten, the copy decides whether it is writable
	MirrorError destError;
	std::string destDigest = m_digest.digestFile(planned.dest, destError);
	if (destError)
	{
		LOG(Warn, "Cannot hash destination %s: %s.", planned.dest.string().c_str(), destError.describe().c_str());
		planned.reason = "destination unreadable";
		return planned;
	}

	if (destDigest != sourceDigest)
	{
		planned.reason = "content differs";
		return planned;
	}

	LOG(Info, "File unchanged: %s (digest matches).", source.string().c_str());
	planned.action = FileAction::Unchanged;
	return planned;
}
