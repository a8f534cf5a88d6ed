#include "MirrorManager.hpp"
#include "Logger.hpp"

#include <new>
#include <optional>
#include <string>
#include <system_error>

/**
* Name: MirrorManager::MirrorManager
* Description: Constructor
* @Param settings - algorithm, block size and exclusions used for every run
*/
MirrorManager::MirrorManager(const MirrorSettings& settings) :
    m_settings(settings) {}

/**
* Name: MirrorManager::Mirror
* Description: Mirror the source tree into the destination tree.
* Copies new and changed files, leaves unchanged and excluded files alone.
* @Param source - source directory
* @Param dest - destination directory, created when missing
*/
RunResult MirrorManager::Mirror(const fs::path& source, const fs::path& dest)
{
    LOG(Debug, "Entry.");

    RunResult result;
    const auto start = std::chrono::steady_clock::now();

    if (0 >= m_settings.blockSize ||
        static_cast<unsigned long long>(m_settings.blockSize) > FileSynchronizer::MAX_BLOCK_SIZE)
    {
        result.error = MirrorError(ErrorKind::Configuration,
            "block size must be between 1 and " + std::to_string(FileSynchronizer::MAX_BLOCK_SIZE) +
            ", got " + std::to_string(m_settings.blockSize));
        LOG(Error, "%s", result.error.message.c_str());
        return result;
    }

    // probe digest of nothing, rejects an algorithm without implementation before the walk
    DigestProvider digest(m_settings.algorithm);
    MirrorError probeError;
    digest.digestBytes("", 0, probeError);
    if (probeError)
    {
        result.error = probeError;
        LOG(Error, "Algorithm %s cannot be used: %s.", toString(m_settings.algorithm), probeError.describe().c_str());
        return result;
    }

    ExclusionFilter filter;
    if (!filter.compile(m_settings.excludePatterns, result.error))
    {
        return result;
    }

    fs::path sourceRoot;
    fs::path destRoot;
    result.error = resolveRoots(source, dest, sourceRoot, destRoot);
    if (result.error)
    {
        return result;
    }

    // the copy buffer is allocated before the destination is touched
    std::optional<FileSynchronizer> synchronizer;
    try
    {
        synchronizer.emplace(m_metadataCopier, static_cast<std::size_t>(m_settings.blockSize));
    }
    catch (const std::bad_alloc&)
    {
        result.error = MirrorError(ErrorKind::Configuration,
            "cannot allocate a copy buffer of " + std::to_string(m_settings.blockSize) + " bytes");
        LOG(Error, "%s", result.error.message.c_str());
        return result;
    }

    std::vector<CreatedDirectory> created;
    result.error = bootstrapDestination(sourceRoot, destRoot, created);
    if (result.error)
    {
        return result;
    }

    LOG(Info, "Starting mirror of %s into %s (%s).", sourceRoot.string().c_str(), destRoot.string().c_str(),
        toString(m_settings.algorithm));

    TreeScanner scanner(digest, filter, m_metadataCopier, m_settings.matchAbsolute);
    ScanPlan plan = scanner.scan(sourceRoot, destRoot);
    created.insert(created.end(), plan.createdDirectories.begin(), plan.createdDirectories.end());

    RunStatistics& statistics = result.statistics;
    statistics.failedDirectories = plan.failedDirectories;

    execute(plan, *synchronizer, statistics);
    restoreDirectoryTimes(created);

    statistics.elapsed = std::chrono::steady_clock::now() - start;

    LOG(Info, "Mirror finished. Copied files: %zu/%zu, unchanged: %zu, excluded: %zu, failed: %zu. Time: %.2f seconds.",
        statistics.copiedFiles, statistics.totalFiles, statistics.unchangedFiles, statistics.excludedFiles,
        statistics.failedFiles, statistics.elapsed.count());
    LOG(Debug, "Exit.");
    return result;
}

/**
* Name: MirrorManager::resolveRoots
* Description: Make both roots absolute and normalized, and check the source is a directory
*/
MirrorError MirrorManager::resolveRoots(const fs::path& source, const fs::path& dest, fs::path& sourceRoot, fs::path& destRoot)
{
    std::error_code ec;
    fs::path absoluteSource = fs::absolute(source, ec);
    if (ec || !fs::is_directory(absoluteSource, ec))
    {
        LOG(Error, "Source directory does not exist or is not a directory: %s.", source.string().c_str());
        return MirrorError(ErrorKind::SourceNotFound, source.string());
    }

    sourceRoot = fs::canonical(absoluteSource, ec);
    if (ec)
    {
        LOG(Error, "Cannot resolve %s: %s.", source.string().c_str(), ec.message().c_str());
        return MirrorError(ErrorKind::SourceNotFound, source.string() + ": " + ec.message());
    }

    fs::path absoluteDest = fs::absolute(dest, ec);
    if (!ec)
    {
        destRoot = fs::weakly_canonical(absoluteDest, ec);
    }
    if (ec)
    {
        LOG(Error, "Cannot resolve %s: %s.", dest.string().c_str(), ec.message().c_str());
        return MirrorError(ErrorKind::Io, dest.string() + ": " + ec.message());
    }

    // the walk would otherwise mirror its own output
    fs::path relative = destRoot.lexically_relative(sourceRoot);
    if (!relative.empty() && *relative.begin() != fs::path(".."))
    {
        LOG(Error, "Destination %s lies inside source %s.", destRoot.string().c_str(), sourceRoot.string().c_str());
        return MirrorError(ErrorKind::Configuration, "destination must not be inside the source directory");
    }

    return MirrorError();
}

/**
* Name: MirrorManager::bootstrapDestination
* Description: Create the destination root when missing and give it the source root times
*/
MirrorError MirrorManager::bootstrapDestination(const fs::path& sourceRoot, const fs::path& destRoot,
    std::vector<CreatedDirectory>& created)
{
    std::error_code ec;
    if (fs::exists(destRoot, ec))
    {
        if (!fs::is_directory(destRoot, ec))
        {
            LOG(Error, "Destination %s is not a directory.", destRoot.string().c_str());
            return MirrorError(ErrorKind::Io, destRoot.string() + " is not a directory");
        }
        return MirrorError();
    }

    LOG(Info, "Destination directory does not exist: %s. Creating it.", destRoot.string().c_str());
    fs::create_directories(destRoot, ec);
    if (ec)
    {
        LOG(Error, "Cannot create %s: %s.", destRoot.string().c_str(), ec.message().c_str());
        return MirrorError(ErrorKind::Io, "cannot create " + destRoot.string() + ": " + ec.message());
    }

    MirrorError error;
    if (!m_metadataCopier.copyMetadata(sourceRoot, destRoot, error))
    {
        LOG(Warn, "Root directory times not copied: %s.", error.describe().c_str());
    }

    created.push_back({ sourceRoot, destRoot });
    return MirrorError();
}

/**
* Name: MirrorManager::execute
* Description: Copy every file the plan marked for copying. A failing file is counted and skipped.
*/
void MirrorManager::execute(const ScanPlan& plan, FileSynchronizer& synchronizer, RunStatistics& statistics)
{
    for (const PlannedFile& file : plan.files)
    {
        ++statistics.totalFiles;

        switch (file.action)
        {
        case FileAction::Excluded:
            ++statistics.excludedFiles;
            continue;
        case FileAction::Unchanged:
            ++statistics.unchangedFiles;
            continue;
        case FileAction::Failed:
            ++statistics.failedFiles;
            continue;
        case FileAction::Copy:
            break;
        }

        std::error_code ec;
        fs::create_directories(file.dest.parent_path(), ec);
        if (ec)
        {
            LOG(Error, "Cannot create %s: %s.", file.dest.parent_path().string().c_str(), ec.message().c_str());
            ++statistics.failedFiles;
            continue;
        }

        LOG(Info, "Copying file (%s): %s -> %s.", file.reason.c_str(), file.source.string().c_str(), file.dest.string().c_str());
        MirrorError error;
        if (synchronizer.copyFile(file.source, file.dest, error))
        {
            ++statistics.copiedFiles;
        }
        else
        {
            LOG(Error, "Copy failed: %s.", error.describe().c_str());
            ++statistics.failedFiles;
        }
    }
}

/**
* Name: MirrorManager::restoreDirectoryTimes
* Description: Writing files changes directory mtime, so reapply source times to the
* directories created in this run, deepest first.
*/
void MirrorManager::restoreDirectoryTimes(const std::vector<CreatedDirectory>& created)
{
    for (auto it = created.rbegin(); it != created.rend(); ++it)
    {
        MirrorError error;
        if (!m_metadataCopier.copyMetadata(it->source, it->dest, error))
        {
            LOG(Warn, "Directory times not restored: %s.", error.describe().c_str());
        }
    }
}
