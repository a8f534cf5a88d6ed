#include "MetadataCopier.hpp"
#include "Logger.hpp"

#include <cerrno>
#include <cstring>
#include <string>

#if defined(_WIN32)
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#endif

namespace
{
#if !defined(_WIN32)
	MirrorError ioError(const std::string& what, const fs::path& path)
	{
		return MirrorError(ErrorKind::Io, what + " " + path.string() + ": " + std::strerror(errno));
	}
#else
	struct ScopedHandle
	{
		explicit ScopedHandle(HANDLE handle) : m_handle(handle) {}
		~ScopedHandle()
		{
			if (INVALID_HANDLE_VALUE != m_handle)
			{
				CloseHandle(m_handle);
			}
		}

		HANDLE m_handle;
	};

	HANDLE openForTimes(const fs::path& path, DWORD access)
	{
		// FILE_FLAG_BACKUP_SEMANTICS is required to open directories
		return CreateFileW(path.c_str(), access,
			FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE,
			nullptr, OPEN_EXISTING, FILE_FLAG_BACKUP_SEMANTICS, nullptr);
	}
#endif
} // anonymous namespace

/**
* Name: MetadataCopier::copyMetadata
* Description: Copy timestamps from the source entry to the destination entry
* @Param source - existing file or directory
* @Param dest - existing file or directory receiving the timestamps
* @Param error - I/O error when atime/mtime cannot be read or applied
* @Param creationTime - optional, receives whether creation time was applied
*/
bool MetadataCopier::copyMetadata(const fs::path& source, const fs::path& dest, MirrorError& error,
	CreationTime* creationTime) const
{
	if (creationTime)
	{
		*creationTime = CreationTime::Unsupported;
	}

#if defined(_WIN32)
	ScopedHandle src(openForTimes(source, FILE_READ_ATTRIBUTES));
	if (INVALID_HANDLE_VALUE == src.m_handle)
	{
		error = MirrorError(ErrorKind::Io, "cannot open " + source.string());
		LOG(Error, "Cannot open %s for reading times.", source.string().c_str());
		return false;
	}

	FILETIME created{}, accessed{}, written{};
	if (!GetFileTime(src.m_handle, &created, &accessed, &written))
	{
		error = MirrorError(ErrorKind::Io, "cannot read times of " + source.string());
		LOG(Error, "GetFileTime failed for %s.", source.string().c_str());
		return false;
	}

	ScopedHandle dst(openForTimes(dest, FILE_WRITE_ATTRIBUTES));
	if (INVALID_HANDLE_VALUE == dst.m_handle)
	{
		error = MirrorError(ErrorKind::Io, "cannot open " + dest.string());
		LOG(Error, "Cannot open %s for writing times.", dest.string().c_str());
		return false;
	}

	if (!SetFileTime(dst.m_handle, nullptr, &accessed, &written))
	{
		error = MirrorError(ErrorKind::Io, "cannot set times of " + dest.string());
		LOG(Error, "SetFileTime failed for %s.", dest.string().c_str());
		return false;
	}

	if (SetFileTime(dst.m_handle, &created, nullptr, nullptr))
	{
		if (creationTime)
		{
			*creationTime = CreationTime::Applied;
		}
	}
	else
	{
		LOG(Debug, "Creation time not settable on %s.", dest.string().c_str());
	}
#else
	struct stat statInfo{};
	if (0 != ::stat(source.c_str(), &statInfo))
	{
		error = ioError("cannot stat", source);
		LOG(Error, "stat failed for %s.", source.string().c_str());
		return false;
	}

	struct timespec times[2];
	times[0] = statInfo.st_atim;
	times[1] = statInfo.st_mtim;

	if (0 != ::utimensat(AT_FDCWD, dest.c_str(), times, 0))
	{
		error = ioError("cannot set times of", dest);
		LOG(Error, "utimensat failed for %s.", dest.string().c_str());
		return false;
	}

	// POSIX has no call that sets the birth time
	LOG(Debug, "Creation time not settable on %s.", dest.string().c_str());
#endif

	return true;
}
