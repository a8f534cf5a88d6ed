#include "FileSynchronizer.hpp"
#include "Logger.hpp"

/**
* Name: FileSynchronizer::FileSynchronizer
* Description: Constructor
* @Param metadataCopier - applied to every copied file
* @Param blockSize - maximum bytes per read/write, must be positive
*/
FileSynchronizer::FileSynchronizer(const MetadataCopier& metadataCopier, std::size_t blockSize) :
	m_BLOCK(blockSize), m_buffer(blockSize), m_metadataCopier(metadataCopier) {}

/**
* Name: FileSynchronizer::copyFile
* Description: Copy file, block by block, truncating the destination, then copy its timestamps
* @Param source - path to source file
* @Param dest - path to destination file, parent directory must exist
* @Param error - I/O error on failure
*/
bool FileSynchronizer::copyFile(const fs::path& source, const fs::path& dest, MirrorError& error)
{
	LOG(Debug, "Entry, %s -> %s.", source.string().c_str(), dest.string().c_str());

	{
		std::ifstream inFile(source, std::ios::binary);
		if (!inFile)
		{
			error = MirrorError(ErrorKind::Io, "cannot open " + source.string());
			LOG(Error, "Cannot open file %s.", source.string().c_str());
			return false;
		}

		std::ofstream outFile(dest, std::ios::binary | std::ios::trunc);
		if (!outFile)
		{
			error = MirrorError(ErrorKind::Io, "cannot create " + dest.string());
			LOG(Error, "Cannot create output file %s.", dest.string().c_str());
			return false;
		}

		while (inFile)
		{
			inFile.read(m_buffer.data(), static_cast<std::streamsize>(m_BLOCK));
			std::streamsize readBytes = inFile.gcount();
			if (0 >= readBytes)
			{
				break;
			}

			if (!outFile.write(m_buffer.data(), readBytes))
			{
				error = MirrorError(ErrorKind::Io, "write failed for " + dest.string());
				LOG(Error, "Write error on %s.", dest.string().c_str());
				return false;
			}
		}

		if (inFile.bad())
		{
			error = MirrorError(ErrorKind::Io, "read failed for " + source.string());
			LOG(Error, "Read error on %s.", source.string().c_str());
			return false;
		}

		outFile.close();
		if (!outFile)
		{
			error = MirrorError(ErrorKind::Io, "flush failed for " + dest.string());
			LOG(Error, "Cannot flush %s.", dest.string().c_str());
			return false;
		}
	}

	if (!m_metadataCopier.copyMetadata(source, dest, error))
	{
		return false;
	}

	LOG(Debug, "Exit.");
	return true;
}
