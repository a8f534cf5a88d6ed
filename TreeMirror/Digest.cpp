#include "Digest.hpp"
#include "Logger.hpp"

#include <openssl/evp.h>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

#include <blake3.h>

namespace
{
	std::string toHex(const unsigned char* data, std::size_t size)
	{
		std::ostringstream ss;
		ss << std::hex << std::setfill('0');

		for (std::size_t i = 0; i < size; ++i)
		{
			ss << std::setw(2) << static_cast<int>(data[i]);
		}

		return ss.str();
	}

	class Sha256Hasher : public IHasher
	{
	public:
		Sha256Hasher() : m_ctx(EVP_MD_CTX_new())
		{
			if (!m_ctx)
			{
				LOG(Error, "Failed to create EVP context");
				return;
			}

			if (1 != EVP_DigestInit_ex(m_ctx.get(), EVP_sha256(), nullptr))
			{
				LOG(Error, "Failed to init EVP.");
				m_ctx.reset();
			}
		}

		bool update(const char* data, std::size_t size) override
		{
			if (!m_ctx)
			{
				return false;
			}

			if (1 != EVP_DigestUpdate(m_ctx.get(), data, size))
			{
				LOG(Error, "Update failed.");
				return false;
			}
			return true;
		}

		std::string finalHex() override
		{
			if (!m_ctx)
			{
				return std::string();
			}

			std::vector<unsigned char> hash(EVP_MAX_MD_SIZE);
			unsigned int hashLen = 0;

			if (1 != EVP_DigestFinal_ex(m_ctx.get(), hash.data(), &hashLen))
			{
				LOG(Error, "Final failed.");
				return std::string();
			}

			return toHex(hash.data(), hashLen);
		}

	private:
		struct CtxDeleter
		{
			void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
		};

		std::unique_ptr<EVP_MD_CTX, CtxDeleter> m_ctx;
	};

	class Blake3Hasher : public IHasher
	{
	public:
		Blake3Hasher()
		{
			blake3_hasher_init(&m_hasher);
		}

		bool update(const char* data, std::size_t size) override
		{
			blake3_hasher_update(&m_hasher, data, size);
			return true;
		}

		std::string finalHex() override
		{
			uint8_t out[BLAKE3_OUT_LEN];
			blake3_hasher_finalize(&m_hasher, out, BLAKE3_OUT_LEN);
			return toHex(out, BLAKE3_OUT_LEN);
		}

	private:
		blake3_hasher m_hasher;
	};
} // anonymous namespace

std::optional<HashAlgorithm> parseHashAlgorithm(const std::string& name)
{
	if ("sha256" == name)
	{
		return HashAlgorithm::Sha256;
	}
	if ("blake3" == name)
	{
		return HashAlgorithm::Blake3;
	}
	return std::nullopt;
}

const char* toString(HashAlgorithm algorithm)
{
	switch (algorithm)
	{
	case HashAlgorithm::Sha256: return "sha256";
	case HashAlgorithm::Blake3: return "blake3";
	default: return "unknown";
	}
}

DigestProvider::DigestProvider(HashAlgorithm algorithm) :
	m_algorithm(algorithm) {}

std::unique_ptr<IHasher> DigestProvider::createHasher(HashAlgorithm algorithm)
{
	switch (algorithm)
	{
	case HashAlgorithm::Sha256:
		return std::make_unique<Sha256Hasher>();
	case HashAlgorithm::Blake3:
		return std::make_unique<Blake3Hasher>();
	default:
		return nullptr;
	}
}

/**
* Name: DigestProvider::digestFile
* Description: Hash file content chunk by chunk and return the lowercase hex digest
* @Param path - path to file
* @Param error - set on failure, empty string is returned then
*/
std::string DigestProvider::digestFile(const fs::path& path, MirrorError& error) const
{
	auto hasher = createHasher(m_algorithm);
	if (!hasher)
	{
		error = MirrorError(ErrorKind::UnsupportedAlgorithm,
			std::string("no implementation for ") + toString(m_algorithm));
		LOG(Error, "Unsupported algorithm %s.", toString(m_algorithm));
		return std::string();
	}

	std::ifstream file(path, std::ios::binary);
	if (!file)
	{
		error = MirrorError(ErrorKind::Io, "cannot open " + path.string());
		LOG(Error, "Failed to open file: %s.", path.string().c_str());
		return std::string();
	}

	std::vector<char> buffer(CHUNK_SIZE);

	while (file)
	{
		file.read(buffer.data(), CHUNK_SIZE);
		std::streamsize readBytes = file.gcount();

		if (0 < readBytes && !hasher->update(buffer.data(), static_cast<std::size_t>(readBytes)))
		{
			error = MirrorError(ErrorKind::Io, "hash update failed for " + path.string());
			return std::string();
		}
	}

	if (file.bad())
	{
		error = MirrorError(ErrorKind::Io, "read failed for " + path.string());
		LOG(Error, "Read failed: %s.", path.string().c_str());
		return std::string();
	}

	std::string hex = hasher->finalHex();
	if (hex.empty())
	{
		error = MirrorError(ErrorKind::Io, "hash finalization failed for " + path.string());
	}
	return hex;
}

std::string DigestProvider::digestBytes(const char* data, std::size_t size, MirrorError& error) const
{
	auto hasher = createHasher(m_algorithm);
	if (!hasher)
	{
		error = MirrorError(ErrorKind::UnsupportedAlgorithm,
			std::string("no implementation for ") + toString(m_algorithm));
		return std::string();
	}

	if (!hasher->update(data, size))
	{
		error = MirrorError(ErrorKind::Io, "hash update failed");
		return std::string();
	}

	return hasher->finalHex();
}
