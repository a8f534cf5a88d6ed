#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "Errors.hpp"

namespace fs = std::filesystem;

enum class HashAlgorithm { Sha256 = 0, Blake3 };

std::optional<HashAlgorithm> parseHashAlgorithm(const std::string& name);
const char* toString(HashAlgorithm algorithm);

/**
* Incremental hash accumulator for one digest computation.
*/
class IHasher
{
public:
	virtual ~IHasher() = default;
	virtual bool update(const char* data, std::size_t size) = 0;
	virtual std::string finalHex() = 0;
};

class DigestProvider
{
public:
	static constexpr std::size_t CHUNK_SIZE = 4096;

	explicit DigestProvider(HashAlgorithm algorithm);

	// Null for a value outside the enumerated algorithms.
	static std::unique_ptr<IHasher> createHasher(HashAlgorithm algorithm);

	std::string digestFile(const fs::path& path, MirrorError& error) const;
	std::string digestBytes(const char* data, std::size_t size, MirrorError& error) const;

private:
	HashAlgorithm m_algorithm;
};
