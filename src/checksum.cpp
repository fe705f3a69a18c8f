#include "checksum.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <fmt/core.h>

// OpenSSL EVP = "Envelope" API (high-level cryptography interface)
#include <openssl/evp.h>

namespace
{
    const EVP_MD *evpAlgorithm(DigestAlgorithm algorithm)
    {
        switch (algorithm)
        {
        case DigestAlgorithm::SHA256:
            return EVP_sha256();
        case DigestAlgorithm::SHA512:
            return EVP_sha512();
        case DigestAlgorithm::SHA1:
            return EVP_sha1();
        case DigestAlgorithm::MD5:
            return EVP_md5();
        case DigestAlgorithm::SHA3_256:
            return EVP_sha3_256();
        }
        return nullptr;
    }
}

std::string ExpectedDigest::toString() const
{
    return fmt::format("{}:{}", ChecksumVerifier::algorithmName(algorithm),
                       ChecksumVerifier::toHex(value));
}

// ----------------------------------------------------------------------
// DigestStream
// ----------------------------------------------------------------------

void DigestStream::ContextDeleter::operator()(evp_md_ctx_st *ctx) const
{
    if (ctx)
        EVP_MD_CTX_free(ctx);
}

DigestStream::DigestStream(DigestAlgorithm algorithm)
    : algorithm_(algorithm), context_(EVP_MD_CTX_new())
{
    if (!context_)
    {
        throw std::runtime_error("Failed to create OpenSSL context");
    }
    reset();
}

DigestStream::~DigestStream() = default;

void DigestStream::reset()
{
    if (EVP_DigestInit_ex(context_.get(), evpAlgorithm(algorithm_), nullptr) != 1)
    {
        throw std::runtime_error(fmt::format("Failed to initialize {} digest",
                                             ChecksumVerifier::algorithmName(algorithm_)));
    }
}

void DigestStream::update(const void *data, std::size_t length)
{
    if (EVP_DigestUpdate(context_.get(), data, length) != 1)
    {
        throw std::runtime_error(fmt::format("Failed to update {} digest",
                                             ChecksumVerifier::algorithmName(algorithm_)));
    }
}

std::vector<unsigned char> DigestStream::finish()
{
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLength = 0;

    if (EVP_DigestFinal_ex(context_.get(), hash, &hashLength) != 1)
    {
        throw std::runtime_error(fmt::format("Failed to finalize {} digest",
                                             ChecksumVerifier::algorithmName(algorithm_)));
    }
    return std::vector<unsigned char>(hash, hash + hashLength);
}

// ----------------------------------------------------------------------
// StreamVerifier
// ----------------------------------------------------------------------

StreamVerifier::StreamVerifier(std::optional<ExpectedDigest> expected)
    : expected_(std::move(expected))
{
    if (expected_)
    {
        stream_ = std::make_unique<DigestStream>(expected_->algorithm);
    }
}

void StreamVerifier::update(const void *data, std::size_t length)
{
    if (stream_)
    {
        stream_->update(data, length);
    }
}

bool StreamVerifier::finish()
{
    if (!stream_)
    {
        return true;
    }

    std::vector<unsigned char> actual = stream_->finish();
    actualHex_ = ChecksumVerifier::toHex(actual);
    return actual == expected_->value;
}

void StreamVerifier::reset()
{
    actualHex_.clear();
    if (stream_)
    {
        stream_->reset();
    }
}

// ----------------------------------------------------------------------
// ChecksumVerifier
// ----------------------------------------------------------------------

std::string ChecksumVerifier::computeFile(const std::filesystem::path &filePath,
                                          DigestAlgorithm algorithm)
{
    std::ifstream file(filePath, std::ios::binary);
    if (!file)
    {
        throw std::runtime_error(
            fmt::format("Cannot open file for checksum: {}", filePath.string()));
    }

    DigestStream digest(algorithm);
    std::vector<char> buffer(CHUNK_SIZE);

    while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0)
    {
        digest.update(buffer.data(), static_cast<std::size_t>(file.gcount()));
    }

    if (file.bad())
    {
        throw std::runtime_error(
            fmt::format("Error while reading {} for checksum", filePath.string()));
    }

    return toHex(digest.finish());
}

bool ChecksumVerifier::verify(const std::filesystem::path &filePath,
                              const std::string &expectedChecksum)
{
    ExpectedDigest expected = parseChecksum(expectedChecksum);
    return computeFile(filePath, expected.algorithm) == toHex(expected.value);
}

ExpectedDigest ChecksumVerifier::parseChecksum(const std::string &checksumString)
{
    // Expected format: "algorithm:hexhash"
    // Example: "sha256:abc123..."
    std::size_t colonPos = checksumString.find(':');
    if (colonPos == std::string::npos)
    {
        throw ConfigError("Invalid checksum format. Expected 'algorithm:hexhash'");
    }

    std::string algorithmStr = checksumString.substr(0, colonPos);
    std::string hexHash = checksumString.substr(colonPos + 1);

    std::transform(algorithmStr.begin(), algorithmStr.end(), algorithmStr.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    ExpectedDigest result;
    if (algorithmStr == "sha256")
    {
        result.algorithm = DigestAlgorithm::SHA256;
    }
    else if (algorithmStr == "sha512")
    {
        result.algorithm = DigestAlgorithm::SHA512;
    }
    else if (algorithmStr == "sha1")
    {
        result.algorithm = DigestAlgorithm::SHA1;
    }
    else if (algorithmStr == "md5")
    {
        result.algorithm = DigestAlgorithm::MD5;
    }
    else if (algorithmStr == "sha3-256" || algorithmStr == "sha3_256")
    {
        result.algorithm = DigestAlgorithm::SHA3_256;
    }
    else
    {
        throw ConfigError(fmt::format("Unsupported algorithm: '{}'", algorithmStr));
    }

    std::string normalizedHex = normalizeHex(hexHash);

    std::size_t expectedLength = hexLength(result.algorithm);
    if (normalizedHex.length() != expectedLength)
    {
        throw ConfigError(
            fmt::format("Invalid {} hash length. Expected {} hex characters, got {}",
                        algorithmStr, expectedLength, normalizedHex.length()));
    }

    result.value = fromHex(normalizedHex);
    return result;
}

const char *ChecksumVerifier::algorithmName(DigestAlgorithm algorithm)
{
    switch (algorithm)
    {
    case DigestAlgorithm::SHA256:
        return "sha256";
    case DigestAlgorithm::SHA512:
        return "sha512";
    case DigestAlgorithm::SHA1:
        return "sha1";
    case DigestAlgorithm::MD5:
        return "md5";
    case DigestAlgorithm::SHA3_256:
        return "sha3-256";
    }
    return "unknown";
}

std::size_t ChecksumVerifier::hexLength(DigestAlgorithm algorithm)
{
    switch (algorithm)
    {
    case DigestAlgorithm::SHA256:
    case DigestAlgorithm::SHA3_256:
        return 64; // 256 bits / 4 bits per hex digit
    case DigestAlgorithm::SHA512:
        return 128;
    case DigestAlgorithm::SHA1:
        return 40;
    case DigestAlgorithm::MD5:
        return 32;
    }
    return 0;
}

std::string ChecksumVerifier::toHex(const std::vector<unsigned char> &data)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (unsigned char byte : data)
    {
        oss << std::setw(2) << static_cast<unsigned int>(byte);
    }

    return oss.str();
}

std::string ChecksumVerifier::normalizeHex(const std::string &hex)
{
    std::string result;
    result.reserve(hex.length());

    for (char ch : hex)
    {
        unsigned char uch = static_cast<unsigned char>(ch);

        // Skip whitespace and common separators
        if (std::isspace(uch) || ch == ':' || ch == '-')
        {
            continue;
        }

        if (std::isxdigit(uch))
        {
            result += static_cast<char>(std::tolower(uch));
        }
        else
        {
            throw ConfigError(fmt::format("Invalid character in checksum: '{}'", ch));
        }
    }

    return result;
}

std::vector<unsigned char> ChecksumVerifier::fromHex(const std::string &hex)
{
    auto nibble = [](char ch) -> unsigned char
    {
        return static_cast<unsigned char>(ch <= '9' ? ch - '0' : ch - 'a' + 10);
    };

    std::vector<unsigned char> bytes;
    bytes.reserve(hex.size() / 2);
    for (std::size_t i = 0; i + 1 < hex.size(); i += 2)
    {
        bytes.push_back(static_cast<unsigned char>((nibble(hex[i]) << 4) | nibble(hex[i + 1])));
    }
    return bytes;
}
