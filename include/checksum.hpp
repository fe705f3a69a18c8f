#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// OpenSSL's EVP_MD_CTX, kept out of this header
struct evp_md_ctx_st;

/**
 * Supported hash algorithms.
 */
enum class DigestAlgorithm
{
    SHA256,
    SHA512,
    SHA1,
    MD5,
    SHA3_256
};

/**
 * A digest a Download is expected to match: algorithm plus raw digest bytes.
 */
struct ExpectedDigest
{
    DigestAlgorithm algorithm = DigestAlgorithm::SHA256;
    std::vector<unsigned char> value;

    /**
     * Format as "algorithm:hexhash", the same form parseChecksum() accepts.
     */
    std::string toString() const;
};

/**
 * Incremental hash computation over OpenSSL's EVP interface.
 * Feed bytes with update() as they arrive, then call finish() once.
 */
class DigestStream
{
public:
    explicit DigestStream(DigestAlgorithm algorithm);
    ~DigestStream();

    DigestStream(const DigestStream &) = delete;
    DigestStream &operator=(const DigestStream &) = delete;

    /**
     * @throws std::runtime_error if OpenSSL rejects the update
     */
    void update(const void *data, std::size_t length);

    /**
     * Finalize and return the raw digest. The stream must be reset()
     * before it can be used again.
     *
     * @throws std::runtime_error if OpenSSL fails to finalize
     */
    std::vector<unsigned char> finish();

    /**
     * Discard all consumed bytes and start over.
     */
    void reset();

    DigestAlgorithm algorithm() const { return algorithm_; }

private:
    struct ContextDeleter
    {
        void operator()(evp_md_ctx_st *ctx) const;
    };

    DigestAlgorithm algorithm_;
    std::unique_ptr<evp_md_ctx_st, ContextDeleter> context_;
};

/**
 * Verifies a streamed transfer against an optional expected digest.
 * Without an expected digest every call is a pass-through and finish() succeeds.
 */
class StreamVerifier
{
public:
    explicit StreamVerifier(std::optional<ExpectedDigest> expected);

    bool active() const { return expected_.has_value(); }

    void update(const void *data, std::size_t length);

    /**
     * @return true if no digest was requested or the computed digest matches exactly
     */
    bool finish();

    /**
     * Hex form of the digest computed by the last finish(), empty if inactive.
     */
    const std::string &actualHex() const { return actualHex_; }

    void reset();

private:
    std::optional<ExpectedDigest> expected_;
    std::unique_ptr<DigestStream> stream_;
    std::string actualHex_;
};

/**
 * File integrity helpers: checksum strings and whole-file hashing.
 */
class ChecksumVerifier
{
public:
    /**
     * Compute the hash of a file.
     * Reads file in chunks to avoid loading entire file into memory.
     *
     * @param filePath Path to file to hash
     * @param algorithm Hash algorithm to use
     * @return Hex-encoded hash string
     * @throws std::runtime_error if file cannot be read
     */
    static std::string computeFile(const std::filesystem::path &filePath,
                                   DigestAlgorithm algorithm = DigestAlgorithm::SHA256);

    /**
     * Verify a file matches an expected checksum.
     *
     * @param filePath Path to file to verify
     * @param expectedChecksum Expected hash in format "algorithm:hexhash"
     *                         Example: "sha256:abc123..."
     * @return true if checksums match, false otherwise
     * @throws ConfigError if format is invalid or algorithm unsupported
     */
    static bool verify(const std::filesystem::path &filePath,
                       const std::string &expectedChecksum);

    /**
     * Parse checksum string into algorithm and digest bytes.
     * Format: "algorithm:hexhash", algorithm one of sha256, sha512, sha1, md5, sha3-256
     *
     * @param checksumStr Input string (e.g., "sha256:abc123...")
     * @throws ConfigError if format is invalid
     */
    static ExpectedDigest parseChecksum(const std::string &checksumStr);

    static const char *algorithmName(DigestAlgorithm algorithm);

    /**
     * Number of hex characters a digest of this algorithm has.
     */
    static std::size_t hexLength(DigestAlgorithm algorithm);

    /**
     * Convert binary data to hex string.
     * Example: {0x01, 0xFF} → "01ff"
     */
    static std::string toHex(const std::vector<unsigned char> &data);

private:
    /**
     * Convert hex string to lowercase and remove whitespace.
     * Makes comparison case-insensitive.
     */
    static std::string normalizeHex(const std::string &hex);

    static std::vector<unsigned char> fromHex(const std::string &hex);

    // Chunk size for file reading (1 MB)
    static constexpr std::size_t CHUNK_SIZE = 1024 * 1024;
};
