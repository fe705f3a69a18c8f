#include "checksum.hpp"
#include "errors.hpp"
#include "test_support.hpp"

#include <fmt/core.h>

namespace
{
    // Published test vectors for the message "abc"
    const std::string ABC_SHA256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
    const std::string ABC_SHA1 = "a9993e364706816aba3e25717850c26c9cd0d89d";
    const std::string ABC_MD5 = "900150983cd24fb0d6963f7d28e17f72";
    const std::string ABC_SHA3_256 = "3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532";
    const std::string ABC_SHA512 =
        "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
        "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f";
}

int main()
{
    TestRun run("checksum");

    try
    {
        TempDir dir("checksum");
        auto file = dir.path() / "abc.txt";
        writeFile(file, "abc");

        run.section("Whole-file hashing");
        std::string hash = ChecksumVerifier::computeFile(file);
        fmt::print("Computed SHA-256: {}\n", hash);
        run.expect(hash == ABC_SHA256, "SHA-256 of 'abc'");
        run.expect(ChecksumVerifier::computeFile(file, DigestAlgorithm::SHA1) == ABC_SHA1, "SHA-1 of 'abc'");
        run.expect(ChecksumVerifier::computeFile(file, DigestAlgorithm::MD5) == ABC_MD5, "MD5 of 'abc'");
        run.expect(ChecksumVerifier::computeFile(file, DigestAlgorithm::SHA3_256) == ABC_SHA3_256,
                   "SHA3-256 of 'abc'");
        run.expect(ChecksumVerifier::computeFile(file, DigestAlgorithm::SHA512) == ABC_SHA512, "SHA-512 of 'abc'");
        run.expectThrows<std::runtime_error>([&]
                                             { ChecksumVerifier::computeFile(dir.path() / "missing"); },
                                             "Hashing a missing file throws");

        run.section("verify()");
        run.expect(ChecksumVerifier::verify(file, "sha256:" + ABC_SHA256), "Verification with correct hash");
        run.expect(!ChecksumVerifier::verify(file, "sha256:" + std::string(64, '0')),
                   "Verification with wrong hash is rejected");
        run.expect(ChecksumVerifier::verify(file, "md5:" + ABC_MD5), "MD5 verification");

        run.section("parseChecksum()");
        ExpectedDigest parsed = ChecksumVerifier::parseChecksum("SHA256:" + std::string("BA7816BF 8f01cfea-414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
        run.expect(parsed.algorithm == DigestAlgorithm::SHA256, "Algorithm name is case-insensitive");
        run.expect(parsed.value.size() == 32, "SHA-256 digest has 32 bytes");
        run.expect(parsed.toString() == "sha256:" + ABC_SHA256, "Separators and case are normalized");
        run.expect(ChecksumVerifier::parseChecksum("sha3-256:" + ABC_SHA3_256).algorithm == DigestAlgorithm::SHA3_256,
                   "sha3-256 is recognized");

        run.expectThrows<ConfigError>([]
                                      { ChecksumVerifier::parseChecksum(ABC_SHA256); },
                                      "Missing algorithm prefix is rejected");
        run.expectThrows<ConfigError>([]
                                      { ChecksumVerifier::parseChecksum("crc32:abcd"); },
                                      "Unknown algorithm is rejected");
        run.expectThrows<ConfigError>([]
                                      { ChecksumVerifier::parseChecksum("sha256:abcd"); },
                                      "Wrong digest length is rejected");
        run.expectThrows<ConfigError>([]
                                      { ChecksumVerifier::parseChecksum("md5:" + std::string(31, 'a') + "g"); },
                                      "Non-hex character is rejected");

        run.section("Streaming verification");
        StreamVerifier verifier(ChecksumVerifier::parseChecksum("sha256:" + ABC_SHA256));
        run.expect(verifier.active(), "Verifier with expected digest is active");
        verifier.update("a", 1);
        verifier.update("bc", 2);
        run.expect(verifier.finish(), "Digest fed in chunks matches");
        run.expect(verifier.actualHex() == ABC_SHA256, "Computed digest is exposed");

        verifier.reset();
        verifier.update("abd", 3);
        run.expect(!verifier.finish(), "Different bytes do not match");

        verifier.reset();
        verifier.update("abc", 3);
        run.expect(verifier.finish(), "Reset discards earlier bytes");

        StreamVerifier passThrough(std::nullopt);
        passThrough.update("anything", 8);
        run.expect(!passThrough.active() && passThrough.finish(), "Verifier without digest always passes");
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }

    return run.finish();
}
