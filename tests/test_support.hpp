#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <utility>
#include <unistd.h>

#include <fmt/core.h>

/**
 * Counts failed expectations of one test program.
 */
class TestRun
{
public:
    explicit TestRun(std::string name) : name_(std::move(name)) {}

    void expect(bool condition, const std::string &what)
    {
        if (condition)
        {
            fmt::print("  PASS  {}\n", what);
        }
        else
        {
            ++failures_;
            fmt::print(stderr, "  FAIL  {}\n", what);
        }
    }

    template <typename Exception, typename Fn>
    void expectThrows(Fn &&fn, const std::string &what)
    {
        bool thrown = false;
        try
        {
            fn();
        }
        catch (const Exception &)
        {
            thrown = true;
        }
        expect(thrown, what);
    }

    void section(const std::string &title) { fmt::print("\n{}\n", title); }

    int finish() const
    {
        if (failures_ == 0)
        {
            fmt::print("\n✅ {}: all tests passed!\n", name_);
            return 0;
        }
        fmt::print(stderr, "\n❌ {}: {} expectation(s) failed\n", name_, failures_);
        return 1;
    }

private:
    std::string name_;
    int failures_ = 0;
};

/**
 * Scratch directory under the system temp dir, removed on destruction.
 */
class TempDir
{
public:
    explicit TempDir(const std::string &tag)
    {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                fmt::format("mirrorfetch-{}-{}-{}", tag, ::getpid(), counter++);
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::filesystem::path &path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline std::string readFile(const std::filesystem::path &path)
{
    std::ifstream file(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

inline void writeFile(const std::filesystem::path &path, const std::string &content)
{
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file << content;
}
