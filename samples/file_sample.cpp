#include "faultless/faultless.hpp"

#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <optional>
#include <print>
#include <string>

namespace
{
    struct FileCloser
    {
        inline void operator()(std::FILE* file) { std::fclose(file); }
    };
    using File = std::unique_ptr<std::FILE, FileCloser>;

    class FileNotFoundError : public faultless::StructuredError<FileNotFoundError>
    {
      public:
        explicit FileNotFoundError(std::filesystem::path path)
          : m_path(std::move(path))
        {
        }

        auto message() const -> std::string override
        {
            return std::format("I'm looking for {}, where's the file?", m_path.string());
        }

        inline auto path() const -> const std::filesystem::path& { return m_path; }

      private:
        std::filesystem::path m_path;
    };

    auto openFile(const std::filesystem::path& path) -> faultless::Result<File>
    {
        if (!std::filesystem::exists(path)) {
            return faultless::error(FileNotFoundError(path));
        }

        File file{ std::fopen(path.c_str(), "r") };
        if (!file) {
            return faultless::error(std::format("Something went wrong while trying to open file {}.", path.string()));
        }
        return faultless::ok(std::move(file));
    }

    auto readFile(File& file, size_t size) -> faultless::Result<std::string>
    {
        std::string content(size, '\0');
        auto read{ std::fread(content.data(), 1, size, file.get()) };
        if (read < size && std::ferror(file.get())) {
            return faultless::error("Couldn't read from stream.");
        }
        content.resize(read);
        return faultless::ok(std::move(content));
    }

    auto closeFile(File& file) -> faultless::Result<void>
    {
        if (!file) {
            return faultless::error("File is not open.");
        }
        if (std::fclose(file.release()) != 0) {
            return faultless::error(std::error_code(errno, std::generic_category()));
        }
        return faultless::success();
    }

    // Guard-statement style: every step returns early on error.
    auto readGreeting(const std::filesystem::path& path) -> faultless::Result<std::string>
    {
        FAULTLESS_TRY_ASSIGN(auto file, openFile(path));
        FAULTLESS_TRY_ASSIGN(auto contents, readFile(file, 5));
        FAULTLESS_TRY(closeFile(file));
        return contents;
    }
}

int main()
{
    auto path{ std::filesystem::temp_directory_path() / "faultless-file-sample.txt" };
    std::ofstream(path) << "hello world";

    // Unwrap with an error slot
    {
        std::optional<faultless::Error> err;

        auto file{ faultless::unwrap(openFile(path), err) };
        if (err) {
            faultless::log::error("open failed: {:v}", *err);
            return 1;
        }

        auto contents{ faultless::unwrap(readFile(file, 5), err) };
        if (err) {
            faultless::log::error("read failed: {:v}", *err);
            return 1;
        }

        faultless::unwrap(closeFile(file), err);
        if (err) {
            faultless::log::error("close failed: {:v}", *err);
            return 1;
        }

        std::println("unwrap: {}", contents);
    }

    // Producer driven by runSequence
    {
        auto contents{ faultless::runSequence([&]() -> faultless::Sequence<std::string> {
            auto file = co_yield openFile(path);
            auto contents = co_yield readFile(file, 5);
            co_yield closeFile(file);
            co_return contents;
        }) };
        std::println("runSequence: {}", contents);
    }

    // Guard macros
    std::println("guards: {}", readGreeting(path));

    // Structured error with extra fields
    {
        auto missing{ faultless::runSequence([]() -> faultless::Sequence<std::string> {
            auto file = co_yield openFile("does-not-exist.txt");
            auto contents = co_yield readFile(file, 5);
            co_return contents;
        }) };

        if (!missing) {
            if (const auto* notFound{ missing.error().as<FileNotFoundError>() }) {
                std::println("missing {}: {}", notFound->path().string(), missing.error());
            }
        }
    }

    std::filesystem::remove(path);
    return 0;
}
