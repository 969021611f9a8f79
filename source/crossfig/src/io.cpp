#include "crossfig/io.hpp"
#include "crossfig/hash.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <system_error>

#if defined(_WIN32)
#include <process.h>
#define CROSSFIG_GETPID _getpid
#else
#include <unistd.h>
#define CROSSFIG_GETPID getpid
#endif

namespace crossfig
{
    Result<std::string> read_text_file(const std::string& path)
    {
        std::ifstream f(path, std::ios::binary);
        if (!f)
            return Result<std::string>::err({ErrorCode::eIO, "Failed to open file: " + path});

        f.seekg(0, std::ios::end);
        const auto size = static_cast<size_t>(f.tellg());
        f.seekg(0, std::ios::beg);

        std::string text;
        text.resize(size);
        f.read(text.data(), static_cast<std::streamsize>(size));
        if (!f)
            return Result<std::string>::err({ErrorCode::eIO, "Failed to read file: " + path});

        return Result<std::string>::ok(std::move(text));
    }

    Result<void> write_text_file(const std::string& path, std::string_view text)
    {
        std::error_code ec;

        auto parentPath = std::filesystem::path(path).parent_path();
        if (!parentPath.empty())
        {
            std::filesystem::create_directories(parentPath, ec);
            if (ec)
                return Result<void>::err(
                    {ErrorCode::eIO, "Failed to create directory: " + parentPath.generic_string() + ": " + ec.message()});
        }

        const std::string tmpPath = path + ".tmp." + std::to_string(static_cast<uint64_t>(CROSSFIG_GETPID()));

        {
            std::ofstream f(tmpPath, std::ios::binary);
            if (!f)
                return Result<void>::err({ErrorCode::eIO, "Failed to open file for writing: " + tmpPath});

            f.write(text.data(), static_cast<std::streamsize>(text.size()));
            if (!f)
                return Result<void>::err({ErrorCode::eIO, "Failed to write file: " + tmpPath});
        }

        std::filesystem::rename(tmpPath, path, ec);
        if (ec)
        {
            // Try replace existing (Windows compatibility)
            std::filesystem::remove(path, ec);
            ec.clear();
            std::filesystem::rename(tmpPath, path, ec);
            if (ec)
            {
                std::filesystem::remove(tmpPath, ec);
                return Result<void>::err({ErrorCode::eIO, "Failed to rename temp file to: " + path});
            }
        }

        return Result<void>::ok();
    }

    Result<bool> write_text_file_if_changed(const std::string& path, std::string_view text)
    {
        std::error_code ec;
        if (std::filesystem::is_regular_file(path, ec))
        {
            auto existing = read_text_file(path);
            if (existing.isOk() && existing.value().size() == text.size() &&
                xxhash64(existing.value()) == xxhash64(text))
                return Result<bool>::ok(false);
        }

        auto w = write_text_file(path, text);
        if (!w.isOk())
            return Result<bool>::err(w.error());
        return Result<bool>::ok(true);
    }
} // namespace crossfig
