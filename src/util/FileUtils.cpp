#include "FileUtils.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace pa::file {

Result<std::string> readText(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<std::string>::err(ErrorCode::Io,
                                        "Failed to open " + path.string());
    }

    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return Result<std::string>::err(ErrorCode::Io,
                                        "Failed to read " + path.string());
    }
    return Result<std::string>::ok(ss.str());
}

Result<void> writeText(const fs::path& path, std::string_view content) {
    fs::path tempPath = path;
    tempPath += ".tmp";
    {
        std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Result<void>::err(ErrorCode::Io,
                                     "Failed to open " + tempPath.string());
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!out) {
            return Result<void>::err(ErrorCode::Io,
                                     "Failed to write " + tempPath.string());
        }
    }

    std::error_code ec;
    fs::rename(tempPath, path, ec);
    if (ec) {
        fs::remove(tempPath, ec);
        return Result<void>::err(ErrorCode::Io,
                                 "Failed to move " + tempPath.string() +
                                         " to " + path.string());
    }
    return Result<void>::ok();
}

bool ensureDir(const fs::path& dir) {
    if (dir.empty())
        return true;
    std::error_code ec;
    if (fs::exists(dir, ec))
        return fs::is_directory(dir, ec);
    return fs::create_directories(dir, ec);
}

std::string extensionOf(const fs::path& path) {
    auto ext = path.extension().string();
    if (!ext.empty() && ext.front() == '.')
        ext.erase(0, 1);
    return toLower(ext);
}

std::string toLower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(), [](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });
    return result;
}

} // namespace pa::file
