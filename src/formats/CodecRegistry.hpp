/**
 * @file CodecRegistry.hpp
 * @brief Extension -> codec lookup used by Alignment::load and save.
 *
 * The registry owns one codec per file extension. Extensions are matched
 * case-insensitively and without the leading dot. The JSON, MLF and TextGrid
 * codecs are registered on first use; further formats are added with add().
 *
 * @section Patterns
 * - Singleton: Global access point for the codec table.
 * - Registry: New formats plug in without touching Alignment.
 */

#pragma once
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "AlignmentCodec.hpp"

namespace pa::formats {

class CodecRegistry {
public:
    static CodecRegistry& instance();

    // Replaces any codec already registered for the extension
    void add(std::string_view extension, std::shared_ptr<AlignmentCodec> codec);

    const AlignmentCodec* find(std::string_view extension) const;
    // Codec for the path's extension, nullptr when none is registered
    const AlignmentCodec* forPath(const std::filesystem::path& path) const;

    std::vector<std::string> extensions() const;

private:
    CodecRegistry();

    std::map<std::string, std::shared_ptr<AlignmentCodec>> codecs_;
    mutable std::mutex mutex_;
};

} // namespace pa::formats
