#include "CodecRegistry.hpp"
#include "JsonCodec.hpp"
#include "MlfCodec.hpp"
#include "TextGridCodec.hpp"
#include "core/Logger.hpp"
#include "util/FileUtils.hpp"

namespace pa::formats {

CodecRegistry& CodecRegistry::instance() {
    static CodecRegistry instance;
    return instance;
}

CodecRegistry::CodecRegistry() {
    codecs_["json"] = std::make_shared<JsonCodec>();
    codecs_["mlf"] = std::make_shared<MlfCodec>();
    codecs_["textgrid"] = std::make_shared<TextGridCodec>();
}

void CodecRegistry::add(std::string_view extension,
                        std::shared_ptr<AlignmentCodec> codec) {
    auto key = file::toLower(extension);
    if (!key.empty() && key.front() == '.')
        key.erase(0, 1);

    std::lock_guard lock(mutex_);
    LOG_DEBUG("CodecRegistry: Registering '{}' for .{}", codec->name(), key);
    codecs_[key] = std::move(codec);
}

const AlignmentCodec* CodecRegistry::find(std::string_view extension) const {
    auto key = file::toLower(extension);
    if (!key.empty() && key.front() == '.')
        key.erase(0, 1);

    std::lock_guard lock(mutex_);
    auto it = codecs_.find(key);
    return it != codecs_.end() ? it->second.get() : nullptr;
}

const AlignmentCodec* CodecRegistry::forPath(
        const std::filesystem::path& path) const {
    return find(file::extensionOf(path));
}

std::vector<std::string> CodecRegistry::extensions() const {
    std::lock_guard lock(mutex_);
    std::vector<std::string> result;
    result.reserve(codecs_.size());
    for (const auto& [ext, codec] : codecs_)
        result.push_back(ext);
    return result;
}

} // namespace pa::formats
