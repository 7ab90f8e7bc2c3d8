#include "geostream/streaming/AssetSource.h"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <system_error>

MemoryAssetSource::MemoryAssetSource(std::shared_ptr<const AssetBytes> bytes,
                                     std::optional<uint64_t> declaredSize,
                                     std::string name)
    : bytes_(std::move(bytes)), declaredSize_(declaredSize), name_(std::move(name)) {}

std::unique_ptr<MemoryAssetSource> MemoryAssetSource::fromText(const std::string& text,
                                                               std::optional<uint64_t> declaredSize) {
    auto bytes = std::make_shared<const AssetBytes>(text.begin(), text.end());
    return std::make_unique<MemoryAssetSource>(std::move(bytes), declaredSize);
}

std::optional<uint64_t> MemoryAssetSource::probeSize() {
    if (sizeUnknown_) {
        return std::nullopt;
    }
    if (declaredSize_) {
        return declaredSize_;
    }
    return bytes_ ? std::optional<uint64_t>(bytes_->size()) : std::nullopt;
}

std::shared_ptr<const AssetBytes> MemoryAssetSource::fetch(const std::function<void(float)>& onProgress) {
    if (!bytes_) {
        throw std::runtime_error("memory source '" + name_ + "' holds no data");
    }
    if (onProgress) {
        onProgress(1.0f);
    }
    return bytes_;
}

std::string MemoryAssetSource::describe() const {
    return name_;
}

FileAssetSource::FileAssetSource(std::filesystem::path path) : path_(std::move(path)) {}

std::optional<uint64_t> FileAssetSource::probeSize() {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path_, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(size);
}

std::shared_ptr<const AssetBytes> FileAssetSource::fetch(const std::function<void(float)>& onProgress) {
    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("unable to open '" + path_.string() + "'");
    }

    const std::optional<uint64_t> expected = probeSize();
    AssetBytes bytes;
    if (expected) {
        bytes.reserve(static_cast<std::size_t>(*expected));
    }

    std::vector<char> block(kReadBlockBytes);
    while (file) {
        file.read(block.data(), static_cast<std::streamsize>(block.size()));
        const std::streamsize got = file.gcount();
        if (got <= 0) {
            break;
        }
        bytes.insert(bytes.end(), block.begin(), block.begin() + got);
        if (onProgress && expected && *expected > 0) {
            onProgress(std::min(1.0f, static_cast<float>(bytes.size()) / static_cast<float>(*expected)));
        }
    }

    if (file.bad()) {
        throw std::runtime_error("read error on '" + path_.string() + "'");
    }
    if (onProgress) {
        onProgress(1.0f);
    }
    return std::make_shared<const AssetBytes>(std::move(bytes));
}

std::string FileAssetSource::describe() const {
    return path_.string();
}
