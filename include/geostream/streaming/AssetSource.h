#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using AssetBytes = std::vector<uint8_t>;

// Where a load's bytes come from. probeSize() is the cheap content-length
// style query used for strategy selection; fetch() delivers the payload.
class AssetSource {
public:
    virtual ~AssetSource() = default;

    virtual std::optional<uint64_t> probeSize() = 0;
    virtual std::shared_ptr<const AssetBytes> fetch(const std::function<void(float)>& onProgress) = 0;
    virtual std::string describe() const = 0;
};

class MemoryAssetSource : public AssetSource {
public:
    // declaredSize overrides the buffer length in probeSize(), like a
    // content-length header that differs from the bytes at hand.
    explicit MemoryAssetSource(std::shared_ptr<const AssetBytes> bytes,
                               std::optional<uint64_t> declaredSize = std::nullopt,
                               std::string name = "memory");

    static std::unique_ptr<MemoryAssetSource> fromText(const std::string& text,
                                                       std::optional<uint64_t> declaredSize = std::nullopt);

    void setSizeUnknown(bool unknown) {
        sizeUnknown_ = unknown;
    }

    std::optional<uint64_t> probeSize() override;
    std::shared_ptr<const AssetBytes> fetch(const std::function<void(float)>& onProgress) override;
    std::string describe() const override;

private:
    std::shared_ptr<const AssetBytes> bytes_;
    std::optional<uint64_t> declaredSize_;
    std::string name_;
    bool sizeUnknown_ = false;
};

class FileAssetSource : public AssetSource {
public:
    static constexpr std::size_t kReadBlockBytes = 1024 * 1024;

    explicit FileAssetSource(std::filesystem::path path);

    std::optional<uint64_t> probeSize() override;
    std::shared_ptr<const AssetBytes> fetch(const std::function<void(float)>& onProgress) override;
    std::string describe() const override;

private:
    std::filesystem::path path_;
};
