#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct ModelInfo {
    std::string name;   // file stem, e.g. "ggml-base.en"
    std::filesystem::path path;
};

// Installed whisper.cpp models (ggml-*.bin) in one directory.
class ModelCatalog {
public:
    explicit ModelCatalog(std::filesystem::path dir);

    // Sorted by name.
    std::vector<ModelInfo> installed() const;

    // The selected model if installed, otherwise the first installed model.
    std::optional<ModelInfo> resolve(const std::string& selected) const;

    std::optional<std::string> validate(const std::string& selected) const;

    const std::filesystem::path& dir() const { return dir_; }

private:
    std::filesystem::path dir_;
};
