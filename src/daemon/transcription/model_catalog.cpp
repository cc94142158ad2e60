#include "model_catalog.hpp"

#include <algorithm>
#include <format>

namespace fs = std::filesystem;

ModelCatalog::ModelCatalog(fs::path dir) : dir_(std::move(dir)) {}

std::vector<ModelInfo> ModelCatalog::installed() const {
    std::vector<ModelInfo> models;
    std::error_code ec;
    for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        auto& p = it->path();
        auto stem = p.stem().string();
        if (p.extension() == ".bin" && stem.starts_with("ggml-")) {
            models.push_back({stem, p});
        }
    }
    std::ranges::sort(models, {}, &ModelInfo::name);
    return models;
}

std::optional<ModelInfo> ModelCatalog::resolve(const std::string& selected) const {
    auto models = installed();
    if (models.empty()) return std::nullopt;

    if (!selected.empty()) {
        auto it = std::ranges::find_if(models, [&](const ModelInfo& m) {
            return m.name == selected || m.path.filename() == selected;
        });
        if (it != models.end()) return *it;
    }
    return models.front();
}

std::optional<std::string> ModelCatalog::validate(const std::string& selected) const {
    auto models = installed();
    if (models.empty()) {
        return std::format("No speech model installed. Put a ggml-*.bin model in {}.",
                           dir_.string());
    }
    if (selected.empty()) {
        return "Choose a speech model (local.model in the config).";
    }
    bool found = std::ranges::any_of(models, [&](const ModelInfo& m) {
        return m.name == selected || m.path.filename() == selected;
    });
    if (!found) {
        return std::format("Speech model '{}' is not installed in {}.", selected, dir_.string());
    }
    return std::nullopt;
}
