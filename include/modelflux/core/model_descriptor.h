#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace modelflux {

enum class ModelType { Llm, Embedding };

/**
 * Role of a file within a model manifest. Every manifest has exactly one Model file;
 * the rest are optional companions loaded alongside it.
 */
enum class FileRole { Model, Tokenizer, TokenizerConfig, Projector };

inline constexpr const char* fileRoleName(FileRole role) {
    switch (role) {
        case FileRole::Model:
            return "model";
        case FileRole::Tokenizer:
            return "tokenizer";
        case FileRole::TokenizerConfig:
            return "tokenizer_config";
        case FileRole::Projector:
            return "mmproj";
    }
    return "model";
}

inline std::optional<FileRole> parseFileRole(std::string_view s) {
    if (s == "model")
        return FileRole::Model;
    if (s == "tokenizer")
        return FileRole::Tokenizer;
    if (s == "tokenizer_config")
        return FileRole::TokenizerConfig;
    if (s == "mmproj")
        return FileRole::Projector;
    return std::nullopt;
}

inline constexpr const char* modelTypeName(ModelType type) {
    return type == ModelType::Embedding ? "embedding" : "llm";
}

struct ModelFile {
    FileRole role{FileRole::Model};
    std::string url;
    std::string fileName;
    std::optional<std::uint64_t> sizeBytes;
    std::optional<std::string> sha256; // lower-case hex
};

/**
 * Immutable catalog entry for a downloadable model.
 */
struct ModelDescriptor {
    std::string id;
    std::string name;
    std::string provider;
    ModelType type{ModelType::Llm};
    std::vector<ModelFile> files;
    std::uint64_t sizeEstimate{0};
    std::size_t embeddingDimension{0}; // embedding models only

    [[nodiscard]] const ModelFile* file(FileRole role) const {
        for (const auto& f : files) {
            if (f.role == role)
                return &f;
        }
        return nullptr;
    }
};

} // namespace modelflux
