#pragma once

#include "Entity.hpp"
#include "Intersection.hpp"
#include "SceneLayout.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scramble
{
    struct TextureInfo
    {
        std::string key;
        int width = 0;
        int height = 0;
    };

    // Named texture lookup produced by the offline sprite pipeline.
    class ITextureCatalog
    {
    public:
        virtual ~ITextureCatalog() = default;
        virtual std::optional<TextureInfo> find(const std::string &key) const = 0;
        virtual std::size_t size() const = 0;
    };

    class TextureCatalog : public ITextureCatalog
    {
    public:
        TextureCatalog() = default;

        void add(const std::string &key, int width, int height);
        bool contains(const std::string &key) const;
        std::vector<std::string> keys() const;

        std::optional<TextureInfo> find(const std::string &key) const override;
        std::size_t size() const override { return textures.size(); }

    private:
        std::map<std::string, TextureInfo> textures;
    };

    struct AtlasParseResult
    {
        bool ok = false;
        TextureCatalog catalog;
        std::vector<std::string> errors;
    };

    // Every frame the sprite generator emits for moving actors and signal heads.
    TextureCatalog makeDefaultTextureCatalog();

    // Reads a TexturePacker "hash" manifest: {"frames": {"<key>": {"frame": {"w":..,"h":..}}}}.
    AtlasParseResult textureCatalogFromAtlasJson(const std::string &json_text);

    // Texture key naming scheme.
    std::string vehicleTextureKey(const std::string &vehicle_type, Heading heading);
    std::string sedanTextureKey(const std::string &color, Heading heading);
    std::string cyclistTextureKey(const std::string &variant, Heading heading, int frame);
    std::string pedestrianTextureKey(const std::string &variant, Heading heading, int frame);
    std::string vehicleSignalTextureKey(LightState state);
    std::string pedestrianSignalTextureKey(WalkState state, bool lamp_lit);

    // Key for the entity's current heading and animation frame.
    std::string animatedTextureKey(const Entity &entity);

} // namespace scramble
