#include "TextureCatalog.hpp"
#include "ScreenSignCycle.hpp"

#include <nlohmann/json.hpp>

#include <initializer_list>

namespace scramble
{
    namespace
    {
        using nlohmann::json;

        const char *kSedanColors[] = {"red", "blue", "white", "black"};
        const char *kPedestrianVariants[] = {"office_m", "office_f", "student", "tourist", "elderly"};

        struct VehicleSprite
        {
            const char *type;
            int width; // across the travel axis
            int length;
        };

        const VehicleSprite kVehicleSprites[] = {
            {"taxi", 16, 24},
            {"bus", 16, 40},
            {"kei_truck", 14, 20},
            {"police", 16, 24},
        };

        // Sprites are drawn facing their heading, so E/W frames swap width and height.
        void addOriented(TextureCatalog &catalog, const std::string &key, Heading heading, int width, int length)
        {
            if (axisOf(heading) == Axis::NorthSouth)
            {
                catalog.add(key, width, length);
            }
            else
            {
                catalog.add(key, length, width);
            }
        }
    }

    void TextureCatalog::add(const std::string &key, int width, int height)
    {
        textures[key] = TextureInfo{key, width, height};
    }

    bool TextureCatalog::contains(const std::string &key) const
    {
        return textures.find(key) != textures.end();
    }

    std::vector<std::string> TextureCatalog::keys() const
    {
        std::vector<std::string> result;
        result.reserve(textures.size());
        for (const auto &entry : textures)
        {
            result.push_back(entry.first);
        }
        return result;
    }

    std::optional<TextureInfo> TextureCatalog::find(const std::string &key) const
    {
        auto it = textures.find(key);
        if (it == textures.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    TextureCatalog makeDefaultTextureCatalog()
    {
        TextureCatalog catalog;

        for (Heading heading : kCardinalHeadings)
        {
            for (const char *color : kSedanColors)
            {
                addOriented(catalog, sedanTextureKey(color, heading), heading, 16, 24);
            }
            for (const auto &sprite : kVehicleSprites)
            {
                addOriented(catalog, vehicleTextureKey(sprite.type, heading), heading, sprite.width, sprite.length);
            }
            for (int frame = 0; frame < 2; ++frame)
            {
                addOriented(catalog, cyclistTextureKey("commuter", heading, frame), heading, 10, 20);
                addOriented(catalog, cyclistTextureKey("delivery", heading, frame), heading, 10, 22);
            }
        }

        for (const char *variant : kPedestrianVariants)
        {
            for (uint8_t i = 0; i < 8; ++i)
            {
                for (int frame = 0; frame < 4; ++frame)
                {
                    catalog.add(pedestrianTextureKey(variant, static_cast<Heading>(i), frame), 10, 16);
                }
            }
        }

        for (LightState state : {LightState::Red, LightState::Yellow, LightState::Green})
        {
            catalog.add(vehicleSignalTextureKey(state), 8, 8);
        }
        catalog.add("signal_ped_stop", 6, 7);
        catalog.add("signal_ped_walk", 6, 7);
        catalog.add("signal_ped_flash", 6, 7);

        for (int color = 0; color < ScreenSignCycle::COLOR_COUNT; ++color)
        {
            catalog.add(screenSignTextureKey(color, false), 80, 118);
            catalog.add(screenSignTextureKey(color, true), 80, 118);
        }

        return catalog;
    }

    AtlasParseResult textureCatalogFromAtlasJson(const std::string &json_text)
    {
        AtlasParseResult result;

        json root;
        try
        {
            root = json::parse(json_text);
        }
        catch (const std::exception &e)
        {
            result.errors.push_back(std::string("invalid JSON: ") + e.what());
            return result;
        }

        if (!root.is_object() || !root.contains("frames") || !root["frames"].is_object())
        {
            result.errors.push_back("frames must be an object keyed by texture name");
            return result;
        }

        for (const auto &item : root["frames"].items())
        {
            const json &entry = item.value();
            if (!entry.is_object() || !entry.contains("frame") || !entry["frame"].is_object())
            {
                result.errors.push_back("frame " + item.key() + " has no frame rectangle");
                continue;
            }

            const json &rect = entry["frame"];
            if (!rect.contains("w") || !rect.contains("h") ||
                !rect["w"].is_number_integer() || !rect["h"].is_number_integer())
            {
                result.errors.push_back("frame " + item.key() + " needs integer w and h");
                continue;
            }

            int width = rect["w"].get<int>();
            int height = rect["h"].get<int>();
            if (width <= 0 || height <= 0)
            {
                result.errors.push_back("frame " + item.key() + " has an empty rectangle");
                continue;
            }

            result.catalog.add(item.key(), width, height);
        }

        result.ok = result.errors.empty();
        return result;
    }

    std::string vehicleTextureKey(const std::string &vehicle_type, Heading heading)
    {
        return vehicle_type + "_" + toString(heading);
    }

    std::string sedanTextureKey(const std::string &color, Heading heading)
    {
        return "sedan_" + color + "_" + toString(heading);
    }

    std::string cyclistTextureKey(const std::string &variant, Heading heading, int frame)
    {
        return "cyclist_" + variant + "_" + toString(heading) + "_" + std::to_string(frame);
    }

    std::string pedestrianTextureKey(const std::string &variant, Heading heading, int frame)
    {
        return "ped_" + variant + "_" + toString(heading) + "_" + std::to_string(frame);
    }

    std::string vehicleSignalTextureKey(LightState state)
    {
        return std::string("signal_vehicle_") + toString(state);
    }

    std::string pedestrianSignalTextureKey(WalkState state, bool lamp_lit)
    {
        switch (state)
        {
        case WalkState::Walk:
            return "signal_ped_walk";
        case WalkState::Flashing:
            return lamp_lit ? "signal_ped_walk" : "signal_ped_flash";
        case WalkState::DontWalk:
            break;
        }
        return "signal_ped_stop";
    }

    std::string animatedTextureKey(const Entity &entity)
    {
        switch (entity.kind)
        {
        case EntityKind::Cyclist:
            return cyclistTextureKey(entity.variant, entity.heading, entity.anim_frame);
        case EntityKind::Pedestrian:
            return pedestrianTextureKey(entity.variant, entity.heading, entity.anim_frame);
        case EntityKind::Vehicle:
            break;
        }
        return entity.texture_key;
    }

} // namespace scramble
