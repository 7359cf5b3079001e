#include <iostream>
#include <atomic>
#include <csignal>
#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <thread>
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>
#include "SimulatorEngine.hpp"
#include "SimpleHttpUiServer.hpp"
#include "SimulationConfigJson.hpp"
#include "TextureCatalog.hpp"
#include "db/Database.hpp"

namespace
{
    std::atomic<bool> g_keep_running{true};

    void handleSignal(int)
    {
        g_keep_running = false;
    }

    std::shared_ptr<const scramble::ITextureCatalog> loadTextureCatalog(const std::string &atlas_path)
    {
        std::ifstream file(atlas_path);
        if (!file.is_open())
        {
            std::cout << "No sprite atlas at " << atlas_path << ", using built-in texture list" << std::endl;
            return std::make_shared<scramble::TextureCatalog>(scramble::makeDefaultTextureCatalog());
        }

        std::ostringstream buffer;
        buffer << file.rdbuf();
        scramble::AtlasParseResult parsed = scramble::textureCatalogFromAtlasJson(buffer.str());
        if (!parsed.ok)
        {
            for (const auto &error : parsed.errors)
            {
                std::cerr << "Warning: sprite atlas: " << error << std::endl;
            }
            std::cerr << "Warning: sprite atlas is invalid, using built-in texture list" << std::endl;
            return std::make_shared<scramble::TextureCatalog>(scramble::makeDefaultTextureCatalog());
        }

        std::cout << "Loaded " << parsed.catalog.size() << " textures from " << atlas_path << std::endl;
        return std::make_shared<scramble::TextureCatalog>(std::move(parsed.catalog));
    }

    std::string textureListJson(const scramble::ITextureCatalog &textures)
    {
        nlohmann::json root;
        root["count"] = textures.size();
        if (const auto *catalog = dynamic_cast<const scramble::TextureCatalog *>(&textures))
        {
            root["keys"] = catalog->keys();
        }
        return root.dump();
    }
}

int main()
{
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    std::cout << "=== Scramble Crossing Simulator ===" << std::endl;
    std::cout << std::endl;

    scramble::db::Database database("scramble.db");
    std::string db_error;
    if (!database.initialize(&db_error))
    {
        std::cerr << "Warning: failed to initialize config database: " << db_error << std::endl;
    }

    scramble::SimulationConfig initial_config = scramble::makeDefaultSimulationConfig();
    if (auto stored = database.loadActiveSimulationConfigJson(&db_error); stored.has_value())
    {
        scramble::ConfigParseResult parsed = scramble::simulationConfigFromJson(*stored);
        if (parsed.ok)
        {
            initial_config = parsed.config;
        }
        else
        {
            for (const auto &error : parsed.errors)
            {
                std::cerr << "Warning: stored config: " << error << std::endl;
            }
            std::cerr << "Warning: stored config is invalid, using defaults" << std::endl;
        }
    }
    else if (!db_error.empty())
    {
        std::cerr << "Warning: failed to load config from database: " << db_error << std::endl;
    }
    else if (!database.saveActiveSimulationConfigJson(scramble::simulationConfigToJson(initial_config), &db_error))
    {
        std::cerr << "Warning: failed to store default config: " << db_error << std::endl;
    }

    auto textures = loadTextureCatalog("sprites/spritesheet.json");

    scramble::SimulatorEngine engine(initial_config, textures);
    std::mutex engine_mutex;
    std::atomic<bool> app_running{true};
    std::optional<scramble::SimulationConfig> pending_config;

    using HandlerResult = scramble::SimpleHttpUiServer::HandlerResult;

    scramble::SimpleHttpUiServer server(
        8080,
        [&]()
        {
            std::lock_guard<std::mutex> lock(engine_mutex);
            return engine.getSnapshotJson();
        },
        [&](const std::string &cmd)
        {
            std::lock_guard<std::mutex> lock(engine_mutex);

            std::optional<scramble::SimulatorEngine::UICommand> command = scramble::commandFromString(cmd);
            if (!command.has_value())
            {
                return HandlerResult{400, "unknown command: " + cmd};
            }

            auto applyPendingConfigIfNeeded = [&]()
            {
                if (!pending_config.has_value())
                {
                    return;
                }
                engine.applyConfig(*pending_config);
                pending_config.reset();
                std::cout << "Applied pending config" << std::endl;
            };

            if (*command == scramble::SimulatorEngine::UICommand::Start && !engine.isRunning())
            {
                applyPendingConfigIfNeeded();
            }
            else if (*command == scramble::SimulatorEngine::UICommand::Reset)
            {
                applyPendingConfigIfNeeded();
            }

            engine.handleCommand(*command);
            return HandlerResult{200, "ok"};
        },
        [&]()
        {
            std::lock_guard<std::mutex> lock(engine_mutex);
            if (pending_config.has_value())
            {
                return scramble::simulationConfigToJson(*pending_config);
            }
            return scramble::simulationConfigToJson(engine.getConfig());
        },
        [&](const std::string &body)
        {
            std::lock_guard<std::mutex> lock(engine_mutex);

            scramble::ConfigParseResult parsed = scramble::simulationConfigFromJson(body);
            if (!parsed.ok)
            {
                return HandlerResult{400, scramble::validationErrorsToJson(parsed.errors)};
            }

            const std::string normalized_json = scramble::simulationConfigToJson(parsed.config);
            std::string error;
            if (!database.saveActiveSimulationConfigJson(normalized_json, &error))
            {
                std::cerr << "Warning: failed to store config: " << error << std::endl;
                return HandlerResult{500, scramble::validationErrorsToJson({"database error: " + error})};
            }

            pending_config = parsed.config;
            return HandlerResult{200, "{\"ok\":true,\"state\":\"pending\",\"apply_on\":\"start_or_reset\"}"};
        },
        [&]()
        {
            return textureListJson(*textures);
        });

    if (!server.start())
    {
        std::cerr << "Failed to start UI server on port 8080" << std::endl;
        return 1;
    }

    engine.start();

    std::thread sim_thread([&]()
                           {
        auto next_tick = std::chrono::steady_clock::now();
        while (app_running)
        {
            // Re-read every tick: an applied config may change the tick rate
            double tick_dt = 0.0;
            {
                std::lock_guard<std::mutex> lock(engine_mutex);
                tick_dt = engine.tickInterval();
                engine.tick(tick_dt);
            }
            next_tick += std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                std::chrono::duration<double>(tick_dt));
            std::this_thread::sleep_until(next_tick);
        } });

    std::cout << "Snapshot API at: http://localhost:8080/snapshot" << std::endl;
    std::cout << "Press Ctrl+C to stop server..." << std::endl;

    while (g_keep_running)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    app_running = false;
    if (sim_thread.joinable())
    {
        sim_thread.join();
    }
    server.stop();

    std::cout << "Simulator stopped." << std::endl;
    return 0;
}
