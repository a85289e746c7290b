/**
 * @file engine_settings.h
 * @brief Typed startup settings read from the INI config
 *
 * Example config.ini:
 * @code
 * [World]
 * size_x = 80
 * size_y = 16
 * size_z = 80
 * seed = 12345
 *
 * [Server]
 * host = 127.0.0.1
 * port = 9050
 * tick_rate = 20
 *
 * [Streaming]
 * load_distance = 10
 * unload_distance = 12
 * @endcode
 */

#pragma once

#include <cstdint>
#include <string>
#include "logger.h"
#include "world_constants.h"

class Config;

struct WorldSettings {
    int sizeX = 80;        ///< Pre-generated area along X (blocks, centered on origin)
    int sizeY = 16;        ///< Base terrain height (blocks)
    int sizeZ = 80;        ///< Pre-generated area along Z (blocks, centered on origin)
    uint32_t seed = 12345;
};

struct ServerSettings {
    std::string host = "127.0.0.1";
    int port = 9050;
    int tickRate = 20;     ///< Simulation ticks per second
    int maxClients = 10;
};

struct StreamingSettings {
    int renderDistance = StreamingConstants::RENDER_DISTANCE;
    int loadDistance = StreamingConstants::LOAD_DISTANCE;
    int unloadDistance = StreamingConstants::UNLOAD_DISTANCE;
    int meshUploadsPerFrame = StreamingConstants::MESH_UPLOADS_PER_FRAME;
    int meshWorkers = 0;   ///< 0 = max(2, cores / 2)
};

struct RenderSettings {
    bool ambientOcclusion = true;
    float aoStrength = LightingConstants::AMBIENT_OCCLUSION_STRENGTH;
};

struct ClientSettings {
    std::string playerName = "Player";
};

struct LoggingSettings {
    LogLevel level = LogLevel::INFO;
    bool colors = true;
    std::string file;      ///< Empty = console only
};

/**
 * @brief All settings consumed at startup
 *
 * Values missing from the config keep the defaults above. Out-of-range values
 * are clamped and reported with a warning.
 */
struct EngineSettings {
    WorldSettings world;
    ServerSettings server;
    StreamingSettings streaming;
    RenderSettings rendering;
    ClientSettings client;
    LoggingSettings logging;

    static EngineSettings fromConfig(const Config& config);

    /**
     * @brief Writes every value back into a config (used to produce a default config file)
     */
    void writeTo(Config& config) const;

    /**
     * @brief Applies the logging section to the Logger
     */
    void applyLogging() const;
};
