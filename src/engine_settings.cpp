/**
 * @file engine_settings.cpp
 * @brief Config sections to typed settings
 */

#include "engine_settings.h"
#include "config.h"
#include <algorithm>

namespace {

int clampSetting(const char* name, int value, int minValue, int maxValue) {
    int clamped = std::max(minValue, std::min(value, maxValue));
    if (clamped != value) {
        Logger::warning() << "Setting " << name << "=" << value << " out of range, using " << clamped;
    }
    return clamped;
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "debug";
        case LogLevel::INFO:    return "info";
        case LogLevel::WARNING: return "warning";
        case LogLevel::ERROR:   return "error";
    }
    return "info";
}

} // namespace

EngineSettings EngineSettings::fromConfig(const Config& config) {
    EngineSettings s;

    // ========== World ==========
    s.world.sizeX = clampSetting("World.size_x", config.getInt("World", "size_x", s.world.sizeX), 1, 4096);
    s.world.sizeY = clampSetting("World.size_y", config.getInt("World", "size_y", s.world.sizeY), 1, ChunkConstants::WORLD_HEIGHT - 1);
    s.world.sizeZ = clampSetting("World.size_z", config.getInt("World", "size_z", s.world.sizeZ), 1, 4096);
    s.world.seed = static_cast<uint32_t>(config.getInt("World", "seed", static_cast<int>(s.world.seed)));

    // ========== Server ==========
    s.server.host = config.getString("Server", "host", s.server.host);
    s.server.port = clampSetting("Server.port", config.getInt("Server", "port", s.server.port), 1, 65535);
    s.server.tickRate = clampSetting("Server.tick_rate", config.getInt("Server", "tick_rate", s.server.tickRate), 1, 1000);
    s.server.maxClients = clampSetting("Server.max_clients", config.getInt("Server", "max_clients", s.server.maxClients), 1, 1024);

    // ========== Streaming ==========
    s.streaming.renderDistance = clampSetting("Streaming.render_distance",
        config.getInt("Streaming", "render_distance", s.streaming.renderDistance), 1, 64);
    s.streaming.loadDistance = clampSetting("Streaming.load_distance",
        config.getInt("Streaming", "load_distance", s.streaming.loadDistance), 1, 64);
    s.streaming.unloadDistance = clampSetting("Streaming.unload_distance",
        config.getInt("Streaming", "unload_distance", s.streaming.unloadDistance),
        s.streaming.loadDistance + StreamingConstants::MIN_UNLOAD_MARGIN, 128);
    s.streaming.meshUploadsPerFrame = clampSetting("Streaming.mesh_uploads_per_frame",
        config.getInt("Streaming", "mesh_uploads_per_frame", s.streaming.meshUploadsPerFrame), 1, 256);
    s.streaming.meshWorkers = clampSetting("Streaming.mesh_workers",
        config.getInt("Streaming", "mesh_workers", s.streaming.meshWorkers), 0, 64);

    // ========== Rendering ==========
    s.rendering.ambientOcclusion = config.getBool("Rendering", "ambient_occlusion", s.rendering.ambientOcclusion);
    float aoStrength = config.getFloat("Rendering", "ao_strength", s.rendering.aoStrength);
    s.rendering.aoStrength = std::max(0.0f, std::min(aoStrength, 1.0f));
    if (s.rendering.aoStrength != aoStrength) {
        Logger::warning() << "Setting Rendering.ao_strength=" << aoStrength << " out of range, using " << s.rendering.aoStrength;
    }

    // ========== Client ==========
    s.client.playerName = config.getString("Client", "player_name", s.client.playerName);

    // ========== Logging ==========
    s.logging.level = parseLogLevel(config.getString("Logging", "level", logLevelName(s.logging.level)), s.logging.level);
    s.logging.colors = config.getBool("Logging", "colors", s.logging.colors);
    s.logging.file = config.getString("Logging", "file", s.logging.file);

    return s;
}

void EngineSettings::writeTo(Config& config) const {
    config.setInt("World", "size_x", world.sizeX);
    config.setInt("World", "size_y", world.sizeY);
    config.setInt("World", "size_z", world.sizeZ);
    config.setInt("World", "seed", static_cast<int>(world.seed));

    config.setString("Server", "host", server.host);
    config.setInt("Server", "port", server.port);
    config.setInt("Server", "tick_rate", server.tickRate);
    config.setInt("Server", "max_clients", server.maxClients);

    config.setInt("Streaming", "render_distance", streaming.renderDistance);
    config.setInt("Streaming", "load_distance", streaming.loadDistance);
    config.setInt("Streaming", "unload_distance", streaming.unloadDistance);
    config.setInt("Streaming", "mesh_uploads_per_frame", streaming.meshUploadsPerFrame);
    config.setInt("Streaming", "mesh_workers", streaming.meshWorkers);

    config.setBool("Rendering", "ambient_occlusion", rendering.ambientOcclusion);
    config.setFloat("Rendering", "ao_strength", rendering.aoStrength);

    config.setString("Client", "player_name", client.playerName);

    config.setString("Logging", "level", logLevelName(logging.level));
    config.setBool("Logging", "colors", logging.colors);
    config.setString("Logging", "file", logging.file);
}

void EngineSettings::applyLogging() const {
    Logger::setMinLevel(logging.level);
    Logger::setUseColors(logging.colors);
    if (!Logger::setLogFile(logging.file)) {
        Logger::warning() << "Could not open log file " << logging.file;
    }
}
