/**
 * @file game_server.h
 * @brief Authoritative world and per-client message handling (transport agnostic)
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <glm/glm.hpp>
#include "engine_settings.h"
#include "terrain_generator.h"
#include "world.h"

/**
 * @brief Packet the transport should deliver to one client
 */
struct OutboundPacket {
    int clientId;
    std::vector<uint8_t> data;
};

/**
 * @brief Owns the authoritative world and answers client packets
 *
 * The transport layer feeds every received packet to handleMessage() and sends
 * the returned packets. Columns are generated on first request.
 *
 * - ClientConnect: registers the player (refused with Disconnect when full)
 * - ChunkRequest: one ChunkData reply per requested column
 * - BlockUpdate: applied, then relayed to every other connected client
 * - PlayerPosition: remembered per client
 * - Disconnect: unregisters the client
 *
 * Malformed packets are logged and produce no reply. Not thread-safe: call
 * from the server tick thread.
 */
class GameServer {
public:
    GameServer(const ServerSettings& serverSettings, const WorldSettings& worldSettings);

    GameServer(const GameServer&) = delete;
    GameServer& operator=(const GameServer&) = delete;

    /**
     * @brief Pre-generates the configured area around the origin
     * @return Number of columns generated
     */
    int initializeWorld();

    /**
     * @brief Handles one packet from a client
     * @return Packets to send in response
     */
    std::vector<OutboundPacket> handleMessage(int clientId, const std::vector<uint8_t>& packet);

    bool isClientConnected(int clientId) const { return m_clients.count(clientId) > 0; }
    size_t getClientCount() const { return m_clients.size(); }

    /// Empty string if the client is not connected
    std::string getPlayerName(int clientId) const;

    /// Last reported position, origin if none was reported
    glm::vec3 getPlayerPosition(int clientId) const;

    World& getWorld() { return m_world; }
    const World& getWorld() const { return m_world; }

    /// Time between simulation ticks derived from the configured tick rate
    std::chrono::milliseconds getTickInterval() const;

private:
    struct ClientState {
        std::string playerName;
        glm::vec3 position{0.0f};
    };

    std::vector<OutboundPacket> handleClientConnect(int clientId, const std::vector<uint8_t>& packet);
    std::vector<OutboundPacket> handleChunkRequest(int clientId, const std::vector<uint8_t>& packet);
    std::vector<OutboundPacket> handleBlockUpdate(int clientId, const std::vector<uint8_t>& packet);
    void handlePlayerPosition(int clientId, const std::vector<uint8_t>& packet);

    void ensureChunk(int chunkX, int chunkZ);

    ServerSettings m_serverSettings;
    WorldSettings m_worldSettings;
    World m_world;
    TerrainGenerator m_terrain;
    std::map<int, ClientState> m_clients;  ///< Ordered so relays go out in client id order
};
