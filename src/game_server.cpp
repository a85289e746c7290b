/**
 * @file game_server.cpp
 * @brief Server-side packet dispatch and on-demand terrain
 */

#include "game_server.h"
#include "net_protocol.h"
#include "world_utils.h"
#include "logger.h"
#include <algorithm>

GameServer::GameServer(const ServerSettings& serverSettings, const WorldSettings& worldSettings)
    : m_serverSettings(serverSettings)
    , m_worldSettings(worldSettings)
    , m_terrain(worldSettings.seed, worldSettings.sizeY)
{
    Logger::info() << "Server configured for " << m_serverSettings.host << ":" << m_serverSettings.port
                   << " (max clients: " << m_serverSettings.maxClients
                   << ", tick rate: " << m_serverSettings.tickRate << " Hz)";
}

int GameServer::initializeWorld() {
    int halfX = m_worldSettings.sizeX / 2;
    int halfZ = m_worldSettings.sizeZ / 2;

    ChunkCoord minChunk = Chunk::worldToChunkPosition(-halfX, -halfZ);
    ChunkCoord maxChunk = Chunk::worldToChunkPosition(halfX, halfZ);

    int generated = 0;
    for (int cx = minChunk.x; cx <= maxChunk.x; ++cx) {
        for (int cz = minChunk.z; cz <= maxChunk.z; ++cz) {
            if (!m_world.hasChunk(cx, cz)) {
                m_terrain.generateChunk(m_world, cx, cz);
                generated++;
            }
        }
    }

    Logger::info() << "World generated: " << generated << " chunks covering "
                   << m_worldSettings.sizeX << "x" << m_worldSettings.sizeZ << " blocks (seed "
                   << m_worldSettings.seed << ")";
    return generated;
}

std::vector<OutboundPacket> GameServer::handleMessage(int clientId, const std::vector<uint8_t>& packet) {
    try {
        MessageType type = Protocol::peekMessageType(packet);

        if (type != MessageType::ClientConnect && !isClientConnected(clientId)) {
            Logger::warning() << "Ignoring " << messageTypeName(type) << " from unknown client " << clientId;
            return {};
        }

        switch (type) {
            case MessageType::ClientConnect:
                return handleClientConnect(clientId, packet);
            case MessageType::ChunkRequest:
                return handleChunkRequest(clientId, packet);
            case MessageType::BlockUpdate:
                return handleBlockUpdate(clientId, packet);
            case MessageType::PlayerPosition:
                handlePlayerPosition(clientId, packet);
                return {};
            case MessageType::Disconnect:
                Protocol::decodeDisconnect(packet);
                Logger::info() << "Player left: " << m_clients[clientId].playerName;
                m_clients.erase(clientId);
                return {};
            case MessageType::ChunkData:
                Logger::warning() << "Client " << clientId << " sent server-only ChunkData";
                return {};
        }
    } catch (const ProtocolError& e) {
        Logger::warning() << "Malformed packet from client " << clientId << ": " << e.what();
    }
    return {};
}

std::vector<OutboundPacket> GameServer::handleClientConnect(int clientId, const std::vector<uint8_t>& packet) {
    ClientConnectMessage message = Protocol::decodeClientConnect(packet);

    if (!isClientConnected(clientId) &&
        static_cast<int>(m_clients.size()) >= m_serverSettings.maxClients) {
        Logger::warning() << "Refusing " << message.playerName << ": server full";
        return { OutboundPacket{clientId, Protocol::encode(DisconnectMessage{})} };
    }

    m_clients[clientId].playerName = message.playerName;
    Logger::info() << "Player joined: " << message.playerName << " (client " << clientId << ")";
    return {};
}

std::vector<OutboundPacket> GameServer::handleChunkRequest(int clientId, const std::vector<uint8_t>& packet) {
    ChunkRequestMessage request = Protocol::decodeChunkRequest(packet);

    std::vector<OutboundPacket> replies;
    replies.reserve(request.positions.size());
    for (const auto& coord : request.positions) {
        ensureChunk(coord.x, coord.z);
        auto chunk = m_world.getChunk(coord.x, coord.z);
        if (chunk) {
            replies.push_back(OutboundPacket{clientId, Protocol::encode(ChunkDataMessage::fromChunk(*chunk))});
        }
    }

    Logger::debug() << "Sent " << replies.size() << " chunks to client " << clientId;
    return replies;
}

std::vector<OutboundPacket> GameServer::handleBlockUpdate(int clientId, const std::vector<uint8_t>& packet) {
    BlockUpdateMessage update = Protocol::decodeBlockUpdate(packet);

    if (update.y < 0 || update.y >= Chunk::HEIGHT) {
        Logger::warning() << "Client " << clientId << " edited out-of-range height " << update.y;
        return {};
    }

    // Edits land in generated terrain, not in a blank column
    ChunkCoord coord = Chunk::worldToChunkPosition(update.x, update.z);
    ensureChunk(coord.x, coord.z);
    m_world.setBlock(update.x, update.y, update.z, update.type);

    Logger::debug() << "Block updated at (" << update.x << "," << update.y << "," << update.z
                    << ") to " << blockTypeName(update.type);

    std::vector<OutboundPacket> relays;
    std::vector<uint8_t> encoded = Protocol::encode(update);
    for (const auto& client : m_clients) {
        if (client.first != clientId) {
            relays.push_back(OutboundPacket{client.first, encoded});
        }
    }
    return relays;
}

void GameServer::handlePlayerPosition(int clientId, const std::vector<uint8_t>& packet) {
    PlayerPositionMessage message = Protocol::decodePlayerPosition(packet);
    m_clients[clientId].position = message.position;
}

void GameServer::ensureChunk(int chunkX, int chunkZ) {
    if (!m_world.hasChunk(chunkX, chunkZ)) {
        m_terrain.generateChunk(m_world, chunkX, chunkZ);
    }
}

std::string GameServer::getPlayerName(int clientId) const {
    auto it = m_clients.find(clientId);
    return it != m_clients.end() ? it->second.playerName : std::string();
}

glm::vec3 GameServer::getPlayerPosition(int clientId) const {
    auto it = m_clients.find(clientId);
    return it != m_clients.end() ? it->second.position : glm::vec3(0.0f);
}

std::chrono::milliseconds GameServer::getTickInterval() const {
    return std::chrono::milliseconds(1000 / std::max(1, m_serverSettings.tickRate));
}
