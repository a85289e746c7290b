/**
 * @file net_protocol.h
 * @brief Binary wire format for client/server messages
 *
 * Every packet is one MessageType byte followed by the payload. All integers
 * and floats are little-endian, strings are a uint16 length plus UTF-8 bytes.
 *
 * | Type           | Payload                                                   |
 * |----------------|-----------------------------------------------------------|
 * | ClientConnect  | string playerName                                         |
 * | ChunkRequest   | uint32 count, count x (int32 x, int32 z)                  |
 * | PlayerPosition | float32 x, y, z                                           |
 * | BlockUpdate    | int32 x, y, z, uint8 type                                 |
 * | ChunkData      | int32 x, int32 z, uint32 runs, runs x (uint8, uint32)     |
 * | Disconnect     | (empty)                                                   |
 *
 * ChunkData runs are the run-length encoded column in storage order and must
 * add up to exactly one column of blocks.
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include <glm/glm.hpp>
#include "block_types.h"
#include "chunk.h"

class World;

enum class MessageType : uint8_t {
    // Client -> Server
    ClientConnect = 1,
    ChunkRequest = 2,
    PlayerPosition = 3,

    // Server -> Client
    BlockUpdate = 11,
    ChunkData = 12,

    // Bidirectional
    Disconnect = 255
};

const char* messageTypeName(MessageType type);

/**
 * @brief Raised when a packet is truncated, has trailing bytes or carries invalid values
 */
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& message) : std::runtime_error(message) {}
};

struct ClientConnectMessage {
    std::string playerName;
};

struct ChunkRequestMessage {
    std::vector<ChunkCoord> positions;
};

struct PlayerPositionMessage {
    glm::vec3 position{0.0f};
};

/// Single block placed or broken (sent in both directions)
struct BlockUpdateMessage {
    int x = 0;
    int y = 0;
    int z = 0;
    BlockType type = BlockType::Air;
};

/// Full contents of one column
struct ChunkDataMessage {
    ChunkCoord position{0, 0};
    std::vector<BlockRun> runs;

    static ChunkDataMessage fromChunk(const Chunk& chunk);

    /**
     * @brief Writes the column into a world, replacing any existing data
     * @return False if the runs do not describe a complete column
     */
    bool applyTo(World& world) const;
};

struct DisconnectMessage {};

namespace Protocol {
    /// Longest player name that fits the uint16 length prefix
    constexpr size_t MAX_STRING_LENGTH = 0xFFFF;

    std::vector<uint8_t> encode(const ClientConnectMessage& message);
    std::vector<uint8_t> encode(const ChunkRequestMessage& message);
    std::vector<uint8_t> encode(const PlayerPositionMessage& message);
    std::vector<uint8_t> encode(const BlockUpdateMessage& message);
    std::vector<uint8_t> encode(const ChunkDataMessage& message);
    std::vector<uint8_t> encode(const DisconnectMessage& message);

    /**
     * @brief Reads the message type of a packet
     * @throws ProtocolError if the packet is empty or the type is unknown
     */
    MessageType peekMessageType(const std::vector<uint8_t>& packet);

    // Each decoder checks the type byte and consumes the whole packet
    ClientConnectMessage decodeClientConnect(const std::vector<uint8_t>& packet);
    ChunkRequestMessage decodeChunkRequest(const std::vector<uint8_t>& packet);
    PlayerPositionMessage decodePlayerPosition(const std::vector<uint8_t>& packet);
    BlockUpdateMessage decodeBlockUpdate(const std::vector<uint8_t>& packet);
    ChunkDataMessage decodeChunkData(const std::vector<uint8_t>& packet);
    DisconnectMessage decodeDisconnect(const std::vector<uint8_t>& packet);
}
