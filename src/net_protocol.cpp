/**
 * @file net_protocol.cpp
 * @brief Little-endian packet encoding and validating decoders
 */

#include "net_protocol.h"
#include "world.h"
#include <cstring>

namespace {

class ByteWriter {
public:
    explicit ByteWriter(MessageType type) {
        m_data.push_back(static_cast<uint8_t>(type));
    }

    void putU8(uint8_t value) { m_data.push_back(value); }

    void putU16(uint16_t value) {
        m_data.push_back(static_cast<uint8_t>(value & 0xFF));
        m_data.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    }

    void putU32(uint32_t value) {
        for (int shift = 0; shift < 32; shift += 8) {
            m_data.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
        }
    }

    void putI32(int32_t value) { putU32(static_cast<uint32_t>(value)); }

    void putF32(float value) {
        uint32_t bits;
        std::memcpy(&bits, &value, sizeof(bits));
        putU32(bits);
    }

    void putString(const std::string& value) {
        if (value.size() > Protocol::MAX_STRING_LENGTH) {
            throw ProtocolError("String too long for packet: " + std::to_string(value.size()) + " bytes");
        }
        putU16(static_cast<uint16_t>(value.size()));
        m_data.insert(m_data.end(), value.begin(), value.end());
    }

    std::vector<uint8_t> take() { return std::move(m_data); }

private:
    std::vector<uint8_t> m_data;
};

class ByteReader {
public:
    ByteReader(const std::vector<uint8_t>& data, MessageType expected)
        : m_data(data)
    {
        MessageType actual = Protocol::peekMessageType(data);
        if (actual != expected) {
            throw ProtocolError(std::string("Expected ") + messageTypeName(expected) +
                                " packet, got " + messageTypeName(actual));
        }
        m_offset = 1;
    }

    uint8_t getU8() {
        require(1);
        return m_data[m_offset++];
    }

    uint16_t getU16() {
        require(2);
        uint16_t value = static_cast<uint16_t>(m_data[m_offset] | (m_data[m_offset + 1] << 8));
        m_offset += 2;
        return value;
    }

    uint32_t getU32() {
        require(4);
        uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            value |= static_cast<uint32_t>(m_data[m_offset + i]) << (8 * i);
        }
        m_offset += 4;
        return value;
    }

    int32_t getI32() { return static_cast<int32_t>(getU32()); }

    float getF32() {
        uint32_t bits = getU32();
        float value;
        std::memcpy(&value, &bits, sizeof(value));
        return value;
    }

    std::string getString() {
        uint16_t length = getU16();
        require(length);
        std::string value(reinterpret_cast<const char*>(m_data.data() + m_offset), length);
        m_offset += length;
        return value;
    }

    BlockType getBlockType() {
        uint8_t raw = getU8();
        if (!isValidBlockType(raw)) {
            throw ProtocolError("Invalid block type " + std::to_string(raw));
        }
        return static_cast<BlockType>(raw);
    }

    /**
     * @brief Guards a count-prefixed array against a lying count
     */
    void requireElements(uint32_t count, size_t elementSize) {
        if (static_cast<uint64_t>(count) * elementSize > remaining()) {
            throw ProtocolError("Element count " + std::to_string(count) + " exceeds packet size");
        }
    }

    void finish() const {
        if (m_offset != m_data.size()) {
            throw ProtocolError(std::to_string(m_data.size() - m_offset) + " trailing bytes in packet");
        }
    }

private:
    size_t remaining() const { return m_data.size() - m_offset; }

    void require(size_t bytes) const {
        if (remaining() < bytes) {
            throw ProtocolError("Truncated packet: need " + std::to_string(bytes) +
                                " bytes, have " + std::to_string(remaining()));
        }
    }

    const std::vector<uint8_t>& m_data;
    size_t m_offset = 0;
};

} // namespace

const char* messageTypeName(MessageType type) {
    switch (type) {
        case MessageType::ClientConnect:  return "ClientConnect";
        case MessageType::ChunkRequest:   return "ChunkRequest";
        case MessageType::PlayerPosition: return "PlayerPosition";
        case MessageType::BlockUpdate:    return "BlockUpdate";
        case MessageType::ChunkData:      return "ChunkData";
        case MessageType::Disconnect:     return "Disconnect";
    }
    return "Unknown";
}

ChunkDataMessage ChunkDataMessage::fromChunk(const Chunk& chunk) {
    ChunkDataMessage message;
    message.position = chunk.getCoord();
    message.runs = chunk.compressBlocks();
    return message;
}

bool ChunkDataMessage::applyTo(World& world) const {
    return world.setChunkData(position.x, position.z, runs);
}

namespace Protocol {

std::vector<uint8_t> encode(const ClientConnectMessage& message) {
    ByteWriter writer(MessageType::ClientConnect);
    writer.putString(message.playerName);
    return writer.take();
}

std::vector<uint8_t> encode(const ChunkRequestMessage& message) {
    ByteWriter writer(MessageType::ChunkRequest);
    writer.putU32(static_cast<uint32_t>(message.positions.size()));
    for (const auto& coord : message.positions) {
        writer.putI32(coord.x);
        writer.putI32(coord.z);
    }
    return writer.take();
}

std::vector<uint8_t> encode(const PlayerPositionMessage& message) {
    ByteWriter writer(MessageType::PlayerPosition);
    writer.putF32(message.position.x);
    writer.putF32(message.position.y);
    writer.putF32(message.position.z);
    return writer.take();
}

std::vector<uint8_t> encode(const BlockUpdateMessage& message) {
    ByteWriter writer(MessageType::BlockUpdate);
    writer.putI32(message.x);
    writer.putI32(message.y);
    writer.putI32(message.z);
    writer.putU8(static_cast<uint8_t>(message.type));
    return writer.take();
}

std::vector<uint8_t> encode(const ChunkDataMessage& message) {
    ByteWriter writer(MessageType::ChunkData);
    writer.putI32(message.position.x);
    writer.putI32(message.position.z);
    writer.putU32(static_cast<uint32_t>(message.runs.size()));
    for (const auto& run : message.runs) {
        writer.putU8(static_cast<uint8_t>(run.type));
        writer.putU32(run.count);
    }
    return writer.take();
}

std::vector<uint8_t> encode(const DisconnectMessage&) {
    ByteWriter writer(MessageType::Disconnect);
    return writer.take();
}

MessageType peekMessageType(const std::vector<uint8_t>& packet) {
    if (packet.empty()) {
        throw ProtocolError("Empty packet");
    }

    MessageType type = static_cast<MessageType>(packet[0]);
    switch (type) {
        case MessageType::ClientConnect:
        case MessageType::ChunkRequest:
        case MessageType::PlayerPosition:
        case MessageType::BlockUpdate:
        case MessageType::ChunkData:
        case MessageType::Disconnect:
            return type;
    }
    throw ProtocolError("Unknown message type " + std::to_string(packet[0]));
}

ClientConnectMessage decodeClientConnect(const std::vector<uint8_t>& packet) {
    ByteReader reader(packet, MessageType::ClientConnect);
    ClientConnectMessage message;
    message.playerName = reader.getString();
    reader.finish();
    return message;
}

ChunkRequestMessage decodeChunkRequest(const std::vector<uint8_t>& packet) {
    ByteReader reader(packet, MessageType::ChunkRequest);
    uint32_t count = reader.getU32();
    reader.requireElements(count, 8);

    ChunkRequestMessage message;
    message.positions.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        int x = reader.getI32();
        int z = reader.getI32();
        message.positions.push_back(ChunkCoord{x, z});
    }
    reader.finish();
    return message;
}

PlayerPositionMessage decodePlayerPosition(const std::vector<uint8_t>& packet) {
    ByteReader reader(packet, MessageType::PlayerPosition);
    PlayerPositionMessage message;
    message.position.x = reader.getF32();
    message.position.y = reader.getF32();
    message.position.z = reader.getF32();
    reader.finish();
    return message;
}

BlockUpdateMessage decodeBlockUpdate(const std::vector<uint8_t>& packet) {
    ByteReader reader(packet, MessageType::BlockUpdate);
    BlockUpdateMessage message;
    message.x = reader.getI32();
    message.y = reader.getI32();
    message.z = reader.getI32();
    message.type = reader.getBlockType();
    reader.finish();
    return message;
}

ChunkDataMessage decodeChunkData(const std::vector<uint8_t>& packet) {
    ByteReader reader(packet, MessageType::ChunkData);
    ChunkDataMessage message;
    int x = reader.getI32();
    int z = reader.getI32();
    message.position = ChunkCoord{x, z};

    uint32_t runCount = reader.getU32();
    reader.requireElements(runCount, 5);
    message.runs.reserve(runCount);

    uint64_t total = 0;
    for (uint32_t i = 0; i < runCount; ++i) {
        BlockType type = reader.getBlockType();
        uint32_t count = reader.getU32();
        total += count;
        message.runs.push_back(BlockRun{type, count});
    }
    reader.finish();

    if (total != static_cast<uint64_t>(Chunk::VOLUME)) {
        throw ProtocolError("Chunk data covers " + std::to_string(total) + " blocks, expected " +
                            std::to_string(Chunk::VOLUME));
    }
    return message;
}

DisconnectMessage decodeDisconnect(const std::vector<uint8_t>& packet) {
    ByteReader reader(packet, MessageType::Disconnect);
    reader.finish();
    return DisconnectMessage{};
}

} // namespace Protocol
