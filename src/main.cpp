/**
 * @file main.cpp
 * @brief Headless TerraNova session: in-process server, streaming client, mesh pipeline
 *
 * Runs the authoritative GameServer and a client GameEngine in one process.
 * Every message between them goes through the binary protocol, so the session
 * exercises the same path a socket transport would. A logging renderer stands
 * in for the graphics backend.
 *
 * Usage: terranova [--config config.ini] [--blocks blocks.yaml] [--ticks 200] [--debug]
 */

#include <chrono>
#include <cmath>
#include <cstdlib>
#include <deque>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <glm/glm.hpp>
#include "block_system.h"
#include "config.h"
#include "engine_settings.h"
#include "game_engine.h"
#include "game_server.h"
#include "logger.h"
#include "net_protocol.h"
#include "world.h"
#include "world_renderer.h"

namespace {

/**
 * @brief Renderer that keeps per-column face counts instead of GPU buffers
 */
class LoggingRenderer : public WorldRenderer {
public:
    void updateChunk(const ChunkCoord& position, const ChunkMeshData& mesh) override {
        m_faces[position] = mesh.getFaceCount();
        m_uploads++;
        Logger::debug() << "Mesh for chunk (" << position.x << ", " << position.z << "): "
                        << mesh.getFaceCount() << " faces, " << mesh.getVertexCount() << " vertices";
    }

    void removeChunk(const ChunkCoord& position) override {
        m_faces.erase(position);
        m_removals++;
        Logger::debug() << "Removed mesh for chunk (" << position.x << ", " << position.z << ")";
    }

    void highlightBlock(const glm::ivec3& position, bool highlighted) override {
        Logger::debug() << (highlighted ? "Highlight " : "Clear highlight ")
                        << position.x << "," << position.y << "," << position.z;
    }

    void setCamera(const glm::vec3& position, const glm::vec3& rotation) override {
        m_cameraPosition = position;
        Logger::debug() << "Camera pitch " << rotation.x << ", yaw " << rotation.y;
    }

    const glm::vec3& getCameraPosition() const { return m_cameraPosition; }
    size_t getResidentMeshCount() const { return m_faces.size(); }
    size_t getUploadCount() const { return m_uploads; }
    size_t getRemovalCount() const { return m_removals; }

    size_t getTotalFaceCount() const {
        size_t total = 0;
        for (const auto& entry : m_faces) {
            total += entry.second;
        }
        return total;
    }

private:
    std::unordered_map<ChunkCoord, size_t> m_faces;
    size_t m_uploads = 0;
    size_t m_removals = 0;
    glm::vec3 m_cameraPosition{0.0f};
};

// Highest solid block in a column, 0 if the column is empty or missing
int findSurfaceHeight(const World& world, int x, int z) {
    for (int y = Chunk::HEIGHT - 1; y > 0; --y) {
        if (world.isSolid(x, y, z)) {
            return y;
        }
    }
    return 0;
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  --config <path>   INI configuration (default: config.ini)\n"
              << "  --blocks <path>   Block color overrides (default: blocks.yaml)\n"
              << "  --ticks <n>       Number of simulation ticks to run (default: 200)\n"
              << "  --debug           Verbose logging\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configPath = "config.ini";
    std::string blocksPath = "blocks.yaml";
    int ticks = 200;
    bool debugMode = false;

    // Parse command line arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--debug" || arg == "-debug") {
            debugMode = true;
        } else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--blocks" && i + 1 < argc) {
            blocksPath = argv[++i];
        } else if (arg == "--ticks" && i + 1 < argc) {
            try {
                ticks = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid tick count: " << argv[i] << '\n';
                return EXIT_FAILURE;
            }
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return EXIT_SUCCESS;
        } else {
            std::cerr << "Unknown argument: " << arg << '\n';
            printUsage(argv[0]);
            return EXIT_FAILURE;
        }
    }

    try {
        // Load configuration first
        Config& config = Config::instance();
        if (!config.loadFromFile(configPath)) {
            Logger::warning() << "Failed to load " << configPath << ", using default values";
        }

        EngineSettings settings = EngineSettings::fromConfig(config);
        if (debugMode) {
            settings.logging.level = LogLevel::DEBUG;
        }
        settings.applyLogging();

        if (!BlockRegistry::instance().loadFromFile(blocksPath)) {
            Logger::warning() << "Using built-in block colors";
        }

        // ========== Server ==========
        GameServer server(settings.server, settings.world);
        server.initializeWorld();

        // ========== Client ==========
        const int clientId = 1;
        World clientWorld;
        LoggingRenderer renderer;
        GameEngine engine(renderer, settings);

        // Loopback transport: server replies wait in the inbox until the next tick
        std::deque<std::vector<uint8_t>> inbox;
        bool connected = true;

        auto send = [&](const std::vector<uint8_t>& packet) {
            for (auto& reply : server.handleMessage(clientId, packet)) {
                if (reply.clientId == clientId) {
                    inbox.push_back(std::move(reply.data));
                }
            }
        };

        auto processInbox = [&]() {
            while (!inbox.empty()) {
                std::vector<uint8_t> packet = std::move(inbox.front());
                inbox.pop_front();
                try {
                    MessageType type = Protocol::peekMessageType(packet);
                    switch (type) {
                        case MessageType::ChunkData:
                            engine.receiveChunkData(Protocol::decodeChunkData(packet));
                            break;
                        case MessageType::BlockUpdate: {
                            BlockUpdateMessage update = Protocol::decodeBlockUpdate(packet);
                            engine.notifyBlockUpdate(update.x, update.y, update.z, update.type);
                            break;
                        }
                        case MessageType::Disconnect:
                            Logger::warning() << "Disconnected by server";
                            connected = false;
                            break;
                        default:
                            Logger::warning() << "Unexpected " << messageTypeName(type) << " from server";
                            break;
                    }
                } catch (const ProtocolError& e) {
                    Logger::warning() << "Malformed packet from server: " << e.what();
                }
            }
        };

        engine.setChunkRequestHandler([&](const std::vector<ChunkCoord>& positions) {
            ChunkRequestMessage request;
            request.positions = positions;
            send(Protocol::encode(request));
        });

        send(Protocol::encode(ClientConnectMessage{settings.client.playerName}));
        processInbox();
        if (!connected) {
            return EXIT_FAILURE;
        }
        engine.setWorld(&clientWorld);

        // ========== Session loop ==========
        const auto tickInterval = server.getTickInterval();
        const float deltaTime = static_cast<float>(tickInterval.count()) / 1000.0f;
        const glm::vec3 lookDirection = glm::normalize(glm::vec3(0.3f, -1.0f, 0.2f));
        glm::vec3 position(0.5f, 0.0f, 0.5f);
        bool dug = false;

        Logger::info() << "Running " << ticks << " ticks at " << settings.server.tickRate << " Hz";
        auto sessionStart = std::chrono::steady_clock::now();

        for (int tick = 0; tick < ticks && connected; ++tick) {
            auto frameStart = std::chrono::steady_clock::now();

            // Walk east with a slow sideways drift
            position.x += 4.0f * deltaTime;
            position.z += 1.5f * deltaTime * std::sin(tick * 0.05f);
            int surface = findSurfaceHeight(clientWorld, static_cast<int>(std::floor(position.x + 0.5f)),
                                            static_cast<int>(std::floor(position.z + 0.5f)));
            position.y = static_cast<float>(surface) + 2.6f;

            engine.updatePlayerPosition(position);
            send(Protocol::encode(PlayerPositionMessage{position}));
            processInbox();

            engine.setCamera(position, glm::vec3(-60.0f, 0.0f, 0.0f));
            engine.updateTargetBlock(position, lookDirection);

            // Dig out the targeted block once, halfway through
            if (!dug && tick >= ticks / 2 && engine.hasTargetBlock()) {
                glm::ivec3 target = engine.getTargetBlock();
                engine.notifyBlockUpdate(target.x, target.y, target.z, BlockType::Air);
                send(Protocol::encode(BlockUpdateMessage{target.x, target.y, target.z, BlockType::Air}));
                Logger::info() << "Dug block at " << target.x << "," << target.y << "," << target.z;
                dug = true;
            }

            engine.update(deltaTime);
            std::this_thread::sleep_until(frameStart + tickInterval);
        }

        // Let the workers finish and hand over everything that is left
        AsyncChunkMeshBuilder* meshing = engine.getAsyncMeshBuilder();
        if (meshing) {
            engine.update(0.0f);
            if (!meshing->waitUntilIdle(std::chrono::seconds(5))) {
                Logger::warning() << "Mesh workers still busy after 5 seconds";
            }
            while (engine.update(0.0f) > 0) {
            }

            double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - sessionStart).count();
            Logger::info() << "Session finished in " << seconds << " s";
            Logger::info() << "  Chunks resident: " << clientWorld.getChunkCount()
                           << " (server: " << server.getWorld().getChunkCount() << ")";
            Logger::info() << "  Meshes built: " << meshing->getTotalBuilt()
                           << ", failed: " << meshing->getFailedBuildCount()
                           << ", stale: " << meshing->getDiscardedStaleCount();
            const glm::vec3& camera = renderer.getCameraPosition();
            Logger::info() << "  Camera: " << camera.x << ", " << camera.y << ", " << camera.z;
            Logger::info() << "  Renderer: " << renderer.getResidentMeshCount() << " meshes, "
                           << renderer.getTotalFaceCount() << " faces, "
                           << renderer.getUploadCount() << " uploads, "
                           << renderer.getRemovalCount() << " removals";
        }

        send(Protocol::encode(DisconnectMessage{}));
        engine.shutdown();
    } catch (const std::exception& e) {
        Logger::error() << "Fatal error: " << e.what();
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
