/**
 * @file world_constants.h
 * @brief Constants for chunk sizing, lighting and streaming
 */

#pragma once

namespace ChunkConstants {
    /// Horizontal edge length of a column (blocks)
    constexpr int CHUNK_SIZE = 16;

    /// Vertical extent of every column (blocks), there is no vertical chunking
    constexpr int WORLD_HEIGHT = 128;

    constexpr int BLOCKS_PER_CHUNK = CHUNK_SIZE * WORLD_HEIGHT * CHUNK_SIZE;
}

namespace LightingConstants {
    // ========== Directional Face Brightness ==========
    constexpr float TOP_FACE_BRIGHTNESS = 1.0f;
    constexpr float SIDE_FACE_BRIGHTNESS = 0.75f;
    constexpr float BOTTOM_FACE_BRIGHTNESS = 0.5f;

    /// Darkening applied to a fully occluded vertex (0 = off, 1 = black)
    constexpr float AMBIENT_OCCLUSION_STRENGTH = 0.3f;
}

namespace StreamingConstants {
    // ========== Residency Rings (in columns) ==========
    constexpr int RENDER_DISTANCE = 8;
    constexpr int LOAD_DISTANCE = 10;
    constexpr int UNLOAD_DISTANCE = 12;

    /// Unload ring must exceed the load ring by this much to avoid thrash
    constexpr int MIN_UNLOAD_MARGIN = 2;

    /// Player movement (world units) below which residency is not recomputed
    constexpr float MOVEMENT_THRESHOLD = 1.0f;

    /// Completed meshes handed to the renderer per frame
    constexpr int MESH_UPLOADS_PER_FRAME = 3;

    /// Lower bound for the mesh worker pool
    constexpr int MIN_MESH_WORKERS = 2;
}
