#pragma once

#include <cstdint>
#include <map>
#include <span>
#include <vector>

#include "TriangleMesh.hpp"

namespace plaster
{
    /// Identifies one submitted batch. 0 is never handed out.
    using BatchHandle = uint64_t;

    /**
     * @brief CPU-side vertices + indices of one batch, before placement.
     *
     * Indices are batch-local: append() offsets each mesh's indices by the
     * number of vertices already in the batch.
     */
    struct PackedBatch
    {
        std::vector<Vertex>   vertices;
        std::vector<uint32_t> indices;

        void append(const TriangleMesh& mesh);

        void clear() noexcept
        {
            vertices.clear();
            indices.clear();
        }

        [[nodiscard]] bool empty() const noexcept
        {
            return indices.empty();
        }
    };

    /// One indexed draw; maps 1:1 to vkCmdDrawIndexed.
    struct DrawCall
    {
        uint32_t indexCount = 0;
        uint32_t firstIndex = 0;
        int32_t  baseVertex = 0;

        bool operator==(const DrawCall&) const = default;
    };

    /// Element range (not bytes) inside the packed vertex or index array.
    struct ElementRange
    {
        uint32_t first = 0;
        uint32_t count = 0;

        bool operator==(const ElementRange&) const = default;
    };

    /**
     * @brief Everything a backend needs to bring the GPU copy up to date.
     *
     * Spans point into the GeometryBuffer's packed arrays and stay valid until
     * the next mutation of the buffer.
     */
    struct GeometryUploadPlan
    {
        std::span<const Vertex>   vertices;
        std::span<const uint32_t> indices;

        std::vector<ElementRange> vertexRanges;
        std::vector<ElementRange> indexRanges;

        [[nodiscard]] uint64_t requiredVertexBytes() const noexcept
        {
            return uint64_t(vertices.size()) * sizeof(Vertex);
        }

        [[nodiscard]] uint64_t requiredIndexBytes() const noexcept
        {
            return uint64_t(indices.size()) * sizeof(uint32_t);
        }

        [[nodiscard]] bool empty() const noexcept
        {
            return vertexRanges.empty() && indexRanges.empty();
        }
    };

    namespace geom
    {
        /**
         * @brief Capacity after growth: unchanged when required fits, otherwise
         * at least double the current capacity (or exactly required if larger).
         */
        [[nodiscard]] uint64_t grownCapacity(uint64_t current, uint64_t required) noexcept;

    } // namespace geom

    /**
     * @brief Contiguous packing of batches into one vertex array and one index array.
     *
     * Batches keep submission order. Each batch occupies a contiguous range in
     * both arrays and is drawn with a single indexed draw call. When a batch
     * changes size (or is removed), later batches are relocated and marked
     * dirty. Only dirty batches appear in the upload plan.
     *
     * Vulkan-free: the GPU copy lives in the FrameBackend.
     */
    class GeometryBuffer
    {
    public:
        struct BatchInfo
        {
            uint32_t firstVertex = 0;
            uint32_t vertexCount = 0;
            uint32_t firstIndex  = 0;
            uint32_t indexCount  = 0;
            bool     dirty       = true;
        };

        GeometryBuffer() = default;

        BatchHandle addBatch(PackedBatch&& batch);
        bool        replaceBatch(BatchHandle handle, PackedBatch&& batch);
        bool        removeBatch(BatchHandle handle);
        void        clear();

        [[nodiscard]] bool             contains(BatchHandle handle) const noexcept;
        [[nodiscard]] const BatchInfo* info(BatchHandle handle) const noexcept;

        /// One draw per non-empty batch, in submission order.
        [[nodiscard]] std::vector<DrawCall> drawCalls() const;

        [[nodiscard]] bool               needsUpload() const noexcept;
        [[nodiscard]] GeometryUploadPlan uploadPlan() const;
        void                             markUploaded() noexcept;

        /// Put every batch back into the next plan, e.g. after the GPU copy was lost.
        void markAllDirty() noexcept;

        [[nodiscard]] std::span<const Vertex> vertices() const noexcept
        {
            return m_vertices;
        }

        [[nodiscard]] std::span<const uint32_t> indices() const noexcept
        {
            return m_indices;
        }

        [[nodiscard]] std::size_t batchCount() const noexcept
        {
            return m_slots.size();
        }

    private:
        struct Slot
        {
            PackedBatch data;
            BatchInfo   info;
        };

        /// Reassign offsets, rebuild the packed arrays, dirty anything that moved.
        void relayout();

    private:
        std::map<BatchHandle, Slot> m_slots; // handles increase, so map order = submission order
        BatchHandle                 m_nextHandle = 1;

        std::vector<Vertex>   m_vertices;
        std::vector<uint32_t> m_indices;
    };

} // namespace plaster
