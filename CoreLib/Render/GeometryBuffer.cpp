#include "GeometryBuffer.hpp"

#include <algorithm>

namespace plaster
{
    void PackedBatch::append(const TriangleMesh& mesh)
    {
        const uint32_t base = static_cast<uint32_t>(vertices.size());

        vertices.insert(vertices.end(), mesh.vertices.begin(), mesh.vertices.end());

        indices.reserve(indices.size() + mesh.indices.size());
        for (uint32_t i : mesh.indices)
            indices.push_back(base + i);
    }

    uint64_t geom::grownCapacity(uint64_t current, uint64_t required) noexcept
    {
        if (required <= current)
            return current;
        return std::max(current * 2, required);
    }

    // --------------------------------------------------------
    // Batch management
    // --------------------------------------------------------

    BatchHandle GeometryBuffer::addBatch(PackedBatch&& batch)
    {
        const BatchHandle handle = m_nextHandle++;

        Slot slot;
        slot.data       = std::move(batch);
        slot.info.dirty = true;
        m_slots.emplace(handle, std::move(slot));

        relayout();
        return handle;
    }

    bool GeometryBuffer::replaceBatch(BatchHandle handle, PackedBatch&& batch)
    {
        auto it = m_slots.find(handle);
        if (it == m_slots.end())
            return false;

        it->second.data       = std::move(batch);
        it->second.info.dirty = true;

        relayout();
        return true;
    }

    bool GeometryBuffer::removeBatch(BatchHandle handle)
    {
        if (m_slots.erase(handle) == 0)
            return false;

        relayout();
        return true;
    }

    void GeometryBuffer::clear()
    {
        m_slots.clear();
        m_vertices.clear();
        m_indices.clear();
    }

    bool GeometryBuffer::contains(BatchHandle handle) const noexcept
    {
        return m_slots.find(handle) != m_slots.end();
    }

    const GeometryBuffer::BatchInfo* GeometryBuffer::info(BatchHandle handle) const noexcept
    {
        auto it = m_slots.find(handle);
        if (it == m_slots.end())
            return nullptr;
        return &it->second.info;
    }

    // --------------------------------------------------------
    // Layout
    // --------------------------------------------------------

    void GeometryBuffer::relayout()
    {
        uint32_t vcursor = 0;
        uint32_t icursor = 0;

        for (auto& [handle, slot] : m_slots)
        {
            BatchInfo& bi = slot.info;

            const uint32_t vcount = static_cast<uint32_t>(slot.data.vertices.size());
            const uint32_t icount = static_cast<uint32_t>(slot.data.indices.size());

            if (bi.firstVertex != vcursor || bi.firstIndex != icursor)
                bi.dirty = true;

            bi.firstVertex = vcursor;
            bi.vertexCount = vcount;
            bi.firstIndex  = icursor;
            bi.indexCount  = icount;

            vcursor += vcount;
            icursor += icount;
        }

        m_vertices.resize(vcursor);
        m_indices.resize(icursor);

        for (const auto& [handle, slot] : m_slots)
        {
            if (!slot.info.dirty)
                continue;

            std::copy(slot.data.vertices.begin(), slot.data.vertices.end(), m_vertices.begin() + slot.info.firstVertex);
            std::copy(slot.data.indices.begin(), slot.data.indices.end(), m_indices.begin() + slot.info.firstIndex);
        }
    }

    std::vector<DrawCall> GeometryBuffer::drawCalls() const
    {
        std::vector<DrawCall> calls;
        calls.reserve(m_slots.size());

        for (const auto& [handle, slot] : m_slots)
        {
            if (slot.info.indexCount == 0)
                continue;

            calls.push_back(DrawCall{slot.info.indexCount,
                                     slot.info.firstIndex,
                                     static_cast<int32_t>(slot.info.firstVertex)});
        }
        return calls;
    }

    // --------------------------------------------------------
    // Upload bookkeeping
    // --------------------------------------------------------

    bool GeometryBuffer::needsUpload() const noexcept
    {
        for (const auto& [handle, slot] : m_slots)
        {
            if (slot.info.dirty && (slot.info.vertexCount > 0 || slot.info.indexCount > 0))
                return true;
        }
        return false;
    }

    GeometryUploadPlan GeometryBuffer::uploadPlan() const
    {
        GeometryUploadPlan plan;
        plan.vertices = m_vertices;
        plan.indices  = m_indices;

        // Neighbouring dirty batches collapse into one range.
        auto push = [](std::vector<ElementRange>& ranges, uint32_t first, uint32_t count) {
            if (count == 0)
                return;
            if (!ranges.empty() && ranges.back().first + ranges.back().count == first)
            {
                ranges.back().count += count;
                return;
            }
            ranges.push_back(ElementRange{first, count});
        };

        for (const auto& [handle, slot] : m_slots)
        {
            if (!slot.info.dirty)
                continue;

            push(plan.vertexRanges, slot.info.firstVertex, slot.info.vertexCount);
            push(plan.indexRanges, slot.info.firstIndex, slot.info.indexCount);
        }

        return plan;
    }

    void GeometryBuffer::markUploaded() noexcept
    {
        for (auto& [handle, slot] : m_slots)
            slot.info.dirty = false;
    }

    void GeometryBuffer::markAllDirty() noexcept
    {
        for (auto& [handle, slot] : m_slots)
            slot.info.dirty = true;
    }

} // namespace plaster
