#include "balloon/persistence/project_snapshot.h"
#include "balloon/core/util.h"
#include "balloon/persistence/snapshot_internal.h"

#include <algorithm>
#include <cstring>
#include <utility>

namespace balloon {
using namespace snapshot::detail;

namespace {

std::uint32_t packKind(BubbleType type, FontName font) {
    return static_cast<std::uint32_t>(type) | (static_cast<std::uint32_t>(font) << 8);
}

void writeBubble(SectionWriter& w, const Bubble& b) {
    w.u32(b.id);
    w.u32(packKind(b.type, b.fontFamily));
    w.f32(b.x);
    w.f32(b.y);
    w.f32(b.width);
    w.f32(b.height);
    w.f32(b.fontSize);
    w.u32(b.zIndex);
    w.i32(b.shapeVariant);
    w.u32(static_cast<std::uint32_t>(b.parts.size()));

    for (const Part& p : b.parts) {
        w.u32(p.id);
        w.u32(static_cast<std::uint32_t>(p.type()));
        if (p.isTail()) {
            w.f32(p.tail().baseCX);
            w.f32(p.tail().baseCY);
            w.f32(p.tail().baseWidth);
            w.f32(p.tail().tipX);
            w.f32(p.tail().tipY);
            w.f32(p.tail().initialLength);
            w.f32(p.tail().initialBaseWidth);
        } else {
            w.f32(p.dot().offsetX);
            w.f32(p.dot().offsetY);
            w.f32(p.dot().size);
        }
    }

    w.str(b.text);
    w.str(b.textColor);
    w.str(b.borderColor);
}

} // namespace

std::vector<std::uint8_t> buildProjectSnapshotBytes(const ProjectSnapshot& data) {
    struct SectionBytes {
        std::uint32_t tag;
        std::vector<std::uint8_t> bytes;
    };

    std::vector<SectionBytes> sections;
    sections.reserve(5);

    // IMAG
    {
        SectionBytes sec{TAG_IMAG, {}};
        SectionWriter w{sec.bytes};
        w.str(data.image.uri);
        w.f32(data.image.width);
        w.f32(data.image.height);
        sections.push_back(std::move(sec));
    }

    // BUBL
    {
        SectionBytes sec{TAG_BUBL, {}};
        SectionWriter w{sec.bytes};

        std::vector<std::size_t> order(data.bubbles.size());
        for (std::size_t i = 0; i < order.size(); ++i) order[i] = i;
        std::sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
            return data.bubbles[a].id < data.bubbles[b].id;
        });

        w.u32(static_cast<std::uint32_t>(order.size()));
        for (std::size_t idx : order) {
            writeBubble(w, data.bubbles[idx]);
        }
        sections.push_back(std::move(sec));
    }

    // TOOL
    {
        SectionBytes sec{TAG_TOOL, {}};
        SectionWriter w{sec.bytes};
        const ToolSettings& t = data.toolSettings;
        w.u32(packKind(t.type, t.fontFamily));
        w.f32(t.fontSize);
        w.f32(t.tailLength);
        w.f32(t.tailBaseWidth);
        w.u32(t.dotCount);
        w.f32(t.dotSize);
        w.str(t.textColor);
        w.str(t.borderColor);
        sections.push_back(std::move(sec));
    }

    // NIDX
    {
        SectionBytes sec{TAG_NIDX, {}};
        SectionWriter w{sec.bytes};
        w.u32(data.nextZIndex);
        w.u32(data.nextId);
        sections.push_back(std::move(sec));
    }

    // CANV
    {
        SectionBytes sec{TAG_CANV, {}};
        SectionWriter w{sec.bytes};
        w.f32(data.canvas.width);
        w.f32(data.canvas.height);
        sections.push_back(std::move(sec));
    }

    const std::size_t headerBytes = snapshotHeaderBytes;
    const std::size_t tableBytes = sections.size() * snapshotSectionEntryBytes;
    std::size_t payloadBytes = 0;
    for (const auto& sec : sections) payloadBytes += sec.bytes.size();
    const std::size_t totalBytes = headerBytes + tableBytes + payloadBytes;

    std::vector<std::uint8_t> out(totalBytes);
    writeU32LE(out.data(), 0, snapshotMagicBlnp);
    writeU32LE(out.data(), 4, snapshotVersionBlnp);
    writeU32LE(out.data(), 8, static_cast<std::uint32_t>(sections.size()));
    writeU32LE(out.data(), 12, 0);

    std::size_t tableOffset = headerBytes;
    std::size_t dataOffset = headerBytes + tableBytes;
    for (const auto& sec : sections) {
        writeU32LE(out.data(), tableOffset + 0, sec.tag);
        writeU32LE(out.data(), tableOffset + 4, static_cast<std::uint32_t>(dataOffset));
        writeU32LE(out.data(), tableOffset + 8, static_cast<std::uint32_t>(sec.bytes.size()));
        writeU32LE(out.data(), tableOffset + 12, crc32(sec.bytes.data(), sec.bytes.size()));
        if (!sec.bytes.empty()) {
            std::memcpy(out.data() + dataOffset, sec.bytes.data(), sec.bytes.size());
        }
        tableOffset += snapshotSectionEntryBytes;
        dataOffset += sec.bytes.size();
    }
    return out;
}

} // namespace balloon
