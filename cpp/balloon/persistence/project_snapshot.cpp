#include "balloon/persistence/project_snapshot.h"
#include "balloon/core/bubble.h"
#include "balloon/core/logging.h"
#include "balloon/core/util.h"
#include "balloon/persistence/snapshot_internal.h"

#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace {
struct SectionView {
    const std::uint8_t* data{nullptr};
    std::uint32_t size{0};
};
} // namespace

namespace balloon {
using namespace snapshot::detail;

namespace {

constexpr std::uint32_t kMaxBubbleType = static_cast<std::uint32_t>(BubbleType::TextOnly);
constexpr std::uint32_t kMaxFontName = static_cast<std::uint32_t>(FontName::Arial);

bool unpackKind(std::uint32_t packed, BubbleType& type, FontName& font) {
    const std::uint32_t t = packed & 0xFFu;
    const std::uint32_t f = (packed >> 8) & 0xFFu;
    if (t > kMaxBubbleType || f > kMaxFontName || (packed >> 16) != 0) return false;
    type = static_cast<BubbleType>(t);
    font = static_cast<FontName>(f);
    return true;
}

BalloonError readBubble(SectionReader& r, Bubble& b) {
    if (!r.has(bubbleRecordBytes)) return BalloonError::BufferTruncated;
    b.id = r.u32();
    if (!unpackKind(r.u32(), b.type, b.fontFamily)) return BalloonError::InvalidPayloadSize;
    b.x = r.f32();
    b.y = r.f32();
    b.width = r.f32();
    b.height = r.f32();
    b.fontSize = r.f32();
    b.zIndex = r.u32();
    b.shapeVariant = r.i32();
    const std::uint32_t partCount = r.u32();

    // Smallest possible record bounds the count before reserving.
    std::size_t minPartBytes = 0;
    if (!tryMul(partCount, dotRecordBytes, minPartBytes) || !r.has(minPartBytes)) {
        return BalloonError::BufferTruncated;
    }
    b.parts.clear();
    b.parts.reserve(partCount);
    for (std::uint32_t i = 0; i < partCount; ++i) {
        if (!r.has(2 * 4)) return BalloonError::BufferTruncated;
        const std::uint32_t id = r.u32();
        const std::uint32_t type = r.u32();
        if (type == static_cast<std::uint32_t>(PartType::SpeechTail)) {
            if (!r.has(tailRecordBytes - 2 * 4)) return BalloonError::BufferTruncated;
            SpeechTailPart tail;
            tail.baseCX = r.f32();
            tail.baseCY = r.f32();
            tail.baseWidth = r.f32();
            tail.tipX = r.f32();
            tail.tipY = r.f32();
            tail.initialLength = r.f32();
            tail.initialBaseWidth = r.f32();
            b.parts.push_back(Part::makeTail(id, tail));
        } else if (type == static_cast<std::uint32_t>(PartType::ThoughtDot)) {
            if (!r.has(dotRecordBytes - 2 * 4)) return BalloonError::BufferTruncated;
            ThoughtDotPart dot;
            dot.offsetX = r.f32();
            dot.offsetY = r.f32();
            dot.size = r.f32();
            b.parts.push_back(Part::makeDot(id, dot));
        } else {
            return BalloonError::InvalidPayloadSize;
        }
    }

    b.text = r.str();
    b.textColor = r.str();
    b.borderColor = r.str();
    if (!r.ok) return BalloonError::BufferTruncated;
    if (b.textColor.empty()) b.textColor = "#000000";
    if (b.borderColor.empty()) b.borderColor = "#000000";
    return BalloonError::Ok;
}

} // namespace

BalloonError parseProjectSnapshot(const std::uint8_t* src, std::uint32_t byteCount, ProjectSnapshot& out) {
    if (!src || byteCount < snapshotHeaderBytes) {
        return BalloonError::BufferTruncated;
    }

    const std::uint32_t magic = readU32(src, 0);
    if (magic != snapshotMagicBlnp) return BalloonError::InvalidMagic;

    const std::uint32_t version = readU32(src, 4);
    if (version != snapshotVersionBlnp) return BalloonError::UnsupportedVersion;
    out.version = version;

    const std::uint32_t sectionCount = readU32(src, 8);
    std::size_t tableBytes = 0;
    if (!tryMul(static_cast<std::size_t>(sectionCount), snapshotSectionEntryBytes, tableBytes)) {
        return BalloonError::InvalidPayloadSize;
    }
    std::size_t headerPlusTable = 0;
    if (!tryAdd(snapshotHeaderBytes, tableBytes, headerPlusTable)) {
        return BalloonError::InvalidPayloadSize;
    }
    if (byteCount < headerPlusTable) {
        return BalloonError::BufferTruncated;
    }

    std::unordered_map<std::uint32_t, SectionView> sections;
    sections.reserve(sectionCount);

    for (std::uint32_t i = 0; i < sectionCount; ++i) {
        const std::size_t base = snapshotHeaderBytes + i * snapshotSectionEntryBytes;
        const std::uint32_t tag = readU32(src, base + 0);
        const std::uint32_t offset = readU32(src, base + 4);
        const std::uint32_t size = readU32(src, base + 8);
        const std::uint32_t expectedCrc = readU32(src, base + 12);

        std::size_t end = 0;
        if (!tryAdd(static_cast<std::size_t>(offset), static_cast<std::size_t>(size), end)) {
            return BalloonError::InvalidPayloadSize;
        }
        if (offset < headerPlusTable) return BalloonError::InvalidPayloadSize;
        if (end > byteCount) return BalloonError::BufferTruncated;

        const std::uint8_t* payload = src + offset;
        if (crc32(payload, size) != expectedCrc) {
            BALLOON_LOG_WARN("snapshot section %u: crc mismatch", i);
            return BalloonError::InvalidPayloadSize;
        }

        if (sections.find(tag) == sections.end()) {
            sections.emplace(tag, SectionView{payload, size});
        }
    }

    const auto findSection = [&](std::uint32_t tag) -> const SectionView* {
        auto it = sections.find(tag);
        if (it == sections.end()) return nullptr;
        return &it->second;
    };

    const SectionView* imag = findSection(TAG_IMAG);
    const SectionView* bubl = findSection(TAG_BUBL);
    const SectionView* tool = findSection(TAG_TOOL);
    const SectionView* nidx = findSection(TAG_NIDX);
    const SectionView* canv = findSection(TAG_CANV);
    if (!imag || !bubl || !tool || !nidx) {
        BALLOON_LOG_WARN("snapshot is missing a required section");
        return BalloonError::InvalidPayloadSize;
    }

    // IMAG
    {
        SectionReader r{imag->data, imag->size};
        out.image.uri = r.str();
        out.image.width = r.f32();
        out.image.height = r.f32();
        if (!r.ok) return BalloonError::BufferTruncated;
    }

    // BUBL
    {
        SectionReader r{bubl->data, bubl->size};
        const std::uint32_t count = r.u32();
        std::size_t minBytes = 0;
        if (!tryMul(count, bubbleRecordBytes, minBytes) || !r.has(minBytes)) {
            return BalloonError::BufferTruncated;
        }
        out.bubbles.clear();
        out.bubbles.reserve(count);
        // Bubbles and parts share one id space; 0 is never allocated.
        std::unordered_set<std::uint32_t> seenIds;
        const auto claimId = [&seenIds](std::uint32_t id) {
            return id != 0 && seenIds.insert(id).second;
        };
        for (std::uint32_t i = 0; i < count; ++i) {
            Bubble b;
            const BalloonError err = readBubble(r, b);
            if (err != BalloonError::Ok) return err;
            bool idsOk = claimId(b.id);
            for (const Part& p : b.parts) idsOk = idsOk && claimId(p.id);
            if (!idsOk) {
                BALLOON_LOG_WARN("snapshot bubble %u: duplicate or zero id", b.id);
                return BalloonError::InvalidPayloadSize;
            }
            sanitizeBubble(b);
            out.bubbles.push_back(std::move(b));
        }
    }

    // TOOL
    {
        SectionReader r{tool->data, tool->size};
        ToolSettings& t = out.toolSettings;
        if (!unpackKind(r.u32(), t.type, t.fontFamily)) {
            return r.ok ? BalloonError::InvalidPayloadSize : BalloonError::BufferTruncated;
        }
        t.fontSize = r.f32();
        t.tailLength = r.f32();
        t.tailBaseWidth = r.f32();
        t.dotCount = r.u32();
        t.dotSize = r.f32();
        t.textColor = r.str();
        t.borderColor = r.str();
        if (!r.ok) return BalloonError::BufferTruncated;
        sanitizeToolSettings(t);
    }

    // NIDX
    {
        if (nidx->size < nidxSectionBytes) return BalloonError::BufferTruncated;
        out.nextZIndex = readU32(nidx->data, 0);
        out.nextId = readU32(nidx->data, 4);
    }

    // CANV
    if (canv) {
        if (canv->size < canvSectionBytes) return BalloonError::BufferTruncated;
        out.canvas.width = readF32(canv->data, 0);
        out.canvas.height = readF32(canv->data, 4);
        out.hasCanvas = true;
    } else {
        out.canvas.width = out.image.width * 0.5f;
        out.canvas.height = out.image.height * 0.5f;
        out.hasCanvas = false;
    }

    return BalloonError::Ok;
}

} // namespace balloon
