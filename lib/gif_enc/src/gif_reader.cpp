#include "gif_reader.h"

#include <cstring>
#include <utility>
#include <string>
#include <vector>

#include "gif_exception.h"
#include "gif_format.h"
#include "gif_lzw.h"
using std::vector, std::span, std::string;

namespace {
class ByteCursor {
  public:
    explicit ByteCursor(const span<const uint8_t>& data) : m_data(data) {}

    uint8_t
    u8() {
        need(1);
        return m_data[m_pos++];
    }

    uint32_t
    u16() {
        need(2);
        const uint32_t ret = m_data[m_pos] | (static_cast<uint32_t>(m_data[m_pos + 1]) << 8);
        m_pos += 2;
        return ret;
    }

    span<const uint8_t>
    bytes(const size_t count) {
        need(count);
        const auto ret = m_data.subspan(m_pos, count);
        m_pos += count;
        return ret;
    }

    // concatenated payload of a sub-block chain, terminator consumed
    vector<uint8_t>
    subBlocks() {
        vector<uint8_t> ret;
        for (uint8_t size = u8(); size != 0; size = u8()) {
            const auto block = bytes(size);
            ret.insert(ret.end(), block.begin(), block.end());
        }
        return ret;
    }

  private:
    void
    need(const size_t count) const {
        if (m_data.size() - m_pos < count) {
            throw GIFEnc::GIFParseException("unexpected end of data at offset " + std::to_string(m_pos));
        }
    }

    span<const uint8_t> m_data;
    size_t m_pos = 0;
};

vector<PixelBGRA>
readColorTable(ByteCursor& cursor, const uint32_t sizeBits) {
    const auto raw = cursor.bytes((1ull << (sizeBits + 1)) * 3);
    vector<PixelBGRA> ret;
    ret.reserve(raw.size() / 3);
    for (size_t i = 0; i < raw.size(); i += 3) {
        ret.push_back(makeRGBA(raw[i], raw[i + 1], raw[i + 2]));
    }
    return ret;
}
}  // namespace

GIFEnc::GIFInfo
GIFEnc::readDocument(const span<const uint8_t>& data) {
    ByteCursor cursor(data);
    GIFInfo info;

    const auto signature = cursor.bytes(6);
    if (std::memcmp(signature.data(), "GIF89a", 6) != 0 && std::memcmp(signature.data(), "GIF87a", 6) != 0) {
        throw GIFParseException("bad signature");
    }
    info.width                 = cursor.u16();
    info.height                = cursor.u16();
    const uint8_t screenPacked = cursor.u8();
    info.backgroundIndex       = cursor.u8();
    cursor.u8();  // pixel aspect ratio
    if (!(screenPacked & 0x80)) {
        throw GIFParseException("no global color table");
    }
    info.globalColorTable = readColorTable(cursor, screenPacked & 0x07);

    GIFFrameInfo pending;
    while (true) {
        const uint8_t introducer = cursor.u8();
        if (introducer == GIF_END) {
            break;
        }
        if (introducer == 0x21) {
            const uint8_t label = cursor.u8();
            if (label == 0xF9) {
                const auto block = cursor.subBlocks();
                if (block.size() != 4) {
                    throw GIFParseException("bad graphic control extension");
                }
                pending.disposalMethod   = (block[0] >> 2) & 0x07;
                pending.hasTransparency  = block[0] & 0x01;
                pending.delay            = block[1] | (static_cast<uint32_t>(block[2]) << 8);
                pending.transparentIndex = block[3];
            } else if (label == 0xFF) {
                const uint8_t size = cursor.u8();
                const auto ident   = cursor.bytes(size);
                const auto payload = cursor.subBlocks();
                if (size == 11 && std::memcmp(ident.data(), "NETSCAPE2.0", 11) == 0) {
                    if (payload.size() != 3 || payload[0] != 0x01) {
                        throw GIFParseException("bad loop extension");
                    }
                    info.hasLoopExtension = true;
                    info.loops            = payload[1] | (static_cast<uint32_t>(payload[2]) << 8);
                }
            } else {
                cursor.subBlocks();
            }
        } else if (introducer == 0x2C) {
            cursor.u16();  // left
            cursor.u16();  // top
            pending.width             = cursor.u16();
            pending.height            = cursor.u16();
            const uint8_t imagePacked = cursor.u8();
            if (imagePacked & 0x80) {
                throw GIFParseException("local color tables are not supported");
            }
            if (imagePacked & 0x40) {
                throw GIFParseException("interlaced images are not supported");
            }
            const uint8_t minCodeLength = cursor.u8();
            const auto compressed       = cursor.subBlocks();
            pending.indices             = LZW::decompress(compressed, minCodeLength);
            if (pending.indices.size() != static_cast<size_t>(pending.width) * pending.height) {
                throw GIFParseException("image data of frame " + std::to_string(info.frames.size()) +
                                        " does not match its size");
            }
            info.frames.push_back(std::move(pending));
            pending = GIFFrameInfo{};
        } else {
            throw GIFParseException("unknown block " + std::to_string(introducer));
        }
    }
    return info;
}
