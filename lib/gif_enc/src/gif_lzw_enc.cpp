#include <algorithm>
#include <array>
#include <exception>
#include <utility>
#include <vector>

#include "gif_lzw.h"
using std::vector, std::span;

class LZWCompressImpl {
    static constexpr uint32_t MAX_SYMBOLS = 256;
    // index: next symbol; value: code + 1 of the extended string, 0 if absent
    using LZWNode = std::array<uint16_t, MAX_SYMBOLS>;

  public:
    LZWCompressImpl(GIFEnc::LZW::WriteCallback write,
                    GIFEnc::LZW::ErrorCallback onError,
                    uint32_t minCodeSize,
                    size_t writeChunkSize);

    void
    process(const span<const uint8_t>& input);

    size_t
    finish();

    [[nodiscard]] bool
    isFinished() const {
        return m_isFinished;
    }

  private:
    void
    _pushCode(uint16_t code);
    void
    _flush();
    void
    _reset();
    void
    _onError();

    GIFEnc::LZW::WriteCallback m_write;
    GIFEnc::LZW::ErrorCallback m_onError;
    const size_t m_writeChunkSize;
    vector<uint8_t> m_result;
    size_t m_resultTotalSize = 0;

    const uint32_t m_minCodeSize;
    const uint16_t m_clearCode, m_endCode;
    uint16_t m_maxCode = 0, m_nextCode = 0;
    uint32_t m_codeLength = 0;
    uint32_t m_buffer = 0, m_bufferSize = 0;  // bit buffer

    vector<LZWNode> m_dict;  // index: code + 1; 0 is the virtual root
    uint16_t m_currNode = 0;

    bool m_isFinished = false;
};

LZWCompressImpl::LZWCompressImpl(GIFEnc::LZW::WriteCallback write,
                                 GIFEnc::LZW::ErrorCallback onError,
                                 const uint32_t minCodeSize,
                                 const size_t writeChunkSize)
    : m_write(std::move(write)),
      m_onError(std::move(onError)),
      m_writeChunkSize(writeChunkSize),
      m_minCodeSize(minCodeSize),
      m_clearCode(static_cast<uint16_t>(1u << minCodeSize)),
      m_endCode(static_cast<uint16_t>(m_clearCode + 1)),
      m_dict(GIFEnc::LZW::MAX_DICT_SIZE + 1) {
    m_result.reserve(writeChunkSize);
    _reset();
    _pushCode(m_clearCode);
}

void
LZWCompressImpl::process(const span<const uint8_t>& input) {
    if (m_isFinished) {
        return;
    }
    for (size_t i = 0; i < input.size(); ++i) {
        const uint8_t data = input[i];
        if (data >= m_clearCode) {
            _onError();
            return;
        }
        if (!m_currNode) {
            m_currNode = data + 1;
            continue;
        }
        if (const uint16_t next = m_dict[m_currNode][data]) {
            m_currNode = next;
            continue;
        }
        _pushCode(m_currNode - 1);
        if (m_nextCode < GIFEnc::LZW::MAX_DICT_SIZE) {
            m_dict[m_currNode][data] = m_nextCode + 1;
            if (m_nextCode >= m_maxCode) {
                m_maxCode <<= 1;
                ++m_codeLength;
            }
            ++m_nextCode;
            m_currNode = data + 1;
        } else {
            // table full: emit a clear code and start over with this symbol
            _pushCode(m_clearCode);
            _reset();
            m_currNode = data + 1;
        }
    }
}

size_t
LZWCompressImpl::finish() {
    if (m_isFinished) return 0;
    m_isFinished = true;

    if (m_currNode) {
        _pushCode(m_currNode - 1);
    }
    _pushCode(m_endCode);
    if (m_bufferSize) {
        m_result.push_back(static_cast<uint8_t>(m_buffer));
        m_buffer = m_bufferSize = 0;
    }
    _flush();
    return m_resultTotalSize;
}

void
LZWCompressImpl::_reset() {
    std::fill(m_dict.begin(), m_dict.end(), LZWNode{});
    m_currNode   = 0;
    m_nextCode   = m_endCode + 1;
    m_maxCode    = static_cast<uint16_t>(1u << (m_minCodeSize + 1));
    m_codeLength = m_minCodeSize + 1;
}

void
LZWCompressImpl::_pushCode(const uint16_t code) {
    m_buffer |= static_cast<uint32_t>(code) << m_bufferSize;
    m_bufferSize += m_codeLength;
    while (m_bufferSize >= 8) {
        m_result.push_back(static_cast<uint8_t>(m_buffer & 0xFF));
        m_buffer >>= 8;
        m_bufferSize -= 8;
        if (m_result.size() >= m_writeChunkSize) {
            _flush();
        }
    }
}

void
LZWCompressImpl::_flush() {
    if (m_result.empty()) return;
    m_write(span<const uint8_t>(m_result.data(), m_result.size()));
    m_resultTotalSize += m_result.size();
    m_result.clear();
}

void
LZWCompressImpl::_onError() {
    m_isFinished      = true;
    m_resultTotalSize = 0;
    m_result.clear();
    if (m_onError) {
        m_onError();
    }
}

size_t
GIFEnc::LZW::compressStream(const ReadCallback& read,
                            const WriteCallback& write,
                            const ErrorCallback& onError,
                            const uint32_t minCodeSize,
                            const size_t writeChunkSize) noexcept {
    if (minCodeSize < 2 || minCodeSize > 8 || writeChunkSize == 0) {
        return 0;
    }
    if (read == nullptr || write == nullptr) {
        return 0;
    }
    try {
        LZWCompressImpl encoder(write, onError, minCodeSize, writeChunkSize);
        while (!encoder.isFinished()) {
            const auto data = read();
            if (data.empty()) break;
            encoder.process(data);
        }
        return encoder.finish();
    } catch (const std::exception&) {
        // allocation failure or a throwing write callback
        if (onError) onError();
        return 0;
    }
}

vector<uint8_t>
GIFEnc::LZW::compress(const span<const uint8_t>& data, const uint32_t minCodeSize) noexcept {
    vector<uint8_t> out;
    bool isFirst = true;
    compressStream(
        [&data, &isFirst]() -> span<const uint8_t> {
            if (!isFirst) return {};
            isFirst = false;
            return data;
        },
        [&out](const span<const uint8_t>& chunk) { out.insert(out.end(), chunk.begin(), chunk.end()); },
        [&out]() { out.clear(); },
        minCodeSize,
        WRITE_DEFAULT_CHUNK_SIZE);
    return out;
}
