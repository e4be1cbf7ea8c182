#include <exception>
#include <vector>

#include "gif_lzw.h"
using std::vector, std::span;

class LZWDecompressImpl {
    static constexpr uint16_t NONE_CODE = 0xFFFFu;

    struct LZWNode {                // string: prefix + final byte
        uint32_t len  = 0;          // length of string
        uint16_t prev = NONE_CODE;  // code of prefix
        uint8_t data  = 0;          // final byte
    };

  public:
    LZWDecompressImpl(vector<uint8_t>& out, uint32_t minCodeSize);

    // false on malformed input
    bool
    process(const span<const uint8_t>& data);

    [[nodiscard]] bool
    finished() const {
        return m_finished;
    }

  private:
    void
    _reset();
    bool
    _insertDict(uint16_t prev, uint8_t data);
    uint8_t
    _writeCode(uint16_t code);

    vector<uint8_t>& m_out;
    vector<LZWNode> m_dict;
    uint32_t m_dictSize = 0;

    uint32_t m_buffer = 0, m_bufferSize = 0;

    const uint32_t m_minCodeSize;
    uint32_t m_currCodeSize = 0;
    const uint16_t m_clearCode, m_endCode;
    uint16_t m_prevCode = NONE_CODE;

    bool m_finished = false;
};

LZWDecompressImpl::LZWDecompressImpl(vector<uint8_t>& out, const uint32_t minCodeSize)
    : m_out(out),
      m_dict(GIFEnc::LZW::MAX_DICT_SIZE),
      m_minCodeSize(minCodeSize),
      m_clearCode(static_cast<uint16_t>(1u << minCodeSize)),
      m_endCode(static_cast<uint16_t>(m_clearCode + 1)) {
    for (uint16_t i = 0; i < m_clearCode; i++) {
        m_dict[i].data = static_cast<uint8_t>(i);
        m_dict[i].len  = 1;
    }
    _reset();
}

void
LZWDecompressImpl::_reset() {
    m_currCodeSize = m_minCodeSize + 1;
    m_dictSize     = m_endCode + 1u;
    m_prevCode     = NONE_CODE;
}

bool
LZWDecompressImpl::process(const span<const uint8_t>& data) {
    size_t pos = 0;
    while (!m_finished) {
        while (m_bufferSize < m_currCodeSize) {
            if (pos >= data.size()) {
                return true;
            }
            m_buffer |= static_cast<uint32_t>(data[pos++]) << m_bufferSize;
            m_bufferSize += 8;
        }
        const auto code = static_cast<uint16_t>(m_buffer & ((1u << m_currCodeSize) - 1u));
        m_buffer >>= m_currCodeSize;
        m_bufferSize -= m_currCodeSize;

        if (code == m_clearCode) {
            _reset();
        } else if (code == m_endCode) {
            m_finished = true;
        } else if (m_prevCode == NONE_CODE) {
            if (code >= m_dictSize) {
                return false;
            }
            _writeCode(code);
            m_prevCode = code;
        } else if (code < m_dictSize) {
            const uint8_t first = _writeCode(code);
            if (!_insertDict(m_prevCode, first)) {
                return false;
            }
            m_prevCode = code;
        } else if (code == m_dictSize) {
            // string not yet in the table: prefix + first byte of prefix
            const uint8_t first = _writeCode(m_prevCode);
            m_out.push_back(first);
            if (!_insertDict(m_prevCode, first)) {
                return false;
            }
            m_prevCode = code;
        } else {
            return false;
        }
    }
    return true;
}

bool
LZWDecompressImpl::_insertDict(const uint16_t prev, const uint8_t data) {
    if (m_dictSize >= GIFEnc::LZW::MAX_DICT_SIZE) {
        // full table without a clear code: the encoder keeps using fixed 12-bit codes
        return true;
    }
    m_dict[m_dictSize].prev = prev;
    m_dict[m_dictSize].data = data;
    m_dict[m_dictSize].len  = m_dict[prev].len + 1;
    m_dictSize++;
    if (m_currCodeSize < GIFEnc::LZW::MAX_CODE_SIZE && m_dictSize >= 1u << m_currCodeSize) {
        m_currCodeSize++;
    }
    return true;
}

uint8_t
LZWDecompressImpl::_writeCode(const uint16_t code) {
    const size_t start = m_out.size();
    m_out.resize(start + m_dict[code].len);
    uint16_t curr = code;
    for (size_t i = m_out.size(); i > start; --i) {
        m_out[i - 1] = m_dict[curr].data;
        curr         = m_dict[curr].prev;
    }
    return m_out[start];
}

vector<uint8_t>
GIFEnc::LZW::decompress(const span<const uint8_t>& data, const uint32_t minCodeSize) noexcept {
    if (minCodeSize < 2 || minCodeSize > 8) {
        return {};
    }
    try {
        vector<uint8_t> out;
        LZWDecompressImpl decoder(out, minCodeSize);
        if (!decoder.process(data) || !decoder.finished()) {
            return {};
        }
        return out;
    } catch (const std::exception&) {
        return {};
    }
}
