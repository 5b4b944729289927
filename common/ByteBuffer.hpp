#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace lanwatch::common
{
    // Accumulates bytes read from a socket until a full HTTP request head
    // ("...\r\n\r\n") is available.
    class ByteBuffer
    {
    private:
        std::string m_buffer;

    public:
        ByteBuffer() = default;
        void Append(const uint8_t *data, size_t size);

        // Length of the head including the blank line, or 0 if incomplete.
        size_t HeadLength() const;
        bool HasCompleteHead() const { return HeadLength() != 0; }

        std::string_view View() const { return m_buffer; }
        void Consume(size_t bytes);
        void Clear() { m_buffer.clear(); }
        size_t Size() const { return m_buffer.size(); }
    };
}
