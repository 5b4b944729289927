#include "ByteBuffer.hpp"

namespace lanwatch::common
{
    void ByteBuffer::Append(const uint8_t *data, size_t size)
    {
        m_buffer.append(reinterpret_cast<const char *>(data), size);
    }

    size_t ByteBuffer::HeadLength() const
    {
        size_t pos = m_buffer.find("\r\n\r\n");
        if (pos == std::string::npos)
            return 0;
        return pos + 4;
    }

    void ByteBuffer::Consume(size_t bytes)
    {
        if (bytes >= m_buffer.size())
        {
            m_buffer.clear();
            return;
        }
        m_buffer.erase(0, bytes);
    }
}
