#include "Bytes.hpp"

#include <llvm/Support/FormatVariadic.h>

bool jmf::ByteReader::reserve(std::size_t length)
{
    if (m_failed)
    {
        return false;
    }
    if (length <= remaining())
    {
        return true;
    }
    m_failed = true;
    m_failedOffset = m_offset;
    m_failedLength = length;
    return false;
}

llvm::ArrayRef<char> jmf::ByteReader::consumeBytes(std::size_t length)
{
    if (!reserve(length))
    {
        return {};
    }
    llvm::ArrayRef<char> result = m_bytes.slice(m_offset, length);
    m_offset += length;
    return result;
}

llvm::Error jmf::ByteReader::takeError() const
{
    if (!m_failed)
    {
        return llvm::Error::success();
    }
    return llvm::make_error<ClassFileError>(
        ClassFileError::UnexpectedEof,
        llvm::formatv("needed {0} bytes at offset {1} but only {2} remain", m_failedLength, m_failedOffset,
                      m_bytes.size() - m_failedOffset)
            .str());
}
