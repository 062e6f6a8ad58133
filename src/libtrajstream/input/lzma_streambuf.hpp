#ifndef __LZMA_STREAMBUF_HPP__
#define __LZMA_STREAMBUF_HPP__

#include "../pch.hpp"

#if HAVE_LZMA

#include <lzma.h>

// Decompresses an .xz stream (concatenated streams included) while it is read.
// Damaged or truncated input raises runtime_error from underflow().
class LZMAStreamBuf : public std::streambuf
{
public:
    explicit LZMAStreamBuf(std::istream* pIn)
        : m_pIn(pIn)
        , m_lzmaStream(LZMA_STREAM_INIT)
        , m_aInBuffer(CHUNK_SIZE)
        , m_aOutBuffer(CHUNK_SIZE)
    {
        const lzma_ret ret = lzma_stream_decoder(&m_lzmaStream, std::numeric_limits<uint64_t>::max(), LZMA_CONCATENATED);
        if(ret != LZMA_OK)
            throw std::runtime_error("LZMA decoder could not be opened (error " + std::to_string(ret) + ")");

        m_lzmaStream.avail_in = 0;
        setg(m_aOutBuffer.data(), m_aOutBuffer.data(), m_aOutBuffer.data());
    }

    ~LZMAStreamBuf() override
    {
        lzma_end(&m_lzmaStream);
    }

    LZMAStreamBuf(const LZMAStreamBuf&) = delete;
    LZMAStreamBuf& operator=(const LZMAStreamBuf&) = delete;

    int underflow() override final
    {
        if(gptr() < egptr())
            return traits_type::to_int_type(*gptr());

        if(m_bFinished)
            return traits_type::eof();

        while(true)
        {
            if(m_lzmaStream.avail_in == 0 && !m_pIn->eof())
            {
                m_pIn->read(m_aInBuffer.data(), m_aInBuffer.size());
                if(m_pIn->bad())
                    throw std::runtime_error("LZMAStreamBuf: Error while reading the provided input stream!");

                m_lzmaStream.next_in = reinterpret_cast<const uint8_t*>(m_aInBuffer.data());
                m_lzmaStream.avail_in = static_cast<size_t>(m_pIn->gcount());
            }

            m_lzmaStream.next_out = reinterpret_cast<uint8_t*>(m_aOutBuffer.data());
            m_lzmaStream.avail_out = m_aOutBuffer.size();

            const lzma_action action = m_pIn->eof() ? LZMA_FINISH : LZMA_RUN;
            const lzma_ret ret = lzma_code(&m_lzmaStream, action);

            if(ret == LZMA_STREAM_END)
                m_bFinished = true;
            else if(ret != LZMA_OK)
                throw std::runtime_error("LZMA stream is damaged or truncated (error " + std::to_string(ret) + ")");

            // avail_out is the space left, not the amount written
            const size_t nProduced = m_aOutBuffer.size() - m_lzmaStream.avail_out;
            if(nProduced > 0)
            {
                setg(m_aOutBuffer.data(), m_aOutBuffer.data(), m_aOutBuffer.data() + nProduced);
                return traits_type::to_int_type(*gptr());
            }

            if(m_bFinished)
                return traits_type::eof();

            // the decoder needs more input, but there is none
            if(action == LZMA_FINISH && m_lzmaStream.avail_in == 0)
                throw std::runtime_error("LZMA stream is truncated");
        }
    }

private:
    static constexpr size_t CHUNK_SIZE = 256 * 1024;

    std::istream* m_pIn;
    lzma_stream m_lzmaStream;
    std::vector<char> m_aInBuffer;
    std::vector<char> m_aOutBuffer;
    bool m_bFinished = false;
};

#endif // HAVE_LZMA

#endif
