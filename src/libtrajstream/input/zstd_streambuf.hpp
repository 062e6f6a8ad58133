#ifndef __ZSTD_STREAMBUF_HPP__
#define __ZSTD_STREAMBUF_HPP__

#include "../pch.hpp"

#if HAVE_ZSTD 

#include <zstd.h>

// Decompresses a .zst stream while it is read.
class ZStdStreamBuf : public std::streambuf
{
public:
    explicit ZStdStreamBuf(std::istream* pIn)
        : m_pIn(pIn)
        , m_pDctx(ZSTD_createDCtx())
        , m_aInBuffer(IN_CHUNK_SIZE)
        , m_aOutBuffer(OUT_CHUNK_SIZE)  
    {
        if(!m_pDctx)
            throw std::runtime_error("ZSTD decompression context could not be created");

        m_input.src = m_aInBuffer.data();
        m_input.pos = m_input.size = 0;

        m_output.dst = m_aOutBuffer.data();
        m_output.size = m_aOutBuffer.size();
        m_output.pos = 0;

        setg(m_aOutBuffer.data(), m_aOutBuffer.data(), m_aOutBuffer.data());
    }

    ~ZStdStreamBuf() override
    {
        ZSTD_freeDCtx(m_pDctx);
    }

    ZStdStreamBuf(const ZStdStreamBuf&) = delete;
    ZStdStreamBuf& operator=(const ZStdStreamBuf&) = delete;

    int underflow() override final 
    {
        if(gptr() < egptr())
            return traits_type::to_int_type(*gptr());

        // loop until the output buffer contains results
        m_output.pos = 0;
        while(m_output.pos == 0)
        {
            // only read new data if the input buffer is used up
            if(m_input.pos == m_input.size)
            {
                m_pIn->read(m_aInBuffer.data(), m_aInBuffer.size());
                if(m_pIn->bad())
                    throw std::runtime_error("ZStdStreamBuf: Error while reading the provided input stream!");

                m_input.size = m_pIn->gcount();
                m_input.pos = 0;

                if(m_input.size == 0)
                {
                    // a frame that is still open at the end of input was cut off
                    if(m_nPending != 0)
                        throw std::runtime_error("ZSTD stream is truncated");
                    return traits_type::eof();
                }
            }

            m_nPending = ZSTD_decompressStream(m_pDctx, &m_output, &m_input);
            if(ZSTD_isError(m_nPending))
                throw std::runtime_error("ZSTD decompression failed: " + std::string(ZSTD_getErrorName(m_nPending)));

            setg(m_aOutBuffer.data(), m_aOutBuffer.data(), m_aOutBuffer.data() + m_output.pos);
        }

        return traits_type::to_int_type(*gptr());
    }

private:
    static constexpr size_t IN_CHUNK_SIZE = 256 * 1024;
    static constexpr size_t OUT_CHUNK_SIZE = 512 * 1024;

    std::istream* m_pIn;
    ZSTD_DCtx* m_pDctx;
    std::vector<char> m_aInBuffer; 
    std::vector<char> m_aOutBuffer;
    ZSTD_inBuffer m_input;
    ZSTD_outBuffer m_output;
    // last hint of ZSTD_decompressStream, 0 once a frame is complete
    size_t m_nPending = 0;
};

#endif // HAVE_ZSTD

#endif
