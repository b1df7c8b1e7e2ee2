#pragma once

#include <fcomb/base/fwd/diagnostics.h>

#include <fcomb/base/optional.h>
#include <fcomb/base/stringview.h>

#include <stddef.h>

#include <string>

namespace fcomb
{
    // Wraps a reader so that every chunk read from it is also written to `mirror`, which is flushed after each
    // chunk. A null mirror turns TeeReader into a plain forwarding reader.
    //
    // Inner must provide Optional<size_t> read(DiagnosticContext&, char*, size_t) returning 0 at the end of
    // the stream; Mirror must provide write(StringView) and flush().
    template<class Inner, class Mirror>
    struct TeeReader
    {
        TeeReader(Inner& inner, Mirror* mirror) noexcept : m_inner(inner), m_mirror(mirror) { }

        Optional<size_t> read(DiagnosticContext& context, char* buffer, size_t size)
        {
            auto maybe_read_amount = m_inner.read(context, buffer, size);
            if (auto read_amount = maybe_read_amount.get())
            {
                if (m_mirror && *read_amount != 0)
                {
                    m_mirror->write(StringView{buffer, *read_amount});
                    m_mirror->flush();
                }
            }

            return maybe_read_amount;
        }

    private:
        Inner& m_inner;
        Mirror* m_mirror;
    };

    template<class Inner, class Mirror>
    TeeReader<Inner, Mirror> make_tee_reader(Inner& inner, Mirror* mirror) noexcept
    {
        return TeeReader<Inner, Mirror>(inner, mirror);
    }

    // Appends everything `reader` yields to `target`. Returns false if a read failed; `target` then holds
    // everything read before the failure.
    template<class Reader>
    bool read_to_end(DiagnosticContext& context, Reader& reader, std::string& target)
    {
        char buffer[4096];
        for (;;)
        {
            auto maybe_read_amount = reader.read(context, buffer, sizeof(buffer));
            auto read_amount = maybe_read_amount.get();
            if (!read_amount)
            {
                return false;
            }

            if (*read_amount == 0)
            {
                return true;
            }

            target.append(buffer, *read_amount);
        }
    }

    // Destination for the raw output of a child process.
    struct OutputWriter
    {
        virtual void write(StringView text) = 0;
        virtual void flush() = 0;

        virtual ~OutputWriter() = default;
    };

    // Writes to this process' standard output.
    struct StdOutWriter final : OutputWriter
    {
        virtual void write(StringView text) override;
        // write(2) is unbuffered
        virtual void flush() override { }
    };
}
