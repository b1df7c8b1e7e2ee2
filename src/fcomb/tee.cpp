#include <fcomb/base/messages.h>

#include <fcomb/tee.h>

namespace fcomb
{
    void StdOutWriter::write(StringView text) { msg::write_raw_text(OutputStream::StdOut, text); }
}
