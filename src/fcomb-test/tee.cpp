#include <fcomb-test/util.h>

#include <fcomb/base/diagnostics.h>

#include <fcomb/tee.h>

#include <string.h>

using namespace fcomb;

namespace
{
    // Yields `chunks` one per read, then either the end of the stream or a failure.
    struct ChunkReader
    {
        std::vector<std::string> chunks;
        bool fail_at_end = false;
        size_t next = 0;

        Optional<size_t> read(DiagnosticContext& context, char* buffer, size_t size)
        {
            if (next == chunks.size())
            {
                if (fail_at_end)
                {
                    context.report_error(LocalizedString::from_raw("read failed"));
                    return nullopt;
                }

                return 0;
            }

            const auto& chunk = chunks[next++];
            REQUIRE(chunk.size() <= size);
            ::memcpy(buffer, chunk.data(), chunk.size());
            return chunk.size();
        }
    };

    struct RecordingWriter
    {
        std::string written;
        size_t flushes = 0;

        void write(StringView text) { written.append(text.data(), text.size()); }
        void flush() noexcept { ++flushes; }
    };
}

TEST_CASE ("tee mirrors every chunk", "[tee]")
{
    ChunkReader inner{{"   Compiling app\n", "warning: `app` (lib) ", "generated 2 warnings\n"}};
    RecordingWriter mirror;
    auto tee = make_tee_reader(inner, &mirror);
    BufferedDiagnosticContext bdc{out_sink};
    std::string captured;
    CHECK(read_to_end(bdc, tee, captured));
    CHECK(captured == "   Compiling app\nwarning: `app` (lib) generated 2 warnings\n");
    CHECK(mirror.written == captured);
    CHECK(mirror.flushes == 3);
    CHECK(bdc.empty());
}

TEST_CASE ("tee without a mirror only forwards", "[tee]")
{
    ChunkReader inner{{"abc", "def"}};
    auto tee = make_tee_reader(inner, static_cast<RecordingWriter*>(nullptr));
    BufferedDiagnosticContext bdc{out_sink};
    std::string captured;
    CHECK(read_to_end(bdc, tee, captured));
    CHECK(captured == "abcdef");
}

TEST_CASE ("tee keeps everything read before a failure", "[tee]")
{
    ChunkReader inner{{"partial"}, true};
    RecordingWriter mirror;
    auto tee = make_tee_reader(inner, &mirror);
    BufferedDiagnosticContext bdc{out_sink};
    std::string captured;
    CHECK_FALSE(read_to_end(bdc, tee, captured));
    CHECK(captured == "partial");
    CHECK(mirror.written == "partial");
    CHECK(bdc.to_string() == "error: read failed");
}
