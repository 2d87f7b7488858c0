#include "verso/types.hpp"
#include <chrono>

namespace verso::engine {

    const char* to_string(SourceKind kind) {
        switch (kind) {
            case SourceKind::Document: return "document";
            case SourceKind::Template: return "template";
            case SourceKind::Data: return "data";
            case SourceKind::Book: return "book";
            case SourceKind::Passthrough: return "passthrough";
            case SourceKind::Ignored: return "ignored";
        }
        return "unknown";
    }

    std::int64_t to_ticks(std::filesystem::file_time_type time) {
        return std::chrono::duration_cast<std::chrono::nanoseconds>(time.time_since_epoch()).count();
    }

    std::filesystem::file_time_type from_ticks(std::int64_t ticks) {
        return std::filesystem::file_time_type(
            std::chrono::duration_cast<std::filesystem::file_time_type::duration>(std::chrono::nanoseconds(ticks)));
    }

}
